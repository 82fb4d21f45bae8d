#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "primitives/amount.hpp"

namespace rootsave::wallet {

inline constexpr std::uint64_t kSecondsPerYear = 31'536'000;  // 365 days

// Simple interest: principal * rate/100 * elapsed/kSecondsPerYear, in wei,
// truncated toward zero. Exact integer arithmetic; returns false instead of
// wrapping when an intermediate product overflows 128 bits.
bool ProjectedYield(primitives::Amount principal, std::uint64_t elapsed_seconds,
                    std::uint32_t annual_rate_percent, primitives::Amount* out) noexcept;

// Display helper over an RBTC decimal principal. nullopt on a malformed
// principal or overflow.
std::optional<primitives::Amount> ProjectedYieldRbtc(std::string_view principal_rbtc,
                                                     std::uint64_t elapsed_seconds,
                                                     std::uint32_t annual_rate_percent);

}  // namespace rootsave::wallet
