#include "wallet/yield_math.hpp"

namespace rootsave::wallet {

namespace {

using primitives::Amount;

constexpr Amount kAmountMax = ~static_cast<Amount>(0);

bool MulOverflows(Amount a, Amount b, Amount* out) noexcept {
  if (a != 0 && b > kAmountMax / a) {
    return true;
  }
  *out = a * b;
  return false;
}

}  // namespace

bool ProjectedYield(Amount principal, std::uint64_t elapsed_seconds,
                    std::uint32_t annual_rate_percent, Amount* out) noexcept {
  Amount scaled = 0;
  if (MulOverflows(principal, annual_rate_percent, &scaled) ||
      MulOverflows(scaled, elapsed_seconds, &scaled)) {
    return false;
  }
  if (out) {
    *out = scaled / (static_cast<Amount>(100) * kSecondsPerYear);
  }
  return true;
}

std::optional<Amount> ProjectedYieldRbtc(std::string_view principal_rbtc,
                                         std::uint64_t elapsed_seconds,
                                         std::uint32_t annual_rate_percent) {
  Amount principal = 0;
  if (!primitives::ParseRbtc(principal_rbtc, &principal)) {
    return std::nullopt;
  }
  Amount yield = 0;
  if (!ProjectedYield(principal, elapsed_seconds, annual_rate_percent, &yield)) {
    return std::nullopt;
  }
  return yield;
}

}  // namespace rootsave::wallet
