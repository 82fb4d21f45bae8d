#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rootsave::primitives {

// Amounts are denominated in wei (1e-18 RBTC). 18 decimals do not fit a
// 64-bit integer once balances exceed ~18.4 RBTC, so use 128 bits.
using Amount = unsigned __int128;

inline constexpr unsigned kRbtcDecimals = 18;
inline constexpr Amount kWeiPerRbtc = 1'000'000'000'000'000'000ULL;
inline constexpr Amount kMaxMoney = static_cast<Amount>(21'000'000ULL) * kWeiPerRbtc;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (a > kMaxMoney - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

inline bool CheckedMul(Amount a, std::uint64_t b, Amount* out) noexcept {
  if (!MoneyRange(a)) {
    return false;
  }
  if (b == 0) {
    if (out) {
      *out = 0;
    }
    return true;
  }
  if (a > kMaxMoney / b) {
    return false;
  }
  if (out) {
    *out = a * b;
  }
  return true;
}

// Parses a non-negative RBTC decimal ("0.01", "5", ".5", "1.000000000000000001").
// Rejects signs, exponents, separators, more than 18 fractional digits and
// values above kMaxMoney.
bool ParseRbtc(std::string_view text, Amount* out, std::string* error = nullptr);

// Shortest exact decimal rendering in RBTC: 10^16 wei -> "0.01", 5 RBTC -> "5".
std::string FormatRbtc(Amount value);

// Decimal string of a raw 128-bit value.
std::string ToDecimalString(Amount value);

// Strict unsigned decimal parse of a raw wei value.
std::optional<Amount> ParseWei(std::string_view text);

// USD value in cents of `value` at `usd_cents_per_rbtc`, truncated.
std::optional<std::uint64_t> UsdCentsFor(Amount value, std::uint64_t usd_cents_per_rbtc);

// "1234.50" style rendering of a cent amount.
std::string FormatUsdCents(std::uint64_t cents);

// Parses "43000", "43000.5", "43000.50" into cents.
bool ParseUsdCents(std::string_view text, std::uint64_t* cents);

}  // namespace rootsave::primitives
