#include "primitives/amount.hpp"

#include <algorithm>

namespace rootsave::primitives {

namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

std::string ToDecimalString(Amount value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<Amount> ParseWei(std::string_view text) {
  if (text.empty() || text.size() > 39) {
    return std::nullopt;
  }
  Amount value = 0;
  for (char c : text) {
    if (!IsDigit(c)) {
      return std::nullopt;
    }
    const Amount next = value * 10 + static_cast<Amount>(c - '0');
    if (next / 10 != value) {
      return std::nullopt;
    }
    value = next;
  }
  if (!MoneyRange(value)) {
    return std::nullopt;
  }
  return value;
}

bool ParseRbtc(std::string_view text, Amount* out, std::string* error) {
  auto fail = [error](const char* reason) {
    if (error) {
      *error = reason;
    }
    return false;
  };
  if (text.empty()) {
    return fail("amount is empty");
  }
  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view frac =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && frac.empty()) {
    return fail("amount has no digits");
  }
  if (frac.size() > kRbtcDecimals) {
    return fail("amount has more than 18 decimal places");
  }
  if (!std::all_of(whole.begin(), whole.end(), IsDigit) ||
      !std::all_of(frac.begin(), frac.end(), IsDigit)) {
    return fail("amount must be a plain decimal number");
  }
  // 21M RBTC has 8 integer digits; anything longer is out of range anyway.
  const auto first_nonzero = whole.find_first_not_of('0');
  const std::string_view significant =
      first_nonzero == std::string_view::npos ? std::string_view{} : whole.substr(first_nonzero);
  if (significant.size() > 8) {
    return fail("amount exceeds the maximum supply");
  }
  Amount value = 0;
  for (char c : significant) {
    value = value * 10 + static_cast<Amount>(c - '0');
  }
  value *= kWeiPerRbtc;
  Amount scale = kWeiPerRbtc;
  for (char c : frac) {
    scale /= 10;
    value += static_cast<Amount>(c - '0') * scale;
  }
  if (!MoneyRange(value)) {
    return fail("amount exceeds the maximum supply");
  }
  if (out) {
    *out = value;
  }
  return true;
}

std::string FormatRbtc(Amount value) {
  std::string whole = ToDecimalString(value / kWeiPerRbtc);
  const Amount frac = value % kWeiPerRbtc;
  if (frac == 0) {
    return whole;
  }
  std::string frac_digits = ToDecimalString(frac);
  frac_digits.insert(frac_digits.begin(), kRbtcDecimals - frac_digits.size(), '0');
  while (!frac_digits.empty() && frac_digits.back() == '0') {
    frac_digits.pop_back();
  }
  return whole + "." + frac_digits;
}

std::optional<std::uint64_t> UsdCentsFor(Amount value, std::uint64_t usd_cents_per_rbtc) {
  if (!MoneyRange(value)) {
    return std::nullopt;
  }
  // kMaxMoney * 2^64 overflows 128 bits, so split into whole and fractional RBTC.
  const Amount whole = value / kWeiPerRbtc;
  const Amount frac = value % kWeiPerRbtc;
  const Amount cents = whole * usd_cents_per_rbtc + (frac * usd_cents_per_rbtc) / kWeiPerRbtc;
  if (cents > static_cast<Amount>(UINT64_MAX)) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(cents);
}

std::string FormatUsdCents(std::uint64_t cents) {
  std::string frac = std::to_string(cents % 100);
  if (frac.size() < 2) {
    frac.insert(frac.begin(), '0');
  }
  return std::to_string(cents / 100) + "." + frac;
}

bool ParseUsdCents(std::string_view text, std::uint64_t* cents) {
  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  std::string_view frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() || whole.size() > 15 || frac.size() > 2 ||
      !std::all_of(whole.begin(), whole.end(), IsDigit) ||
      !std::all_of(frac.begin(), frac.end(), IsDigit)) {
    return false;
  }
  std::uint64_t value = 0;
  for (char c : whole) {
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  value *= 100;
  if (!frac.empty()) {
    value += static_cast<std::uint64_t>(frac[0] - '0') * 10;
    if (frac.size() == 2) {
      value += static_cast<std::uint64_t>(frac[1] - '0');
    }
  }
  if (cents) {
    *cents = value;
  }
  return true;
}

}  // namespace rootsave::primitives
