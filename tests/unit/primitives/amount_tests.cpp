#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "primitives/amount.hpp"

using namespace rootsave;
using primitives::Amount;

namespace {

constexpr Amount kCentiRbtc = primitives::kWeiPerRbtc / 100;

bool TestParseAcceptsPlainDecimals() {
  struct Case {
    const char* text;
    Amount expected;
  };
  const Case cases[] = {
      {"0.01", kCentiRbtc},
      {"5", 5 * primitives::kWeiPerRbtc},
      {".5", primitives::kWeiPerRbtc / 2},
      {"1.", primitives::kWeiPerRbtc},
      {"0001.25", primitives::kWeiPerRbtc + primitives::kWeiPerRbtc / 4},
      {"1.000000000000000001", primitives::kWeiPerRbtc + 1},
      {"0.000000000000000001", 1},
      {"21000000", primitives::kMaxMoney},
      {"0", 0},
  };
  for (const auto& c : cases) {
    Amount value = 0;
    std::string error;
    if (!primitives::ParseRbtc(c.text, &value, &error)) {
      std::cerr << "Expected '" << c.text << "' to parse: " << error << "\n";
      return false;
    }
    if (value != c.expected) {
      std::cerr << "Wrong value for '" << c.text << "': "
                << primitives::ToDecimalString(value) << "\n";
      return false;
    }
  }
  return true;
}

bool TestParseRejectsMalformed() {
  const char* bad[] = {"",     ".",      "-1",     "+1",        "1e3",     "1,000",
                       "0x10", " 1",     "1 ",     "1.2.3",     "abc",     "21000000.000000000000000001",
                       "99999999", "0.0000000000000000001"};
  for (const char* text : bad) {
    Amount value = 7;
    std::string error;
    if (primitives::ParseRbtc(text, &value, &error)) {
      std::cerr << "Expected '" << text << "' to be rejected\n";
      return false;
    }
    if (error.empty() || value != 7) {
      std::cerr << "Rejected '" << text << "' without a reason or with output written\n";
      return false;
    }
  }
  return true;
}

bool TestFormatIsShortestExact() {
  if (primitives::FormatRbtc(kCentiRbtc) != "0.01" ||
      primitives::FormatRbtc(5 * primitives::kWeiPerRbtc) != "5" ||
      primitives::FormatRbtc(0) != "0" || primitives::FormatRbtc(1) != "0.000000000000000001" ||
      primitives::FormatRbtc(primitives::kWeiPerRbtc + primitives::kWeiPerRbtc / 2) != "1.5") {
    std::cerr << "Unexpected RBTC formatting\n";
    return false;
  }
  for (const char* text : {"0.02", "12.345", "20999999.999999999999999999"}) {
    Amount value = 0;
    if (!primitives::ParseRbtc(text, &value) || primitives::FormatRbtc(value) != text) {
      std::cerr << "Format does not reproduce '" << text << "'\n";
      return false;
    }
  }
  return true;
}

bool TestCheckedArithmetic() {
  Amount out = 0;
  if (primitives::CheckedAdd(primitives::kMaxMoney, 1, &out)) {
    std::cerr << "CheckedAdd allowed exceeding max money\n";
    return false;
  }
  if (!primitives::CheckedAdd(kCentiRbtc, kCentiRbtc, &out) || out != 2 * kCentiRbtc) {
    std::cerr << "CheckedAdd failed on small values\n";
    return false;
  }
  if (primitives::CheckedSub(1, 2, &out)) {
    std::cerr << "CheckedSub allowed underflow\n";
    return false;
  }
  if (primitives::CheckedMul(primitives::kMaxMoney, 2, &out)) {
    std::cerr << "CheckedMul allowed overflow\n";
    return false;
  }
  if (!primitives::CheckedMul(kCentiRbtc, 0, &out) || out != 0) {
    std::cerr << "CheckedMul by zero failed\n";
    return false;
  }
  return true;
}

bool TestWeiParsing() {
  const auto value = primitives::ParseWei("10000000000000000");
  if (!value || *value != kCentiRbtc) {
    std::cerr << "ParseWei failed on 1e16\n";
    return false;
  }
  if (primitives::ParseWei("") || primitives::ParseWei("12a") ||
      primitives::ParseWei("340282366920938463463374607431768211456")) {
    std::cerr << "ParseWei accepted malformed input\n";
    return false;
  }
  return true;
}

bool TestUsdValue() {
  const auto cents = primitives::UsdCentsFor(kCentiRbtc, 4'300'000);
  if (!cents || *cents != 43'000) {
    std::cerr << "Expected 0.01 RBTC at $43000 to be 43000 cents\n";
    return false;
  }
  if (primitives::FormatUsdCents(43'000) != "430.00" || primitives::FormatUsdCents(5) != "0.05") {
    std::cerr << "Unexpected USD formatting\n";
    return false;
  }
  std::uint64_t parsed = 0;
  if (!primitives::ParseUsdCents("43000", &parsed) || parsed != 4'300'000 ||
      !primitives::ParseUsdCents("43000.5", &parsed) || parsed != 4'300'050 ||
      !primitives::ParseUsdCents("0.07", &parsed) || parsed != 7) {
    std::cerr << "Unexpected USD parsing\n";
    return false;
  }
  if (primitives::ParseUsdCents("1.234", &parsed) || primitives::ParseUsdCents("-1", &parsed) ||
      primitives::ParseUsdCents("", &parsed)) {
    std::cerr << "ParseUsdCents accepted malformed input\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestParseAcceptsPlainDecimals() || !TestParseRejectsMalformed() ||
      !TestFormatIsShortestExact() || !TestCheckedArithmetic() || !TestWeiParsing() ||
      !TestUsdValue()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
