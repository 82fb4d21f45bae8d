#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>

#include "primitives/amount.hpp"
#include "wallet/yield_math.hpp"

using namespace rootsave;
using primitives::Amount;

namespace {

bool TestOneYearAtFivePercent() {
  Amount out = 0;
  if (!wallet::ProjectedYield(100, wallet::kSecondsPerYear, 5, &out) || out != 5) {
    std::cerr << "Expected 100 over one year at 5% to yield 5\n";
    return false;
  }
  return true;
}

bool TestExactAcrossRandomPrincipals() {
  std::mt19937_64 rng(20240131);
  for (int i = 0; i < 10'000; ++i) {
    const Amount principal = static_cast<Amount>(rng()) % primitives::kMaxMoney;
    Amount out = 0;
    if (!wallet::ProjectedYield(principal, wallet::kSecondsPerYear, 5, &out)) {
      std::cerr << "Unexpected overflow for principal "
                << primitives::ToDecimalString(principal) << "\n";
      return false;
    }
    if (out != principal * 5 / 100) {
      std::cerr << "Drift for principal " << primitives::ToDecimalString(principal) << "\n";
      return false;
    }
  }
  return true;
}

bool TestPartialPeriods() {
  Amount out = 1;
  if (!wallet::ProjectedYield(primitives::kWeiPerRbtc, 0, 5, &out) || out != 0) {
    std::cerr << "Zero elapsed time must yield zero\n";
    return false;
  }
  if (!wallet::ProjectedYield(primitives::kWeiPerRbtc, wallet::kSecondsPerYear / 2, 5, &out) ||
      out != primitives::kWeiPerRbtc / 40) {
    std::cerr << "Expected half a year on 1 RBTC to yield 0.025 RBTC\n";
    return false;
  }
  // 1 wei for one hour truncates to zero.
  if (!wallet::ProjectedYield(1, 3600, 5, &out) || out != 0) {
    std::cerr << "Expected truncation toward zero\n";
    return false;
  }
  return true;
}

bool TestOverflowIsReported() {
  const Amount huge = ~static_cast<Amount>(0) / 2;
  Amount out = 9;
  if (wallet::ProjectedYield(huge, wallet::kSecondsPerYear, 5, &out)) {
    std::cerr << "Expected overflow to be reported\n";
    return false;
  }
  if (out != 9) {
    std::cerr << "Output written on overflow\n";
    return false;
  }
  return true;
}

bool TestRbtcHelper() {
  const auto yield = wallet::ProjectedYieldRbtc("1", wallet::kSecondsPerYear, 5);
  if (!yield || *yield != primitives::kWeiPerRbtc / 20) {
    std::cerr << "Expected 1 RBTC to yield 0.05 RBTC per year\n";
    return false;
  }
  if (wallet::ProjectedYieldRbtc("one", wallet::kSecondsPerYear, 5)) {
    std::cerr << "Malformed principal accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestOneYearAtFivePercent() || !TestExactAcrossRandomPrincipals() || !TestPartialPeriods() ||
      !TestOverflowIsReported() || !TestRbtcHelper()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
