#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config/network.hpp"
#include "ledger/ledger_entry.hpp"
#include "primitives/amount.hpp"
#include "util/argon2_kdf.hpp"
#include "util/logging.hpp"

namespace rootsave::config {

struct WalletOptions {
  std::filesystem::path data_dir{"rootsave-data"};
  NetworkType network{NetworkType::kTestnet};
  // Savings contract; the chain client resolves the address.
  std::string contract_address;

  std::uint64_t deposit_gas_limit{100'000};
  std::uint64_t withdraw_gas_limit{150'000};

  std::uint32_t annual_rate_percent{5};
  std::chrono::seconds yield_tick_interval{3600};
  // 0.000001 RBTC
  primitives::Amount yield_significance_threshold{1'000'000'000'000ULL};
  std::chrono::seconds stale_pending_window{300};
  // 0.001 RBTC
  primitives::Amount minimum_deposit{1'000'000'000'000'000ULL};
  // Reference price for the USD value recorded with each entry.
  std::uint64_t usd_cents_per_rbtc{4'300'000};

  std::size_t recovery_phrase_words{12};
  util::Argon2idParams vault_argon2{util::DefaultArgon2idParams()};
  ledger::StatusFilter stats_filter{ledger::StatusFilter::kAll};

  util::LogLevel log_level{util::LogLevel::kInfo};
  std::string log_file;  // empty disables the file sink
  std::uintmax_t log_max_bytes{0};
  std::size_t log_max_files{0};
};

// Applies one key=value option. Keys are matched ignoring case, '-' and '_'.
// Unknown keys are logged and ignored; malformed values throw
// std::runtime_error.
void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       WalletOptions* opts);

// Reads "key = value" lines; '#' starts a comment; a bare key means "1".
// A missing file leaves `opts` untouched. Errors carry "path:line: ".
void LoadConfigFile(const std::filesystem::path& path, WalletOptions* opts);

// Routes util::Logger per the options.
void ApplyLoggingOptions(const WalletOptions& opts);

}  // namespace rootsave::config
