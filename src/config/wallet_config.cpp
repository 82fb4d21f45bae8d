#include "config/wallet_config.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "crypto/address.hpp"

namespace rootsave::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::uint64_t ParseUnsigned(const std::string& value, const std::string& key) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("invalid number for " + key + ": " + value);
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("number out of range for " + key + ": " + value);
  }
}

std::uint32_t ParseU32(const std::string& value, const std::string& key) {
  const auto parsed = ParseUnsigned(value, key);
  if (parsed > UINT32_MAX) {
    throw std::runtime_error("number out of range for " + key + ": " + value);
  }
  return static_cast<std::uint32_t>(parsed);
}

primitives::Amount ParseRbtcOption(const std::string& value, const std::string& key) {
  primitives::Amount amount = 0;
  std::string reason;
  if (!primitives::ParseRbtc(value, &amount, &reason)) {
    throw std::runtime_error("invalid RBTC amount for " + key + ": " + reason);
  }
  return amount;
}

}  // namespace

void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       WalletOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "datadir" || key == "datadirectory") {
    opts->data_dir = value;
  } else if (key == "network") {
    opts->network = NetworkFromString(value);
  } else if (key == "contract" || key == "contractaddress") {
    opts->contract_address = crypto::NormalizeAddress(value);
    if (opts->contract_address.empty()) {
      throw std::runtime_error("invalid contract address: " + value);
    }
  } else if (key == "depositgaslimit") {
    opts->deposit_gas_limit = ParseUnsigned(value, raw_key);
  } else if (key == "withdrawgaslimit") {
    opts->withdraw_gas_limit = ParseUnsigned(value, raw_key);
  } else if (key == "annualrate" || key == "annualratepercent") {
    opts->annual_rate_percent = ParseU32(value, raw_key);
  } else if (key == "yieldtickseconds" || key == "yieldtickinterval") {
    opts->yield_tick_interval = std::chrono::seconds(ParseUnsigned(value, raw_key));
  } else if (key == "yieldthreshold" || key == "yieldsignificance") {
    opts->yield_significance_threshold = ParseRbtcOption(value, raw_key);
  } else if (key == "stalependingseconds" || key == "stalependingwindow") {
    opts->stale_pending_window = std::chrono::seconds(ParseUnsigned(value, raw_key));
  } else if (key == "minimumdeposit" || key == "mindeposit") {
    opts->minimum_deposit = ParseRbtcOption(value, raw_key);
  } else if (key == "usdprice" || key == "rbtcusdprice") {
    if (!primitives::ParseUsdCents(value, &opts->usd_cents_per_rbtc)) {
      throw std::runtime_error("invalid USD price: " + value);
    }
  } else if (key == "phrasewords" || key == "recoveryphrasewords") {
    const auto words = ParseUnsigned(value, raw_key);
    if (words != 12 && words != 24) {
      throw std::runtime_error("recovery phrase length must be 12 or 24 words");
    }
    opts->recovery_phrase_words = static_cast<std::size_t>(words);
  } else if (key == "vaultargon2t" || key == "vaultargon2iterations") {
    opts->vault_argon2.t_cost = ParseU32(value, raw_key);
  } else if (key == "vaultargon2memorykib") {
    opts->vault_argon2.m_cost_kib = ParseU32(value, raw_key);
  } else if (key == "vaultargon2parallelism") {
    opts->vault_argon2.parallelism = ParseU32(value, raw_key);
  } else if (key == "statsfilter") {
    const auto filter = ledger::ParseStatusFilter(value);
    if (!filter) {
      throw std::runtime_error("invalid stats filter: " + value);
    }
    opts->stats_filter = *filter;
  } else if (key == "loglevel") {
    opts->log_level = util::ParseLogLevel(value);
  } else if (key == "logfile") {
    opts->log_file = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_bytes = static_cast<std::uintmax_t>(ParseUnsigned(value, raw_key)) * 1024 * 1024;
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(ParseUnsigned(value, raw_key));
  } else {
    util::LogWarn("config", "unknown config key '" + raw_key + "'");
  }
}

void LoadConfigFile(const std::filesystem::path& path, WalletOptions* opts) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  WalletOptions updated = *opts;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, &updated);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
  std::string argon_error;
  if (!util::ValidateArgon2idParams(updated.vault_argon2, &argon_error)) {
    throw std::runtime_error(path.string() + ": " + argon_error);
  }
  *opts = std::move(updated);
}

void ApplyLoggingOptions(const WalletOptions& opts) {
  auto& logger = util::Logger::Instance();
  logger.Configure(opts.log_level, opts.log_max_bytes, opts.log_max_files);
  if (opts.log_file.empty()) {
    logger.DisableFile();
  } else {
    logger.EnableFile(opts.log_file);
  }
}

}  // namespace rootsave::config
