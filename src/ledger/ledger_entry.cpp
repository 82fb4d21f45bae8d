#include "ledger/ledger_entry.hpp"

#include <utility>

namespace rootsave::ledger {

namespace {

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ReadAmount(const nlohmann::json& j, const char* field, primitives::Amount* out,
                std::string* error) {
  const auto it = j.find(field);
  if (it == j.end() || !it->is_string()) {
    return Fail(error, std::string("missing ") + field);
  }
  std::string reason;
  if (!primitives::ParseRbtc(it->get_ref<const std::string&>(), out, &reason)) {
    return Fail(error, std::string(field) + ": " + reason);
  }
  return true;
}

}  // namespace

const char* EntryKindName(EntryKind kind) {
  switch (kind) {
    case EntryKind::kDeposit:
      return "deposit";
    case EntryKind::kWithdraw:
      return "withdraw";
    case EntryKind::kYieldCredit:
      return "yield";
  }
  return "unknown";
}

std::optional<EntryKind> ParseEntryKind(std::string_view name) {
  if (name == "deposit") return EntryKind::kDeposit;
  if (name == "withdraw") return EntryKind::kWithdraw;
  if (name == "yield") return EntryKind::kYieldCredit;
  return std::nullopt;
}

const char* EntryStatusName(EntryStatus status) {
  switch (status) {
    case EntryStatus::kPending:
      return "pending";
    case EntryStatus::kCompleted:
      return "completed";
    case EntryStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<EntryStatus> ParseEntryStatus(std::string_view name) {
  if (name == "pending") return EntryStatus::kPending;
  if (name == "completed") return EntryStatus::kCompleted;
  if (name == "failed") return EntryStatus::kFailed;
  return std::nullopt;
}

std::optional<StatusFilter> ParseStatusFilter(std::string_view name) {
  if (name == "all") return StatusFilter::kAll;
  if (name == "exclude-failed" || name == "excludefailed") return StatusFilter::kExcludeFailed;
  if (name == "completed" || name == "completed-only") return StatusFilter::kCompletedOnly;
  return std::nullopt;
}

bool PassesFilter(EntryStatus status, StatusFilter filter) {
  switch (filter) {
    case StatusFilter::kAll:
      return true;
    case StatusFilter::kExcludeFailed:
      return status != EntryStatus::kFailed;
    case StatusFilter::kCompletedOnly:
      return status == EntryStatus::kCompleted;
  }
  return true;
}

nlohmann::json EntryToJson(const LedgerEntry& entry) {
  nlohmann::json j;
  j["id"] = entry.id;
  j["walletAddress"] = entry.address;
  j["type"] = EntryKindName(entry.kind);
  j["amount"] = primitives::FormatRbtc(entry.amount);
  j["usdValue"] = primitives::FormatUsdCents(entry.usd_cents);
  j["timestamp"] = entry.created_at_ms;
  j["status"] = EntryStatusName(entry.status);
  j["notes"] = entry.notes;
  if (entry.tx_hash) j["txHash"] = *entry.tx_hash;
  if (entry.block_number) j["blockNumber"] = *entry.block_number;
  if (entry.gas_used) j["gasUsed"] = *entry.gas_used;
  if (entry.observed_yield) j["observedYield"] = primitives::FormatRbtc(*entry.observed_yield);
  return j;
}

bool EntryFromJson(const nlohmann::json& j, LedgerEntry* out, std::string* error) {
  if (!j.is_object()) {
    return Fail(error, "ledger entry is not an object");
  }
  LedgerEntry entry;
  try {
    entry.id = j.at("id").get<std::string>();
    entry.address = j.at("walletAddress").get<std::string>();
    const auto kind = ParseEntryKind(j.at("type").get<std::string>());
    const auto status = ParseEntryStatus(j.at("status").get<std::string>());
    if (!kind || !status) {
      return Fail(error, "unknown entry type or status in " + entry.id);
    }
    entry.kind = *kind;
    entry.status = *status;
    entry.created_at_ms = j.at("timestamp").get<std::int64_t>();
    entry.notes = j.value("notes", std::string{});
    if (!ReadAmount(j, "amount", &entry.amount, error)) {
      return false;
    }
    if (!primitives::ParseUsdCents(j.value("usdValue", std::string("0")), &entry.usd_cents)) {
      return Fail(error, "malformed usdValue in " + entry.id);
    }
    if (j.contains("txHash")) entry.tx_hash = j.at("txHash").get<std::string>();
    if (j.contains("blockNumber")) entry.block_number = j.at("blockNumber").get<std::uint64_t>();
    if (j.contains("gasUsed")) entry.gas_used = j.at("gasUsed").get<std::uint64_t>();
    if (j.contains("observedYield")) {
      primitives::Amount observed = 0;
      if (!ReadAmount(j, "observedYield", &observed, error)) {
        return false;
      }
      entry.observed_yield = observed;
    }
  } catch (const nlohmann::json::exception& ex) {
    return Fail(error, std::string("malformed ledger entry: ") + ex.what());
  }
  if (out) {
    *out = std::move(entry);
  }
  return true;
}

nlohmann::json StatsToJson(const LedgerStats& stats) {
  nlohmann::json j;
  j["totalDeposits"] = primitives::FormatRbtc(stats.total_deposits);
  j["totalWithdrawals"] = primitives::FormatRbtc(stats.total_withdrawals);
  j["totalYieldEarned"] = primitives::FormatRbtc(stats.total_yield_earned);
  j["transactionCount"] = stats.count;
  return j;
}

}  // namespace rootsave::ledger
