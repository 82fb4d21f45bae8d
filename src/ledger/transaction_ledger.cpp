#include "ledger/transaction_ledger.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <ctime>
#include <utility>

#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace rootsave::ledger {

using wallet::SetWalletError;
using wallet::WalletError;
using wallet::WalletErrorCode;

namespace {

constexpr char kLogTag[] = "ledger";
constexpr char kKeyPrefix[] = "rootsave_transactions_";

std::int64_t SystemNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string FormatIsoUtc(std::int64_t ms) {
  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char millis[8];
  std::snprintf(millis, sizeof(millis), ".%03dZ", static_cast<int>(ms % 1000));
  return std::string(buf) + millis;
}

// Stored amounts must parse back on load, which rejects anything above the
// money supply.
bool AmountsInRange(const LedgerEntry& entry, WalletError* error) {
  if (!primitives::MoneyRange(entry.amount)) {
    return SetWalletError(error, WalletErrorCode::kInvalidAmount,
                          "ledger amount exceeds the money supply");
  }
  if (entry.observed_yield && !primitives::MoneyRange(*entry.observed_yield)) {
    return SetWalletError(error, WalletErrorCode::kInvalidAmount,
                          "observed yield exceeds the money supply");
  }
  return true;
}

}  // namespace

TransactionLedger::TransactionLedger(KeyValueStore& store, Clock clock)
    : store_(store), clock_(clock ? std::move(clock) : Clock(&SystemNowMs)) {}

std::string TransactionLedger::StorageKey(const std::string& address) {
  return kKeyPrefix + address;
}

std::shared_ptr<std::shared_mutex> TransactionLedger::LockFor(const std::string& address) {
  std::lock_guard<std::mutex> guard(locks_mutex_);
  auto& slot = locks_[address];
  if (!slot) {
    slot = std::make_shared<std::shared_mutex>();
  }
  return slot;
}

bool TransactionLedger::LoadLocked(const std::string& address, std::vector<LedgerEntry>* entries,
                                   WalletError* error) {
  entries->clear();
  std::optional<std::string> raw;
  std::string store_error;
  if (!store_.Read(StorageKey(address), &raw, &store_error)) {
    util::LogError(kLogTag, "failed to read ledger: " + store_error);
    return SetWalletError(error, WalletErrorCode::kStorageError, store_error);
  }
  if (!raw || raw->empty()) {
    return true;
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(*raw);
  } catch (const nlohmann::json::exception& ex) {
    util::LogError(kLogTag, std::string("ledger for ") + address + " is corrupt: " + ex.what());
    return SetWalletError(error, WalletErrorCode::kStorageError, "ledger data is corrupt");
  }
  if (!doc.is_array()) {
    return SetWalletError(error, WalletErrorCode::kStorageError, "ledger data is not an array");
  }
  entries->reserve(doc.size());
  for (const auto& item : doc) {
    LedgerEntry entry;
    std::string reason;
    if (!EntryFromJson(item, &entry, &reason)) {
      util::LogError(kLogTag, "malformed ledger entry: " + reason);
      entries->clear();
      return SetWalletError(error, WalletErrorCode::kStorageError, reason);
    }
    entries->push_back(std::move(entry));
  }
  return true;
}

bool TransactionLedger::SaveLocked(const std::string& address,
                                   const std::vector<LedgerEntry>& entries, WalletError* error) {
  nlohmann::json doc = nlohmann::json::array();
  for (const auto& entry : entries) {
    doc.push_back(EntryToJson(entry));
  }
  std::string store_error;
  if (!store_.Write(StorageKey(address), doc.dump(), &store_error)) {
    util::LogError(kLogTag, "failed to write ledger: " + store_error);
    return SetWalletError(error, WalletErrorCode::kStorageError, store_error);
  }
  return true;
}

std::optional<std::string> TransactionLedger::NewId(std::int64_t now_ms,
                                                    const std::vector<LedgerEntry>& existing,
                                                    WalletError* error) {
  for (int attempt = 0; attempt < 4; ++attempt) {
    std::array<std::uint8_t, 8> random{};
    std::string rng_error;
    if (!util::FillSecureRandomBytes(random, &rng_error)) {
      SetWalletError(error, WalletErrorCode::kEntropyError, rng_error);
      return std::nullopt;
    }
    std::string id = "tx_" + std::to_string(now_ms) + "_" + util::HexEncode(random);
    const bool taken = std::any_of(existing.begin(), existing.end(),
                                   [&](const LedgerEntry& e) { return e.id == id; });
    if (!taken) {
      return id;
    }
  }
  SetWalletError(error, WalletErrorCode::kStorageError, "could not allocate a unique entry id");
  return std::nullopt;
}

std::optional<std::string> TransactionLedger::Append(LedgerEntry entry, WalletError* error) {
  if (entry.address.empty()) {
    SetWalletError(error, WalletErrorCode::kStorageError, "ledger entry has no address");
    return std::nullopt;
  }
  if (!AmountsInRange(entry, error)) {
    return std::nullopt;
  }
  const auto lock = LockFor(entry.address);
  std::unique_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(entry.address, &entries, error)) {
    return std::nullopt;
  }
  const std::int64_t now = clock_();
  auto id = NewId(now, entries, error);
  if (!id) {
    return std::nullopt;
  }
  entry.id = *id;
  if (entry.created_at_ms == 0) {
    entry.created_at_ms = now;
  }
  const std::string address = entry.address;
  const std::string kind = EntryKindName(entry.kind);
  const std::string status = EntryStatusName(entry.status);
  entries.insert(entries.begin(), std::move(entry));
  if (!SaveLocked(address, entries, error)) {
    return std::nullopt;
  }
  util::LogDebug(kLogTag, "appended " + kind + " entry " + *id + " (" + status + ")");
  return id;
}

bool TransactionLedger::MutateEntry(
    const std::string& address, const std::string& id,
    const std::function<bool(LedgerEntry&, WalletError*)>& mutate, WalletError* error) {
  const auto lock = LockFor(address);
  std::unique_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(address, &entries, error)) {
    return false;
  }
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const LedgerEntry& e) { return e.id == id; });
  if (it == entries.end()) {
    return SetWalletError(error, WalletErrorCode::kEntryNotFound, "no ledger entry " + id);
  }
  if (!mutate(*it, error) || !AmountsInRange(*it, error)) {
    return false;
  }
  return SaveLocked(address, entries, error);
}

bool TransactionLedger::UpdateStatus(const std::string& address, const std::string& id,
                                     EntryStatus status, std::optional<std::string> tx_hash,
                                     WalletError* error) {
  const bool ok = MutateEntry(
      address, id,
      [&](LedgerEntry& entry, WalletError* err) {
        if (IsTerminal(entry.status)) {
          return SetWalletError(err, WalletErrorCode::kInvalidStatusTransition,
                                std::string("entry ") + id + " is already " +
                                    EntryStatusName(entry.status));
        }
        entry.status = status;
        if (tx_hash) {
          entry.tx_hash = *tx_hash;
        }
        return true;
      },
      error);
  if (ok) {
    util::LogDebug(kLogTag, "entry " + id + " -> " + EntryStatusName(status));
  }
  return ok;
}

bool TransactionLedger::UpdateReceipt(const std::string& address, const std::string& id,
                                      std::uint64_t block_number, std::uint64_t gas_used,
                                      WalletError* error) {
  return MutateEntry(
      address, id,
      [&](LedgerEntry& entry, WalletError*) {
        entry.block_number = block_number;
        entry.gas_used = gas_used;
        return true;
      },
      error);
}

std::optional<LedgerEntry> TransactionLedger::FindStalePending(
    const std::string& address, EntryKind kind, std::chrono::milliseconds window,
    std::optional<primitives::Amount> amount) {
  const auto lock = LockFor(address);
  std::shared_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(address, &entries, nullptr)) {
    return std::nullopt;
  }
  const std::int64_t now = clock_();
  for (auto& entry : entries) {
    if (entry.kind != kind || entry.status != EntryStatus::kPending) {
      continue;
    }
    if (now - entry.created_at_ms > window.count()) {
      continue;
    }
    if (amount && entry.amount != *amount) {
      continue;
    }
    return std::move(entry);
  }
  return std::nullopt;
}

std::optional<LedgerEntry> TransactionLedger::Find(const std::string& address,
                                                   const std::string& id) {
  const auto lock = LockFor(address);
  std::shared_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(address, &entries, nullptr)) {
    return std::nullopt;
  }
  for (auto& entry : entries) {
    if (entry.id == id) {
      return std::move(entry);
    }
  }
  return std::nullopt;
}

std::optional<LedgerEntry> TransactionLedger::LatestOfKind(const std::string& address,
                                                           EntryKind kind) {
  const auto lock = LockFor(address);
  std::shared_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(address, &entries, nullptr)) {
    return std::nullopt;
  }
  for (auto& entry : entries) {
    if (entry.kind == kind) {
      return std::move(entry);
    }
  }
  return std::nullopt;
}

std::optional<std::vector<LedgerEntry>> TransactionLedger::History(const std::string& address,
                                                                   std::size_t limit,
                                                                   WalletError* error) {
  const auto lock = LockFor(address);
  std::shared_lock<std::shared_mutex> guard(*lock);
  std::vector<LedgerEntry> entries;
  if (!LoadLocked(address, &entries, error)) {
    return std::nullopt;
  }
  if (limit > 0 && entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

std::optional<LedgerStats> TransactionLedger::Stats(const std::string& address,
                                                    StatusFilter filter, WalletError* error) {
  const auto entries = History(address, 0, error);
  if (!entries) {
    return std::nullopt;
  }
  LedgerStats stats;
  for (const auto& entry : *entries) {
    if (!PassesFilter(entry.status, filter)) {
      continue;
    }
    primitives::Amount* total = nullptr;
    switch (entry.kind) {
      case EntryKind::kDeposit:
        total = &stats.total_deposits;
        break;
      case EntryKind::kWithdraw:
        total = &stats.total_withdrawals;
        break;
      case EntryKind::kYieldCredit:
        total = &stats.total_yield_earned;
        break;
    }
    if (!primitives::CheckedAdd(*total, entry.amount, total)) {
      SetWalletError(error, WalletErrorCode::kStorageError, "ledger totals overflow");
      return std::nullopt;
    }
    ++stats.count;
  }
  return stats;
}

std::optional<std::string> TransactionLedger::ExportJson(const std::string& address,
                                                         StatusFilter filter,
                                                         WalletError* error) {
  const auto entries = History(address, 0, error);
  if (!entries) {
    return std::nullopt;
  }
  const auto stats = Stats(address, filter, error);
  if (!stats) {
    return std::nullopt;
  }
  nlohmann::json doc;
  doc["walletAddress"] = address;
  doc["exportDate"] = FormatIsoUtc(clock_());
  doc["stats"] = StatsToJson(*stats);
  doc["transactions"] = nlohmann::json::array();
  for (const auto& entry : *entries) {
    doc["transactions"].push_back(EntryToJson(entry));
  }
  return doc.dump(2);
}

bool TransactionLedger::Clear(const std::string& address, WalletError* error) {
  const auto lock = LockFor(address);
  std::unique_lock<std::shared_mutex> guard(*lock);
  std::string store_error;
  if (!store_.Erase(StorageKey(address), &store_error)) {
    util::LogError(kLogTag, "failed to clear ledger: " + store_error);
    return SetWalletError(error, WalletErrorCode::kStorageError, store_error);
  }
  util::LogInfo(kLogTag, "cleared ledger for " + address);
  return true;
}

}  // namespace rootsave::ledger
