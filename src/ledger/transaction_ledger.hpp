#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ledger/kv_store.hpp"
#include "ledger/ledger_entry.hpp"
#include "wallet/wallet_error.hpp"

namespace rootsave::ledger {

// Per-address record of deposit, withdraw and yield-credit intents, stored
// newest first as a JSON array under "rootsave_transactions_<address>".
//
// Entries are never deleted individually; only Clear wipes an address.
// Status moves Pending -> Completed | Failed and never leaves a terminal
// state. Writes to one address are serialized; reads run concurrently.
class TransactionLedger {
 public:
  // Unix time in milliseconds.
  using Clock = std::function<std::int64_t()>;

  explicit TransactionLedger(KeyValueStore& store, Clock clock = {});

  static std::string StorageKey(const std::string& address);

  // Assigns a fresh id ("tx_<ms>_<hex>") and, when unset, the creation time.
  // Returns the id.
  std::optional<std::string> Append(LedgerEntry entry, wallet::WalletError* error = nullptr);

  // kEntryNotFound for an unknown id, kInvalidStatusTransition when the entry
  // is already terminal. Pending -> Pending is allowed to attach a hash.
  bool UpdateStatus(const std::string& address, const std::string& id, EntryStatus status,
                    std::optional<std::string> tx_hash = std::nullopt,
                    wallet::WalletError* error = nullptr);

  bool UpdateReceipt(const std::string& address, const std::string& id,
                     std::uint64_t block_number, std::uint64_t gas_used,
                     wallet::WalletError* error = nullptr);

  // Newest Pending entry of `kind` created within `window` of now (and, when
  // given, for exactly `amount`). Used to recover an entry whose id was lost.
  std::optional<LedgerEntry> FindStalePending(const std::string& address, EntryKind kind,
                                              std::chrono::milliseconds window,
                                              std::optional<primitives::Amount> amount =
                                                  std::nullopt);

  std::optional<LedgerEntry> Find(const std::string& address, const std::string& id);
  std::optional<LedgerEntry> LatestOfKind(const std::string& address, EntryKind kind);

  // Newest first; `limit` 0 means everything.
  std::optional<std::vector<LedgerEntry>> History(const std::string& address,
                                                  std::size_t limit = 0,
                                                  wallet::WalletError* error = nullptr);

  std::optional<LedgerStats> Stats(const std::string& address,
                                   StatusFilter filter = StatusFilter::kAll,
                                   wallet::WalletError* error = nullptr);

  // {walletAddress, exportDate, stats, transactions}, pretty printed.
  std::optional<std::string> ExportJson(const std::string& address,
                                        StatusFilter filter = StatusFilter::kAll,
                                        wallet::WalletError* error = nullptr);

  // Idempotent.
  bool Clear(const std::string& address, wallet::WalletError* error = nullptr);

 private:
  std::shared_ptr<std::shared_mutex> LockFor(const std::string& address);
  bool LoadLocked(const std::string& address, std::vector<LedgerEntry>* entries,
                  wallet::WalletError* error);
  bool SaveLocked(const std::string& address, const std::vector<LedgerEntry>& entries,
                  wallet::WalletError* error);
  bool MutateEntry(const std::string& address, const std::string& id,
                   const std::function<bool(LedgerEntry&, wallet::WalletError*)>& mutate,
                   wallet::WalletError* error);
  std::optional<std::string> NewId(std::int64_t now_ms, const std::vector<LedgerEntry>& existing,
                                   wallet::WalletError* error);

  KeyValueStore& store_;
  Clock clock_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;
};

}  // namespace rootsave::ledger
