#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "chain/chain_client.hpp"
#include "config/network.hpp"
#include "config/wallet_config.hpp"
#include "ledger/transaction_ledger.hpp"
#include "primitives/amount.hpp"
#include "wallet/credential_vault.hpp"
#include "wallet/key_material.hpp"
#include "wallet/wallet_error.hpp"

namespace rootsave::wallet {

enum class SessionState {
  kUninitialized,  // no vault entry
  kLocked,         // vault entry exists, no key in memory
  kUnlocked,       // key resident in memory
};

const char* SessionStateName(SessionState state);

struct BalanceSnapshot {
  primitives::Amount wallet_balance{0};
  primitives::Amount user_deposit{0};
  primitives::Amount current_yield{0};
  primitives::Amount total_withdrawable{0};
  std::int64_t refreshed_at_ms{0};  // 0 until the first successful refresh
};

// Orchestrates custody, the savings contract and the local ledger for one
// wallet. Construct one per process and pass it by reference.
//
// Deposit, withdraw, create, import and clear are mutually exclusive and fail
// fast with kOperationInProgress rather than queueing. A background worker
// refreshes BalanceSnapshot on request; a second worker records yield
// credits while the session is unlocked.
class WalletSession {
 public:
  // Unix time in milliseconds.
  using Clock = std::function<std::int64_t()>;

  WalletSession(CredentialVault& vault, ledger::TransactionLedger& ledger,
                chain::ChainClient& chain, config::WalletOptions options, Clock clock = {});
  ~WalletSession();

  WalletSession(const WalletSession&) = delete;
  WalletSession& operator=(const WalletSession&) = delete;

  // Checks the vault without prompting. Yields kLocked or kUninitialized.
  SessionState InitializeFromStored();

  // Generates and stores a new key pair; returns the recovery phrase, which
  // is never retrievable through this path again. kWalletExists when a vault
  // entry is already present.
  std::optional<std::string> CreateWallet(WalletError* error = nullptr);

  bool ImportWallet(std::string_view phrase, WalletError* error = nullptr);

  // true once unlocked, false when the user dismissed the prompt, nullopt
  // with `error` on any other failure.
  std::optional<bool> Unlock(WalletError* error = nullptr);

  // Wipes the in-memory key.
  void Lock();

  // Ledger first (failure is logged only), then the vault. Idempotent.
  bool ClearWallet(WalletError* error = nullptr);

  // Returns the transaction hash once the deposit is confirmed.
  std::optional<std::string> Deposit(std::string_view amount_rbtc,
                                     WalletError* error = nullptr);

  // Withdraws the contract's authoritative withdrawable amount.
  std::optional<std::string> WithdrawAll(WalletError* error = nullptr);

  // Advisory contract reads; zero when the address is unknown or the chain
  // call fails.
  primitives::Amount CurrentYield();
  primitives::Amount UserDeposit();
  primitives::Amount TotalWithdrawable();

  // Records a Completed yield credit when the tick interval has elapsed since
  // the last one and the yield grew by at least the significance threshold.
  // Returns whether an entry was written; `error` stays kNone when the tick
  // simply had nothing to record.
  bool RecordYieldTick(WalletError* error = nullptr);

  std::optional<std::vector<ledger::LedgerEntry>> History(std::size_t limit = 0,
                                                          WalletError* error = nullptr);
  std::optional<ledger::LedgerStats> Stats(WalletError* error = nullptr);
  std::optional<ledger::LedgerStats> Stats(ledger::StatusFilter filter,
                                           WalletError* error = nullptr);
  std::optional<std::string> ExportLedger(WalletError* error = nullptr);

  // Schedules a balance refresh; requests made while one runs coalesce.
  void RequestRefresh();
  // Waits until every refresh requested so far has finished.
  bool WaitForRefresh(std::chrono::milliseconds timeout);

  SessionState state() const;
  bool IsUnlocked() const;
  std::optional<std::string> address() const;
  BalanceSnapshot balance() const;
  std::string last_refresh_error() const;
  const config::NetworkConfig& network() const { return network_; }

 private:
  class OperationGuard {
   public:
    explicit OperationGuard(std::atomic<bool>& flag)
        : flag_(flag), acquired_(!flag.exchange(true, std::memory_order_acq_rel)) {}
    ~OperationGuard() {
      if (acquired_) {
        flag_.store(false, std::memory_order_release);
      }
    }
    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;

    bool acquired() const { return acquired_; }

   private:
    std::atomic<bool>& flag_;
    bool acquired_;
  };

  std::int64_t NowMs() const;
  bool UnlockedAddress(std::string* address, WalletError* error) const;
  std::optional<std::string> KnownAddress(WalletError* error) const;

  std::optional<std::string> SubmitOperation(const std::string& address, ledger::EntryKind kind,
                                             std::string_view method,
                                             primitives::Amount ledger_amount,
                                             primitives::Amount value, std::uint64_t gas_limit,
                                             std::string notes, WalletError* error);
  void MarkFailed(const std::string& address, const std::string& id, ledger::EntryKind kind,
                  primitives::Amount amount);
  bool CommitNewKeyPair(KeyPair key_pair, WalletError* error);
  primitives::Amount AdvisoryView(std::string_view method);

  void StartYieldTicker();
  void StopYieldTicker();
  void YieldTickerLoop(std::stop_token stop);
  void RefreshLoop(std::stop_token stop);
  void RefreshOnce();

  CredentialVault& vault_;
  ledger::TransactionLedger& ledger_;
  chain::ChainClient& chain_;
  const config::WalletOptions options_;
  const config::NetworkConfig network_;
  Clock clock_;

  mutable std::mutex mutex_;
  SessionState state_{SessionState::kUninitialized};
  std::optional<std::string> address_;
  std::optional<KeyPair> key_pair_;
  BalanceSnapshot balance_;
  std::string last_refresh_error_;

  std::atomic<bool> operation_in_flight_{false};
  std::mutex yield_tick_mutex_;

  std::mutex refresh_mutex_;
  std::condition_variable_any refresh_cv_;
  std::condition_variable refresh_done_cv_;
  std::uint64_t refresh_requested_{0};
  std::uint64_t refresh_completed_{0};

  std::mutex ticker_mutex_;
  std::condition_variable_any ticker_cv_;
  std::mutex worker_mutex_;

  std::jthread yield_thread_;
  std::jthread refresh_thread_;
};

}  // namespace rootsave::wallet
