#include "wallet/wallet_session.hpp"

#include <exception>
#include <utility>

#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::wallet {

namespace {

constexpr char kLogTag[] = "session";

std::int64_t SystemNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool FailFromChainError(const chain::ChainError& ex, WalletError* error) {
  if (ex.kind() == chain::ChainError::Kind::kRevert) {
    return SetWalletError(error, WalletErrorCode::kChainRevertError,
                          ex.revert_reason().empty() ? ex.what() : ex.revert_reason());
  }
  return SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
}

void CopyError(const WalletError& from, WalletError* to) {
  if (to) {
    *to = from;
  }
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kUninitialized:
      return "uninitialized";
    case SessionState::kLocked:
      return "locked";
    case SessionState::kUnlocked:
      return "unlocked";
  }
  return "unknown";
}

WalletSession::WalletSession(CredentialVault& vault, ledger::TransactionLedger& ledger,
                             chain::ChainClient& chain, config::WalletOptions options,
                             Clock clock)
    : vault_(vault),
      ledger_(ledger),
      chain_(chain),
      options_(std::move(options)),
      network_(config::NetworkConfigFor(options_.network)),
      clock_(std::move(clock)) {
  refresh_thread_ = std::jthread([this](std::stop_token stop) { RefreshLoop(stop); });
}

WalletSession::~WalletSession() {
  StopYieldTicker();
  refresh_thread_.request_stop();
  if (refresh_thread_.joinable()) {
    refresh_thread_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (key_pair_) {
    key_pair_->Wipe();
    key_pair_.reset();
  }
}

std::int64_t WalletSession::NowMs() const { return clock_ ? clock_() : SystemNowMs(); }

SessionState WalletSession::InitializeFromStored() {
  const auto stored = vault_.StoredAddress();
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::kUnlocked && stored && address_ == stored) {
    return state_;
  }
  if (key_pair_) {
    key_pair_->Wipe();
    key_pair_.reset();
  }
  if (stored) {
    address_ = *stored;
    state_ = SessionState::kLocked;
  } else {
    address_.reset();
    state_ = SessionState::kUninitialized;
  }
  util::LogInfo(kLogTag, std::string("startup state ") + SessionStateName(state_));
  return state_;
}

bool WalletSession::CommitNewKeyPair(KeyPair key_pair, WalletError* error) {
  WalletError store_error;
  if (!vault_.Store(key_pair, &store_error)) {
    util::LogWarn(kLogTag, std::string("storing wallet failed: ") +
                               WalletErrorCodeName(store_error.code));
    CopyError(store_error, error);
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  address_ = key_pair.address;
  state_ = SessionState::kLocked;
  return true;
}

std::optional<std::string> WalletSession::CreateWallet(WalletError* error) {
  OperationGuard guard(operation_in_flight_);
  if (!guard.acquired()) {
    SetWalletError(error, WalletErrorCode::kOperationInProgress, "another operation is running");
    return std::nullopt;
  }
  if (vault_.Exists()) {
    SetWalletError(error, WalletErrorCode::kWalletExists,
                   "a wallet is already stored on this device; clear it first");
    return std::nullopt;
  }
  WalletError generate_error;
  auto key_pair = GenerateKeyPair(options_.recovery_phrase_words, {}, &generate_error);
  if (!key_pair) {
    CopyError(generate_error, error);
    return std::nullopt;
  }
  std::string phrase = *key_pair->recovery_phrase;
  const std::string created_address = key_pair->address;
  if (!CommitNewKeyPair(std::move(*key_pair), error)) {
    util::SecureWipe(phrase);
    return std::nullopt;
  }
  util::LogInfo(kLogTag, "created wallet " + created_address);
  return phrase;
}

bool WalletSession::ImportWallet(std::string_view phrase, WalletError* error) {
  OperationGuard guard(operation_in_flight_);
  if (!guard.acquired()) {
    return SetWalletError(error, WalletErrorCode::kOperationInProgress,
                          "another operation is running");
  }
  WalletError derive_error;
  auto key_pair = KeyPairFromPhrase(phrase, &derive_error);
  if (!key_pair) {
    CopyError(derive_error, error);
    return false;
  }
  if (vault_.Exists()) {
    return SetWalletError(error, WalletErrorCode::kWalletExists,
                          "a wallet is already stored on this device; clear it first");
  }
  const std::string imported_address = key_pair->address;
  if (!CommitNewKeyPair(std::move(*key_pair), error)) {
    return false;
  }
  util::LogInfo(kLogTag, "imported wallet " + imported_address);
  return true;
}

std::optional<bool> WalletSession::Unlock(WalletError* error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kUnlocked) {
      return true;
    }
    if (state_ == SessionState::kUninitialized) {
      SetWalletError(error, WalletErrorCode::kNotFound, "no wallet has been created or imported");
      return std::nullopt;
    }
  }

  WalletError read_error;
  auto key_pair = vault_.Read(&read_error);
  if (!key_pair) {
    if (read_error.code == WalletErrorCode::kAuthenticationCancelled) {
      util::LogInfo(kLogTag, "unlock cancelled");
      return false;
    }
    if (read_error.code == WalletErrorCode::kNotFound) {
      std::lock_guard<std::mutex> lock(mutex_);
      address_.reset();
      state_ = SessionState::kUninitialized;
    }
    util::LogWarn(kLogTag,
                  std::string("unlock failed: ") + WalletErrorCodeName(read_error.code));
    CopyError(read_error, error);
    return std::nullopt;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kUninitialized) {
      // Cleared while the prompt was up.
      key_pair->Wipe();
      SetWalletError(error, WalletErrorCode::kNotFound, "wallet was cleared during unlock");
      return std::nullopt;
    }
    address_ = key_pair->address;
    key_pair_ = std::move(key_pair);
    state_ = SessionState::kUnlocked;
  }
  util::LogInfo(kLogTag, "unlocked " + *address());
  StartYieldTicker();
  RequestRefresh();
  return true;
}

void WalletSession::Lock() {
  StopYieldTicker();
  std::lock_guard<std::mutex> lock(mutex_);
  if (key_pair_) {
    key_pair_->Wipe();
    key_pair_.reset();
  }
  if (state_ == SessionState::kUnlocked) {
    state_ = SessionState::kLocked;
    util::LogInfo(kLogTag, "locked");
  }
}

bool WalletSession::ClearWallet(WalletError* error) {
  OperationGuard guard(operation_in_flight_);
  if (!guard.acquired()) {
    return SetWalletError(error, WalletErrorCode::kOperationInProgress,
                          "another operation is running");
  }
  StopYieldTicker();

  std::optional<std::string> target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = address_;
  }
  if (!target) {
    target = vault_.StoredAddress();
  }
  if (target) {
    WalletError ledger_error;
    if (!ledger_.Clear(*target, &ledger_error)) {
      util::LogWarn(kLogTag, "clearing transaction history failed: " + ledger_error.message);
    }
  }

  WalletError vault_error;
  const bool cleared = vault_.Clear(&vault_error);

  std::lock_guard<std::mutex> lock(mutex_);
  if (key_pair_) {
    key_pair_->Wipe();
    key_pair_.reset();
  }
  if (!cleared) {
    if (state_ == SessionState::kUnlocked) {
      state_ = SessionState::kLocked;
    }
    util::LogError(kLogTag, "clearing vault failed: " + vault_error.message);
    CopyError(vault_error, error);
    return false;
  }
  address_.reset();
  balance_ = BalanceSnapshot{};
  last_refresh_error_.clear();
  state_ = SessionState::kUninitialized;
  util::LogInfo(kLogTag, "wallet cleared");
  return true;
}

bool WalletSession::UnlockedAddress(std::string* address, WalletError* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kUnlocked || !address_ || !key_pair_) {
    return SetWalletError(error, WalletErrorCode::kNotUnlocked, "wallet is locked");
  }
  *address = *address_;
  return true;
}

std::optional<std::string> WalletSession::KnownAddress(WalletError* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!address_) {
    SetWalletError(error, WalletErrorCode::kNotFound, "no wallet has been created or imported");
    return std::nullopt;
  }
  return address_;
}

std::optional<std::string> WalletSession::Deposit(std::string_view amount_rbtc,
                                                  WalletError* error) {
  std::string from;
  if (!UnlockedAddress(&from, error)) {
    return std::nullopt;
  }
  OperationGuard guard(operation_in_flight_);
  if (!guard.acquired()) {
    SetWalletError(error, WalletErrorCode::kOperationInProgress, "another operation is running");
    return std::nullopt;
  }

  primitives::Amount amount = 0;
  std::string reason;
  if (!primitives::ParseRbtc(amount_rbtc, &amount, &reason)) {
    SetWalletError(error, WalletErrorCode::kInvalidAmount, reason);
    return std::nullopt;
  }
  if (amount == 0) {
    SetWalletError(error, WalletErrorCode::kInvalidAmount, "amount must be greater than zero");
    return std::nullopt;
  }
  if (amount < options_.minimum_deposit) {
    SetWalletError(error, WalletErrorCode::kInvalidAmount,
                   "minimum deposit is " + primitives::FormatRbtc(options_.minimum_deposit) +
                       " " + network_.currency_symbol);
    return std::nullopt;
  }

  return SubmitOperation(from, ledger::EntryKind::kDeposit, chain::kMethodDeposit, amount,
                         amount, options_.deposit_gas_limit, "Deposit to savings contract",
                         error);
}

std::optional<std::string> WalletSession::WithdrawAll(WalletError* error) {
  std::string from;
  if (!UnlockedAddress(&from, error)) {
    return std::nullopt;
  }
  OperationGuard guard(operation_in_flight_);
  if (!guard.acquired()) {
    SetWalletError(error, WalletErrorCode::kOperationInProgress, "another operation is running");
    return std::nullopt;
  }

  // Read just before recording so a stale cached figure is never submitted.
  primitives::Amount withdrawable = 0;
  try {
    withdrawable = chain_.ViewCall(chain::kViewTotalWithdrawable, from);
  } catch (const chain::ChainError& ex) {
    FailFromChainError(ex, error);
    return std::nullopt;
  } catch (const std::exception& ex) {
    SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
    return std::nullopt;
  }
  if (!primitives::MoneyRange(withdrawable)) {
    SetWalletError(error, WalletErrorCode::kChainTransportError,
                   "node reported a withdrawable amount above the money supply");
    return std::nullopt;
  }
  if (withdrawable == 0) {
    SetWalletError(error, WalletErrorCode::kNothingToWithdraw, "no savings to withdraw");
    return std::nullopt;
  }

  return SubmitOperation(from, ledger::EntryKind::kWithdraw, chain::kMethodWithdraw,
                         withdrawable, 0, options_.withdraw_gas_limit, "Withdraw all savings",
                         error);
}

std::optional<std::string> WalletSession::SubmitOperation(
    const std::string& address, ledger::EntryKind kind, std::string_view method,
    primitives::Amount ledger_amount, primitives::Amount value, std::uint64_t gas_limit,
    std::string notes, WalletError* error) {
  const char* kind_name = ledger::EntryKindName(kind);

  ledger::LedgerEntry entry;
  entry.address = address;
  entry.kind = kind;
  entry.amount = ledger_amount;
  entry.usd_cents = primitives::UsdCentsFor(ledger_amount, options_.usd_cents_per_rbtc).value_or(0);
  entry.status = ledger::EntryStatus::kPending;
  entry.notes = std::move(notes);

  WalletError ledger_error;
  const auto id = ledger_.Append(std::move(entry), &ledger_error);
  if (!id) {
    // Nothing is submitted without a recorded intent.
    util::LogError(kLogTag, std::string("recording ") + kind_name +
                                " failed, not submitting: " + ledger_error.message);
    CopyError(ledger_error, error);
    return std::nullopt;
  }

  chain::TransactionIntent intent;
  intent.from = address;
  intent.to = options_.contract_address;
  intent.method = std::string(method);
  intent.value = value;
  intent.gas_limit = gas_limit;
  intent.gas_price = network_.gas_price;
  intent.chain_id = network_.chain_id;
  try {
    intent.nonce = chain_.GetTransactionCount(address);
  } catch (const chain::ChainError& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " nonce lookup failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    FailFromChainError(ex, error);
    return std::nullopt;
  } catch (const std::exception& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " nonce lookup failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
    return std::nullopt;
  }

  std::vector<std::uint8_t> key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kUnlocked && key_pair_) {
      key = key_pair_->private_key;
    }
  }
  if (key.empty()) {
    MarkFailed(address, *id, kind, ledger_amount);
    SetWalletError(error, WalletErrorCode::kNotUnlocked, "wallet was locked before signing");
    return std::nullopt;
  }
  WalletError sign_error;
  auto signed_intent = SignIntent(key, intent, &sign_error);
  util::SecureWipe(key);
  if (!signed_intent) {
    MarkFailed(address, *id, kind, ledger_amount);
    CopyError(sign_error, error);
    return std::nullopt;
  }

  std::string tx_hash;
  try {
    tx_hash = chain_.Submit(*signed_intent);
  } catch (const chain::ChainError& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " broadcast failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    FailFromChainError(ex, error);
    return std::nullopt;
  } catch (const std::exception& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " broadcast failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
    return std::nullopt;
  }

  WalletError update_error;
  if (!ledger_.UpdateStatus(address, *id, ledger::EntryStatus::kPending, tx_hash,
                            &update_error)) {
    util::LogWarn(kLogTag, "attaching tx hash failed: " + update_error.message);
  }

  chain::TxReceipt receipt;
  try {
    receipt = chain_.WaitForConfirmation(tx_hash);
  } catch (const chain::ChainError& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " " + tx_hash +
                               " confirmation failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    FailFromChainError(ex, error);
    return std::nullopt;
  } catch (const std::exception& ex) {
    util::LogWarn(kLogTag, std::string(kind_name) + " " + tx_hash +
                               " confirmation failed: " + ex.what());
    MarkFailed(address, *id, kind, ledger_amount);
    SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
    return std::nullopt;
  }
  if (!receipt.success) {
    util::LogWarn(kLogTag, std::string(kind_name) + " " + tx_hash + " reverted");
    MarkFailed(address, *id, kind, ledger_amount);
    SetWalletError(error, WalletErrorCode::kChainRevertError,
                   receipt.revert_reason.empty() ? "transaction reverted" : receipt.revert_reason);
    return std::nullopt;
  }

  if (!ledger_.UpdateStatus(address, *id, ledger::EntryStatus::kCompleted, tx_hash,
                            &update_error)) {
    util::LogWarn(kLogTag, "completing " + *id + " failed: " + update_error.message);
  } else if (!ledger_.UpdateReceipt(address, *id, receipt.block_number, receipt.gas_used,
                                    &update_error)) {
    util::LogWarn(kLogTag, "recording receipt for " + *id + " failed: " + update_error.message);
  }
  util::LogInfo(kLogTag, std::string(kind_name) + " " + tx_hash + " confirmed in block " +
                             std::to_string(receipt.block_number));
  RequestRefresh();
  return tx_hash;
}

void WalletSession::MarkFailed(const std::string& address, const std::string& id,
                               ledger::EntryKind kind, primitives::Amount amount) {
  WalletError update_error;
  if (ledger_.UpdateStatus(address, id, ledger::EntryStatus::kFailed, std::nullopt,
                           &update_error)) {
    return;
  }
  util::LogWarn(kLogTag, "marking " + id + " failed: " + update_error.message);
  const auto stale = ledger_.FindStalePending(
      address, kind,
      std::chrono::duration_cast<std::chrono::milliseconds>(options_.stale_pending_window),
      amount);
  if (stale && ledger_.UpdateStatus(address, stale->id, ledger::EntryStatus::kFailed,
                                    std::nullopt, &update_error)) {
    util::LogInfo(kLogTag, "marked recent pending " + stale->id + " failed");
    return;
  }
  util::LogError(kLogTag, std::string("pending ") + ledger::EntryKindName(kind) +
                              " could not be marked failed");
}

primitives::Amount WalletSession::AdvisoryView(std::string_view method) {
  const auto target = address();
  if (!target) {
    return 0;
  }
  try {
    return chain_.ViewCall(method, *target);
  } catch (const std::exception& ex) {
    util::LogWarn(kLogTag, std::string(method) + " failed: " + ex.what());
    return 0;
  }
}

primitives::Amount WalletSession::CurrentYield() { return AdvisoryView(chain::kViewCurrentYield); }

primitives::Amount WalletSession::UserDeposit() { return AdvisoryView(chain::kViewUserDeposit); }

primitives::Amount WalletSession::TotalWithdrawable() {
  return AdvisoryView(chain::kViewTotalWithdrawable);
}

bool WalletSession::RecordYieldTick(WalletError* error) {
  std::string target;
  if (!UnlockedAddress(&target, error)) {
    return false;
  }
  primitives::Amount current = 0;
  try {
    current = chain_.ViewCall(chain::kViewCurrentYield, target);
  } catch (const chain::ChainError& ex) {
    return FailFromChainError(ex, error);
  } catch (const std::exception& ex) {
    return SetWalletError(error, WalletErrorCode::kChainTransportError, ex.what());
  }
  if (!primitives::MoneyRange(current)) {
    return SetWalletError(error, WalletErrorCode::kChainTransportError,
                          "node reported a yield above the money supply");
  }

  // Serializes the read of the last credit with the append of the next one.
  std::lock_guard<std::mutex> tick_lock(yield_tick_mutex_);
  const std::int64_t now = NowMs();
  const auto last = ledger_.LatestOfKind(target, ledger::EntryKind::kYieldCredit);
  const auto interval_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(options_.yield_tick_interval).count();
  if (last && now - last->created_at_ms < interval_ms) {
    return false;
  }
  const primitives::Amount baseline = (last && last->observed_yield) ? *last->observed_yield : 0;
  // Yield resets when savings are withdrawn; count from zero again.
  const primitives::Amount delta = current >= baseline ? current - baseline : current;
  if (delta == 0 || delta < options_.yield_significance_threshold) {
    return false;
  }

  ledger::LedgerEntry entry;
  entry.address = target;
  entry.kind = ledger::EntryKind::kYieldCredit;
  entry.amount = delta;
  entry.usd_cents = primitives::UsdCentsFor(delta, options_.usd_cents_per_rbtc).value_or(0);
  entry.created_at_ms = now;
  entry.status = ledger::EntryStatus::kCompleted;
  entry.notes =
      "Automatic yield earning (" + std::to_string(options_.annual_rate_percent) + "% APY)";
  entry.observed_yield = current;
  WalletError ledger_error;
  if (!ledger_.Append(std::move(entry), &ledger_error)) {
    CopyError(ledger_error, error);
    return false;
  }
  util::LogInfo(kLogTag, "recorded yield credit of " + primitives::FormatRbtc(delta) + " " +
                             network_.currency_symbol);
  return true;
}

std::optional<std::vector<ledger::LedgerEntry>> WalletSession::History(std::size_t limit,
                                                                       WalletError* error) {
  const auto target = KnownAddress(error);
  if (!target) {
    return std::nullopt;
  }
  return ledger_.History(*target, limit, error);
}

std::optional<ledger::LedgerStats> WalletSession::Stats(WalletError* error) {
  return Stats(options_.stats_filter, error);
}

std::optional<ledger::LedgerStats> WalletSession::Stats(ledger::StatusFilter filter,
                                                        WalletError* error) {
  const auto target = KnownAddress(error);
  if (!target) {
    return std::nullopt;
  }
  return ledger_.Stats(*target, filter, error);
}

std::optional<std::string> WalletSession::ExportLedger(WalletError* error) {
  const auto target = KnownAddress(error);
  if (!target) {
    return std::nullopt;
  }
  return ledger_.ExportJson(*target, options_.stats_filter, error);
}

void WalletSession::RequestRefresh() {
  {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    ++refresh_requested_;
  }
  refresh_cv_.notify_one();
}

bool WalletSession::WaitForRefresh(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(refresh_mutex_);
  const std::uint64_t target = refresh_requested_;
  return refresh_done_cv_.wait_for(lock, timeout,
                                   [&] { return refresh_completed_ >= target; });
}

void WalletSession::RefreshLoop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    std::uint64_t target = 0;
    {
      std::unique_lock<std::mutex> lock(refresh_mutex_);
      if (!refresh_cv_.wait(lock, stop, [&] { return refresh_requested_ != refresh_completed_; })) {
        return;
      }
      target = refresh_requested_;
    }
    RefreshOnce();
    {
      std::lock_guard<std::mutex> lock(refresh_mutex_);
      refresh_completed_ = target;
    }
    refresh_done_cv_.notify_all();
  }
}

void WalletSession::RefreshOnce() {
  std::string target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kUnlocked || !address_) {
      return;
    }
    target = *address_;
  }
  BalanceSnapshot snapshot;
  try {
    snapshot.wallet_balance = chain_.GetBalance(target);
    snapshot.user_deposit = chain_.ViewCall(chain::kViewUserDeposit, target);
    snapshot.current_yield = chain_.ViewCall(chain::kViewCurrentYield, target);
    snapshot.total_withdrawable = chain_.ViewCall(chain::kViewTotalWithdrawable, target);
  } catch (const std::exception& ex) {
    util::LogWarn(kLogTag, std::string("balance refresh failed: ") + ex.what());
    std::lock_guard<std::mutex> lock(mutex_);
    last_refresh_error_ = ex.what();
    return;
  }
  snapshot.refreshed_at_ms = NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  if (address_ != target) {
    return;
  }
  balance_ = snapshot;
  last_refresh_error_.clear();
}

void WalletSession::StartYieldTicker() {
  if (options_.yield_tick_interval.count() <= 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (yield_thread_.joinable()) {
    return;
  }
  yield_thread_ = std::jthread([this](std::stop_token stop) { YieldTickerLoop(stop); });
}

void WalletSession::StopYieldTicker() {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (!yield_thread_.joinable()) {
    return;
  }
  yield_thread_.request_stop();
  yield_thread_.join();
  yield_thread_ = std::jthread();
}

void WalletSession::YieldTickerLoop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    {
      std::unique_lock<std::mutex> lock(ticker_mutex_);
      ticker_cv_.wait_for(lock, stop, options_.yield_tick_interval, [] { return false; });
    }
    if (stop.stop_requested()) {
      return;
    }
    WalletError error;
    if (!RecordYieldTick(&error) && error.code != WalletErrorCode::kNone) {
      util::LogWarn(kLogTag, std::string("yield tick failed: ") + DescribeError(error));
    }
  }
}

SessionState WalletSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool WalletSession::IsUnlocked() const { return state() == SessionState::kUnlocked; }

std::optional<std::string> WalletSession::address() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return address_;
}

BalanceSnapshot WalletSession::balance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return balance_;
}

std::string WalletSession::last_refresh_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_refresh_error_;
}

}  // namespace rootsave::wallet
