#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "chain/chain_client.hpp"
#include "ledger/transaction_ledger.hpp"
#include "test_fakes.hpp"
#include "wallet/credential_vault.hpp"
#include "wallet/key_material.hpp"
#include "wallet/wallet_session.hpp"

using namespace rootsave;
using ledger::EntryKind;
using ledger::EntryStatus;
using wallet::SessionState;
using wallet::WalletErrorCode;

namespace {

const std::string kPhrase =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";
const std::string kContract = "0x" + std::string(40, '5');
constexpr primitives::Amount kCentiRbtc = primitives::kWeiPerRbtc / 100;
constexpr primitives::Amount kMicroRbtc = primitives::kWeiPerRbtc / 1'000'000;
constexpr auto kRefreshTimeout = std::chrono::seconds(10);

config::WalletOptions TestOptions() {
  config::WalletOptions options;
  options.contract_address = kContract;
  return options;
}

struct Harness {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault{storage};
  test::FailingKeyValueStore store;
  test::ManualClock clock;
  ledger::TransactionLedger ledger{store, clock.AsClock()};
  test::FakeChainClient chain;
  std::unique_ptr<wallet::WalletSession> session;

  explicit Harness(config::WalletOptions options = TestOptions()) {
    session = std::make_unique<wallet::WalletSession>(vault, ledger, chain, std::move(options),
                                                      clock.AsClock());
  }
};

bool ExpectCode(const wallet::WalletError& error, WalletErrorCode code, const char* what) {
  if (error.code != code) {
    std::cerr << what << ": expected " << wallet::WalletErrorCodeName(code) << ", got "
              << wallet::WalletErrorCodeName(error.code) << " (" << error.message << ")\n";
    return false;
  }
  return true;
}

bool ImportAndUnlock(Harness& h) {
  wallet::WalletError error;
  if (!h.session->ImportWallet(kPhrase, &error)) {
    std::cerr << "Import failed: " << error.message << "\n";
    return false;
  }
  const auto unlocked = h.session->Unlock(&error);
  if (!unlocked || !*unlocked || !h.session->IsUnlocked()) {
    std::cerr << "Unlock failed: " << error.message << "\n";
    return false;
  }
  return true;
}

bool TestStateMachine() {
  Harness h;
  wallet::WalletError error;
  if (h.session->InitializeFromStored() != SessionState::kUninitialized || h.session->address()) {
    std::cerr << "Fresh device must start uninitialized\n";
    return false;
  }
  if (h.session->Unlock(&error) ||
      !ExpectCode(error, WalletErrorCode::kNotFound, "unlock uninitialized")) {
    return false;
  }
  error = {};
  if (h.session->Deposit("0.01", &error) ||
      !ExpectCode(error, WalletErrorCode::kNotUnlocked, "deposit uninitialized")) {
    return false;
  }

  error = {};
  const auto phrase = h.session->CreateWallet(&error);
  if (!phrase || h.session->state() != SessionState::kLocked || !h.session->address()) {
    std::cerr << "CreateWallet did not reach Locked: " << error.message << "\n";
    return false;
  }
  const auto restored = wallet::KeyPairFromPhrase(*phrase);
  if (!restored || restored->address != *h.session->address()) {
    std::cerr << "Returned phrase does not restore the created wallet\n";
    return false;
  }
  if (h.storage.get_calls() != 0) {
    std::cerr << "CreateWallet must not read the vault back\n";
    return false;
  }

  error = {};
  if (h.session->Deposit("0.01", &error) ||
      !ExpectCode(error, WalletErrorCode::kNotUnlocked, "deposit locked")) {
    return false;
  }
  error = {};
  if (h.session->WithdrawAll(&error) ||
      !ExpectCode(error, WalletErrorCode::kNotUnlocked, "withdraw locked")) {
    return false;
  }
  error = {};
  if (h.session->CreateWallet(&error) ||
      !ExpectCode(error, WalletErrorCode::kWalletExists, "create twice")) {
    return false;
  }
  error = {};
  if (h.session->ImportWallet(kPhrase, &error) ||
      !ExpectCode(error, WalletErrorCode::kWalletExists, "import over existing")) {
    return false;
  }

  const auto unlocked = h.session->Unlock(&error);
  if (!unlocked || !*unlocked || h.session->state() != SessionState::kUnlocked) {
    std::cerr << "Unlock from Locked failed\n";
    return false;
  }
  h.session->Lock();
  if (h.session->state() != SessionState::kLocked || !h.session->address()) {
    std::cerr << "Lock must return to Locked and keep the address\n";
    return false;
  }

  // A restarted process finds the stored wallet without prompting.
  wallet::WalletSession restarted(h.vault, h.ledger, h.chain, TestOptions(), h.clock.AsClock());
  if (restarted.InitializeFromStored() != SessionState::kLocked ||
      restarted.address() != h.session->address()) {
    std::cerr << "Restarted session did not find the stored wallet\n";
    return false;
  }
  return true;
}

bool TestImportRejectsBadPhrase() {
  Harness h;
  wallet::WalletError error;
  if (h.session->ImportWallet("legal winner thank", &error) ||
      !ExpectCode(error, WalletErrorCode::kInvalidPhrase, "short phrase")) {
    return false;
  }
  if (h.session->state() != SessionState::kUninitialized || h.vault.Exists()) {
    std::cerr << "Rejected import changed state\n";
    return false;
  }
  h.storage.SetPutStatus(wallet::StorageStatus::kUnavailable);
  error = {};
  if (h.session->ImportWallet(kPhrase, &error) ||
      !ExpectCode(error, WalletErrorCode::kVaultUnavailable, "import without screen lock")) {
    return false;
  }
  if (wallet::DescribeError(error).empty() || h.session->state() != SessionState::kUninitialized) {
    std::cerr << "VaultUnavailable must be described and leave the session uninitialized\n";
    return false;
  }
  return true;
}

// Scenario A.
bool TestSuccessfulDeposit() {
  Harness h;
  h.chain.SetBalance(primitives::kWeiPerRbtc);
  h.chain.SetView(chain::kViewUserDeposit, kCentiRbtc);
  h.chain.SetView(chain::kViewCurrentYield, 7);
  h.chain.SetView(chain::kViewTotalWithdrawable, kCentiRbtc + 7);
  h.chain.SetNextNonce(12);
  if (!ImportAndUnlock(h)) {
    return false;
  }

  wallet::WalletError error;
  const auto hash = h.session->Deposit("0.01", &error);
  if (!hash || *hash != "0xabc123") {
    std::cerr << "Deposit failed: " << error.message << "\n";
    return false;
  }
  const auto history = h.session->History(0, &error);
  if (!history || history->size() != 1) {
    std::cerr << "Expected exactly one ledger entry\n";
    return false;
  }
  const auto& entry = history->front();
  if (entry.kind != EntryKind::kDeposit || entry.status != EntryStatus::kCompleted ||
      entry.tx_hash != "0xabc123" || entry.amount != kCentiRbtc ||
      entry.block_number != std::uint64_t{4242} || entry.gas_used != std::uint64_t{51234} ||
      entry.usd_cents != 43'000 || entry.notes != "Deposit to savings contract") {
    std::cerr << "Unexpected deposit entry\n";
    return false;
  }
  const auto stats = h.session->Stats(&error);
  if (!stats || stats->total_deposits != kCentiRbtc) {
    std::cerr << "Stats must report the 0.01 deposit\n";
    return false;
  }

  const auto submitted = h.chain.submitted();
  if (submitted.size() != 1) {
    std::cerr << "Expected one submission\n";
    return false;
  }
  const auto& intent = submitted.front().intent;
  if (intent.method != chain::kMethodDeposit || intent.value != kCentiRbtc ||
      intent.gas_limit != 100'000 || intent.gas_price != 65'000'000 || intent.chain_id != 31 ||
      intent.to != kContract || intent.from != *h.session->address() || intent.nonce != 12) {
    std::cerr << "Unexpected deposit intent with nonce " << intent.nonce << "\n";
    return false;
  }
  if (!chain::VerifySignedIntent(submitted.front())) {
    std::cerr << "Submitted intent is not correctly signed\n";
    return false;
  }

  if (!h.session->WaitForRefresh(kRefreshTimeout)) {
    std::cerr << "Balance refresh did not finish\n";
    return false;
  }
  const auto balance = h.session->balance();
  if (balance.wallet_balance != primitives::kWeiPerRbtc || balance.user_deposit != kCentiRbtc ||
      balance.current_yield != 7 || balance.total_withdrawable != kCentiRbtc + 7 ||
      balance.refreshed_at_ms != h.clock.now() || !h.session->last_refresh_error().empty()) {
    std::cerr << "Balance snapshot not refreshed\n";
    return false;
  }
  return true;
}

bool TestWithdraw() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  // Scenario B.
  wallet::WalletError error;
  if (h.session->WithdrawAll(&error) ||
      !ExpectCode(error, WalletErrorCode::kNothingToWithdraw, "empty withdraw")) {
    return false;
  }
  if (!h.session->History()->empty() || !h.chain.submitted().empty()) {
    std::cerr << "NothingToWithdraw must not record or submit anything\n";
    return false;
  }

  h.chain.SetView(chain::kViewTotalWithdrawable, 5 * kCentiRbtc);
  error = {};
  if (!h.session->WithdrawAll(&error)) {
    std::cerr << "Withdraw failed: " << error.message << "\n";
    return false;
  }
  const auto entry = h.session->History()->front();
  if (entry.kind != EntryKind::kWithdraw || entry.amount != 5 * kCentiRbtc ||
      entry.status != EntryStatus::kCompleted || entry.notes != "Withdraw all savings") {
    std::cerr << "Unexpected withdraw entry\n";
    return false;
  }
  const auto intent = h.chain.submitted().front().intent;
  if (intent.method != chain::kMethodWithdraw || intent.value != 0 ||
      intent.gas_limit != 150'000) {
    std::cerr << "Unexpected withdraw intent\n";
    return false;
  }

  h.chain.SetViewsFail(true);
  error = {};
  if (h.session->WithdrawAll(&error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "withdraw view failure")) {
    return false;
  }
  if (h.session->History()->size() != 1) {
    std::cerr << "Failed withdrawable read must not record an entry\n";
    return false;
  }
  return true;
}

// Scenario C.
bool TestCancelledUnlock() {
  Harness h;
  wallet::WalletError error;
  if (!h.session->ImportWallet(kPhrase, &error)) {
    std::cerr << "Import failed\n";
    return false;
  }
  h.storage.QueueGetOutcome(wallet::StorageStatus::kCancelled);
  const auto result = h.session->Unlock(&error);
  if (!result || *result || error.code != WalletErrorCode::kNone ||
      h.session->state() != SessionState::kLocked) {
    std::cerr << "Cancelled unlock must return false and stay Locked\n";
    return false;
  }
  h.storage.QueueGetOutcome(wallet::StorageStatus::kAuthFailed);
  if (h.session->Unlock(&error) ||
      !ExpectCode(error, WalletErrorCode::kAuthenticationFailed, "rejected unlock") ||
      h.session->state() != SessionState::kLocked) {
    return false;
  }
  const auto retried = h.session->Unlock(&error);
  if (!retried || !*retried) {
    std::cerr << "Unlock must succeed after a cancelled attempt\n";
    return false;
  }
  return true;
}

// Scenario D and the other chain failure paths.
bool TestChainFailuresMarkEntriesFailed() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  wallet::WalletError error;
  h.chain.FailNextSubmit(chain::ChainError(chain::ChainError::Kind::kTransport, "connection reset"));
  if (h.session->Deposit("0.02", &error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "broadcast failure")) {
    return false;
  }
  auto entry = h.session->History()->front();
  if (entry.status != EntryStatus::kFailed || entry.amount != 2 * kCentiRbtc || entry.tx_hash) {
    std::cerr << "Broadcast failure must leave a Failed entry without hash\n";
    return false;
  }
  const std::string address = *h.session->address();
  if (h.ledger.FindStalePending(address, EntryKind::kDeposit, std::chrono::minutes(5))) {
    std::cerr << "No deposit may remain Pending after a failure\n";
    return false;
  }
  const auto stats = h.session->Stats(ledger::StatusFilter::kAll, &error);
  if (!stats || stats->total_deposits != 2 * kCentiRbtc) {
    std::cerr << "Default stats still count the failed deposit\n";
    return false;
  }
  const auto completed = h.session->Stats(ledger::StatusFilter::kCompletedOnly, &error);
  if (!completed || completed->total_deposits != 0) {
    std::cerr << "CompletedOnly stats must skip the failed deposit\n";
    return false;
  }

  error = {};
  h.chain.FailNextConfirmation(chain::ChainError(chain::ChainError::Kind::kRevert,
                                                 "execution reverted", "Deposit already active"));
  if (h.session->Deposit("0.01", &error) ||
      !ExpectCode(error, WalletErrorCode::kChainRevertError, "confirmation revert")) {
    return false;
  }
  if (error.message != "Deposit already active") {
    std::cerr << "Revert reason not propagated: " << error.message << "\n";
    return false;
  }
  entry = h.session->History()->front();
  if (entry.status != EntryStatus::kFailed || entry.tx_hash != "0xabc123") {
    std::cerr << "Confirmation failure must keep the hash and mark Failed\n";
    return false;
  }

  error = {};
  h.chain.SetReceipt(chain::TxReceipt{false, 10, 30'000, ""});
  h.chain.SetView(chain::kViewTotalWithdrawable, kCentiRbtc);
  error = {};
  if (h.session->WithdrawAll(&error) ||
      !ExpectCode(error, WalletErrorCode::kChainRevertError, "reverted receipt")) {
    return false;
  }
  if (h.session->History()->front().status != EntryStatus::kFailed ||
      wallet::DescribeError(error).empty()) {
    std::cerr << "Reverted receipt must mark the withdraw Failed\n";
    return false;
  }
  return true;
}

bool TestInvalidAmounts() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  for (const char* amount : {"0", "", "-1", "abc", "1e-2", "0.0001", "0.0000000000000000001"}) {
    wallet::WalletError error;
    if (h.session->Deposit(amount, &error) ||
        !ExpectCode(error, WalletErrorCode::kInvalidAmount, amount)) {
      return false;
    }
  }
  if (!h.session->History()->empty() || !h.chain.submitted().empty()) {
    std::cerr << "Rejected amounts must not touch the ledger or chain\n";
    return false;
  }
  return true;
}

bool TestLedgerFailureBlocksSubmission() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.store.set_fail_writes(true);
  wallet::WalletError error;
  if (h.session->Deposit("0.01", &error) ||
      !ExpectCode(error, WalletErrorCode::kStorageError, "ledger write failure")) {
    return false;
  }
  if (!h.chain.submitted().empty()) {
    std::cerr << "Nothing may be submitted without a recorded intent\n";
    return false;
  }
  return true;
}

bool TestConcurrentOperationsFailFast() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.chain.SetView(chain::kViewTotalWithdrawable, kCentiRbtc);
  h.chain.HoldSubmit();
  std::optional<std::string> first_hash;
  std::thread first([&] { first_hash = h.session->Deposit("0.01"); });
  h.chain.WaitForSubmitEntered();

  wallet::WalletError error;
  const bool deposit_blocked = !h.session->Deposit("0.01", &error) &&
                               error.code == WalletErrorCode::kOperationInProgress;
  error = {};
  const bool withdraw_blocked = !h.session->WithdrawAll(&error) &&
                                error.code == WalletErrorCode::kOperationInProgress;
  error = {};
  const bool clear_blocked =
      !h.session->ClearWallet(&error) && error.code == WalletErrorCode::kOperationInProgress;

  h.chain.ReleaseSubmit();
  first.join();
  if (!deposit_blocked || !withdraw_blocked || !clear_blocked) {
    std::cerr << "Overlapping operations must fail with OperationInProgress\n";
    return false;
  }
  if (!first_hash || h.chain.submitted().size() != 1 || h.session->History()->size() != 1) {
    std::cerr << "The first deposit must complete alone\n";
    return false;
  }
  if (!h.session->Deposit("0.01")) {
    std::cerr << "Deposits must be accepted again once the first finished\n";
    return false;
  }
  return true;
}

// A by-id failure update falls back to the most recent Pending entry of the
// same kind and amount inside the stale window.
bool TestFailedUpdateFallsBackToRecentPending() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  const std::string address = *h.session->address();
  const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(
      TestOptions().stale_pending_window);

  ledger::LedgerEntry old_entry;
  old_entry.address = address;
  old_entry.kind = EntryKind::kDeposit;
  old_entry.amount = kCentiRbtc;
  old_entry.status = EntryStatus::kPending;
  old_entry.created_at_ms = h.clock.now() - window.count() - 60'000;
  const auto old_id = h.ledger.Append(old_entry);
  if (!old_id) {
    std::cerr << "Seeding the old pending deposit failed\n";
    return false;
  }

  // The append goes through; the by-id Failed update is rejected once.
  h.store.FailWritesAfter(1, 1);
  h.chain.FailNextSubmit(chain::ChainError(chain::ChainError::Kind::kTransport, "timeout"));
  wallet::WalletError error;
  if (h.session->Deposit("0.01", &error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "broadcast failure")) {
    return false;
  }

  const auto history = h.ledger.History(address);
  if (!history || history->size() != 2) {
    std::cerr << "Expected the old and the new deposit\n";
    return false;
  }
  const auto& recent = history->front();
  const auto& old = history->back();
  if (recent.id == *old_id || recent.status != EntryStatus::kFailed) {
    std::cerr << "Recent pending deposit was not marked Failed by the fallback\n";
    return false;
  }
  if (old.id != *old_id || old.status != EntryStatus::kPending) {
    std::cerr << "Pending entry outside the window must be left untouched\n";
    return false;
  }
  return true;
}

// Amounts the ledger could not read back after a restart are refused before
// anything is recorded.
bool TestOutOfRangeChainValuesAreRejected() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.chain.SetView(chain::kViewTotalWithdrawable, primitives::kMaxMoney + 1);
  wallet::WalletError error;
  if (h.session->WithdrawAll(&error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "withdrawable overflow")) {
    return false;
  }
  if (!h.chain.submitted().empty()) {
    std::cerr << "Out-of-range withdrawable must not be submitted\n";
    return false;
  }

  h.chain.SetView(chain::kViewCurrentYield, primitives::kMaxMoney + 1);
  error = {};
  if (h.session->RecordYieldTick(&error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "yield overflow")) {
    return false;
  }

  error = {};
  const auto history = h.session->History(0, &error);
  if (!history || !history->empty()) {
    std::cerr << "Ledger must stay empty and readable: " << error.message << "\n";
    return false;
  }
  h.chain.SetView(chain::kViewTotalWithdrawable, primitives::kMaxMoney);
  if (!h.session->WithdrawAll(&error) || h.session->History()->size() != 1) {
    std::cerr << "The full money supply is still a valid withdrawal\n";
    return false;
  }
  return true;
}

bool TestConcurrentYieldTicksRecordOnce() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.chain.SetView(chain::kViewCurrentYield, 5 * kMicroRbtc);
  std::vector<std::thread> tickers;
  for (int i = 0; i < 4; ++i) {
    tickers.emplace_back([&] { h.session->RecordYieldTick(); });
  }
  for (auto& ticker : tickers) {
    ticker.join();
  }
  const auto history = h.session->History();
  if (!history || history->size() != 1 || history->front().kind != EntryKind::kYieldCredit) {
    std::cerr << "Concurrent ticks must record exactly one yield credit\n";
    return false;
  }
  return true;
}

bool TestLockedCallsDuringOperationReportNotUnlocked() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.chain.SetView(chain::kViewTotalWithdrawable, kCentiRbtc);
  h.chain.HoldSubmit();
  std::thread first([&] { h.session->Deposit("0.01"); });
  h.chain.WaitForSubmitEntered();
  h.session->Lock();

  wallet::WalletError deposit_error;
  const bool deposit_rejected = !h.session->Deposit("0.01", &deposit_error);
  wallet::WalletError withdraw_error;
  const bool withdraw_rejected = !h.session->WithdrawAll(&withdraw_error);

  h.chain.ReleaseSubmit();
  first.join();
  return deposit_rejected && withdraw_rejected &&
         ExpectCode(deposit_error, WalletErrorCode::kNotUnlocked, "deposit after lock") &&
         ExpectCode(withdraw_error, WalletErrorCode::kNotUnlocked, "withdraw after lock");
}

bool TestAdvisoryReadsNeverFail() {
  Harness h;
  if (h.session->CurrentYield() != 0 || h.session->TotalWithdrawable() != 0) {
    std::cerr << "Reads without a wallet must be zero\n";
    return false;
  }
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.chain.SetView(chain::kViewCurrentYield, 11);
  h.chain.SetView(chain::kViewUserDeposit, 22);
  h.chain.SetView(chain::kViewTotalWithdrawable, 33);
  if (h.session->CurrentYield() != 11 || h.session->UserDeposit() != 22 ||
      h.session->TotalWithdrawable() != 33) {
    std::cerr << "Advisory reads returned wrong values\n";
    return false;
  }
  if (!h.session->WaitForRefresh(kRefreshTimeout)) {
    std::cerr << "Unlock refresh did not finish\n";
    return false;
  }
  h.chain.SetViewsFail(true);
  if (h.session->CurrentYield() != 0 || h.session->UserDeposit() != 0 ||
      h.session->TotalWithdrawable() != 0) {
    std::cerr << "Failing advisory reads must fall back to zero\n";
    return false;
  }
  const auto before = h.session->balance();
  h.session->RequestRefresh();
  if (!h.session->WaitForRefresh(kRefreshTimeout)) {
    std::cerr << "Failed refresh did not finish\n";
    return false;
  }
  if (h.session->last_refresh_error().empty() ||
      h.session->balance().refreshed_at_ms != before.refreshed_at_ms) {
    std::cerr << "Refresh failure must be recorded and keep the last snapshot\n";
    return false;
  }
  return true;
}

bool TestClearWallet() {
  Harness h;
  if (!ImportAndUnlock(h)) {
    return false;
  }
  const std::string address = *h.session->address();
  if (!h.session->Deposit("0.01")) {
    std::cerr << "Deposit failed\n";
    return false;
  }
  wallet::WalletError error;
  if (!h.session->ClearWallet(&error) || !h.session->ClearWallet(&error)) {
    std::cerr << "ClearWallet must succeed twice: " << error.message << "\n";
    return false;
  }
  if (h.session->state() != SessionState::kUninitialized || h.vault.Exists() ||
      !h.ledger.History(address)->empty()) {
    std::cerr << "ClearWallet left state behind\n";
    return false;
  }

  // History loss is tolerated; key loss is not.
  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.store.set_fail_writes(true);
  if (!h.session->ClearWallet(&error) || h.vault.Exists()) {
    std::cerr << "Ledger failure must not block clearing the vault\n";
    return false;
  }
  h.store.set_fail_writes(false);

  if (!ImportAndUnlock(h)) {
    return false;
  }
  h.storage.SetDeleteStatus(wallet::StorageStatus::kIoError);
  error = {};
  if (h.session->ClearWallet(&error) ||
      !ExpectCode(error, WalletErrorCode::kStorageError, "vault delete failure")) {
    return false;
  }
  if (h.session->state() != SessionState::kLocked) {
    std::cerr << "Failed clear must still drop the in-memory key\n";
    return false;
  }
  return true;
}

bool TestYieldTicks() {
  Harness h;
  wallet::WalletError error;
  if (h.session->RecordYieldTick(&error) ||
      !ExpectCode(error, WalletErrorCode::kNotUnlocked, "tick while uninitialized")) {
    return false;
  }
  if (!ImportAndUnlock(h)) {
    return false;
  }
  auto tick = [&](primitives::Amount current_yield) {
    h.chain.SetView(chain::kViewCurrentYield, current_yield);
    error = {};
    return h.session->RecordYieldTick(&error);
  };

  if (tick(0) || error.code != WalletErrorCode::kNone) {
    std::cerr << "Zero yield must record nothing\n";
    return false;
  }
  if (!tick(5 * kMicroRbtc)) {
    std::cerr << "First significant yield must be recorded\n";
    return false;
  }
  const auto first = h.session->History()->front();
  if (first.kind != EntryKind::kYieldCredit || first.status != EntryStatus::kCompleted ||
      first.amount != 5 * kMicroRbtc || first.observed_yield != 5 * kMicroRbtc ||
      first.notes != "Automatic yield earning (5% APY)") {
    std::cerr << "Unexpected yield credit entry\n";
    return false;
  }
  if (tick(9 * kMicroRbtc)) {
    std::cerr << "A second credit inside the tick interval must be skipped\n";
    return false;
  }
  h.clock.AdvanceSeconds(3600);
  if (!tick(9 * kMicroRbtc) || h.session->History()->front().amount != 4 * kMicroRbtc) {
    std::cerr << "Credit must be the growth since the last recorded yield\n";
    return false;
  }
  h.clock.AdvanceSeconds(3600);
  if (tick(9 * kMicroRbtc + kMicroRbtc / 2) || error.code != WalletErrorCode::kNone) {
    std::cerr << "Growth below the significance threshold must be skipped\n";
    return false;
  }
  h.clock.AdvanceSeconds(3600);
  if (!tick(2 * kMicroRbtc) || h.session->History()->front().amount != 2 * kMicroRbtc) {
    std::cerr << "Yield reset must count from zero\n";
    return false;
  }
  const auto stats = h.session->Stats(&error);
  if (!stats || stats->total_yield_earned != 11 * kMicroRbtc) {
    std::cerr << "Unexpected yield total\n";
    return false;
  }

  h.clock.AdvanceSeconds(3600);
  h.chain.SetViewsFail(true);
  error = {};
  if (h.session->RecordYieldTick(&error) ||
      !ExpectCode(error, WalletErrorCode::kChainTransportError, "tick with failing chain")) {
    return false;
  }
  h.chain.SetViewsFail(false);
  h.session->Lock();
  error = {};
  if (h.session->RecordYieldTick(&error) ||
      !ExpectCode(error, WalletErrorCode::kNotUnlocked, "tick while locked")) {
    return false;
  }
  return true;
}

bool TestExportLedger() {
  Harness h;
  if (!ImportAndUnlock(h) || !h.session->Deposit("0.01")) {
    std::cerr << "Setup failed\n";
    return false;
  }
  wallet::WalletError error;
  const auto exported = h.session->ExportLedger(&error);
  if (!exported || exported->find("\"totalDeposits\": \"0.01\"") == std::string::npos ||
      exported->find(*h.session->address()) == std::string::npos) {
    std::cerr << "Unexpected export: " << (exported ? *exported : error.message) << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestStateMachine() || !TestImportRejectsBadPhrase() || !TestSuccessfulDeposit() ||
        !TestWithdraw() || !TestCancelledUnlock() || !TestChainFailuresMarkEntriesFailed() ||
        !TestInvalidAmounts() || !TestLedgerFailureBlocksSubmission() ||
        !TestConcurrentOperationsFailFast() || !TestFailedUpdateFallsBackToRecentPending() ||
        !TestOutOfRangeChainValuesAreRejected() || !TestConcurrentYieldTicksRecordOnce() ||
        !TestLockedCallsDuringOperationReportNotUnlocked() || !TestAdvisoryReadsNeverFail() ||
        !TestClearWallet() || !TestYieldTicks() || !TestExportLedger()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "wallet_session_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
