#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/signing_key.hpp"
#include "primitives/amount.hpp"

namespace rootsave::chain {

// Savings contract entry points.
inline constexpr std::string_view kMethodDeposit = "deposit";    // payable
inline constexpr std::string_view kMethodWithdraw = "withdraw";  // withdraws everything

// Savings contract views; each takes the wallet address.
inline constexpr std::string_view kViewUserDeposit = "getUserDeposit";
inline constexpr std::string_view kViewCurrentYield = "getCurrentYield";
inline constexpr std::string_view kViewTotalWithdrawable = "getTotalWithdrawable";
inline constexpr std::string_view kViewContractBalance = "getContractBalance";

// Legacy (pre-EIP-1559) contract call carrying EIP-155 replay protection.
struct TransactionIntent {
  std::string from;
  std::string to;
  std::string method;  // empty for a plain value transfer
  primitives::Amount value{0};
  std::uint64_t nonce{0};  // sender account nonce
  std::uint64_t gas_limit{0};
  std::uint64_t gas_price{0};
  std::uint64_t chain_id{0};
};

// First four bytes of Keccak-256 over a function signature such as
// "deposit()".
std::array<std::uint8_t, 4> FunctionSelector(std::string_view signature);

// Calldata for a zero-argument contract method; empty for a plain transfer.
std::vector<std::uint8_t> IntentCallData(const TransactionIntent& intent);

// RLP [nonce, gasPrice, gas, to, value, data, chainId, 0, 0]. Throws
// std::invalid_argument when `to` is not a canonical address.
std::vector<std::uint8_t> UnsignedTransactionPayload(const TransactionIntent& intent);

// Keccak-256 of the unsigned payload; this is the signed digest.
crypto::Digest32 TransactionSigningHash(const TransactionIntent& intent);

// RLP [nonce, gasPrice, gas, to, value, data, v, r, s] with
// v = recovery_id + chain_id * 2 + 35.
std::vector<std::uint8_t> SignedTransactionPayload(const TransactionIntent& intent,
                                                   const crypto::RecoverableSignature& signature);

struct SignedIntent {
  TransactionIntent intent;
  std::vector<std::uint8_t> raw_transaction;
  std::string tx_hash;  // "0x" + Keccak-256 of raw_transaction
  crypto::RecoverableSignature signature;
};

// Re-encodes the intent, checks the raw bytes and hash match, and recovers
// the signer, which must be `intent.from`.
bool VerifySignedIntent(const SignedIntent& signed_intent);

struct TxReceipt {
  bool success{false};
  std::uint64_t block_number{0};
  std::uint64_t gas_used{0};
  std::string revert_reason;
};

class ChainError : public std::runtime_error {
 public:
  enum class Kind {
    kTransport,
    kRevert,
  };

  ChainError(Kind kind, const std::string& message, std::string revert_reason = {});

  Kind kind() const noexcept { return kind_; }
  const std::string& revert_reason() const noexcept { return revert_reason_; }

 private:
  Kind kind_;
  std::string revert_reason_;
};

// Chain access capability. Implementations own transport, retries and
// timeouts, report failures by throwing ChainError, and must be safe to call
// from several threads at once.
class ChainClient {
 public:
  virtual ~ChainClient() = default;

  // Broadcasts the transaction and returns its hash.
  virtual std::string Submit(const SignedIntent& intent) = 0;

  // Next nonce for `address`, counting pending transactions.
  virtual std::uint64_t GetTransactionCount(const std::string& address) = 0;

  // Blocks until the transaction is mined or the implementation times out.
  virtual TxReceipt WaitForConfirmation(const std::string& tx_hash) = 0;

  virtual primitives::Amount ViewCall(std::string_view method, const std::string& address) = 0;

  virtual primitives::Amount GetBalance(const std::string& address) = 0;
};

}  // namespace rootsave::chain
