#include "chain/chain_client.hpp"

#include <span>
#include <string>
#include <utility>

#include "chain/rlp.hpp"
#include "crypto/address.hpp"
#include "crypto/keccak.hpp"
#include "util/hex.hpp"

namespace rootsave::chain {

namespace {

// Fields shared by the signing and signed encodings.
std::vector<std::uint8_t> EncodeCommonFields(const TransactionIntent& intent) {
  std::vector<std::uint8_t> to;
  if (!crypto::IsValidAddress(intent.to) || !util::HexDecodePrefixed(intent.to, &to)) {
    throw std::invalid_argument("transaction target is not a valid address");
  }
  std::vector<std::uint8_t> fields;
  rlp::WriteUint(&fields, intent.nonce);
  rlp::WriteUint(&fields, intent.gas_price);
  rlp::WriteUint(&fields, intent.gas_limit);
  rlp::WriteBytes(&fields, to);
  rlp::WriteUint(&fields, intent.value);
  rlp::WriteBytes(&fields, IntentCallData(intent));
  return fields;
}

std::span<const std::uint8_t> StripLeadingZeros(std::span<const std::uint8_t> bytes) {
  while (!bytes.empty() && bytes.front() == 0) {
    bytes = bytes.subspan(1);
  }
  return bytes;
}

}  // namespace

std::array<std::uint8_t, 4> FunctionSelector(std::string_view signature) {
  const auto digest = crypto::Keccak256(signature);
  return {digest[0], digest[1], digest[2], digest[3]};
}

std::vector<std::uint8_t> IntentCallData(const TransactionIntent& intent) {
  if (intent.method.empty()) {
    return {};
  }
  const auto selector = FunctionSelector(intent.method + "()");
  return {selector.begin(), selector.end()};
}

std::vector<std::uint8_t> UnsignedTransactionPayload(const TransactionIntent& intent) {
  auto fields = EncodeCommonFields(intent);
  rlp::WriteUint(&fields, intent.chain_id);
  rlp::WriteUint(&fields, 0);
  rlp::WriteUint(&fields, 0);
  std::vector<std::uint8_t> out;
  rlp::WriteList(&out, fields);
  return out;
}

crypto::Digest32 TransactionSigningHash(const TransactionIntent& intent) {
  return crypto::Keccak256(UnsignedTransactionPayload(intent));
}

std::vector<std::uint8_t> SignedTransactionPayload(const TransactionIntent& intent,
                                                   const crypto::RecoverableSignature& signature) {
  auto fields = EncodeCommonFields(intent);
  const primitives::Amount v =
      static_cast<primitives::Amount>(signature.recovery_id) +
      static_cast<primitives::Amount>(intent.chain_id) * 2 + 35;
  rlp::WriteUint(&fields, v);
  rlp::WriteBytes(&fields, StripLeadingZeros(signature.r));
  rlp::WriteBytes(&fields, StripLeadingZeros(signature.s));
  std::vector<std::uint8_t> out;
  rlp::WriteList(&out, fields);
  return out;
}

bool VerifySignedIntent(const SignedIntent& signed_intent) {
  if (signed_intent.signature.recovery_id > 1) {
    return false;
  }
  try {
    const auto& intent = signed_intent.intent;
    if (signed_intent.raw_transaction !=
        SignedTransactionPayload(intent, signed_intent.signature)) {
      return false;
    }
    if (signed_intent.tx_hash !=
        util::HexEncodePrefixed(crypto::Keccak256(signed_intent.raw_transaction))) {
      return false;
    }
    const auto public_key =
        crypto::RecoverPublicKey(TransactionSigningHash(intent), signed_intent.signature);
    return public_key && crypto::AddressFromPublicKey(*public_key) == intent.from;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

ChainError::ChainError(Kind kind, const std::string& message, std::string revert_reason)
    : std::runtime_error(message), kind_(kind), revert_reason_(std::move(revert_reason)) {}

}  // namespace rootsave::chain
