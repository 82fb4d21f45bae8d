#include "wallet/key_material.hpp"

#include <exception>

#include "crypto/address.hpp"
#include "crypto/bip32.hpp"
#include "crypto/keccak.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/signing_key.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::wallet {

namespace {

std::optional<KeyPair> DeriveFromCanonicalPhrase(std::string canonical, WalletError* error) {
  auto seed = crypto::MnemonicSeedFromSentence(canonical, "");
  std::string reason;
  const auto account = crypto::DerivePath(seed, crypto::kEthereumDerivationPath, &reason);
  util::SecureWipe(seed);
  if (!account) {
    util::SecureWipe(canonical);
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, reason);
    return std::nullopt;
  }

  KeyPair pair;
  pair.private_key.assign(account->secret.begin(), account->secret.end());
  auto address = AddressFromPrivateKey(pair.private_key, error);
  if (!address) {
    util::SecureWipe(canonical);
    return std::nullopt;
  }
  pair.address = std::move(*address);
  pair.recovery_phrase = std::move(canonical);
  return pair;
}

}  // namespace

KeyPair::~KeyPair() { Wipe(); }

void KeyPair::Wipe() noexcept {
  util::SecureWipe(private_key);
  if (recovery_phrase) {
    util::SecureWipe(*recovery_phrase);
    recovery_phrase.reset();
  }
}

std::optional<KeyPair> GenerateKeyPair(std::size_t word_count,
                                       const EntropySource& entropy_source,
                                       WalletError* error) {
  if (word_count != crypto::kMnemonicWords12 && word_count != crypto::kMnemonicWords24) {
    SetWalletError(error, WalletErrorCode::kInvalidPhrase,
                   "recovery phrase length must be 12 or 24 words");
    return std::nullopt;
  }
  std::vector<std::uint8_t> entropy(word_count == crypto::kMnemonicWords12 ? 16 : 32);
  std::string reason;
  const bool filled = entropy_source ? entropy_source(entropy, &reason)
                                     : util::FillSecureRandomBytes(entropy, &reason);
  if (!filled) {
    util::SecureWipe(entropy);
    SetWalletError(error, WalletErrorCode::kEntropyError,
                   reason.empty() ? "secure random source unavailable" : reason);
    return std::nullopt;
  }
  std::string sentence = crypto::MnemonicFromEntropy(entropy);
  util::SecureWipe(entropy);
  return DeriveFromCanonicalPhrase(std::move(sentence), error);
}

std::optional<KeyPair> KeyPairFromPhrase(std::string_view phrase, WalletError* error) {
  std::string canonical;
  std::string reason;
  if (!crypto::ValidateMnemonic(phrase, &canonical, &reason)) {
    SetWalletError(error, WalletErrorCode::kInvalidPhrase, reason);
    return std::nullopt;
  }
  return DeriveFromCanonicalPhrase(std::move(canonical), error);
}

bool ValidatePhrase(std::string_view phrase, std::string* reason) {
  return crypto::ValidateMnemonic(phrase, nullptr, reason);
}

std::optional<std::string> AddressFromPrivateKey(std::span<const std::uint8_t> private_key,
                                                 WalletError* error) {
  if (private_key.size() != crypto::kSecretKeyBytes) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "private key must be exactly 32 bytes");
    return std::nullopt;
  }
  if (!crypto::IsValidSecretKey(private_key)) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "private key is outside the secp256k1 scalar range");
    return std::nullopt;
  }
  try {
    const auto key = crypto::SigningKey::FromSecret(private_key);
    return crypto::AddressFromPublicKey(key.PublicKey());
  } catch (const std::exception& ex) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, ex.what());
    return std::nullopt;
  }
}

std::string EncodePrivateKey(std::span<const std::uint8_t> private_key) {
  return util::HexEncodePrefixed(private_key);
}

bool DecodePrivateKey(std::string_view text, std::vector<std::uint8_t>* out) {
  if (text.size() != 2 + crypto::kSecretKeyBytes * 2) {
    return false;
  }
  return util::HexDecodePrefixed(text, out);
}

std::optional<chain::SignedIntent> SignIntent(std::span<const std::uint8_t> private_key,
                                              const chain::TransactionIntent& intent,
                                              WalletError* error) {
  if (private_key.size() != crypto::kSecretKeyBytes || !crypto::IsValidSecretKey(private_key)) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "private key must be a 32-byte secp256k1 secret");
    return std::nullopt;
  }
  if (!crypto::IsValidAddress(intent.from) || !crypto::IsValidAddress(intent.to)) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "transaction addresses must be canonical");
    return std::nullopt;
  }
  try {
    const auto key = crypto::SigningKey::FromSecret(private_key);
    chain::SignedIntent signed_intent;
    signed_intent.intent = intent;
    signed_intent.signature = key.SignDigest(chain::TransactionSigningHash(intent));
    signed_intent.raw_transaction =
        chain::SignedTransactionPayload(intent, signed_intent.signature);
    signed_intent.tx_hash =
        util::HexEncodePrefixed(crypto::Keccak256(signed_intent.raw_transaction));
    return signed_intent;
  } catch (const std::exception& ex) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, ex.what());
    return std::nullopt;
  }
}

}  // namespace rootsave::wallet
