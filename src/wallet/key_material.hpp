#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "chain/chain_client.hpp"
#include "wallet/wallet_error.hpp"

namespace rootsave::wallet {

// Wallet credentials. The private key is the 32-byte secp256k1 secret at
// m/44'/60'/0'/0/0 of the phrase's BIP-39 seed. Secrets are wiped on
// destruction.
struct KeyPair {
  std::string address;
  std::vector<std::uint8_t> private_key;
  std::optional<std::string> recovery_phrase;

  KeyPair() = default;
  KeyPair(const KeyPair&) = default;
  KeyPair& operator=(const KeyPair&) = default;
  KeyPair(KeyPair&&) noexcept = default;
  KeyPair& operator=(KeyPair&&) noexcept = default;
  ~KeyPair();

  void Wipe() noexcept;
};

// Fills the span with entropy, or returns false with a reason.
using EntropySource = std::function<bool(std::span<std::uint8_t>, std::string*)>;

// Fresh key pair with a 12- or 24-word recovery phrase. An empty
// `entropy_source` means the system CSPRNG. Fails with kEntropyError when
// entropy is unavailable.
std::optional<KeyPair> GenerateKeyPair(std::size_t word_count = 12,
                                       const EntropySource& entropy_source = {},
                                       WalletError* error = nullptr);

// Deterministic derivation from a recovery phrase. The returned phrase is the
// canonical (lowercase, single-spaced) form. Fails with kInvalidPhrase.
std::optional<KeyPair> KeyPairFromPhrase(std::string_view phrase, WalletError* error = nullptr);

// Word count, wordlist and checksum check only; no derivation.
bool ValidatePhrase(std::string_view phrase, std::string* reason = nullptr);

std::optional<std::string> AddressFromPrivateKey(std::span<const std::uint8_t> private_key,
                                                 WalletError* error = nullptr);

// "0x" + 64 lowercase hex digits.
std::string EncodePrivateKey(std::span<const std::uint8_t> private_key);

// Accepts exactly "0x" + 64 hex digits (either case); anything else fails.
bool DecodePrivateKey(std::string_view text, std::vector<std::uint8_t>* out);

// Signs the EIP-155 transaction for `intent` and returns the raw bytes ready
// to broadcast. The key is only borrowed for the call.
std::optional<chain::SignedIntent> SignIntent(std::span<const std::uint8_t> private_key,
                                              const chain::TransactionIntent& intent,
                                              WalletError* error = nullptr);

}  // namespace rootsave::wallet
