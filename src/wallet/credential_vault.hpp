#pragma once

#include <optional>
#include <string>

#include "wallet/key_material.hpp"
#include "wallet/secure_storage.hpp"
#include "wallet/wallet_error.hpp"

namespace rootsave::wallet {

inline constexpr char kWalletService[] = "rootsave_wallet";

// Device-authenticated custody of the wallet's private key and recovery
// phrase. Both live in one storage entry keyed by the address, so unlocking
// costs a single authentication prompt.
class CredentialVault {
 public:
  explicit CredentialVault(SecureStorageProvider& storage,
                           AccessPolicy policy = AccessPolicy::kBiometryOrPasscode);

  // Validates and canonicalizes before writing: the private key must be
  // exactly 32 bytes, the address well formed and derived from that key, and
  // a recovery phrase (if any) must derive the same key. Malformed input is
  // rejected here with kInvalidKeyMaterial / kInvalidPhrase.
  bool Store(const KeyPair& key_pair, WalletError* error = nullptr);

  // Prompts for device authentication. Fails with kNotFound,
  // kAuthenticationCancelled, kAuthenticationFailed, kVaultUnavailable or
  // kInvalidKeyMaterial when the stored entry does not validate.
  std::optional<KeyPair> Read(WalletError* error = nullptr);

  // No authentication.
  bool Exists();
  std::optional<std::string> StoredAddress();

  // Idempotent.
  bool Clear(WalletError* error = nullptr);

  static const AuthPrompt& UnlockPrompt();

 private:
  SecureStorageProvider& storage_;
  AccessPolicy policy_;
};

}  // namespace rootsave::wallet
