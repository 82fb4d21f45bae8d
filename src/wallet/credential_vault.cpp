#include "wallet/credential_vault.hpp"

#include <vector>

#include "nlohmann/json.hpp"

#include "crypto/address.hpp"
#include "crypto/signing_key.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::wallet {

namespace {

constexpr char kLogTag[] = "vault";

bool FailFromStatus(StorageStatus status, const std::string& detail, WalletError* error) {
  switch (status) {
    case StorageStatus::kOk:
      return true;
    case StorageStatus::kNotFound:
      return SetWalletError(error, WalletErrorCode::kNotFound, "no wallet stored");
    case StorageStatus::kCancelled:
      return SetWalletError(error, WalletErrorCode::kAuthenticationCancelled, detail);
    case StorageStatus::kAuthFailed:
      return SetWalletError(error, WalletErrorCode::kAuthenticationFailed, detail);
    case StorageStatus::kUnavailable:
      return SetWalletError(error, WalletErrorCode::kVaultUnavailable, kVaultUnavailableGuidance);
    case StorageStatus::kIoError:
      return SetWalletError(error, WalletErrorCode::kStorageError, detail);
  }
  return SetWalletError(error, WalletErrorCode::kStorageError, detail);
}

}  // namespace

CredentialVault::CredentialVault(SecureStorageProvider& storage, AccessPolicy policy)
    : storage_(storage), policy_(policy) {}

const AuthPrompt& CredentialVault::UnlockPrompt() {
  static const AuthPrompt prompt{"Unlock Rootsave", "Use biometrics to access your wallet",
                                 "Authenticate to continue", "Cancel"};
  return prompt;
}

bool CredentialVault::Store(const KeyPair& key_pair, WalletError* error) {
  if (key_pair.private_key.size() != crypto::kSecretKeyBytes) {
    return SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                          "private key must be exactly 32 bytes, got " +
                              std::to_string(key_pair.private_key.size()));
  }
  if (!crypto::IsValidAddress(key_pair.address)) {
    return SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, "malformed address");
  }
  const auto derived_address = AddressFromPrivateKey(key_pair.private_key, error);
  if (!derived_address) {
    return false;
  }
  if (*derived_address != key_pair.address) {
    return SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                          "address does not match private key");
  }

  nlohmann::json envelope;
  envelope["privateKey"] = EncodePrivateKey(key_pair.private_key);
  if (key_pair.recovery_phrase) {
    WalletError phrase_error;
    auto from_phrase = KeyPairFromPhrase(*key_pair.recovery_phrase, &phrase_error);
    if (!from_phrase) {
      if (error) {
        *error = std::move(phrase_error);
      }
      return false;
    }
    if (from_phrase->private_key != key_pair.private_key) {
      return SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                            "recovery phrase does not match private key");
    }
    envelope["mnemonic"] = *from_phrase->recovery_phrase;
  } else {
    envelope["mnemonic"] = nullptr;
  }

  std::string secret = envelope.dump();
  // Scrub the json copies as well as the serialized secret.
  for (auto& value : envelope) {
    if (value.is_string()) {
      util::SecureWipe(value.get_ref<std::string&>());
    }
  }
  std::string detail;
  const auto status = storage_.Put(kWalletService, key_pair.address, secret, policy_, &detail);
  util::SecureWipe(secret);
  if (status != StorageStatus::kOk) {
    util::LogWarn(kLogTag, std::string("store failed: ") + StorageStatusName(status) +
                               (detail.empty() ? "" : " (" + detail + ")"));
    return FailFromStatus(status, detail, error);
  }
  util::LogInfo(kLogTag, "wallet credentials stored for " + key_pair.address);
  return true;
}

std::optional<KeyPair> CredentialVault::Read(WalletError* error) {
  StoredCredential stored;
  std::string detail;
  const auto status = storage_.Get(kWalletService, UnlockPrompt(), &stored, &detail);
  if (status != StorageStatus::kOk) {
    if (status != StorageStatus::kCancelled) {
      util::LogWarn(kLogTag, std::string("read failed: ") + StorageStatusName(status));
    }
    FailFromStatus(status, detail, error);
    return std::nullopt;
  }

  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(stored.secret);
  } catch (const nlohmann::json::exception&) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, "stored credential is not JSON");
    return std::nullopt;
  }

  KeyPair pair;
  const auto key_it = envelope.find("privateKey");
  if (key_it == envelope.end() || !key_it->is_string() ||
      !DecodePrivateKey(key_it->get_ref<const std::string&>(), &pair.private_key)) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "stored private key is not 32 bytes of hex");
    return std::nullopt;
  }
  if (!crypto::IsValidAddress(stored.username)) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial, "stored address is malformed");
    return std::nullopt;
  }
  const auto derived_address = AddressFromPrivateKey(pair.private_key, error);
  if (!derived_address) {
    return std::nullopt;
  }
  if (*derived_address != stored.username) {
    SetWalletError(error, WalletErrorCode::kInvalidKeyMaterial,
                   "stored address does not match stored private key");
    return std::nullopt;
  }
  pair.address = *derived_address;
  const auto phrase_it = envelope.find("mnemonic");
  if (phrase_it != envelope.end() && phrase_it->is_string()) {
    pair.recovery_phrase = phrase_it->get<std::string>();
  }
  for (auto& value : envelope) {
    if (value.is_string()) {
      util::SecureWipe(value.get_ref<std::string&>());
    }
  }
  return pair;
}

bool CredentialVault::Exists() { return storage_.Contains(kWalletService, nullptr); }

std::optional<std::string> CredentialVault::StoredAddress() {
  std::string username;
  if (!storage_.Contains(kWalletService, &username)) {
    return std::nullopt;
  }
  return username;
}

bool CredentialVault::Clear(WalletError* error) {
  std::string detail;
  const auto status = storage_.Delete(kWalletService, &detail);
  if (status == StorageStatus::kOk || status == StorageStatus::kNotFound) {
    if (status == StorageStatus::kOk) {
      util::LogInfo(kLogTag, "wallet credentials deleted");
    }
    return true;
  }
  util::LogError(kLogTag, std::string("failed to delete credentials: ") + detail);
  return FailFromStatus(status, detail, error);
}

}  // namespace rootsave::wallet
