#include <cstdlib>
#include <iostream>
#include <string>

#include "nlohmann/json.hpp"

#include "test_fakes.hpp"
#include "wallet/credential_vault.hpp"
#include "wallet/key_material.hpp"

using namespace rootsave;

namespace {

const std::string kPhrase =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";

bool ExpectCode(const wallet::WalletError& error, wallet::WalletErrorCode code,
                const char* what) {
  if (error.code != code) {
    std::cerr << what << ": expected " << wallet::WalletErrorCodeName(code) << ", got "
              << wallet::WalletErrorCodeName(error.code) << " (" << error.message << ")\n";
    return false;
  }
  return true;
}

bool TestStoreReadRoundTrip() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto pair = wallet::KeyPairFromPhrase(kPhrase);
  if (!pair) {
    std::cerr << "Failed to derive test wallet\n";
    return false;
  }
  if (vault.Exists() || vault.StoredAddress()) {
    std::cerr << "Fresh vault reports a wallet\n";
    return false;
  }
  wallet::WalletError error;
  if (!vault.Store(*pair, &error)) {
    std::cerr << "Store failed: " << error.message << "\n";
    return false;
  }
  if (storage.PolicyOf(wallet::kWalletService) != wallet::AccessPolicy::kBiometryOrPasscode) {
    std::cerr << "Credential stored with the wrong access policy\n";
    return false;
  }
  const auto envelope = nlohmann::json::parse(*storage.RawSecret(wallet::kWalletService));
  if (envelope.at("privateKey").get<std::string>() != wallet::EncodePrivateKey(pair->private_key) ||
      envelope.at("mnemonic").get<std::string>() != kPhrase) {
    std::cerr << "Unexpected credential envelope\n";
    return false;
  }
  if (!vault.Exists() || vault.StoredAddress() != pair->address) {
    std::cerr << "Stored wallet not visible without authentication\n";
    return false;
  }
  if (storage.get_calls() != 0) {
    std::cerr << "Presence checks must not prompt\n";
    return false;
  }
  auto read = vault.Read(&error);
  if (!read || read->address != pair->address || read->private_key != pair->private_key ||
      read->recovery_phrase != kPhrase) {
    std::cerr << "Read did not return the stored key pair\n";
    return false;
  }
  const auto prompt = storage.last_prompt();
  if (prompt.title != "Unlock Rootsave" || prompt.subtitle != "Use biometrics to access your wallet" ||
      prompt.fallback_label != "Authenticate to continue" || prompt.cancel_label != "Cancel") {
    std::cerr << "Unexpected unlock prompt\n";
    return false;
  }
  return true;
}

bool TestStoreWithoutPhrase() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto pair = wallet::KeyPairFromPhrase(kPhrase);
  pair->recovery_phrase.reset();
  if (!vault.Store(*pair)) {
    std::cerr << "Store without phrase failed\n";
    return false;
  }
  auto read = vault.Read();
  if (!read || read->recovery_phrase || read->private_key != pair->private_key) {
    std::cerr << "Phrase-less round trip failed\n";
    return false;
  }
  return true;
}

bool TestStoreRejectsMalformedInput() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto good = wallet::KeyPairFromPhrase(kPhrase);
  auto other = wallet::GenerateKeyPair();

  wallet::WalletError error;
  auto long_key = *good;
  long_key.private_key.push_back(0x00);
  if (vault.Store(long_key, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, "33-byte key")) {
    return false;
  }
  auto bad_address = *good;
  bad_address.address = "0xABCDEF";
  if (vault.Store(bad_address, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, "malformed address")) {
    return false;
  }
  auto mismatched = *good;
  mismatched.address = other->address;
  if (vault.Store(mismatched, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, "foreign address")) {
    return false;
  }
  auto wrong_phrase = *good;
  wrong_phrase.recovery_phrase = *other->recovery_phrase;
  if (vault.Store(wrong_phrase, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, "foreign phrase")) {
    return false;
  }
  auto bad_phrase = *good;
  bad_phrase.recovery_phrase = "not a phrase";
  if (vault.Store(bad_phrase, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidPhrase, "invalid phrase")) {
    return false;
  }
  if (storage.put_calls() != 0 || vault.Exists()) {
    std::cerr << "Rejected input reached the storage provider\n";
    return false;
  }
  return true;
}

bool TestStorageStatusMapping() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto pair = wallet::KeyPairFromPhrase(kPhrase);
  wallet::WalletError error;

  storage.SetPutStatus(wallet::StorageStatus::kUnavailable);
  if (vault.Store(*pair, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kVaultUnavailable, "store unavailable")) {
    return false;
  }
  if (error.message != wallet::kVaultUnavailableGuidance) {
    std::cerr << "VaultUnavailable must carry the settings guidance\n";
    return false;
  }
  storage.SetPutStatus(wallet::StorageStatus::kCancelled);
  if (vault.Store(*pair, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kAuthenticationCancelled, "store cancelled")) {
    return false;
  }
  storage.SetPutStatus(wallet::StorageStatus::kIoError);
  if (vault.Store(*pair, &error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kStorageError, "store io error")) {
    return false;
  }
  storage.SetPutStatus(wallet::StorageStatus::kOk);

  if (vault.Read(&error) || !ExpectCode(error, wallet::WalletErrorCode::kNotFound, "read empty")) {
    return false;
  }
  if (!vault.Store(*pair, &error)) {
    std::cerr << "Store failed\n";
    return false;
  }
  storage.QueueGetOutcome(wallet::StorageStatus::kCancelled);
  if (vault.Read(&error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kAuthenticationCancelled, "read cancelled")) {
    return false;
  }
  storage.QueueGetOutcome(wallet::StorageStatus::kAuthFailed);
  if (vault.Read(&error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kAuthenticationFailed, "read rejected")) {
    return false;
  }
  storage.QueueGetOutcome(wallet::StorageStatus::kUnavailable);
  if (vault.Read(&error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kVaultUnavailable, "read unavailable")) {
    return false;
  }
  if (!vault.Read(&error)) {
    std::cerr << "Read after scripted failures should succeed\n";
    return false;
  }
  return true;
}

bool TestReadRejectsCorruptEntries() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto pair = wallet::KeyPairFromPhrase(kPhrase);
  if (!vault.Store(*pair)) {
    std::cerr << "Store failed\n";
    return false;
  }
  const std::string encoded = wallet::EncodePrivateKey(pair->private_key);
  const std::string corrupt[] = {
      "not json",
      "{\"mnemonic\":null}",
      "{\"privateKey\":\"" + encoded + "ff\",\"mnemonic\":null}",
      "{\"privateKey\":\"" + encoded.substr(0, 40) + "\",\"mnemonic\":null}",
      "{\"privateKey\":42}",
      "{\"privateKey\":\"" + encoded.substr(2) + "\"}",
  };
  for (const auto& secret : corrupt) {
    storage.Tamper(wallet::kWalletService, secret);
    wallet::WalletError error;
    if (vault.Read(&error) ||
        !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, secret.c_str())) {
      return false;
    }
  }

  // A valid key stored under another wallet's address.
  auto other = wallet::GenerateKeyPair();
  storage.Tamper(wallet::kWalletService,
                 "{\"privateKey\":\"" + wallet::EncodePrivateKey(other->private_key) + "\"}");
  wallet::WalletError error;
  if (vault.Read(&error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kInvalidKeyMaterial, "address mismatch")) {
    return false;
  }
  return true;
}

bool TestClearIsIdempotent() {
  test::FakeSecureStorage storage;
  wallet::CredentialVault vault(storage);
  auto pair = wallet::KeyPairFromPhrase(kPhrase);
  if (!vault.Store(*pair)) {
    std::cerr << "Store failed\n";
    return false;
  }
  wallet::WalletError error;
  if (!vault.Clear(&error) || !vault.Clear(&error) || vault.Exists()) {
    std::cerr << "Clear twice must succeed and leave no wallet\n";
    return false;
  }
  if (!vault.Store(*pair)) {
    std::cerr << "Store failed\n";
    return false;
  }
  storage.SetDeleteStatus(wallet::StorageStatus::kIoError);
  if (vault.Clear(&error) ||
      !ExpectCode(error, wallet::WalletErrorCode::kStorageError, "clear io error")) {
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestStoreReadRoundTrip() || !TestStoreWithoutPhrase() ||
        !TestStoreRejectsMalformedInput() || !TestStorageStatusMapping() ||
        !TestReadRejectsCorruptEntries() || !TestClearIsIdempotent()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "credential_vault_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
