#pragma once

#include <filesystem>
#include <string>

#include "util/argon2_kdf.hpp"
#include "wallet/secure_storage.hpp"

namespace rootsave::wallet {

// SecureStorageProvider backed by one encrypted file per service. The
// secret is sealed with ChaCha20-Poly1305 under an Argon2id key derived from
// the factor secret released by the DeviceAuthenticator; the username,
// access policy and KDF parameters sit in an authenticated plaintext header.
class EncryptedFileStorage : public SecureStorageProvider {
 public:
  EncryptedFileStorage(std::filesystem::path directory, DeviceAuthenticator& authenticator,
                       util::Argon2idParams params = util::DefaultArgon2idParams());

  StorageStatus Put(const std::string& service, const std::string& username,
                    const std::string& secret, AccessPolicy policy,
                    std::string* error) override;
  StorageStatus Get(const std::string& service, const AuthPrompt& prompt,
                    StoredCredential* out, std::string* error) override;
  StorageStatus Delete(const std::string& service, std::string* error) override;
  bool Contains(const std::string& service, std::string* username) override;

  std::filesystem::path PathFor(const std::string& service) const;

 private:
  std::filesystem::path directory_;
  DeviceAuthenticator& authenticator_;
  util::Argon2idParams params_;
};

}  // namespace rootsave::wallet
