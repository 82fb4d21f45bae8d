#pragma once

#include <string>

namespace rootsave::wallet {

enum class AccessPolicy {
  // Any enrolled biometric, falling back to the device passcode.
  kBiometryOrPasscode = 0,
  // Invalidated when the enrolled biometric set changes.
  kBiometryCurrentSet = 1,
};

struct AuthPrompt {
  std::string title;
  std::string subtitle;
  std::string fallback_label;
  std::string cancel_label;
};

enum class StorageStatus {
  kOk,
  kNotFound,
  kCancelled,
  kAuthFailed,
  kUnavailable,  // no authentication factor enrolled on the device
  kIoError,
};

const char* StorageStatusName(StorageStatus status);

struct StoredCredential {
  std::string username;
  std::string secret;

  StoredCredential() = default;
  StoredCredential(const StoredCredential&) = delete;
  StoredCredential& operator=(const StoredCredential&) = delete;
  ~StoredCredential();
};

// Device credential store (keychain / keystore / secure enclave). One entry
// per service. Reads require fresh device authentication.
class SecureStorageProvider {
 public:
  virtual ~SecureStorageProvider() = default;

  virtual StorageStatus Put(const std::string& service, const std::string& username,
                            const std::string& secret, AccessPolicy policy,
                            std::string* error) = 0;

  virtual StorageStatus Get(const std::string& service, const AuthPrompt& prompt,
                            StoredCredential* out, std::string* error) = 0;

  // kNotFound when nothing was stored.
  virtual StorageStatus Delete(const std::string& service, std::string* error) = 0;

  // Non-authenticating presence check; reports the stored username.
  virtual bool Contains(const std::string& service, std::string* username) = 0;
};

enum class AuthOutcome {
  kApproved,
  kCancelled,
  kRejected,
};

// Platform authentication (biometric or passcode). On approval it releases
// the device-bound factor secret that unlocks stored credentials.
class DeviceAuthenticator {
 public:
  virtual ~DeviceAuthenticator() = default;

  virtual bool HasEnrolledFactor() const = 0;

  virtual AuthOutcome Authenticate(const AuthPrompt& prompt, std::string* factor_secret) = 0;
};

}  // namespace rootsave::wallet
