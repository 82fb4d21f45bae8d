#include "wallet/encrypted_file_storage.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "util/aead.hpp"
#include "util/atomic_file.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::wallet {

namespace {

constexpr std::array<std::uint8_t, 8> kVaultMagic = {'R', 'S', 'V', 'A', 'U', 'L', 'T', '1'};
constexpr std::uint8_t kVaultVersion = 1;
constexpr std::size_t kSaltSize = 16;
constexpr std::size_t kMaxUsernameSize = 256;
constexpr char kLogTag[] = "vault";

const AuthPrompt& StorePrompt() {
  static const AuthPrompt prompt{"Secure your wallet",
                                 "Authenticate to protect your wallet on this device",
                                 "Use passcode", "Cancel"};
  return prompt;
}

void AppendU32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>(value >> (8 * i)));
  }
}

bool ValidServiceName(const std::string& service) {
  return !service.empty() && std::all_of(service.begin(), service.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
  });
}

StorageStatus Fail(std::string* error, StorageStatus status, const std::string& message) {
  if (error) {
    *error = message;
  }
  return status;
}

struct VaultFile {
  AccessPolicy policy{AccessPolicy::kBiometryOrPasscode};
  util::Argon2idParams params{};
  std::array<std::uint8_t, kSaltSize> salt{};
  std::array<std::uint8_t, util::kChaCha20Poly1305NonceSize> nonce{};
  std::string username;
  std::size_t header_size{0};
};

class Reader {
 public:
  explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

  bool Bytes(std::span<std::uint8_t> out) {
    if (data_.size() - pos_ < out.size()) {
      return false;
    }
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), out.size(), out.begin());
    pos_ += out.size();
    return true;
  }

  bool U8(std::uint8_t* out) { return Bytes(std::span<std::uint8_t>(out, 1)); }

  bool U16(std::uint16_t* out) {
    std::array<std::uint8_t, 2> b{};
    if (!Bytes(b)) return false;
    *out = static_cast<std::uint16_t>(b[0] | (b[1] << 8));
    return true;
  }

  bool U32(std::uint32_t* out) {
    std::array<std::uint8_t, 4> b{};
    if (!Bytes(b)) return false;
    *out = static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
    return true;
  }

  std::size_t position() const { return pos_; }

 private:
  std::span<const std::uint8_t> data_;
  std::size_t pos_{0};
};

bool ParseHeader(std::span<const std::uint8_t> data, VaultFile* out, std::string* error) {
  Reader reader(data);
  std::array<std::uint8_t, kVaultMagic.size()> magic{};
  std::uint8_t version = 0;
  std::uint8_t policy = 0;
  std::uint16_t username_len = 0;
  if (!reader.Bytes(magic) || magic != kVaultMagic) {
    if (error) *error = "not a vault file";
    return false;
  }
  if (!reader.U8(&version) || version != kVaultVersion) {
    if (error) *error = "unsupported vault version";
    return false;
  }
  if (!reader.U8(&policy) || policy > static_cast<std::uint8_t>(AccessPolicy::kBiometryCurrentSet) ||
      !reader.U32(&out->params.t_cost) || !reader.U32(&out->params.m_cost_kib) ||
      !reader.U32(&out->params.parallelism) || !reader.Bytes(out->salt) ||
      !reader.Bytes(out->nonce) || !reader.U16(&username_len) ||
      username_len > kMaxUsernameSize) {
    if (error) *error = "truncated or malformed vault header";
    return false;
  }
  out->policy = static_cast<AccessPolicy>(policy);
  out->username.assign(username_len, '\0');
  if (!reader.Bytes(std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(out->username.data()),
                                            out->username.size()))) {
    if (error) *error = "truncated vault header";
    return false;
  }
  if (!util::ValidateArgon2idParams(out->params, error)) {
    return false;
  }
  out->header_size = reader.position();
  return true;
}

}  // namespace

const char* StorageStatusName(StorageStatus status) {
  switch (status) {
    case StorageStatus::kOk:
      return "ok";
    case StorageStatus::kNotFound:
      return "not-found";
    case StorageStatus::kCancelled:
      return "cancelled";
    case StorageStatus::kAuthFailed:
      return "auth-failed";
    case StorageStatus::kUnavailable:
      return "unavailable";
    case StorageStatus::kIoError:
      return "io-error";
  }
  return "unknown";
}

StoredCredential::~StoredCredential() {
  util::SecureWipe(secret);
}

EncryptedFileStorage::EncryptedFileStorage(std::filesystem::path directory,
                                           DeviceAuthenticator& authenticator,
                                           util::Argon2idParams params)
    : directory_(std::move(directory)), authenticator_(authenticator), params_(params) {}

std::filesystem::path EncryptedFileStorage::PathFor(const std::string& service) const {
  return directory_ / (service + ".vault");
}

StorageStatus EncryptedFileStorage::Put(const std::string& service, const std::string& username,
                                        const std::string& secret, AccessPolicy policy,
                                        std::string* error) {
  if (!ValidServiceName(service) || username.size() > kMaxUsernameSize) {
    return Fail(error, StorageStatus::kIoError, "invalid service or username");
  }
  if (!authenticator_.HasEnrolledFactor()) {
    return Fail(error, StorageStatus::kUnavailable, "no device authentication factor enrolled");
  }
  std::string factor;
  util::ScopedWipe wipe_factor(factor);
  switch (authenticator_.Authenticate(StorePrompt(), &factor)) {
    case AuthOutcome::kApproved:
      break;
    case AuthOutcome::kCancelled:
      return Fail(error, StorageStatus::kCancelled, "authentication cancelled");
    case AuthOutcome::kRejected:
      return Fail(error, StorageStatus::kAuthFailed, "authentication rejected");
  }

  VaultFile file;
  file.policy = policy;
  file.params = params_;
  std::string rng_error;
  if (!util::FillSecureRandomBytes(file.salt, &rng_error) ||
      !util::FillSecureRandomBytes(file.nonce, &rng_error)) {
    return Fail(error, StorageStatus::kIoError, "randomness unavailable: " + rng_error);
  }

  std::vector<std::uint8_t> key;
  util::ScopedWipe wipe_key(key);
  std::string kdf_error;
  const bool derived = util::DeriveKeyArgon2id(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(factor.data()),
                                    factor.size()),
      file.salt, file.params, &key, util::kChaCha20Poly1305KeySize, &kdf_error);
  util::SecureWipe(factor);
  if (!derived) {
    return Fail(error, StorageStatus::kIoError, kdf_error);
  }

  std::vector<std::uint8_t> blob(kVaultMagic.begin(), kVaultMagic.end());
  blob.push_back(kVaultVersion);
  blob.push_back(static_cast<std::uint8_t>(policy));
  AppendU32(&blob, file.params.t_cost);
  AppendU32(&blob, file.params.m_cost_kib);
  AppendU32(&blob, file.params.parallelism);
  blob.insert(blob.end(), file.salt.begin(), file.salt.end());
  blob.insert(blob.end(), file.nonce.begin(), file.nonce.end());
  blob.push_back(static_cast<std::uint8_t>(username.size() & 0xFF));
  blob.push_back(static_cast<std::uint8_t>((username.size() >> 8) & 0xFF));
  blob.insert(blob.end(), username.begin(), username.end());

  const auto sealed = util::ChaCha20Poly1305Encrypt(
      key, file.nonce, blob,
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(secret.data()),
                                    secret.size()));
  util::SecureWipe(key);
  blob.insert(blob.end(), sealed.begin(), sealed.end());

  std::string write_error;
  if (!util::AtomicWriteFileBytes(PathFor(service), blob, &write_error)) {
    util::LogError(kLogTag, "failed to write credential file: " + write_error);
    return Fail(error, StorageStatus::kIoError, write_error);
  }
  util::LogDebug(kLogTag, "stored credential for service " + service);
  return StorageStatus::kOk;
}

StorageStatus EncryptedFileStorage::Get(const std::string& service, const AuthPrompt& prompt,
                                        StoredCredential* out, std::string* error) {
  if (!ValidServiceName(service) || out == nullptr) {
    return Fail(error, StorageStatus::kIoError, "invalid service");
  }
  std::vector<std::uint8_t> blob;
  bool missing = false;
  std::string read_error;
  if (!util::ReadFileBytes(PathFor(service), &blob, &missing, &read_error)) {
    if (missing) {
      return Fail(error, StorageStatus::kNotFound, "no credential stored");
    }
    return Fail(error, StorageStatus::kIoError, read_error);
  }
  VaultFile file;
  std::string parse_error;
  if (!ParseHeader(blob, &file, &parse_error)) {
    util::LogWarn(kLogTag, "credential file rejected: " + parse_error);
    return Fail(error, StorageStatus::kIoError, parse_error);
  }
  if (!authenticator_.HasEnrolledFactor()) {
    return Fail(error, StorageStatus::kUnavailable, "no device authentication factor enrolled");
  }

  std::string factor;
  util::ScopedWipe wipe_factor(factor);
  switch (authenticator_.Authenticate(prompt, &factor)) {
    case AuthOutcome::kApproved:
      break;
    case AuthOutcome::kCancelled:
      return Fail(error, StorageStatus::kCancelled, "authentication cancelled");
    case AuthOutcome::kRejected:
      return Fail(error, StorageStatus::kAuthFailed, "authentication rejected");
  }

  std::vector<std::uint8_t> key;
  util::ScopedWipe wipe_key(key);
  std::string kdf_error;
  const bool derived = util::DeriveKeyArgon2id(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(factor.data()),
                                    factor.size()),
      file.salt, file.params, &key, util::kChaCha20Poly1305KeySize, &kdf_error);
  util::SecureWipe(factor);
  if (!derived) {
    return Fail(error, StorageStatus::kIoError, kdf_error);
  }

  const auto data = std::span<const std::uint8_t>(blob);
  std::vector<std::uint8_t> plaintext;
  util::ScopedWipe wipe_plaintext(plaintext);
  const bool opened = util::ChaCha20Poly1305Decrypt(key, file.nonce, data.first(file.header_size),
                                                    data.subspan(file.header_size), &plaintext);
  util::SecureWipe(key);
  if (!opened) {
    // A wrong factor and a tampered file are indistinguishable here.
    return Fail(error, StorageStatus::kAuthFailed, "credential could not be decrypted");
  }
  out->username = file.username;
  out->secret.assign(plaintext.begin(), plaintext.end());
  return StorageStatus::kOk;
}

StorageStatus EncryptedFileStorage::Delete(const std::string& service, std::string* error) {
  if (!ValidServiceName(service)) {
    return Fail(error, StorageStatus::kIoError, "invalid service");
  }
  std::error_code ec;
  const bool removed = std::filesystem::remove(PathFor(service), ec);
  if (ec) {
    return Fail(error, StorageStatus::kIoError, "failed to remove credential: " + ec.message());
  }
  return removed ? StorageStatus::kOk : StorageStatus::kNotFound;
}

bool EncryptedFileStorage::Contains(const std::string& service, std::string* username) {
  if (!ValidServiceName(service)) {
    return false;
  }
  std::vector<std::uint8_t> blob;
  if (!util::ReadFileBytes(PathFor(service), &blob)) {
    return false;
  }
  VaultFile file;
  if (!ParseHeader(blob, &file, nullptr)) {
    return false;
  }
  if (username) {
    *username = file.username;
  }
  return true;
}

}  // namespace rootsave::wallet
