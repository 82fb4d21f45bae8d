#include "crypto/bip32.hpp"

#include <algorithm>
#include <charconv>

#include "crypto/signing_key.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::crypto {

namespace {

constexpr std::string_view kMasterHmacKey = "Bitcoin seed";

bool Fail(std::string* error, const char* message) {
  if (error) {
    *error = message;
  }
  return false;
}

void AppendBigEndian32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>(value >> 24));
  out.push_back(static_cast<std::uint8_t>(value >> 16));
  out.push_back(static_cast<std::uint8_t>(value >> 8));
  out.push_back(static_cast<std::uint8_t>(value));
}

}  // namespace

ExtendedKey::~ExtendedKey() {
  util::SecureWipe(secret);
  util::SecureWipe(chain_code);
}

std::optional<ExtendedKey> MasterKeyFromSeed(std::span<const std::uint8_t> seed,
                                             std::string* error) {
  if (seed.size() < 16 || seed.size() > 64) {
    Fail(error, "seed must be 16..64 bytes");
    return std::nullopt;
  }
  auto digest = util::HmacSha512(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(kMasterHmacKey.data()),
                                    kMasterHmacKey.size()),
      seed);
  ExtendedKey master;
  std::copy(digest.begin(), digest.begin() + 32, master.secret.begin());
  std::copy(digest.begin() + 32, digest.end(), master.chain_code.begin());
  util::SecureWipe(digest);
  if (!IsValidSecretKey(master.secret)) {
    Fail(error, "seed produced an invalid master key");
    return std::nullopt;
  }
  return master;
}

std::optional<ExtendedKey> DeriveChild(const ExtendedKey& parent, std::uint32_t index,
                                       std::string* error) {
  std::vector<std::uint8_t> data;
  data.reserve(37);
  if (index >= kHardenedOffset) {
    data.push_back(0x00);
    data.insert(data.end(), parent.secret.begin(), parent.secret.end());
  } else {
    const auto public_key = SigningKey::FromSecret(parent.secret).CompressedPublicKey();
    data.insert(data.end(), public_key.begin(), public_key.end());
  }
  AppendBigEndian32(data, index);

  auto digest = util::HmacSha512(parent.chain_code, data);
  util::SecureWipe(data);

  ExtendedKey child;
  const bool ok = AddSecretKeys(parent.secret, std::span<const std::uint8_t>(digest.data(), 32),
                                &child.secret);
  std::copy(digest.begin() + 32, digest.end(), child.chain_code.begin());
  util::SecureWipe(digest);
  if (!ok) {
    Fail(error, "child index produced an invalid key");
    return std::nullopt;
  }
  return child;
}

bool ParseDerivationPath(std::string_view path, std::vector<std::uint32_t>* indices,
                         std::string* error) {
  if (!indices) {
    return Fail(error, "indices output is null");
  }
  indices->clear();
  if (path.empty() || path.front() != 'm') {
    return Fail(error, "derivation path must start with 'm'");
  }
  path.remove_prefix(1);
  while (!path.empty()) {
    if (path.front() != '/') {
      return Fail(error, "derivation path segments are separated by '/'");
    }
    path.remove_prefix(1);
    const std::size_t end = std::min(path.find('/'), path.size());
    std::string_view segment = path.substr(0, end);
    path.remove_prefix(end);

    bool hardened = false;
    if (!segment.empty() && (segment.back() == '\'' || segment.back() == 'h')) {
      hardened = true;
      segment.remove_suffix(1);
    }
    std::uint32_t value = 0;
    const auto [ptr, ec] =
        std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (segment.empty() || ec != std::errc() || ptr != segment.data() + segment.size() ||
        value >= kHardenedOffset) {
      return Fail(error, "invalid derivation path index");
    }
    indices->push_back(hardened ? value + kHardenedOffset : value);
  }
  return true;
}

std::optional<ExtendedKey> DerivePath(std::span<const std::uint8_t> seed, std::string_view path,
                                      std::string* error) {
  std::vector<std::uint32_t> indices;
  if (!ParseDerivationPath(path, &indices, error)) {
    return std::nullopt;
  }
  auto key = MasterKeyFromSeed(seed, error);
  for (std::size_t i = 0; key && i < indices.size(); ++i) {
    key = DeriveChild(*key, indices[i], error);
  }
  return key;
}

}  // namespace rootsave::crypto
