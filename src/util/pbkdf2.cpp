#include "util/pbkdf2.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <oqs/sha2.h>

#include "util/secure_wipe.hpp"

namespace rootsave::util {

namespace {

using HashFn = void (*)(std::uint8_t*, const std::uint8_t*, std::size_t);

// Precomputed inner/outer pads so each PBKDF2 round costs two hashes over
// short buffers.
template <std::size_t kBlockSize, std::size_t kDigestSize, HashFn kHash>
class HmacKey {
 public:
  explicit HmacKey(std::span<const std::uint8_t> key) {
    std::array<std::uint8_t, kBlockSize> block{};
    if (key.size() > kBlockSize) {
      kHash(block.data(), key.data(), key.size());
    } else {
      std::copy(key.begin(), key.end(), block.begin());
    }
    for (std::size_t i = 0; i < kBlockSize; ++i) {
      ipad_[i] = static_cast<std::uint8_t>(block[i] ^ 0x36);
      opad_[i] = static_cast<std::uint8_t>(block[i] ^ 0x5c);
    }
    SecureWipe(block);
  }

  ~HmacKey() {
    SecureWipe(ipad_);
    SecureWipe(opad_);
  }
  HmacKey(const HmacKey&) = delete;
  HmacKey& operator=(const HmacKey&) = delete;

  std::array<std::uint8_t, kDigestSize> Mac(std::span<const std::uint8_t> message) const {
    std::vector<std::uint8_t> inner(ipad_.begin(), ipad_.end());
    inner.insert(inner.end(), message.begin(), message.end());
    std::array<std::uint8_t, kBlockSize + kDigestSize> outer{};
    std::copy(opad_.begin(), opad_.end(), outer.begin());
    kHash(outer.data() + kBlockSize, inner.data(), inner.size());
    std::array<std::uint8_t, kDigestSize> out{};
    kHash(out.data(), outer.data(), outer.size());
    SecureWipe(inner);
    SecureWipe(outer);
    return out;
  }

 private:
  std::array<std::uint8_t, kBlockSize> ipad_{};
  std::array<std::uint8_t, kBlockSize> opad_{};
};

using HmacSha512Key = HmacKey<128, 64, &OQS_SHA2_sha512>;
using HmacSha256Key = HmacKey<64, 32, &OQS_SHA2_sha256>;

}  // namespace

std::array<std::uint8_t, 32> HmacSha256(std::span<const std::uint8_t> key,
                                        std::span<const std::uint8_t> message) {
  const HmacSha256Key hmac(key);
  return hmac.Mac(message);
}

std::array<std::uint8_t, 64> HmacSha512(std::span<const std::uint8_t> key,
                                        std::span<const std::uint8_t> message) {
  const HmacSha512Key hmac(key);
  return hmac.Mac(message);
}

std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iteration count must be positive");
  }
  const HmacSha512Key hmac(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(password.data()), password.size()));

  std::vector<std::uint8_t> derived;
  derived.reserve(dk_len);
  std::vector<std::uint8_t> salt_block(salt.begin(), salt.end());
  salt_block.resize(salt.size() + 4);

  for (std::uint32_t block_index = 1; derived.size() < dk_len; ++block_index) {
    salt_block[salt.size() + 0] = static_cast<std::uint8_t>(block_index >> 24);
    salt_block[salt.size() + 1] = static_cast<std::uint8_t>(block_index >> 16);
    salt_block[salt.size() + 2] = static_cast<std::uint8_t>(block_index >> 8);
    salt_block[salt.size() + 3] = static_cast<std::uint8_t>(block_index);

    auto u = hmac.Mac(salt_block);
    auto t = u;
    for (std::uint32_t round = 1; round < iterations; ++round) {
      u = hmac.Mac(u);
      for (std::size_t i = 0; i < t.size(); ++i) {
        t[i] ^= u[i];
      }
    }
    const std::size_t take = std::min(t.size(), dk_len - derived.size());
    derived.insert(derived.end(), t.begin(), t.begin() + static_cast<std::ptrdiff_t>(take));
    SecureWipe(u);
    SecureWipe(t);
  }
  SecureWipe(salt_block);
  return derived;
}

}  // namespace rootsave::util
