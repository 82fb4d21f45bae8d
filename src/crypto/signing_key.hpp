#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace rootsave::crypto {

inline constexpr std::size_t kSecretKeyBytes = 32;
inline constexpr std::size_t kPublicKeyBytes = 65;  // 0x04 || X || Y
inline constexpr std::size_t kCompressedPublicKeyBytes = 33;

using Digest32 = std::array<std::uint8_t, 32>;

// Low-s ECDSA signature with the recovery id (y parity of R, plus 2 when
// R.x overflowed the group order).
struct RecoverableSignature {
  std::array<std::uint8_t, 32> r{};
  std::array<std::uint8_t, 32> s{};
  std::uint8_t recovery_id{0};
};

// 32 bytes, non-zero and below the secp256k1 group order.
bool IsValidSecretKey(std::span<const std::uint8_t> secret);

// (secret + tweak) mod n. False when the tweak is not below n or the sum is
// zero; BIP-32 treats both as an unusable child index.
bool AddSecretKeys(std::span<const std::uint8_t> secret, std::span<const std::uint8_t> tweak,
                   std::array<std::uint8_t, kSecretKeyBytes>* out);

// secp256k1 key pair held by libcrypto big numbers only for the duration of
// each call. The secret is wiped on destruction.
class SigningKey {
 public:
  ~SigningKey();
  SigningKey(const SigningKey&) = delete;
  SigningKey& operator=(const SigningKey&) = delete;
  SigningKey(SigningKey&&) noexcept;
  SigningKey& operator=(SigningKey&&) noexcept;

  // Throws std::invalid_argument for an out-of-range secret and
  // std::runtime_error when libcrypto fails.
  static SigningKey FromSecret(std::span<const std::uint8_t> secret);

  // RFC 6979 deterministic nonce (HMAC-SHA256), normalized to low s.
  RecoverableSignature SignDigest(const Digest32& digest) const;

  std::span<const std::uint8_t> PublicKey() const noexcept { return public_key_; }
  std::array<std::uint8_t, kCompressedPublicKeyBytes> CompressedPublicKey() const;

 private:
  SigningKey(std::vector<std::uint8_t> secret, std::vector<std::uint8_t> public_key);

  std::vector<std::uint8_t> secret_;
  std::vector<std::uint8_t> public_key_;
};

// Uncompressed public key that produced `signature` over `digest`, or nullopt
// when the signature is malformed.
std::optional<std::array<std::uint8_t, kPublicKeyBytes>> RecoverPublicKey(
    const Digest32& digest, const RecoverableSignature& signature);

}  // namespace rootsave::crypto
