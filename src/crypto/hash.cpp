#include "crypto/hash.hpp"

#include <oqs/sha2.h>

namespace rootsave::crypto {

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha512Hash Sha512(std::span<const std::uint8_t> data) {
  Sha512Hash out{};
  OQS_SHA2_sha512(out.data(), data.data(), data.size());
  return out;
}

}  // namespace rootsave::crypto
