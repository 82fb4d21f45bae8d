#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace rootsave::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;
using Sha512Hash = std::array<std::uint8_t, 64>;

// FIPS 180-4 SHA-256, used for the mnemonic checksum.
Sha256Hash Sha256(std::span<const std::uint8_t> data);

Sha512Hash Sha512(std::span<const std::uint8_t> data);

}  // namespace rootsave::crypto
