#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace rootsave::crypto {

using Keccak256Hash = std::array<std::uint8_t, 32>;

// Original Keccak-256 (0x01 domain padding), as used for account addresses,
// function selectors and transaction hashes. Not FIPS 202 SHA3-256.
Keccak256Hash Keccak256(std::span<const std::uint8_t> data);
Keccak256Hash Keccak256(std::string_view text);

}  // namespace rootsave::crypto
