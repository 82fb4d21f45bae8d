#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rootsave::crypto {

inline constexpr std::size_t kAddressBytes = 20;

// "0x" + lowercase hex of the last 20 bytes of Keccak-256 over the 64-byte
// X || Y public key. Accepts the 65-byte 0x04-prefixed encoding too.
std::string AddressFromPublicKey(std::span<const std::uint8_t> public_key);

// True for "0x" followed by exactly 40 lowercase hex digits.
bool IsValidAddress(std::string_view address);

// EIP-55 mixed-case form of a canonical address; empty when `address` is not
// canonical.
std::string ToChecksumAddress(std::string_view address);

// Accepts the canonical form, all-uppercase hex, or a correct EIP-55
// checksum, and returns the canonical form. Empty on any other input.
std::string NormalizeAddress(std::string_view address);

}  // namespace rootsave::crypto
