#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rootsave::util {

// HMAC-SHA256 and HMAC-SHA512 (RFC 2104) over liboqs' SHA-2.
std::array<std::uint8_t, 32> HmacSha256(std::span<const std::uint8_t> key,
                                        std::span<const std::uint8_t> message);

std::array<std::uint8_t, 64> HmacSha512(std::span<const std::uint8_t> key,
                                        std::span<const std::uint8_t> message);

// PBKDF2-HMAC-SHA512 (RFC 8018). Returns dk_len bytes; iterations must be >= 1.
std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

}  // namespace rootsave::util
