#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rootsave::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

// RFC 8439 AEAD. Returns ciphertext || tag. Throws std::invalid_argument on a
// wrong key or nonce length.
std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext);

// Verifies the tag before decrypting; `plaintext` is untouched on failure.
bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext_and_tag,
                             std::vector<std::uint8_t>* plaintext);

}  // namespace rootsave::util
