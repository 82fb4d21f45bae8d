#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rootsave::crypto {

// Recovery phrases are accepted with exactly 12 (128-bit entropy) or 24
// (256-bit entropy) words.
inline constexpr std::size_t kMnemonicWords12 = 12;
inline constexpr std::size_t kMnemonicWords24 = 24;

// Compute the 64-byte BIP-39 seed:
//   seed = PBKDF2-HMAC-SHA512(sentence, "mnemonic" + passphrase, 2048, 64)
//
// Callers MUST validate first and pass the canonical sentence (lowercase
// words joined by single ASCII spaces) produced by ValidateMnemonic.
std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase);

// The canonical 2048-word English wordlist. Valid for the process lifetime.
const std::vector<std::string>& EnglishMnemonicWordlist();

// Encode 16 or 32 bytes of entropy as a 12 or 24 word sentence. Throws
// std::invalid_argument for any other entropy size.
std::string MnemonicFromEntropy(std::span<const std::uint8_t> entropy);

// Strict validator for wallet recovery:
// - exactly 12 or 24 whitespace-separated words (case-insensitive)
// - every word in the English wordlist
// - checksum matches the entropy
//
// On success writes the canonical sentence to `normalized` (if given). On
// failure writes a human-readable reason to `error`.
bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* normalized = nullptr,
                      std::string* error = nullptr);

}  // namespace rootsave::crypto
