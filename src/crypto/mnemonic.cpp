#include "crypto/mnemonic.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "crypto/hash.hpp"
#include "crypto/mnemonic_wordlist_en.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace rootsave::crypto {

namespace {

constexpr std::size_t kBitsPerWord = 11;

const std::unordered_map<std::string, std::uint16_t>& EnglishMnemonicWordIndex() {
  static const std::unordered_map<std::string, std::uint16_t> index = [] {
    std::unordered_map<std::string, std::uint16_t> out;
    const auto& wordlist = EnglishMnemonicWordlist();
    out.reserve(wordlist.size());
    for (std::size_t i = 0; i < wordlist.size(); ++i) {
      out.emplace(wordlist[i], static_cast<std::uint16_t>(i));
    }
    return out;
  }();
  return index;
}

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::string LowercaseAscii(std::string_view input) {
  std::string out(input);
  for (char& ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

bool GetBit(std::span<const std::uint8_t> bytes, std::size_t bit) {
  return ((bytes[bit / 8] >> (7 - bit % 8)) & 0x01u) != 0;
}

void SetBit(std::span<std::uint8_t> bytes, std::size_t bit) {
  bytes[bit / 8] = static_cast<std::uint8_t>(bytes[bit / 8] | (1u << (7 - bit % 8)));
}

}  // namespace

std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase) {
  std::string salt = "mnemonic";
  salt.append(passphrase);
  const auto salt_bytes = std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(salt.data()), salt.size());

  auto seed_vec = util::Pbkdf2HmacSha512(mnemonic_sentence, salt_bytes, 2048u, 64u);

  std::array<std::uint8_t, 64> seed{};
  std::copy_n(seed_vec.begin(), seed.size(), seed.begin());
  util::SecureWipe(seed_vec);
  util::SecureWipe(salt);
  return seed;
}

const std::vector<std::string>& EnglishMnemonicWordlist() {
  static const std::vector<std::string> wordlist = [] {
    return std::vector<std::string>(kEnglishMnemonicWordlistEn.begin(),
                                    kEnglishMnemonicWordlistEn.end());
  }();
  return wordlist;
}

std::string MnemonicFromEntropy(std::span<const std::uint8_t> entropy) {
  if (entropy.size() != 16 && entropy.size() != 32) {
    throw std::invalid_argument("mnemonic entropy must be 16 or 32 bytes");
  }
  const std::size_t entropy_bits = entropy.size() * 8;
  const std::size_t checksum_bits = entropy_bits / 32;
  const std::size_t word_count = (entropy_bits + checksum_bits) / kBitsPerWord;

  // entropy || first byte of SHA-256(entropy); checksum is at most 8 bits.
  std::vector<std::uint8_t> packed(entropy.begin(), entropy.end());
  const auto digest = Sha256(entropy);
  packed.push_back(digest[0]);

  const auto& wordlist = EnglishMnemonicWordlist();
  std::string sentence;
  for (std::size_t w = 0; w < word_count; ++w) {
    std::uint16_t index = 0;
    for (std::size_t b = 0; b < kBitsPerWord; ++b) {
      index = static_cast<std::uint16_t>((index << 1) |
                                         (GetBit(packed, w * kBitsPerWord + b) ? 1 : 0));
    }
    if (!sentence.empty()) {
      sentence.push_back(' ');
    }
    sentence.append(wordlist[index]);
  }
  util::SecureWipe(packed);
  return sentence;
}

bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* normalized,
                      std::string* error) {
  if (error) {
    error->clear();
  }
  const auto& index = EnglishMnemonicWordIndex();
  std::vector<std::uint16_t> indices;
  indices.reserve(kMnemonicWords24);
  std::string canonical;

  std::size_t pos = 0;
  while (pos < mnemonic_sentence.size()) {
    while (pos < mnemonic_sentence.size() && IsSpace(mnemonic_sentence[pos])) {
      ++pos;
    }
    if (pos >= mnemonic_sentence.size()) {
      break;
    }
    const std::size_t start = pos;
    while (pos < mnemonic_sentence.size() && !IsSpace(mnemonic_sentence[pos])) {
      ++pos;
    }
    if (indices.size() >= kMnemonicWords24) {
      if (error) {
        *error = "mnemonic must contain exactly 12 or 24 words";
      }
      util::SecureWipe(canonical);
      return false;
    }
    std::string word = LowercaseAscii(mnemonic_sentence.substr(start, pos - start));
    const auto it = index.find(word);
    if (it == index.end()) {
      if (error) {
        *error = "mnemonic contains a word not in the English wordlist";
      }
      util::SecureWipe(word);
      util::SecureWipe(canonical);
      return false;
    }
    indices.push_back(it->second);
    if (!canonical.empty()) {
      canonical.push_back(' ');
    }
    canonical.append(word);
    util::SecureWipe(word);
  }

  if (indices.size() != kMnemonicWords12 && indices.size() != kMnemonicWords24) {
    if (error) {
      *error = "mnemonic must contain exactly 12 or 24 words";
    }
    util::SecureWipe(canonical);
    return false;
  }

  const std::size_t total_bits = indices.size() * kBitsPerWord;
  const std::size_t entropy_bits = total_bits * 32 / 33;
  const std::size_t checksum_bits = total_bits - entropy_bits;

  std::vector<std::uint8_t> packed((total_bits + 7) / 8, 0);
  for (std::size_t w = 0; w < indices.size(); ++w) {
    for (std::size_t b = 0; b < kBitsPerWord; ++b) {
      if (((indices[w] >> (kBitsPerWord - 1 - b)) & 0x01u) != 0) {
        SetBit(packed, w * kBitsPerWord + b);
      }
    }
  }
  std::fill(indices.begin(), indices.end(), 0);

  const std::span<const std::uint8_t> entropy(packed.data(), entropy_bits / 8);
  const auto digest = Sha256(entropy);
  bool checksum_ok = true;
  for (std::size_t b = 0; b < checksum_bits; ++b) {
    if (GetBit(digest, b) != GetBit(packed, entropy_bits + b)) {
      checksum_ok = false;
    }
  }
  util::SecureWipe(packed);
  if (!checksum_ok) {
    if (error) {
      *error = "mnemonic checksum mismatch";
    }
    util::SecureWipe(canonical);
    return false;
  }
  if (normalized) {
    *normalized = std::move(canonical);
  } else {
    util::SecureWipe(canonical);
  }
  return true;
}

}  // namespace rootsave::crypto
