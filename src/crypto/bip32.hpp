#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rootsave::crypto {

inline constexpr std::uint32_t kHardenedOffset = 0x80000000u;

// BIP-44 account 0, external chain, first address for coin type 60.
inline constexpr std::string_view kEthereumDerivationPath = "m/44'/60'/0'/0/0";

// BIP-32 extended private key. Both halves are wiped on destruction.
struct ExtendedKey {
  std::array<std::uint8_t, 32> secret{};
  std::array<std::uint8_t, 32> chain_code{};

  ExtendedKey() = default;
  ExtendedKey(const ExtendedKey&) = default;
  ExtendedKey& operator=(const ExtendedKey&) = default;
  ~ExtendedKey();
};

// HMAC-SHA512("Bitcoin seed", seed). Seeds must be 16..64 bytes.
std::optional<ExtendedKey> MasterKeyFromSeed(std::span<const std::uint8_t> seed,
                                             std::string* error = nullptr);

// CKDpriv. Indices at or above kHardenedOffset derive hardened children.
std::optional<ExtendedKey> DeriveChild(const ExtendedKey& parent, std::uint32_t index,
                                       std::string* error = nullptr);

// "m/44'/60'/0'/0/0" style paths; `'` or `h` marks a hardened index.
bool ParseDerivationPath(std::string_view path, std::vector<std::uint32_t>* indices,
                         std::string* error = nullptr);

std::optional<ExtendedKey> DerivePath(std::span<const std::uint8_t> seed, std::string_view path,
                                      std::string* error = nullptr);

}  // namespace rootsave::crypto
