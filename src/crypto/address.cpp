#include "crypto/address.hpp"

#include <cctype>
#include <stdexcept>

#include "crypto/keccak.hpp"
#include "util/hex.hpp"

namespace rootsave::crypto {

std::string AddressFromPublicKey(std::span<const std::uint8_t> public_key) {
  if (public_key.size() == 65 && public_key[0] == 0x04) {
    public_key = public_key.subspan(1);
  }
  if (public_key.size() != 64) {
    throw std::invalid_argument("public key must be 64 or 65 bytes");
  }
  const auto digest = Keccak256(public_key);
  return util::HexEncodePrefixed(
      std::span<const std::uint8_t>(digest.data() + digest.size() - kAddressBytes, kAddressBytes));
}

bool IsValidAddress(std::string_view address) {
  return util::IsCanonicalPrefixedHex(address, kAddressBytes);
}

std::string ToChecksumAddress(std::string_view address) {
  if (!IsValidAddress(address)) {
    return {};
  }
  const std::string_view digits = address.substr(2);
  const auto digest = Keccak256(digits);
  std::string out = "0x";
  for (std::size_t i = 0; i < digits.size(); ++i) {
    const std::uint8_t nibble =
        (i % 2 == 0) ? static_cast<std::uint8_t>(digest[i / 2] >> 4)
                     : static_cast<std::uint8_t>(digest[i / 2] & 0x0f);
    const char c = digits[i];
    out.push_back(c >= 'a' && nibble >= 8 ? static_cast<char>(c - 'a' + 'A') : c);
  }
  return out;
}

std::string NormalizeAddress(std::string_view address) {
  if (address.size() != 2 + kAddressBytes * 2 || address[0] != '0' ||
      (address[1] != 'x' && address[1] != 'X')) {
    return {};
  }
  bool has_lower = false;
  bool has_upper = false;
  std::string canonical = "0x";
  for (std::size_t i = 2; i < address.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(address[i]);
    if (!std::isxdigit(c)) {
      return {};
    }
    has_lower |= (c >= 'a' && c <= 'f');
    has_upper |= (c >= 'A' && c <= 'F');
    canonical.push_back(static_cast<char>(std::tolower(c)));
  }
  if (has_lower && has_upper &&
      ToChecksumAddress(canonical) != "0x" + std::string(address.substr(2))) {
    return {};
  }
  return canonical;
}

}  // namespace rootsave::crypto
