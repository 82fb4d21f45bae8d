#include "util/hex.hpp"

namespace rootsave::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

int FromHex(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool HasHexPrefix(std::string_view text) {
  return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out(data.size() * 2, '0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    out[i * 2] = kHexLower[(data[i] >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[data[i] & 0x0F];
  }
  return out;
}

std::string HexEncodePrefixed(std::span<const std::uint8_t> data) {
  return "0x" + HexEncode(data);
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (out == nullptr || hex.size() % 2 != 0) {
    return false;
  }
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHex(hex[i]);
    const int lo = FromHex(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool HexDecodePrefixed(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (!HasHexPrefix(hex)) {
    return false;
  }
  return HexDecode(hex.substr(2), out);
}

bool IsCanonicalPrefixedHex(std::string_view text, std::size_t byte_count) {
  if (text.size() != 2 + byte_count * 2 || text[0] != '0' || text[1] != 'x') {
    return false;
  }
  for (std::size_t i = 2; i < text.size(); ++i) {
    const char c = text[i];
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

}  // namespace rootsave::util
