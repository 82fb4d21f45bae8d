#include "chain/rlp.hpp"

namespace rootsave::chain::rlp {

namespace {

constexpr std::uint8_t kShortStringOffset = 0x80;
constexpr std::uint8_t kLongStringOffset = 0xb7;
constexpr std::uint8_t kShortListOffset = 0xc0;
constexpr std::uint8_t kLongListOffset = 0xf7;
constexpr std::size_t kShortPayloadLimit = 55;

std::vector<std::uint8_t> BigEndianMinimal(primitives::Amount value) {
  std::vector<std::uint8_t> bytes;
  while (value != 0) {
    bytes.insert(bytes.begin(), static_cast<std::uint8_t>(value & 0xff));
    value >>= 8;
  }
  return bytes;
}

void WriteHeader(std::vector<std::uint8_t>* out, std::size_t length, std::uint8_t short_offset,
                 std::uint8_t long_offset) {
  if (length <= kShortPayloadLimit) {
    out->push_back(static_cast<std::uint8_t>(short_offset + length));
    return;
  }
  const auto length_bytes = BigEndianMinimal(length);
  out->push_back(static_cast<std::uint8_t>(long_offset + length_bytes.size()));
  out->insert(out->end(), length_bytes.begin(), length_bytes.end());
}

}  // namespace

void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes) {
  if (bytes.size() == 1 && bytes[0] < kShortStringOffset) {
    out->push_back(bytes[0]);
    return;
  }
  WriteHeader(out, bytes.size(), kShortStringOffset, kLongStringOffset);
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void WriteUint(std::vector<std::uint8_t>* out, primitives::Amount value) {
  WriteBytes(out, BigEndianMinimal(value));
}

void WriteList(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> payload) {
  WriteHeader(out, payload.size(), kShortListOffset, kLongListOffset);
  out->insert(out->end(), payload.begin(), payload.end());
}

}  // namespace rootsave::chain::rlp
