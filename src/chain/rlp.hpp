#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "primitives/amount.hpp"

namespace rootsave::chain::rlp {

// Recursive Length Prefix encoding, the wire form of account transactions.
// Writers append to `out`; list payloads are the concatenated encodings of
// their items.
void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes);
// Minimal big-endian, zero encodes as the empty string.
void WriteUint(std::vector<std::uint8_t>* out, primitives::Amount value);
void WriteList(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> payload);

}  // namespace rootsave::chain::rlp
