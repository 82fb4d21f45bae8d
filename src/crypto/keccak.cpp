#include "crypto/keccak.hpp"

#include <algorithm>
#include <cstddef>

namespace rootsave::crypto {

namespace {

constexpr std::size_t kRateBytes = 136;
constexpr std::size_t kRateLanes = kRateBytes / 8;

constexpr std::array<std::uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

// Rho offsets and pi lane order, walked together along the pi cycle.
constexpr std::array<int, 24> kRotations = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                            27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};
constexpr std::array<int, 24> kPiLanes = {10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
                                          15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

using State = std::array<std::uint64_t, 25>;

inline std::uint64_t Rotl(std::uint64_t x, int n) { return (x << n) | (x >> (64 - n)); }

void KeccakF1600(State& st) {
  for (const std::uint64_t round_constant : kRoundConstants) {
    std::uint64_t c[5];
    for (int x = 0; x < 5; ++x) {
      c[x] = st[x] ^ st[x + 5] ^ st[x + 10] ^ st[x + 15] ^ st[x + 20];
    }
    for (int x = 0; x < 5; ++x) {
      const std::uint64_t d = c[(x + 4) % 5] ^ Rotl(c[(x + 1) % 5], 1);
      for (int y = 0; y < 25; y += 5) {
        st[y + x] ^= d;
      }
    }

    std::uint64_t carry = st[1];
    for (std::size_t i = 0; i < kPiLanes.size(); ++i) {
      const int lane = kPiLanes[i];
      const std::uint64_t next = st[lane];
      st[lane] = Rotl(carry, kRotations[i]);
      carry = next;
    }

    for (int y = 0; y < 25; y += 5) {
      for (int x = 0; x < 5; ++x) {
        c[x] = st[y + x];
      }
      for (int x = 0; x < 5; ++x) {
        st[y + x] = c[x] ^ (~c[(x + 1) % 5] & c[(x + 2) % 5]);
      }
    }

    st[0] ^= round_constant;
  }
}

void AbsorbBlock(State& st, const std::uint8_t* block) {
  for (std::size_t lane = 0; lane < kRateLanes; ++lane) {
    std::uint64_t word = 0;
    for (std::size_t b = 0; b < 8; ++b) {
      word |= static_cast<std::uint64_t>(block[lane * 8 + b]) << (8 * b);
    }
    st[lane] ^= word;
  }
  KeccakF1600(st);
}

}  // namespace

Keccak256Hash Keccak256(std::span<const std::uint8_t> data) {
  State st{};
  std::size_t offset = 0;
  while (data.size() - offset >= kRateBytes) {
    AbsorbBlock(st, data.data() + offset);
    offset += kRateBytes;
  }

  std::array<std::uint8_t, kRateBytes> last{};
  std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end(), last.begin());
  last[data.size() - offset] ^= 0x01;
  last[kRateBytes - 1] ^= 0x80;
  AbsorbBlock(st, last.data());

  Keccak256Hash out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>(st[i / 8] >> (8 * (i % 8)));
  }
  return out;
}

Keccak256Hash Keccak256(std::string_view text) {
  return Keccak256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

}  // namespace rootsave::crypto
