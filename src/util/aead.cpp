#include "util/aead.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "util/secure_wipe.hpp"

namespace rootsave::util {

namespace {

std::uint32_t LoadLe32(const std::uint8_t* in) {
  return static_cast<std::uint32_t>(in[0]) | (static_cast<std::uint32_t>(in[1]) << 8) |
         (static_cast<std::uint32_t>(in[2]) << 16) | (static_cast<std::uint32_t>(in[3]) << 24);
}

std::uint64_t LoadLe64(const std::uint8_t* in) {
  return static_cast<std::uint64_t>(LoadLe32(in)) |
         (static_cast<std::uint64_t>(LoadLe32(in + 4)) << 32);
}

void StoreLe64(std::uint8_t* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

constexpr std::uint32_t Rotl(std::uint32_t v, int n) { return (v << n) | (v >> (32 - n)); }

// ChaCha20 keystream generator over a fixed key and nonce.
class ChaCha20 {
 public:
  ChaCha20(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
    state_[0] = 0x61707865;
    state_[1] = 0x3320646e;
    state_[2] = 0x79622d32;
    state_[3] = 0x6b206574;
    for (int i = 0; i < 8; ++i) {
      state_[4 + i] = LoadLe32(key.data() + 4 * i);
    }
    state_[12] = 0;
    for (int i = 0; i < 3; ++i) {
      state_[13 + i] = LoadLe32(nonce.data() + 4 * i);
    }
  }

  ~ChaCha20() { SecureWipe(state_); }
  ChaCha20(const ChaCha20&) = delete;
  ChaCha20& operator=(const ChaCha20&) = delete;

  void Block(std::uint32_t counter, std::array<std::uint8_t, 64>* out) const {
    std::array<std::uint32_t, 16> x = state_;
    x[12] = counter;
    const std::array<std::uint32_t, 16> input = x;
    for (int round = 0; round < 10; ++round) {
      QuarterRound(x, 0, 4, 8, 12);
      QuarterRound(x, 1, 5, 9, 13);
      QuarterRound(x, 2, 6, 10, 14);
      QuarterRound(x, 3, 7, 11, 15);
      QuarterRound(x, 0, 5, 10, 15);
      QuarterRound(x, 1, 6, 11, 12);
      QuarterRound(x, 2, 7, 8, 13);
      QuarterRound(x, 3, 4, 9, 14);
    }
    for (int i = 0; i < 16; ++i) {
      const std::uint32_t word = x[i] + input[i];
      (*out)[4 * i] = static_cast<std::uint8_t>(word);
      (*out)[4 * i + 1] = static_cast<std::uint8_t>(word >> 8);
      (*out)[4 * i + 2] = static_cast<std::uint8_t>(word >> 16);
      (*out)[4 * i + 3] = static_cast<std::uint8_t>(word >> 24);
    }
    SecureWipe(x);
  }

  // XORs the keystream starting at block `counter` into `data`.
  void Apply(std::uint32_t counter, std::span<std::uint8_t> data) const {
    std::array<std::uint8_t, 64> block{};
    for (std::size_t offset = 0; offset < data.size(); offset += block.size()) {
      Block(counter++, &block);
      const std::size_t n = std::min(block.size(), data.size() - offset);
      for (std::size_t i = 0; i < n; ++i) {
        data[offset + i] ^= block[i];
      }
    }
    SecureWipe(block);
  }

 private:
  static void QuarterRound(std::array<std::uint32_t, 16>& x, int a, int b, int c, int d) {
    x[a] += x[b]; x[d] = Rotl(x[d] ^ x[a], 16);
    x[c] += x[d]; x[b] = Rotl(x[b] ^ x[c], 12);
    x[a] += x[b]; x[d] = Rotl(x[d] ^ x[a], 8);
    x[c] += x[d]; x[b] = Rotl(x[b] ^ x[c], 7);
  }

  std::array<std::uint32_t, 16> state_{};
};

// Poly1305 with three 44/44/42-bit limbs and 128-bit products.
class Poly1305 {
 public:
  explicit Poly1305(std::span<const std::uint8_t, 32> key) {
    const std::uint64_t t0 = LoadLe64(key.data());
    const std::uint64_t t1 = LoadLe64(key.data() + 8);
    r_[0] = t0 & 0xffc0fffffffULL;
    r_[1] = ((t0 >> 44) | (t1 << 20)) & 0xfffffc0ffffULL;
    r_[2] = (t1 >> 24) & 0x00ffffffc0fULL;
    pad_[0] = LoadLe64(key.data() + 16);
    pad_[1] = LoadLe64(key.data() + 24);
  }

  ~Poly1305() {
    SecureWipe(r_);
    SecureWipe(h_);
    SecureWipe(pad_);
  }
  Poly1305(const Poly1305&) = delete;
  Poly1305& operator=(const Poly1305&) = delete;

  // Absorbs `data` zero-padded to a multiple of 16 bytes.
  void UpdatePadded(std::span<const std::uint8_t> data) {
    std::size_t offset = 0;
    while (offset + 16 <= data.size()) {
      Block(data.data() + offset);
      offset += 16;
    }
    if (offset < data.size()) {
      std::array<std::uint8_t, 16> last{};
      std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end(), last.begin());
      Block(last.data());
    }
  }

  void Update16(const std::uint8_t* block) { Block(block); }

  std::array<std::uint8_t, 16> Finish() {
    constexpr std::uint64_t kMask44 = 0xfffffffffffULL;
    constexpr std::uint64_t kMask42 = 0x3ffffffffffULL;
    std::uint64_t h0 = h_[0];
    std::uint64_t h1 = h_[1];
    std::uint64_t h2 = h_[2];

    std::uint64_t c = h1 >> 44; h1 &= kMask44;
    h2 += c; c = h2 >> 42; h2 &= kMask42;
    h0 += c * 5; c = h0 >> 44; h0 &= kMask44;
    h1 += c; c = h1 >> 44; h1 &= kMask44;
    h2 += c; c = h2 >> 42; h2 &= kMask42;
    h0 += c * 5; c = h0 >> 44; h0 &= kMask44;
    h1 += c;

    // Select h - p when h >= p.
    std::uint64_t g0 = h0 + 5; c = g0 >> 44; g0 &= kMask44;
    std::uint64_t g1 = h1 + c; c = g1 >> 44; g1 &= kMask44;
    std::uint64_t g2 = h2 + c - (1ULL << 42);
    c = (g2 >> 63) - 1;
    g0 &= c; g1 &= c; g2 &= c;
    c = ~c;
    h0 = (h0 & c) | g0;
    h1 = (h1 & c) | g1;
    h2 = (h2 & c) | g2;

    h0 += pad_[0] & kMask44; c = h0 >> 44; h0 &= kMask44;
    h1 += (((pad_[0] >> 44) | (pad_[1] << 20)) & kMask44) + c; c = h1 >> 44; h1 &= kMask44;
    h2 += ((pad_[1] >> 24) & kMask42) + c; h2 &= kMask42;

    std::array<std::uint8_t, 16> tag{};
    StoreLe64(tag.data(), h0 | (h1 << 44));
    StoreLe64(tag.data() + 8, (h1 >> 20) | (h2 << 24));
    return tag;
  }

 private:
  using u128 = unsigned __int128;

  void Block(const std::uint8_t* m) {
    constexpr std::uint64_t kMask44 = 0xfffffffffffULL;
    constexpr std::uint64_t kMask42 = 0x3ffffffffffULL;
    const std::uint64_t s1 = r_[1] * (5 << 2);
    const std::uint64_t s2 = r_[2] * (5 << 2);
    const std::uint64_t t0 = LoadLe64(m);
    const std::uint64_t t1 = LoadLe64(m + 8);

    std::uint64_t h0 = h_[0] + (t0 & kMask44);
    std::uint64_t h1 = h_[1] + (((t0 >> 44) | (t1 << 20)) & kMask44);
    std::uint64_t h2 = h_[2] + (((t1 >> 24) & kMask42) | (1ULL << 40));

    u128 d0 = static_cast<u128>(h0) * r_[0] + static_cast<u128>(h1) * s2 +
              static_cast<u128>(h2) * s1;
    u128 d1 = static_cast<u128>(h0) * r_[1] + static_cast<u128>(h1) * r_[0] +
              static_cast<u128>(h2) * s2;
    u128 d2 = static_cast<u128>(h0) * r_[2] + static_cast<u128>(h1) * r_[1] +
              static_cast<u128>(h2) * r_[0];

    std::uint64_t c = static_cast<std::uint64_t>(d0 >> 44);
    h0 = static_cast<std::uint64_t>(d0) & kMask44;
    d1 += c;
    c = static_cast<std::uint64_t>(d1 >> 44);
    h1 = static_cast<std::uint64_t>(d1) & kMask44;
    d2 += c;
    c = static_cast<std::uint64_t>(d2 >> 42);
    h2 = static_cast<std::uint64_t>(d2) & kMask42;
    h0 += c * 5;
    c = h0 >> 44;
    h0 &= kMask44;
    h1 += c;

    h_[0] = h0;
    h_[1] = h1;
    h_[2] = h2;
  }

  std::array<std::uint64_t, 3> r_{};
  std::array<std::uint64_t, 3> h_{};
  std::array<std::uint64_t, 2> pad_{};
};

std::array<std::uint8_t, 16> ComputeTag(const ChaCha20& cipher,
                                        std::span<const std::uint8_t> aad,
                                        std::span<const std::uint8_t> ciphertext) {
  std::array<std::uint8_t, 64> block0{};
  cipher.Block(0, &block0);
  std::array<std::uint8_t, 16> tag{};
  {
    Poly1305 mac(std::span<const std::uint8_t, 32>(block0.data(), 32));
    mac.UpdatePadded(aad);
    mac.UpdatePadded(ciphertext);
    std::array<std::uint8_t, 16> lengths{};
    StoreLe64(lengths.data(), static_cast<std::uint64_t>(aad.size()));
    StoreLe64(lengths.data() + 8, static_cast<std::uint64_t>(ciphertext.size()));
    mac.Update16(lengths.data());
    tag = mac.Finish();
  }
  SecureWipe(block0);
  return tag;
}

bool TagsEqual(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) {
  if (a.size() != b.size()) {
    return false;
  }
  std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff = static_cast<std::uint8_t>(diff | (a[i] ^ b[i]));
  }
  return diff == 0;
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext) {
  if (key.size() != kChaCha20Poly1305KeySize || nonce.size() != kChaCha20Poly1305NonceSize) {
    throw std::invalid_argument("invalid ChaCha20-Poly1305 key or nonce length");
  }
  const ChaCha20 cipher(key, nonce);
  std::vector<std::uint8_t> out(plaintext.begin(), plaintext.end());
  cipher.Apply(1, out);
  const auto tag = ComputeTag(cipher, aad, out);
  out.insert(out.end(), tag.begin(), tag.end());
  return out;
}

bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext_and_tag,
                             std::vector<std::uint8_t>* plaintext) {
  if (plaintext == nullptr || key.size() != kChaCha20Poly1305KeySize ||
      nonce.size() != kChaCha20Poly1305NonceSize ||
      ciphertext_and_tag.size() < kChaCha20Poly1305TagSize) {
    return false;
  }
  const std::size_t ct_len = ciphertext_and_tag.size() - kChaCha20Poly1305TagSize;
  const auto ciphertext = ciphertext_and_tag.first(ct_len);
  const auto tag = ciphertext_and_tag.subspan(ct_len);

  const ChaCha20 cipher(key, nonce);
  const auto expected = ComputeTag(cipher, aad, ciphertext);
  if (!TagsEqual(tag, expected)) {
    return false;
  }
  plaintext->assign(ciphertext.begin(), ciphertext.end());
  cipher.Apply(1, *plaintext);
  return true;
}

}  // namespace rootsave::util
