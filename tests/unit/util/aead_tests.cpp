#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/aead.hpp"
#include "util/hex.hpp"

using namespace rootsave;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad test hex: " + hex);
  }
  return out;
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

// RFC 8439 section 2.8.2.
bool TestRfc8439Vector() {
  std::vector<std::uint8_t> key(32);
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0x80 + i);
  }
  const auto nonce = FromHex("070000004041424344454647");
  const auto aad = FromHex("50515253c0c1c2c3c4c5c6c7");
  const auto plaintext = Bytes(
      "Ladies and Gentlemen of the class of '99: If I could offer you only one tip for "
      "the future, sunscreen would be it.");

  const auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, aad, plaintext);
  if (sealed.size() != plaintext.size() + util::kChaCha20Poly1305TagSize) {
    std::cerr << "Unexpected sealed size " << sealed.size() << "\n";
    return false;
  }
  const std::string hex = util::HexEncode(sealed);
  if (hex.rfind("d31a8d34648e60db7b86afbc53ef7ec2", 0) != 0) {
    std::cerr << "Ciphertext prefix mismatch: " << hex.substr(0, 32) << "\n";
    return false;
  }
  if (hex.substr(hex.size() - 32) != "1ae10b594f09e26a7e902ecbd0600691") {
    std::cerr << "Tag mismatch: " << hex.substr(hex.size() - 32) << "\n";
    return false;
  }

  std::vector<std::uint8_t> opened;
  if (!util::ChaCha20Poly1305Decrypt(key, nonce, aad, sealed, &opened) || opened != plaintext) {
    std::cerr << "Failed to open the reference ciphertext\n";
    return false;
  }
  return true;
}

bool TestTamperingIsDetected() {
  const std::vector<std::uint8_t> key(32, 0x42);
  const std::vector<std::uint8_t> nonce(12, 0x07);
  const auto aad = Bytes("header");
  const auto plaintext = Bytes("{\"privateKey\":\"0x00\"}");
  const auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, aad, plaintext);

  std::vector<std::uint8_t> opened{0xaa};
  auto flipped = sealed;
  flipped[3] ^= 0x01;
  if (util::ChaCha20Poly1305Decrypt(key, nonce, aad, flipped, &opened)) {
    std::cerr << "Flipped ciphertext byte was accepted\n";
    return false;
  }
  if (opened.size() != 1 || opened[0] != 0xaa) {
    std::cerr << "Output touched on failed decrypt\n";
    return false;
  }
  if (util::ChaCha20Poly1305Decrypt(key, nonce, Bytes("headex"), sealed, &opened)) {
    std::cerr << "Altered associated data was accepted\n";
    return false;
  }
  std::vector<std::uint8_t> other_key = key;
  other_key[0] ^= 0x80;
  if (util::ChaCha20Poly1305Decrypt(other_key, nonce, aad, sealed, &opened)) {
    std::cerr << "Wrong key was accepted\n";
    return false;
  }
  const std::vector<std::uint8_t> truncated(sealed.begin(), sealed.begin() + 10);
  if (util::ChaCha20Poly1305Decrypt(key, nonce, aad, truncated, &opened)) {
    std::cerr << "Input shorter than a tag was accepted\n";
    return false;
  }
  return true;
}

bool TestEmptyPlaintext() {
  const std::vector<std::uint8_t> key(32, 0x01);
  const std::vector<std::uint8_t> nonce(12, 0x02);
  const std::vector<std::uint8_t> empty;
  const auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, empty, empty);
  std::vector<std::uint8_t> opened{1, 2, 3};
  if (sealed.size() != util::kChaCha20Poly1305TagSize ||
      !util::ChaCha20Poly1305Decrypt(key, nonce, empty, sealed, &opened) || !opened.empty()) {
    std::cerr << "Empty plaintext round trip failed\n";
    return false;
  }
  return true;
}

bool TestBadKeySizeThrows() {
  const std::vector<std::uint8_t> short_key(16, 0x01);
  const std::vector<std::uint8_t> nonce(12, 0x02);
  try {
    (void)util::ChaCha20Poly1305Encrypt(short_key, nonce, {}, nonce);
  } catch (const std::invalid_argument&) {
    return true;
  }
  std::cerr << "Expected 16-byte key to be rejected\n";
  return false;
}

}  // namespace

int main() {
  try {
    if (!TestRfc8439Vector() || !TestTamperingIsDetected() || !TestEmptyPlaintext() ||
        !TestBadKeySizeThrows()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "aead_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
