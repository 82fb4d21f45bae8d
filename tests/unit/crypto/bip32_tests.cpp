#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/bip32.hpp"
#include "util/hex.hpp"

using namespace rootsave;

namespace {

std::vector<std::uint8_t> FromHex(std::string_view hex) {
  std::vector<std::uint8_t> out;
  if (!util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test vector");
  }
  return out;
}

bool ExpectKey(const std::optional<crypto::ExtendedKey>& key, std::string_view secret,
               std::string_view chain_code, const char* label) {
  if (!key) {
    std::cerr << label << ": derivation failed\n";
    return false;
  }
  if (util::HexEncode(key->secret) != secret || util::HexEncode(key->chain_code) != chain_code) {
    std::cerr << label << ": got secret " << util::HexEncode(key->secret) << " chain "
              << util::HexEncode(key->chain_code) << "\n";
    return false;
  }
  return true;
}

// BIP-32 test vector 1 covers the master key, a hardened child and a normal
// child below it.
bool TestVectorOne() {
  const auto seed = FromHex("000102030405060708090a0b0c0d0e0f");
  const auto master = crypto::MasterKeyFromSeed(seed);
  if (!ExpectKey(master, "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35",
                 "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508", "m")) {
    return false;
  }
  const auto hardened = crypto::DeriveChild(*master, crypto::kHardenedOffset);
  if (!ExpectKey(hardened, "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea",
                 "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141", "m/0H")) {
    return false;
  }
  const auto normal = crypto::DeriveChild(*hardened, 1);
  if (!ExpectKey(normal, "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368",
                 "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19", "m/0H/1")) {
    return false;
  }
  return ExpectKey(crypto::DerivePath(seed, "m/0'/1"),
                   "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368",
                   "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19",
                   "DerivePath m/0'/1") &&
         ExpectKey(crypto::DerivePath(seed, "m/0h/1"),
                   "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368",
                   "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19",
                   "DerivePath m/0h/1");
}

bool TestPathParsing() {
  std::vector<std::uint32_t> indices;
  if (!crypto::ParseDerivationPath(crypto::kEthereumDerivationPath, &indices) ||
      indices != std::vector<std::uint32_t>{44 + crypto::kHardenedOffset,
                                            60 + crypto::kHardenedOffset,
                                            crypto::kHardenedOffset, 0, 0}) {
    std::cerr << "Account path parsed incorrectly\n";
    return false;
  }
  if (!crypto::ParseDerivationPath("m", &indices) || !indices.empty()) {
    std::cerr << "Bare master path should parse to no indices\n";
    return false;
  }
  for (const char* bad : {"", "44'/60'", "m/", "m//0", "m/abc", "m/-1", "m/2147483648",
                          "m/0''", "m/1 "}) {
    std::string error;
    if (crypto::ParseDerivationPath(bad, &indices, &error) || error.empty()) {
      std::cerr << "Accepted malformed path '" << bad << "'\n";
      return false;
    }
  }
  return true;
}

bool TestSeedLength() {
  std::string error;
  const std::vector<std::uint8_t> short_seed(15, 0x01);
  const std::vector<std::uint8_t> long_seed(65, 0x01);
  if (crypto::MasterKeyFromSeed(short_seed, &error) || error.empty() ||
      crypto::MasterKeyFromSeed(long_seed, &error)) {
    std::cerr << "Seeds outside 16..64 bytes must be rejected\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestVectorOne() || !TestPathParsing() || !TestSeedLength()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "bip32_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
