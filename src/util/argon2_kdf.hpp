#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rootsave::util {

struct Argon2idParams {
  std::uint32_t t_cost;        // iterations
  std::uint32_t m_cost_kib;    // memory in KiB
  std::uint32_t parallelism;   // lanes
};

// Upper bounds accepted when parameters come from disk, so a tampered header
// cannot make unlock allocate unbounded memory or spin for hours.
constexpr std::uint32_t kMaxArgon2idTCost = 10;
constexpr std::uint32_t kMaxArgon2idMemoryKib = 1024 * 1024;  // 1 GiB
constexpr std::uint32_t kMaxArgon2idParallelism = 8;

// 3 iterations, 64 MiB, single lane.
Argon2idParams DefaultArgon2idParams();

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error = nullptr);

// Derive `key_len` bytes with Argon2id. `key_out` is resized to `key_len`.
bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::size_t key_len = 32,
                       std::string* error = nullptr);

}  // namespace rootsave::util
