#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace rootsave::util {

Argon2idParams DefaultArgon2idParams() {
  Argon2idParams params;
  params.t_cost = 3;
  params.m_cost_kib = 64 * 1024;
  params.parallelism = 1;
  return params;
}

bool ValidateArgon2idParams(const Argon2idParams& params, std::string* error) {
  if (params.t_cost == 0 || params.t_cost > kMaxArgon2idTCost) {
    if (error) *error = "argon2id iteration count out of range";
    return false;
  }
  if (params.parallelism == 0 || params.parallelism > kMaxArgon2idParallelism) {
    if (error) *error = "argon2id parallelism out of range";
    return false;
  }
  if (params.m_cost_kib < 8 * params.parallelism || params.m_cost_kib > kMaxArgon2idMemoryKib) {
    if (error) *error = "argon2id memory cost out of range";
    return false;
  }
  return true;
}

bool DeriveKeyArgon2id(std::span<const std::uint8_t> password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::vector<std::uint8_t>* key_out,
                       std::size_t key_len,
                       std::string* error) {
  if (key_out == nullptr || !ValidateArgon2idParams(params, error)) {
    return false;
  }
  key_out->assign(key_len, 0);
  const int rc = argon2id_hash_raw(params.t_cost, params.m_cost_kib, params.parallelism,
                                   password.data(), password.size(), salt.data(), salt.size(),
                                   key_out->data(), key_out->size());
  if (rc != ARGON2_OK) {
    key_out->clear();
    if (error) {
      *error = std::string("argon2id failed: ") + argon2_error_message(rc);
    }
    return false;
  }
  return true;
}

}  // namespace rootsave::util
