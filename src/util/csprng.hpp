#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace rootsave::util {

// Fills `out` from the operating system CSPRNG (getrandom, then
// /dev/urandom). Returns false and writes a reason when neither is usable.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

}  // namespace rootsave::util
