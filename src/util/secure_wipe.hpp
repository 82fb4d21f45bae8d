#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rootsave::util {

// Zeroes `size` bytes through explicit_bzero or a volatile loop.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::span<std::uint8_t> data) noexcept {
  SecureWipe(data.data(), data.size());
}

// Container overloads also release the storage, leaving the container empty.
inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::vector<std::uint8_t>().swap(data);
}

inline void SecureWipe(std::string& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::string().swap(data);
}

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

// Wipes a key, factor or plaintext buffer when the enclosing scope ends.
template <typename Buffer>
class ScopedWipe {
 public:
  explicit ScopedWipe(Buffer& buffer) noexcept : buffer_(buffer) {}
  ~ScopedWipe() { SecureWipe(buffer_); }
  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

 private:
  Buffer& buffer_;
};

}  // namespace rootsave::util
