#include "util/secure_wipe.hpp"

#include <cstring>

namespace rootsave::util {

void SecureWipe(void* data, std::size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }
#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 25))
  explicit_bzero(data, size);
#else
  volatile std::uint8_t* ptr = static_cast<volatile std::uint8_t*>(data);
  for (std::size_t i = 0; i < size; ++i) {
    ptr[i] = 0;
  }
#endif
}

}  // namespace rootsave::util
