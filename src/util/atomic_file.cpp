#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace rootsave::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." +
          std::to_string(nonce));
}

void SetError(std::string* error, const std::string& what) {
  if (error) {
    *error = what + ": " + std::strerror(errno);
  }
}

bool WriteAll(int fd, std::span<const std::uint8_t> data, std::string* error) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetError(error, "write failed");
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    SetError(error, "failed to open temp file for write");
    return false;
  }
  bool ok = WriteAll(fd, data, error);
  if (ok && ::fsync(fd) != 0) {
    SetError(error, "fsync failed");
    ok = false;
  }
  if (::close(fd) != 0 && ok) {
    SetError(error, "close failed");
    ok = false;
  }
  std::error_code ec;
  if (!ok) {
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return false;
  }
  return true;
}

bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error) {
  return AtomicWriteFileBytes(
      path,
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                    text.size()),
      error);
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   bool* missing, std::string* error) {
  if (missing) {
    *missing = false;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (missing) {
      *missing = true;
    }
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) {
      *error = "failed to open " + path.string();
    }
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (error) {
      *error = "failed to read " + path.string();
    }
    out->clear();
    return false;
  }
  return true;
}

}  // namespace rootsave::util
