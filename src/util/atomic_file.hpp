#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rootsave::util {

// Atomically replace `path`: write to a sibling temp file, fsync it, then
// rename it into place. Parent directories are created on demand. The new
// file is created with owner-only permissions.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error = nullptr);

// Reads the whole file. A missing file sets `*missing` (when given) and
// returns false without an error message.
bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   bool* missing = nullptr, std::string* error = nullptr);

}  // namespace rootsave::util
