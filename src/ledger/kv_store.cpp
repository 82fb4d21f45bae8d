#include "ledger/kv_store.hpp"

#include <system_error>
#include <vector>

#include "util/atomic_file.hpp"

namespace rootsave::ledger {

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileKeyValueStore::PathFor(const std::string& key) const {
  std::string name;
  name.reserve(key.size());
  for (char c : key) {
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '_' || c == '-';
    name.push_back(safe ? c : '_');
  }
  return directory_ / (name + ".json");
}

bool FileKeyValueStore::Read(const std::string& key, std::optional<std::string>* value,
                             std::string* error) {
  value->reset();
  std::vector<std::uint8_t> bytes;
  bool missing = false;
  if (!util::ReadFileBytes(PathFor(key), &bytes, &missing, error)) {
    return missing;
  }
  value->emplace(bytes.begin(), bytes.end());
  return true;
}

bool FileKeyValueStore::Write(const std::string& key, const std::string& value,
                              std::string* error) {
  return util::AtomicWriteFileText(PathFor(key), value, error);
}

bool FileKeyValueStore::Erase(const std::string& key, std::string* error) {
  std::error_code ec;
  std::filesystem::remove(PathFor(key), ec);
  if (ec) {
    if (error) {
      *error = "remove failed: " + ec.message();
    }
    return false;
  }
  return true;
}

bool MemoryKeyValueStore::Read(const std::string& key, std::optional<std::string>* value,
                               std::string* /*error*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(key);
  if (it == values_.end()) {
    value->reset();
  } else {
    *value = it->second;
  }
  return true;
}

bool MemoryKeyValueStore::Write(const std::string& key, const std::string& value,
                                std::string* /*error*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  return true;
}

bool MemoryKeyValueStore::Erase(const std::string& key, std::string* /*error*/) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.erase(key);
  return true;
}

std::size_t MemoryKeyValueStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

}  // namespace rootsave::ledger
