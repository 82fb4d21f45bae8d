#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace rootsave::ledger {

// Durable string key-value capability used for ledger persistence.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  // A missing key is success with `*value` reset.
  virtual bool Read(const std::string& key, std::optional<std::string>* value,
                    std::string* error) = 0;
  virtual bool Write(const std::string& key, const std::string& value, std::string* error) = 0;
  // Erasing a missing key succeeds.
  virtual bool Erase(const std::string& key, std::string* error) = 0;
};

// One file per key under `directory`, replaced atomically on every write.
class FileKeyValueStore : public KeyValueStore {
 public:
  explicit FileKeyValueStore(std::filesystem::path directory);

  bool Read(const std::string& key, std::optional<std::string>* value,
            std::string* error) override;
  bool Write(const std::string& key, const std::string& value, std::string* error) override;
  bool Erase(const std::string& key, std::string* error) override;

  std::filesystem::path PathFor(const std::string& key) const;

 private:
  std::filesystem::path directory_;
};

class MemoryKeyValueStore : public KeyValueStore {
 public:
  bool Read(const std::string& key, std::optional<std::string>* value,
            std::string* error) override;
  bool Write(const std::string& key, const std::string& value, std::string* error) override;
  bool Erase(const std::string& key, std::string* error) override;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

}  // namespace rootsave::ledger
