#pragma once
#include <map>
#include <string>

namespace cm {

// Storage capability injected into the drawing layer.
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  // Returns false if the key is absent or unreadable.
  virtual bool get(const std::string& key, std::string& out) const = 0;
  // Returns false if the write failed.
  virtual bool set(const std::string& key, const std::string& bytes) = 0;
  virtual bool remove(const std::string& key) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& bytes) override;
  bool remove(const std::string& key) override;

  std::size_t size() const { return entries_.size(); }

private:
  std::map<std::string, std::string> entries_;
};

// One file per key inside `directory`. Characters outside [A-Za-z0-9._-]
// in keys are replaced by '_' in file names.
class FileKeyValueStore : public KeyValueStore {
public:
  explicit FileKeyValueStore(std::string directory);

  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& bytes) override;
  bool remove(const std::string& key) override;

  std::string pathForKey(const std::string& key) const;
  const std::string& directory() const { return directory_; }

private:
  std::string directory_;
};

} // namespace cm
