#include "cm/persistence/KeyValueStore.hpp"
#include <cstdio>

namespace cm {

// -------------------- MemoryKeyValueStore --------------------

bool MemoryKeyValueStore::get(const std::string& key, std::string& out) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) return false;
  out = it->second;
  return true;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& bytes) {
  entries_[key] = bytes;
  return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
  return entries_.erase(key) > 0;
}

// -------------------- FileKeyValueStore --------------------

FileKeyValueStore::FileKeyValueStore(std::string directory)
  : directory_(std::move(directory)) {}

std::string FileKeyValueStore::pathForKey(const std::string& key) const {
  std::string name;
  name.reserve(key.size());
  for (char c : key) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    name.push_back(ok ? c : '_');
  }
  if (directory_.empty()) return name + ".json";
  char last = directory_.back();
  if (last == '/' || last == '\\') return directory_ + name + ".json";
  return directory_ + "/" + name + ".json";
}

bool FileKeyValueStore::get(const std::string& key, std::string& out) const {
  std::string path = pathForKey(key);
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false; // absent

  std::string data;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    data.append(buf, n);
  }
  bool failed = std::ferror(f) != 0;
  std::fclose(f);

  if (failed) {
    std::fprintf(stderr, "[FileKeyValueStore] read error: %s\n", path.c_str());
    return false;
  }
  out = std::move(data);
  return true;
}

bool FileKeyValueStore::set(const std::string& key, const std::string& bytes) {
  std::string path = pathForKey(key);
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "[FileKeyValueStore] cannot open for writing: %s\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  bool closed = std::fclose(f) == 0;
  if (written != bytes.size() || !closed) {
    std::fprintf(stderr, "[FileKeyValueStore] short write: %s\n", path.c_str());
    return false;
  }
  return true;
}

bool FileKeyValueStore::remove(const std::string& key) {
  return std::remove(pathForKey(key).c_str()) == 0;
}

} // namespace cm
