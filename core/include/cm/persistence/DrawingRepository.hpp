#pragma once
#include "cm/drawing/Drawing.hpp"
#include "cm/persistence/KeyValueStore.hpp"
#include <string>
#include <vector>

namespace cm {

// Per-instrument drawing persistence on top of a KeyValueStore.
class DrawingRepository {
public:
  explicit DrawingRepository(KeyValueStore& store) : store_(store) {}

  // "drawings_<instrumentCode>"
  static std::string storageKey(const std::string& instrumentCode);

  // Missing or corrupt payloads yield an empty set and false.
  bool load(const std::string& instrumentCode, std::vector<Drawing>& out) const;
  // Failures are logged; callers may ignore the result.
  bool save(const std::string& instrumentCode, const std::vector<Drawing>& drawings);

private:
  KeyValueStore& store_;
};

} // namespace cm
