#include "cm/persistence/DrawingRepository.hpp"
#include "cm/drawing/DrawingCodec.hpp"
#include <cstdio>

namespace cm {

std::string DrawingRepository::storageKey(const std::string& instrumentCode) {
  return "drawings_" + instrumentCode;
}

bool DrawingRepository::load(const std::string& instrumentCode,
                             std::vector<Drawing>& out) const {
  out.clear();
  std::string key = storageKey(instrumentCode);
  std::string payload;
  if (!store_.get(key, payload)) return false;

  if (!decodeDrawings(payload, out)) {
    std::fprintf(stderr, "[DrawingRepository] unreadable payload for %s, using empty set\n",
                 key.c_str());
    out.clear();
    return false;
  }
  return true;
}

bool DrawingRepository::save(const std::string& instrumentCode,
                             const std::vector<Drawing>& drawings) {
  std::string key = storageKey(instrumentCode);
  if (!store_.set(key, encodeDrawings(drawings))) {
    std::fprintf(stderr, "[DrawingRepository] failed to save %zu drawings to %s\n",
                 drawings.size(), key.c_str());
    return false;
  }
  return true;
}

} // namespace cm
