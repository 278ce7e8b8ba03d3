#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace cm {

// Drawing identity. Unique within one instrument's set; 0 means "none"
// (no selection, no hover, not yet assigned).
using DrawingId = std::uint64_t;

inline constexpr DrawingId kInvalidId = 0;

// Older payloads store ids as decimal strings. Empty text yields
// kInvalidId; text that is not all digits, or that does not fit in
// 64 bits, throws std::runtime_error.
inline DrawingId parseIdString(const std::string& text) {
  if (text.empty()) return kInvalidId;
  constexpr DrawingId kMax = std::numeric_limits<DrawingId>::max();
  DrawingId value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') throw std::runtime_error("id must be decimal digits");
    DrawingId digit = static_cast<DrawingId>(c - '0');
    if (value > (kMax - digit) / 10) throw std::runtime_error("id does not fit in 64 bits");
    value = value * 10 + digit;
  }
  return value;
}

} // namespace cm
