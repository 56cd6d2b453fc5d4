#include "sidecar/common/text.hpp"

namespace sidecar::common {

namespace {

bool is_continuation(const unsigned char ch) { return (ch & 0xC0U) == 0x80U; }

// Byte offset just past the code point starting at pos.
std::size_t next_code_point(const std::string &value, std::size_t pos) {
  ++pos;
  while (pos < value.size() && is_continuation(static_cast<unsigned char>(value[pos]))) {
    ++pos;
  }
  return pos;
}

} // namespace

std::size_t utf8_length(const std::string &value) {
  std::size_t count = 0;
  for (std::size_t pos = 0; pos < value.size(); pos = next_code_point(value, pos)) {
    ++count;
  }
  return count;
}

std::string utf8_prefix(const std::string &value, const std::size_t max_chars) {
  std::size_t pos = 0;
  for (std::size_t count = 0; count < max_chars && pos < value.size(); ++count) {
    pos = next_code_point(value, pos);
  }
  return value.substr(0, pos);
}

std::string truncate_utf8(const std::string &value, const std::size_t max_bytes) {
  if (value.size() <= max_bytes) {
    return value;
  }
  std::size_t end = max_bytes;
  while (end > 0 && is_continuation(static_cast<unsigned char>(value[end]))) {
    --end;
  }
  return value.substr(0, end);
}

} // namespace sidecar::common
