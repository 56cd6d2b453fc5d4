#pragma once

#include <cstddef>
#include <string>

namespace sidecar::common {

/// Number of UTF-8 code points in value. Invalid lead bytes count as one each.
[[nodiscard]] std::size_t utf8_length(const std::string &value);

/// First max_chars code points of value.
[[nodiscard]] std::string utf8_prefix(const std::string &value, std::size_t max_chars);

/// At most max_bytes bytes of value without splitting a multi-byte sequence.
[[nodiscard]] std::string truncate_utf8(const std::string &value, std::size_t max_bytes);

} // namespace sidecar::common
