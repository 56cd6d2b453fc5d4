#pragma once

#include "sidecar/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sidecar::common {

/// Flat view of a TOML file: keys are "section.key", values keep their raw text.
/// Getters return the fallback when a key is absent or its value does not convert.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint32_t get_uint(const std::string &key, std::uint32_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;

private:
  [[nodiscard]] const std::string *raw(const std::string &key) const;
};

/// Sections, bare keys and scalar values only; arrays and inline tables stay raw text.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace sidecar::common
