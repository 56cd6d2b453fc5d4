#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace sidecar::common {

enum class JsonKind { Invalid, Null, Bool, Number, String, Array, Object };

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when text holds exactly one well-formed JSON value (surrounding whitespace allowed).
[[nodiscard]] bool json_validate(const std::string &text);

/// Classify a raw JSON value by its first significant character.
[[nodiscard]] JsonKind json_kind(const std::string &raw);

/// Decoded contents of a raw JSON string value, or empty when raw is not a string.
[[nodiscard]] std::string json_as_string(const std::string &raw);

/// Top-level members of a JSON object mapped to their raw value text.
/// Keys are unescaped; values keep their JSON encoding (strings keep quotes).
using JsonRawMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonRawMap json_parse_object_raw(const std::string &json);

/// Top-level string member of an object, empty when absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Top-level numeric member of an object as its literal text.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Top-level object member (including braces).
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Top-level array member (including brackets).
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Top-level array member decoded as strings; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Split a JSON array into the raw text of each element.
[[nodiscard]] std::vector<std::string> json_split_top_level_values(const std::string &array_json);

/// Split a JSON array into its object elements, skipping anything else.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Render strings as a JSON array literal.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace sidecar::common
