#include "sidecar/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace sidecar::common {

namespace {

constexpr std::size_t kMaxValidateDepth = 256;

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

std::uint32_t parse_hex4(const std::string &raw, const std::size_t pos) {
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    }
  }
  return value;
}

bool has_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + 4; ++i) {
    if (!is_hex(raw[i])) {
      return false;
    }
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool match_literal(const std::string &text, std::size_t &pos, const char *literal) {
  const std::string lit(literal);
  if (text.compare(pos, lit.size(), lit) != 0) {
    return false;
  }
  pos += lit.size();
  return true;
}

bool scan_string(const std::string &text, std::size_t &pos) {
  ++pos; // opening quote
  while (pos < text.size()) {
    const auto ch = static_cast<unsigned char>(text[pos]);
    if (ch == '"') {
      ++pos;
      return true;
    }
    if (ch < 0x20) {
      return false;
    }
    if (ch == '\\') {
      ++pos;
      if (pos >= text.size()) {
        return false;
      }
      const char esc = text[pos];
      if (esc == 'u') {
        if (!has_hex4(text, pos + 1)) {
          return false;
        }
        pos += 5;
        continue;
      }
      if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
          esc != 'r' && esc != 't') {
        return false;
      }
    }
    ++pos;
  }
  return false;
}

bool scan_digits(const std::string &text, std::size_t &pos) {
  const std::size_t start = pos;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos > start;
}

bool scan_number(const std::string &text, std::size_t &pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (pos >= text.size()) {
    return false;
  }
  if (text[pos] == '0') {
    ++pos;
  } else if (!scan_digits(text, pos)) {
    return false;
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    if (!scan_digits(text, pos)) {
      return false;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    if (!scan_digits(text, pos)) {
      return false;
    }
  }
  return true;
}

bool scan_value(const std::string &text, std::size_t &pos, std::size_t depth);

bool scan_container(const std::string &text, std::size_t &pos, const std::size_t depth,
                    const bool object) {
  const char close = object ? '}' : ']';
  ++pos;
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == close) {
    ++pos;
    return true;
  }
  while (pos < text.size()) {
    if (object) {
      if (text[pos] != '"' || !scan_string(text, pos)) {
        return false;
      }
      pos = json_skip_ws(text, pos);
      if (pos >= text.size() || text[pos] != ':') {
        return false;
      }
      pos = json_skip_ws(text, pos + 1);
    }
    if (!scan_value(text, pos, depth + 1)) {
      return false;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return false;
    }
    if (text[pos] == close) {
      ++pos;
      return true;
    }
    if (text[pos] != ',') {
      return false;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return false;
}

bool scan_value(const std::string &text, std::size_t &pos, const std::size_t depth) {
  if (depth > kMaxValidateDepth || pos >= text.size()) {
    return false;
  }
  switch (text[pos]) {
  case '{':
    return scan_container(text, pos, depth, true);
  case '[':
    return scan_container(text, pos, depth, false);
  case '"':
    return scan_string(text, pos);
  case 't':
    return match_literal(text, pos, "true");
  case 'f':
    return match_literal(text, pos, "false");
  case 'n':
    return match_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
  }
}

// Position one past the raw value starting at pos, or npos.
std::size_t raw_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end > pos ? end : std::string::npos;
}

std::string member_of_kind(const std::string &json, const std::string &field,
                           const JsonKind kind) {
  const auto members = json_parse_object_raw(json);
  const auto it = members.find(field);
  if (it == members.end() || json_kind(it->second) != kind) {
    return "";
  }
  return it->second;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      if (!has_hex4(raw, i + 1)) {
        out.push_back('u');
        break;
      }
      std::uint32_t cp = parse_hex4(raw, i + 1);
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u' &&
            has_hex4(raw, i + 3)) {
          const std::uint32_t low = parse_hex4(raw, i + 3);
          if (low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
            i += 6;
          } else {
            cp = 0xFFFD;
          }
        } else {
          cp = 0xFFFD;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_validate(const std::string &text) {
  std::size_t pos = json_skip_ws(text, 0);
  if (!scan_value(text, pos, 0)) {
    return false;
  }
  return json_skip_ws(text, pos) == text.size();
}

JsonKind json_kind(const std::string &raw) {
  const std::size_t pos = json_skip_ws(raw, 0);
  if (pos >= raw.size()) {
    return JsonKind::Invalid;
  }
  switch (raw[pos]) {
  case '{':
    return JsonKind::Object;
  case '[':
    return JsonKind::Array;
  case '"':
    return JsonKind::String;
  case 't':
  case 'f':
    return JsonKind::Bool;
  case 'n':
    return JsonKind::Null;
  default:
    break;
  }
  if (raw[pos] == '-' || std::isdigit(static_cast<unsigned char>(raw[pos])) != 0) {
    return JsonKind::Number;
  }
  return JsonKind::Invalid;
}

std::string json_as_string(const std::string &raw) {
  const std::size_t pos = json_skip_ws(raw, 0);
  if (pos >= raw.size() || raw[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(raw, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(raw.substr(pos + 1, end - pos - 1));
}

JsonRawMap json_parse_object_raw(const std::string &json) {
  JsonRawMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return result;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto value_end = raw_value_end(json, pos);
    if (value_end == std::string::npos) {
      break;
    }
    // Later duplicates win, matching common JSON parsers.
    result[std::move(key)] = json.substr(pos, value_end - pos);
    pos = value_end;
  }
  return result;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  return json_as_string(member_of_kind(json, field, JsonKind::String));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  return member_of_kind(json, field, JsonKind::Number);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return member_of_kind(json, field, JsonKind::Object);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return member_of_kind(json, field, JsonKind::Array);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  std::vector<std::string> out;
  for (const auto &raw : json_split_top_level_values(json_get_array(json, field))) {
    if (json_kind(raw) == JsonKind::String) {
      out.push_back(json_as_string(raw));
    }
  }
  return out;
}

std::vector<std::string> json_split_top_level_values(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = raw_value_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  for (auto &raw : json_split_top_level_values(array_json)) {
    if (json_kind(raw) == JsonKind::Object) {
      out.push_back(std::move(raw));
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << json_escape(values[i]) << "\"";
  }
  out << "]";
  return out.str();
}

} // namespace sidecar::common
