#include "sidecar/common/toml.hpp"

#include "sidecar/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace sidecar::common {

namespace {

// Cuts a trailing "# comment" that is not inside a quoted value.
std::string without_comment(const std::string &line) {
  char open_quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    const bool escaped = i > 0 && line[i - 1] == '\\';
    if (open_quote != '\0') {
      if (ch == open_quote && !escaped) {
        open_quote = '\0';
      }
    } else if ((ch == '"' || ch == '\'') && !escaped) {
      open_quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

char escape_target(const char code) {
  switch (code) {
  case 'n':
    return '\n';
  case 't':
    return '\t';
  case 'r':
    return '\r';
  default:
    return code;
  }
}

std::string decode_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != value.back() ||
      (value.front() != '"' && value.front() != '\'')) {
    return value;
  }
  const std::string body = value.substr(1, value.size() - 2);
  if (value.front() == '\'') {
    return body;
  }

  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\\' && i + 1 < body.size()) {
      out.push_back(escape_target(body[++i]));
    } else {
      out.push_back(body[i]);
    }
  }
  return out;
}

template <typename T> bool convert_number(const std::string &raw, T &out) {
  const std::string text = trim(raw);
  const char *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

} // namespace

const std::string *TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

bool TomlDocument::has(const std::string &key) const { return raw(key) != nullptr; }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = raw(key);
  return value == nullptr ? fallback : decode_string(*value);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  const std::string word = to_lower(trim(*value));
  if (word == "true" || word == "false") {
    return word == "true";
  }
  return fallback;
}

std::uint32_t TomlDocument::get_uint(const std::string &key, const std::uint32_t fallback) const {
  const auto *value = raw(key);
  std::uint32_t parsed = 0;
  return value != nullptr && convert_number(*value, parsed) ? parsed : fallback;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto *value = raw(key);
  double parsed = 0.0;
  return value != nullptr && convert_number(*value, parsed) ? parsed : fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &what) {
    return Result<TomlDocument>::failure(ErrorCode::Config,
                                         what + " at line " + std::to_string(line_number));
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(without_comment(line));
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[') {
      if (text.back() != ']') {
        return fail("Unterminated section header");
      }
      section = trim(text.substr(1, text.size() - 2));
      if (section.empty()) {
        return fail("Empty section name");
      }
      continue;
    }

    const auto equals = text.find('=');
    if (equals == std::string::npos) {
      return fail("Expected key = value");
    }
    const std::string key = trim(text.substr(0, equals));
    if (key.empty()) {
      return fail("Missing key");
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(text.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace sidecar::common
