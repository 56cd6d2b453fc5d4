#include "sidecar/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace sidecar::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::Config, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::Persistence, "Failed to create directory: " + path.string() + ": " +
                                    ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (starts_with(value, "~")) {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  const auto is_name_char = [](const char ch, const bool first) {
    const auto uch = static_cast<unsigned char>(ch);
    return ch == '_' || (first ? std::isalpha(uch) != 0 : std::isalnum(uch) != 0);
  };

  // $NAME and ${NAME}; unset variables expand to nothing.
  std::string expanded;
  std::size_t pos = 0;
  while (pos < value.size()) {
    const auto dollar = value.find('$', pos);
    if (dollar == std::string::npos) {
      break;
    }
    expanded.append(value, pos, dollar - pos);
    const bool braced = dollar + 1 < value.size() && value[dollar + 1] == '{';
    std::size_t name_end = dollar + (braced ? 2 : 1);
    const std::size_t name_start = name_end;
    while (name_end < value.size() && is_name_char(value[name_end], name_end == name_start)) {
      ++name_end;
    }
    const bool closed = !braced || (name_end < value.size() && value[name_end] == '}');
    if (name_end == name_start || !closed) {
      expanded.push_back('$');
      pos = dollar + 1;
      continue;
    }
    if (const char *var = std::getenv(value.substr(name_start, name_end - name_start).c_str());
        var != nullptr) {
      expanded += var;
    }
    pos = braced ? name_end + 1 : name_end;
  }
  if (pos < value.size()) {
    expanded.append(value, pos, std::string::npos);
  }
  return expanded;
}

std::string safe_file_component(const std::string &value) {
  std::string out = value;
  for (char &ch : out) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) == 0 && ch != '.' && ch != '-' && ch != '_') {
      ch = '_';
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "_" + out;
  }
  return out;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::NotFound,
                                        "Failed to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return Status::error(ErrorCode::Persistence, dir.error());
    }
  }

  const auto tmp =
      path.parent_path() / (path.filename().string() + ".tmp." + std::to_string(::getpid()));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::Persistence, "Failed to write file: " + tmp.string());
    }
    out << content;
    out.flush();
    if (!out) {
      return Status::error(ErrorCode::Persistence, "Failed to write file: " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return Status::error(ErrorCode::Persistence, "Failed to replace file: " + path.string());
  }
  return Status::success();
}

} // namespace sidecar::common
