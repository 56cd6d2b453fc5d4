#pragma once

#include "sidecar/common/result.hpp"
#include <filesystem>
#include <string>

namespace sidecar::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
/// Leading "~" becomes $HOME; $NAME and ${NAME} are replaced from the environment.
[[nodiscard]] std::string expand_path(std::string value);

/// value with every character outside [A-Za-z0-9._-] replaced by '_'.
[[nodiscard]] std::string safe_file_component(const std::string &value);

/// Read a whole file. Fails with NotFound when the file cannot be opened.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write content to a sibling temp file and rename it over path, creating
/// parent directories as needed.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace sidecar::common
