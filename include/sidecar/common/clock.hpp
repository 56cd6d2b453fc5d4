#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace sidecar::common {

[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string now_rfc3339();

/// UTC stamp of the form YYYYMMDD-HHMMSS, safe for file names.
[[nodiscard]] std::string compact_stamp(std::chrono::system_clock::time_point when);

/// Seconds since the Unix epoch, with sub-second precision.
[[nodiscard]] double epoch_seconds(std::chrono::system_clock::time_point when);

/// Modification time of a file as an RFC 3339 string, empty when unavailable.
[[nodiscard]] std::string file_mtime_rfc3339(const std::filesystem::path &path);

} // namespace sidecar::common
