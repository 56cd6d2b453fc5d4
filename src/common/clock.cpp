#include "sidecar/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sidecar::common {

namespace {

std::string format_utc(const std::chrono::system_clock::time_point when, const char *pattern) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, pattern);
  return out.str();
}

} // namespace

std::string format_rfc3339(const std::chrono::system_clock::time_point when) {
  return format_utc(when, "%Y-%m-%dT%H:%M:%SZ");
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::string compact_stamp(const std::chrono::system_clock::time_point when) {
  return format_utc(when, "%Y%m%d-%H%M%S");
}

double epoch_seconds(const std::chrono::system_clock::time_point when) {
  return std::chrono::duration<double>(when.time_since_epoch()).count();
}

std::string file_mtime_rfc3339(const std::filesystem::path &path) {
  std::error_code ec;
  const auto ftime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return "";
  }
  const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
  return format_rfc3339(system_time);
}

} // namespace sidecar::common
