#include "sidecar/guard/lock_store.hpp"

#include "sidecar/common/clock.hpp"
#include "sidecar/common/fs.hpp"
#include "sidecar/observability/global.hpp"

#include <charconv>
#include <cstdio>
#include <optional>
#include <vector>

namespace sidecar::guard {

namespace {

/// Marker timestamp, nullopt when the file is missing or not a number.
std::optional<double> read_marker(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return std::nullopt;
  }
  const std::string text = common::trim(content.value());
  if (text.empty()) {
    return std::nullopt;
  }
  double stamp = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), stamp);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return stamp;
}

std::string format_stamp(const double seconds) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.6f", seconds);
  return buffer;
}

} // namespace

FileLockStore::FileLockStore(std::filesystem::path dir, WallClock clock)
    : dir_(std::move(dir)), clock_(std::move(clock)) {}

std::filesystem::path FileLockStore::lock_path(const std::string &session_id) const {
  return dir_ / (common::safe_file_component(session_id) + ".lock");
}

bool FileLockStore::is_locked(const std::string &session_id,
                              const std::chrono::seconds max_age) const {
  const auto stamp = read_marker(lock_path(session_id));
  if (!stamp.has_value()) {
    return false;
  }
  // A marker stamped in the future is treated as stale.
  const double age = common::epoch_seconds(clock_()) - *stamp;
  return age >= 0.0 && age < static_cast<double>(max_age.count());
}

common::Status FileLockStore::create_lock(const std::string &session_id) {
  const auto status =
      common::write_file_atomic(lock_path(session_id), format_stamp(common::epoch_seconds(clock_())));
  if (!status.ok()) {
    return common::Status::error(common::ErrorCode::Persistence, status.error());
  }
  observability::record_lock(session_id, "create");
  return common::Status::success();
}

void FileLockStore::remove_lock(const std::string &session_id) {
  std::error_code ec;
  if (std::filesystem::remove(lock_path(session_id), ec)) {
    observability::record_lock(session_id, "remove");
  }
}

std::size_t FileLockStore::sweep_stale(const std::chrono::seconds max_age) {
  std::size_t removed = 0;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir_, ec)) {
    return removed;
  }

  const double now = common::epoch_seconds(clock_());
  std::vector<std::filesystem::path> stale;
  for (const auto &entry : std::filesystem::directory_iterator(dir_, ec)) {
    if (entry.path().extension() != ".lock") {
      continue;
    }
    const auto stamp = read_marker(entry.path());
    if (!stamp.has_value() || *stamp > now ||
        now - *stamp > static_cast<double>(max_age.count())) {
      stale.push_back(entry.path());
    }
  }

  for (const auto &path : stale) {
    std::error_code remove_ec;
    if (std::filesystem::remove(path, remove_ec)) {
      ++removed;
      observability::record_lock(path.stem().string(), "sweep");
    }
  }
  return removed;
}

ScopedLockRelease::ScopedLockRelease(LockStore &store, std::string session_id)
    : store_(store), session_id_(std::move(session_id)) {}

ScopedLockRelease::~ScopedLockRelease() {
  if (active_) {
    store_.remove_lock(session_id_);
  }
}

} // namespace sidecar::guard
