#pragma once

#include "sidecar/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace sidecar::guard {

/// Per-session markers that keep at most one background extraction running
/// for a session. Best effort: a marker that cannot be read never blocks.
class LockStore {
public:
  virtual ~LockStore() = default;

  /// True iff a readable marker exists and is younger than max_age.
  [[nodiscard]] virtual bool is_locked(const std::string &session_id,
                                       std::chrono::seconds max_age) const = 0;

  /// Write or overwrite the marker with the current time.
  [[nodiscard]] virtual common::Status create_lock(const std::string &session_id) = 0;

  /// Delete the marker if present. Never fails.
  virtual void remove_lock(const std::string &session_id) = 0;

  /// Delete every marker older than max_age or unreadable. Returns the number removed.
  virtual std::size_t sweep_stale(std::chrono::seconds max_age) = 0;
};

using WallClock = std::function<std::chrono::system_clock::time_point()>;

/// Markers live at <dir>/<session>.lock and hold the creation time in epoch
/// seconds.
class FileLockStore final : public LockStore {
public:
  explicit FileLockStore(std::filesystem::path dir,
                         WallClock clock = [] { return std::chrono::system_clock::now(); });

  [[nodiscard]] bool is_locked(const std::string &session_id,
                               std::chrono::seconds max_age) const override;
  [[nodiscard]] common::Status create_lock(const std::string &session_id) override;
  void remove_lock(const std::string &session_id) override;
  std::size_t sweep_stale(std::chrono::seconds max_age) override;

  [[nodiscard]] std::filesystem::path lock_path(const std::string &session_id) const;

private:
  std::filesystem::path dir_;
  WallClock clock_;
};

/// Releases a session lock when it goes out of scope, on every exit path.
class ScopedLockRelease {
public:
  ScopedLockRelease(LockStore &store, std::string session_id);
  ~ScopedLockRelease();

  ScopedLockRelease(const ScopedLockRelease &) = delete;
  ScopedLockRelease &operator=(const ScopedLockRelease &) = delete;

  /// Keep the lock in place after all.
  void dismiss() { active_ = false; }

private:
  LockStore &store_;
  std::string session_id_;
  bool active_ = true;
};

} // namespace sidecar::guard
