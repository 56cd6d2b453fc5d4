#pragma once

#include "sidecar/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::guard {

struct LaunchRequest {
  std::string session_id;
  bool snapshot = false;
  std::optional<std::string> project_path;
};

/// Starts an extraction without waiting for it.
class BackgroundLauncher {
public:
  virtual ~BackgroundLauncher() = default;

  /// Returns once the work is handed off. Fails with ErrorCode::Spawn.
  [[nodiscard]] virtual common::Status launch(const LaunchRequest &request) = 0;
};

struct DetachedLaunchOptions {
  std::filesystem::path executable;
  std::filesystem::path logs_dir;
  /// Directory the detached process runs in.
  std::filesystem::path working_dir;
  /// Forwarded as --config so the child reads the same settings.
  std::optional<std::filesystem::path> config_path;
};

/// Runs `<executable> analyze --session-id ID --background ...` in a new
/// session with stdin on /dev/null and stdout/stderr appended to
/// <logs_dir>/analyze-<id>.log.
class DetachedProcessLauncher final : public BackgroundLauncher {
public:
  explicit DetachedProcessLauncher(DetachedLaunchOptions options);

  [[nodiscard]] common::Status launch(const LaunchRequest &request) override;

  [[nodiscard]] std::vector<std::string> build_argv(const LaunchRequest &request) const;
  [[nodiscard]] std::filesystem::path log_path(const std::string &session_id) const;

private:
  DetachedLaunchOptions options_;
};

/// Path of the running binary, or "sidecar" to be resolved through PATH.
[[nodiscard]] std::filesystem::path current_executable();

} // namespace sidecar::guard
