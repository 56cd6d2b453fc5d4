#pragma once

#include "sidecar/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sidecar::common {

struct ProcessResult {
  int exit_code = -1;
  std::string output;
  std::string error_output;
  bool timed_out = false;
};

/// Exit status a child reports when its program could not be executed.
inline constexpr int kExecFailedExitCode = 127;

/// Run argv[0] (searched on PATH) in cwd, capturing stdout and stderr.
/// The child is killed when timeout elapses and the result is flagged
/// timed_out. Fails with ErrorCode::Spawn when no child could be started.
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const std::filesystem::path &cwd,
                                                std::chrono::milliseconds timeout);

} // namespace sidecar::common
