#pragma once

#include "sidecar/common/process.hpp"
#include "sidecar/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sidecar::changes {

/// Runs version-control queries against a working tree.
class GitClient {
public:
  virtual ~GitClient() = default;

  /// Run `git <args>` inside repo. A failed result means no process could be
  /// started; a started process reports its exit code and timeout flag.
  [[nodiscard]] virtual common::Result<common::ProcessResult>
  run(const std::filesystem::path &repo, const std::vector<std::string> &args) = 0;
};

class ProcessGitClient final : public GitClient {
public:
  explicit ProcessGitClient(std::chrono::milliseconds timeout = std::chrono::seconds(30),
                            std::string executable = "git");

  [[nodiscard]] common::Result<common::ProcessResult>
  run(const std::filesystem::path &repo, const std::vector<std::string> &args) override;

private:
  std::chrono::milliseconds timeout_;
  std::string executable_;
};

} // namespace sidecar::changes
