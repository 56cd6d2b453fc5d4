#include "sidecar/changes/git_client.hpp"

namespace sidecar::changes {

ProcessGitClient::ProcessGitClient(const std::chrono::milliseconds timeout, std::string executable)
    : timeout_(timeout), executable_(std::move(executable)) {}

common::Result<common::ProcessResult>
ProcessGitClient::run(const std::filesystem::path &repo, const std::vector<std::string> &args) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(executable_);
  argv.insert(argv.end(), args.begin(), args.end());
  return common::run_process(argv, repo, timeout_);
}

} // namespace sidecar::changes
