#include "sidecar/guard/launcher.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/observability/global.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sidecar::guard {

DetachedProcessLauncher::DetachedProcessLauncher(DetachedLaunchOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> DetachedProcessLauncher::build_argv(const LaunchRequest &request) const {
  std::vector<std::string> argv = {options_.executable.string()};
  if (options_.config_path.has_value()) {
    argv.push_back("--config");
    argv.push_back(options_.config_path->string());
  }
  argv.insert(argv.end(), {"analyze", "--session-id", request.session_id, "--background"});
  if (request.snapshot) {
    argv.push_back("--snapshot");
  }
  if (request.project_path.has_value() && !request.project_path->empty()) {
    argv.push_back("--project");
    argv.push_back(*request.project_path);
  }
  return argv;
}

std::filesystem::path DetachedProcessLauncher::log_path(const std::string &session_id) const {
  return options_.logs_dir / ("analyze-" + common::safe_file_component(session_id) + ".log");
}

common::Status DetachedProcessLauncher::launch(const LaunchRequest &request) {
  auto logs = common::ensure_dir(options_.logs_dir);
  if (!logs.ok()) {
    return common::Status::error(common::ErrorCode::Spawn, logs.error());
  }

  // Everything the children touch is prepared before fork.
  const auto args = build_argv(request);
  std::vector<char *> cargs;
  cargs.reserve(args.size() + 1);
  for (const auto &arg : args) {
    cargs.push_back(const_cast<char *>(arg.c_str()));
  }
  cargs.push_back(nullptr);
  const std::string log_file = log_path(request.session_id).string();
  const std::string working_dir = options_.working_dir.string();
  const std::string exec_error = "sidecar: failed to exec " + args.front() + "\n";

  const pid_t pid = fork();
  if (pid < 0) {
    observability::record_event(observability::SpawnEvent{
        .session_id = request.session_id, .snapshot = request.snapshot, .success = false});
    return common::Status::error(common::ErrorCode::Spawn,
                                 std::string("failed to fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    if (setsid() < 0) {
      _exit(1);
    }
    const pid_t grandchild = fork();
    if (grandchild < 0) {
      _exit(1);
    }
    if (grandchild > 0) {
      _exit(0);
    }

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    const int log_fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (log_fd >= 0) {
      dup2(log_fd, STDOUT_FILENO);
      dup2(log_fd, STDERR_FILENO);
      close(log_fd);
    }
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      _exit(1);
    }

    execvp(cargs[0], cargs.data());
    const ssize_t written = write(STDERR_FILENO, exec_error.data(), exec_error.size());
    (void)written;
    _exit(127);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      break;
    }
  }
  const bool detached = WIFEXITED(status) && WEXITSTATUS(status) == 0;
  observability::record_event(observability::SpawnEvent{
      .session_id = request.session_id, .snapshot = request.snapshot, .success = detached});
  if (!detached) {
    return common::Status::error(common::ErrorCode::Spawn,
                                 "failed to detach background analysis for " + request.session_id);
  }
  return common::Status::success();
}

std::filesystem::path current_executable() {
  std::error_code ec;
  const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec || self.empty()) {
    return "sidecar";
  }
  return self;
}

} // namespace sidecar::guard
