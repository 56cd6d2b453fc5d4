#include "sidecar/common/process.hpp"

#include <algorithm>
#include <array>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sidecar::common {

namespace {

constexpr std::size_t kMaxCaptureBytes = 16 * 1024 * 1024;

void set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Returns false once the descriptor reached end of file.
bool drain(const int fd, std::string &sink) {
  std::array<char, 4096> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      const std::size_t room = kMaxCaptureBytes > sink.size() ? kMaxCaptureBytes - sink.size() : 0;
      sink.append(buffer.data(), std::min<std::size_t>(room, static_cast<std::size_t>(bytes)));
      continue;
    }
    return bytes < 0;
  }
}

void close_pipe(int fds[2]) {
  if (fds[0] >= 0) {
    close(fds[0]);
  }
  if (fds[1] >= 0) {
    close(fds[1]);
  }
}

} // namespace

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const std::filesystem::path &cwd,
                                  const std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure(ErrorCode::Spawn, "empty command line");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return Result<ProcessResult>::failure(ErrorCode::Spawn, "Failed to create pipe");
  }
  if (pipe(err_pipe) != 0) {
    close_pipe(out_pipe);
    return Result<ProcessResult>::failure(ErrorCode::Spawn, "Failed to create pipe");
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    return Result<ProcessResult>::failure(ErrorCode::Spawn, "Failed to fork");
  }

  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[1]);
    close(err_pipe[1]);

    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      _exit(kExecFailedExitCode);
    }

    execvp(c_argv[0], c_argv.data());
    _exit(kExecFailedExitCode);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  set_nonblocking(out_pipe[0]);
  set_nonblocking(err_pipe[0]);

  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();

  int status = 0;
  bool out_open = true;
  bool err_open = true;
  bool reaped = false;
  while (!reaped) {
    if (std::chrono::steady_clock::now() - started > timeout) {
      kill(pid, SIGKILL);
      result.timed_out = true;
      break;
    }

    struct pollfd pfds[2] = {
        {.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(pfds, 2, 50);

    if (out_open) {
      out_open = drain(out_pipe[0], result.output);
    }
    if (err_open) {
      err_open = drain(err_pipe[0], result.error_output);
    }

    if (!out_open && !err_open) {
      reaped = waitpid(pid, &status, 0) == pid;
      break;
    }
    reaped = waitpid(pid, &status, WNOHANG) == pid;
  }

  if (!result.timed_out) {
    // Pick up whatever the child wrote just before exiting.
    (void)drain(out_pipe[0], result.output);
    (void)drain(err_pipe[0], result.error_output);
  }

  close(out_pipe[0]);
  close(err_pipe[0]);
  if (!reaped) {
    waitpid(pid, &status, 0);
  }

  if (!result.timed_out) {
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }
  return Result<ProcessResult>::success(std::move(result));
}

} // namespace sidecar::common
