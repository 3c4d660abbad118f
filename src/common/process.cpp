#include "codebox/common/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codebox::common {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Returns false once the stream reached EOF.
bool read_into_buffer(const int fd, std::string &buffer, const std::size_t limit,
                      bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto count = static_cast<std::size_t>(bytes);
      if (buffer.size() < limit) {
        const std::size_t room = limit - buffer.size();
        buffer.append(chunk.data(), count < room ? count : room);
        if (count > room) {
          truncated = true;
        }
      } else {
        truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                  const ProcessOptions &options) {
  if (argv.empty()) {
    return Result<ProcessResult>::failure("command is empty", ErrorCode::InvalidArgument);
  }

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return Result<ProcessResult>::failure("failed to create pipes for " + argv.front());
  }

  // The child must not allocate between fork() and exec.
  std::vector<char *> child_argv;
  child_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    child_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return Result<ProcessResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdin_pipe[0], STDIN_FILENO);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
      close(fds[0]);
      close(fds[1]);
    }

    execvp(child_argv[0], child_argv.data());
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdin_pipe[0]);
  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  set_non_blocking(stdin_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  // Writing to a child that exited early must report EPIPE, not raise SIGPIPE.
  static const bool sigpipe_ignored = [] {
    (void)std::signal(SIGPIPE, SIG_IGN);
    return true;
  }();
  (void)sigpipe_ignored;

  ProcessResult result;
  std::size_t stdin_offset = 0;
  if (options.stdin_data.empty()) {
    close_fd(stdin_pipe[1]);
  }

  int status = 0;
  bool exited = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    if (stdin_pipe[1] >= 0) {
      const ssize_t written = write(stdin_pipe[1], options.stdin_data.data() + stdin_offset,
                                    options.stdin_data.size() - stdin_offset);
      if (written > 0) {
        stdin_offset += static_cast<std::size_t>(written);
      }
      if (stdin_offset >= options.stdin_data.size() ||
          (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
        close_fd(stdin_pipe[1]);
      }
    }

    if (stdout_pipe[0] >= 0 &&
        !read_into_buffer(stdout_pipe[0], result.stdout_text, options.output_limit,
                          result.truncated)) {
      close_fd(stdout_pipe[0]);
    }
    if (stderr_pipe[0] >= 0 &&
        !read_into_buffer(stderr_pipe[0], result.stderr_text, options.output_limit,
                          result.truncated)) {
      close_fd(stderr_pipe[0]);
    }

    if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
    }
    if (exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
      break;
    }

    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      (void)kill(-pid, SIGKILL);
      if (!exited) {
        (void)waitpid(pid, &status, 0);
        exited = true;
      }
      break;
    }

    // Descendants may keep the pipes open after the direct child exits.
    if (exited) {
      (void)kill(-pid, SIGKILL);
    }

    struct pollfd poll_fds[3] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stdin_pipe[1], .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds, 3, 50);
  }

  if (stdout_pipe[0] >= 0) {
    (void)read_into_buffer(stdout_pipe[0], result.stdout_text, options.output_limit,
                           result.truncated);
  }
  if (stderr_pipe[0] >= 0) {
    (void)read_into_buffer(stderr_pipe[0], result.stderr_text, options.output_limit,
                           result.truncated);
  }
  close_fd(stdin_pipe[1]);
  close_fd(stdout_pipe[0]);
  close_fd(stderr_pipe[0]);

  if (result.timed_out) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  return Result<ProcessResult>::success(std::move(result));
}

} // namespace codebox::common
