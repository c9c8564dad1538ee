#include "core/process/process_runner.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sweval::core::process {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Owns the three stdio pipes between parent and child.
struct StdioPipes {
  int stdin_fds[2] = {-1, -1};
  int stdout_fds[2] = {-1, -1};
  int stderr_fds[2] = {-1, -1};

  StdioPipes() = default;
  StdioPipes(const StdioPipes&) = delete;
  StdioPipes& operator=(const StdioPipes&) = delete;

  ~StdioPipes() {
    for (int* pair : {stdin_fds, stdout_fds, stderr_fds}) {
      CloseFd(pair[0]);
      CloseFd(pair[1]);
    }
  }

  bool Create(std::string& error) {
    if (::pipe2(stdin_fds, O_CLOEXEC) != 0 || ::pipe2(stdout_fds, O_CLOEXEC) != 0 ||
        ::pipe2(stderr_fds, O_CLOEXEC) != 0) {
      error = "failed to create stdio pipes (errno=" + std::to_string(errno) + ")";
      return false;
    }
    return true;
  }
};

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Writing to a pipe whose reader exited raises SIGPIPE. The runner handles
// EPIPE itself, so the signal must not terminate the process.
void IgnoreSigpipeOnce() {
  static std::once_flag flag;
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void ChildFail(const char* message) {
  const std::size_t length = std::char_traits<char>::length(message);
  (void)!::write(STDERR_FILENO, message, length);
  ::_exit(127);
}

void KillGroup(pid_t pid) {
  // Negative pid targets the process group created in the child.
  if (::kill(-pid, SIGKILL) != 0) {
    (void)::kill(pid, SIGKILL);
  }
}

// Drains whatever is readable from `fd` into `sink`. Closes `fd` on EOF or a
// hard read error.
void DrainReadable(int& fd, std::string& sink) {
  std::array<char, kReadChunkBytes> buffer{};
  while (fd >= 0) {
    const ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      sink.append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      CloseFd(fd);
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      CloseFd(fd);
    }
    return;
  }
}

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

bool RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options,
                ProcessResult& result, std::string& error) {
  result = ProcessResult{};
  error.clear();

  if (argv.empty() || argv.front().empty()) {
    error = "process argv cannot be empty";
    return false;
  }

  IgnoreSigpipeOnce();

  StdioPipes pipes;
  if (!pipes.Create(error)) {
    return false;
  }

  // Everything the child touches is prepared before fork().
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);
  const std::string working_dir = options.working_dir.string();

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = "fork failed for command: " + DescribeCommand(argv);
    return false;
  }

  if (pid == 0) {
    (void)::setpgid(0, 0);
    if (::dup2(pipes.stdin_fds[0], STDIN_FILENO) < 0 ||
        ::dup2(pipes.stdout_fds[1], STDOUT_FILENO) < 0 ||
        ::dup2(pipes.stderr_fds[1], STDERR_FILENO) < 0) {
      ChildFail("sweval: failed to wire child stdio\n");
    }
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
      ChildFail("sweval: failed to change child working directory\n");
    }
    ::execvp(c_argv[0], c_argv.data());
    ChildFail("sweval: exec failed\n");
  }

  (void)::setpgid(pid, pid);
  CloseFd(pipes.stdin_fds[0]);
  CloseFd(pipes.stdout_fds[1]);
  CloseFd(pipes.stderr_fds[1]);

  int& stdin_fd = pipes.stdin_fds[1];
  int& stdout_fd = pipes.stdout_fds[0];
  int& stderr_fd = pipes.stderr_fds[0];
  SetNonBlocking(stdin_fd);
  SetNonBlocking(stdout_fd);
  SetNonBlocking(stderr_fd);

  std::size_t stdin_offset = 0;
  if (options.stdin_text.empty()) {
    CloseFd(stdin_fd);
  }

  const bool has_deadline = options.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;

  while (stdout_fd >= 0 || stderr_fd >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        KillGroup(pid);
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 1'000));
    }

    std::array<pollfd, 3> poll_fds{};
    nfds_t count = 0;
    if (stdin_fd >= 0) {
      poll_fds[count++] = pollfd{stdin_fd, POLLOUT, 0};
    }
    if (stdout_fd >= 0) {
      poll_fds[count++] = pollfd{stdout_fd, POLLIN, 0};
    }
    if (stderr_fd >= 0) {
      poll_fds[count++] = pollfd{stderr_fd, POLLIN, 0};
    }

    const int ready = ::poll(poll_fds.data(), count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      KillGroup(pid);
      int ignored_status = 0;
      (void)::waitpid(pid, &ignored_status, 0);
      error = "poll failed while running command: " + DescribeCommand(argv);
      return false;
    }

    for (nfds_t i = 0; i < count; ++i) {
      const pollfd& entry = poll_fds[i];
      if (entry.revents == 0) {
        continue;
      }
      if (entry.fd == stdin_fd) {
        const std::size_t pending = options.stdin_text.size() - stdin_offset;
        const ssize_t written =
            ::write(stdin_fd, options.stdin_text.data() + stdin_offset, pending);
        if (written > 0) {
          stdin_offset += static_cast<std::size_t>(written);
          if (stdin_offset >= options.stdin_text.size()) {
            CloseFd(stdin_fd);
          }
        } else if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
          // Child closed its stdin early; the rest of the input is dropped.
          CloseFd(stdin_fd);
        }
      } else if (entry.fd == stdout_fd) {
        DrainReadable(stdout_fd, result.stdout_text);
      } else if (entry.fd == stderr_fd) {
        DrainReadable(stderr_fd, result.stderr_text);
      }
    }
  }

  CloseFd(stdin_fd);
  CloseFd(stdout_fd);
  CloseFd(stderr_fd);

  // Pipes can close before the child exits, so the deadline still applies
  // while reaping.
  int status = 0;
  while (true) {
    const pid_t reaped = ::waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
    if (reaped == pid) {
      break;
    }
    if (reaped < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed to reap child for command: " + DescribeCommand(argv);
      return false;
    }
    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      KillGroup(pid);
      result.timed_out = true;
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  result.exit_code = DecodeWaitStatus(status);
  return true;
}

std::string DescribeCommand(const std::vector<std::string>& argv) {
  std::string text;
  for (const auto& arg : argv) {
    if (!text.empty()) {
      text.push_back(' ');
    }
    if (arg.find_first_of(" \t\n'\"") == std::string::npos && !arg.empty()) {
      text += arg;
      continue;
    }
    text += "'";
    for (const char c : arg) {
      if (c == '\n') {
        text += "\\n";
      } else if (c == '\'') {
        text += "\\'";
      } else {
        text.push_back(c);
      }
    }
    text += "'";
  }
  return text;
}

} // namespace sweval::core::process
