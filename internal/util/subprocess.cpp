#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace digiplayer::util {

namespace {

constexpr size_t kMaxCapturedOutput = 64 * 1024;

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Waits for the child until the deadline, then kills its process group.
int ReapChild(pid_t pid, std::chrono::steady_clock::time_point deadline, bool* timed_out) {
  int status = 0;
  while (true) {
    const pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) return DecodeStatus(status);
    if (rc < 0 && errno != EINTR) return -1;

    if (std::chrono::steady_clock::now() >= deadline) {
      *timed_out = true;
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
      }
      return DecodeStatus(status);
    }
    ::usleep(10 * 1000);
  }
}

} // namespace

std::string DescribeCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out.push_back(' ');
    out += arg;
  }
  return out;
}

ProcessResult SystemProcessRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw ExecutionError("spawn", "empty command line");
  }

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw ExecutionError("spawn", DescribeCommand(argv) + ": pipe2: " + std::strerror(errno));
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    ::close(pipe_fds[0]);
    ::close(pipe_fds[1]);
    throw ExecutionError("spawn", DescribeCommand(argv) + ": fork: " + std::strerror(saved));
  }

  if (pid == 0) {
    ::dup2(pipe_fds[1], STDOUT_FILENO);
    ::dup2(pipe_fds[1], STDERR_FILENO);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::setpgid(0, 0);
    ::execvp(c_argv[0], c_argv.data());
    ::_exit(127);
  }

  ::close(pipe_fds[1]);

  ProcessResult result;
  const auto    deadline = std::chrono::steady_clock::now() + timeout;
  char          buffer[4096];

  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd pfd{pipe_fds[0], POLLIN, 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = ::read(pipe_fds[0], buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;  // child closed its end
    if (result.output.size() < kMaxCapturedOutput) {
      result.output.append(buffer, static_cast<size_t>(n));
    }
  }

  ::close(pipe_fds[0]);

  result.exit_code = ReapChild(pid, deadline, &result.timed_out);
  return result;
}

} // namespace digiplayer::util
