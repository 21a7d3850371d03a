#include "internal/diagnostics/diagnostic_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"

namespace portwatch::diagnostics {

namespace {

using Clock = std::chrono::steady_clock;

class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {
  }
  ~Fd() {
    Close();
  }

  Fd(const Fd&)            = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const {
    return fd_;
  }

  void Reset(int fd) {
    Close();
    fd_ = fd;
  }

  void Close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
};

bool MakePipe(Fd& read_end, Fd& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

int RemainingMs(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

// Reaps the child, killing it once the deadline has passed.
int ReapChild(pid_t pid, Clock::time_point deadline, bool& killed) {
  int status = 0;
  for (;;) {
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) return status;
    if (rc < 0 && errno != EINTR) return status;

    if (Clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      killed = true;
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

} // namespace

DiagnosticRunner::DiagnosticRunner(DiagnosticOptions options) : options_(std::move(options)) {
}

DiagnosticResult DiagnosticRunner::Inspect(uint16_t port) const {
  return Execute({options_.command, "--port", std::to_string(port)});
}

DiagnosticResult DiagnosticRunner::Execute(const std::vector<std::string>& argv) const {
  DiagnosticResult result;
  result.error = true;

  Fd out_read, out_write, err_read, err_write;
  if (!MakePipe(out_read, out_write) || !MakePipe(err_read, err_write)) {
    result.output = std::string("cannot create pipe: ") + std::strerror(errno);
    return result;
  }

  std::vector<char*> c_args;
  for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
  c_args.push_back(nullptr);

  const auto deadline = Clock::now() + options_.timeout;

  pid_t pid = ::fork();
  if (pid < 0) {
    result.output = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    // child: stdout+stderr into the pipe, no shell
    ::dup2(out_write.Get(), STDOUT_FILENO);
    ::dup2(out_write.Get(), STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);

    ::execvp(c_args[0], c_args.data());

    int err = errno;
    ssize_t ignored = ::write(err_write.Get(), &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  out_write.Close();
  err_write.Close();

  // The error pipe closes on a successful exec (O_CLOEXEC) or carries errno.
  int     exec_errno = 0;
  ssize_t n          = 0;
  do {
    n = ::read(err_read.Get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n == sizeof(exec_errno)) {
    bool killed = false;
    ReapChild(pid, deadline, killed);
    if (exec_errno == ENOENT) {
      result.output = options_.command + " not found on path";
    } else {
      result.output = "cannot execute " + options_.command + ": " + std::strerror(exec_errno);
    }
    return result;
  }

  bool truncated = false;
  bool timed_out = false;
  char buf[4096];
  for (;;) {
    int wait_ms = RemainingMs(deadline);
    if (wait_ms == 0) {
      timed_out = true;
      break;
    }

    pollfd pfd{out_read.Get(), POLLIN, 0};
    int    ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    ssize_t got = ::read(out_read.Get(), buf, sizeof(buf));
    if (got < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (got == 0) break; // EOF

    // keep draining past the cap so the child never blocks on a full pipe
    const auto room = options_.max_output_bytes > result.output.size() ? options_.max_output_bytes - result.output.size() : 0;
    if (static_cast<std::size_t>(got) > room) truncated = true;
    result.output.append(buf, std::min(room, static_cast<std::size_t>(got)));
  }

  bool killed = false;
  int  status = ReapChild(pid, timed_out ? Clock::now() : deadline, killed);
  timed_out   = timed_out || killed;

  if (truncated) {
    result.output += "\n[output truncated]";
  }

  if (timed_out) {
    result.timed_out = true;
    result.output += "\n" + options_.command + " timed out after " + std::to_string(options_.timeout.count()) + " ms";
    observability::LogWarn("diagnostic timed out", {observability::StringField("command", options_.command),
                                                    observability::IntField("timeout_ms", options_.timeout.count())});
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    result.error     = result.exit_code != 0;
    if (result.error) {
      result.output += "\nError: exit status " + std::to_string(result.exit_code);
    }
  } else if (WIFSIGNALED(status)) {
    result.output += "\nError: terminated by signal " + std::to_string(WTERMSIG(status));
  }
  return result;
}

} // namespace portwatch::diagnostics
