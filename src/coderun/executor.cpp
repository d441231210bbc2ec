#include <coderun/executor.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include "utils.h"

long kExecutionTimeoutMs = 30'000;
long kMaxOutputKiB = 1024;

namespace {

using Clock = std::chrono::steady_clock;

// how often a still-running step is checked for exit while its pipes are closed
constexpr int kReapIntervalMs = 10;
constexpr size_t kReadChunk = 16384;
// descriptor of the exec error pipe inside the child
constexpr int kReportFd = 3;

std::atomic_bool cancelled(false);

class Pipe {
  int fds_[2];
 public:
  Pipe() : fds_{-1, -1} {}
  ~Pipe() { CloseRead(); CloseWrite(); }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  bool Open() { return pipe2(fds_, O_CLOEXEC) == 0; }
  int Read() const { return fds_[0]; }
  int Write() const { return fds_[1]; }
  void CloseRead() { if (fds_[0] >= 0) close(fds_[0]); fds_[0] = -1; }
  void CloseWrite() { if (fds_[1] >= 0) close(fds_[1]); fds_[1] = -1; }
};

bool WaitChild(pid_t pid, int& status) {
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return false;
  }
  return true;
}

// true if the process has terminated; it is left as a zombie so that its
//  pid (and thus its process group id) stays reserved
bool ChildExited(pid_t pid) {
  siginfo_t info = {};
  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return errno == ECHILD;
  return info.si_pid == pid;
}

// Returns false on EOF or read error
bool ReadAvailable(int fd, std::string& buf, size_t max_output, bool& exceeded) {
  char tmp[kReadChunk];
  while (true) {
    ssize_t r = read(fd, tmp, sizeof(tmp));
    if (r > 0) {
      size_t room = buf.size() < max_output ? max_output - buf.size() : 0;
      if ((size_t)r > room) {
        buf.append(tmp, room);
        exceeded = true;
        return true;
      }
      buf.append(tmp, r);
      continue;
    }
    if (r == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// child; only async-signal-safe calls from here on
[[noreturn]] void ExecChild(char* const* argv, const char* workdir, pid_t parent,
                            int in_fd, int out_fd, int err_fd, int report_fd) {
  setpgid(0, 0);
  // the group leader must not outlive the worker thread that waits for it
  prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (getppid() != parent) _exit(127);
  signal(SIGPIPE, SIG_DFL);
  sigset_t none;
  sigemptyset(&none);
  sigprocmask(SIG_SETMASK, &none, nullptr);
  if (dup2(in_fd, 0) < 0 || dup2(out_fd, 1) < 0 || dup2(err_fd, 2) < 0 ||
      dup2(report_fd, kReportFd) < 0 || fcntl(kReportFd, F_SETFD, FD_CLOEXEC) < 0) {
    _exit(127);
  }
  // dup2 onto itself keeps FD_CLOEXEC
  for (int fd = 0; fd < 3; fd++) fcntl(fd, F_SETFD, 0);
  CloseFrom(kReportFd + 1);
  int err = 0;
  if (*workdir && chdir(workdir) < 0) {
    err = errno;
  } else {
    execvp(argv[0], argv);
    err = errno;
  }
  IGNORE_RETURN(write(kReportFd, &err, sizeof(err)));
  _exit(127);
}

// Run one step until it exits, the deadline passes or its output overflows.
// Returns true only if the step exited with status 0.
bool RunStep(const std::vector<std::string>& args, const std::optional<fs::path>& input,
             const fs::path& workdir, Clock::time_point deadline, size_t max_output,
             ExecutionResult& res, spdlog::logger& logger) {
  logger.debug("Run step workdir={} command={} input={}",
               workdir.c_str(), fmt::format("{}", args), input ? input->c_str() : "(none)");
  std::string input_path = input ? input->string() : "/dev/null";
  int in_fd = open(input_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (in_fd < 0) {
    res.error = fmt::format("Failed to open {}: {}", input_path, strerror(errno));
    logger.error("{}", *res.error);
    return false;
  }
  Pipe out_pipe, err_pipe, report_pipe;
  if (!out_pipe.Open() || !err_pipe.Open() || !report_pipe.Open()) {
    res.error = fmt::format("Failed to create pipes: {}", strerror(errno));
    logger.error("{}", *res.error);
    close(in_fd);
    return false;
  }
  // everything the child needs is prepared before fork
  std::vector<char*> argv;
  for (auto& i : args) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  std::string workdir_str = workdir.string();

  pid_t parent = getpid();
  pid_t pid = fork();
  if (pid < 0) {
    res.error = fmt::format("Failed to fork: {}", strerror(errno));
    logger.error("{}", *res.error);
    close(in_fd);
    return false;
  }
  if (pid == 0) {
    ExecChild(argv.data(), workdir_str.c_str(), parent, in_fd, out_pipe.Write(), err_pipe.Write(), report_pipe.Write());
  }
  setpgid(pid, pid); // also done by the child; whichever runs first wins
  close(in_fd);
  out_pipe.CloseWrite();
  err_pipe.CloseWrite();
  report_pipe.CloseWrite();

  int status = 0;
  {
    int err = 0;
    ssize_t r;
    while ((r = read(report_pipe.Read(), &err, sizeof(err))) < 0 && errno == EINTR);
    if (r == sizeof(err)) {
      WaitChild(pid, status);
      res.error = fmt::format("Failed to run {}: {}", args[0], strerror(err));
      logger.warn("{}", *res.error);
      return false;
    }
  }

  std::string* bufs[2] = {&res.stdout_data, &res.stderr_data};
  int fds[2] = {out_pipe.Read(), err_pipe.Read()};
  bool is_open[2] = {true, true};
  for (int fd : fds) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
  bool reaped = false, exceeded = false, timed_out = false, aborted = false, wait_error = false;
  while (is_open[0] || is_open[1] || !reaped) {
    if (!reaped && ChildExited(pid)) {
      // descendants left behind may still hold the pipes
      kill(-pid, SIGKILL);
      wait_error = !WaitChild(pid, status);
      reaped = true;
      continue;
    }
    if (cancelled) {
      aborted = true;
      break;
    }
    auto now = Clock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    long remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    struct pollfd pfds[2];
    int slot[2], nfds = 0;
    for (int i = 0; i < 2; i++) {
      if (!is_open[i]) continue;
      pfds[nfds] = {fds[i], POLLIN, 0};
      slot[nfds++] = i;
    }
    int wait_ms = (int)std::min(remaining, (long)kReapIntervalMs);
    int ready = poll(pfds, nfds, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      logger.error("poll failed: {}", strerror(errno));
      wait_error = true;
      break;
    }
    for (int i = 0; i < nfds && ready > 0; i++) {
      if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      int idx = slot[i];
      if (!ReadAvailable(fds[idx], *bufs[idx], max_output, exceeded)) is_open[idx] = false;
    }
    if (exceeded) break;
  }
  if (!reaped) {
    kill(-pid, SIGKILL);
    if (!WaitChild(pid, status)) wait_error = true;
  }

  if (aborted) {
    res.cancelled = true;
    res.error = "Execution cancelled";
    logger.warn("Step {} cancelled", args[0]);
    return false;
  }
  if (timed_out) {
    res.timed_out = true;
    logger.warn("Step {} timed out", args[0]);
    return false;
  }
  if (exceeded) {
    res.output_exceeded = true;
    res.error = fmt::format("Output limit of {} KiB exceeded", max_output / 1024);
    logger.warn("Step {}: {}", args[0], *res.error);
    return false;
  }
  if (wait_error) {
    res.error = fmt::format("Lost track of {}: {}", args[0], strerror(errno));
    logger.error("{}", *res.error);
    return false;
  }
  if (WIFSIGNALED(status)) {
    res.exit_code = -1;
    res.term_signal = WTERMSIG(status);
    res.error = fmt::format("Command failed: {} (killed by signal {}: {})",
                            fmt::join(args, " "), res.term_signal, strsignal(res.term_signal));
  } else {
    res.exit_code = WEXITSTATUS(status);
    res.term_signal = 0;
    if (res.exit_code != 0) {
      res.error = fmt::format("Command failed: {} (exit status {})", fmt::join(args, " "), res.exit_code);
    }
  }
  logger.debug("Step {} pid={} exit_code={} signal={}", args[0], pid, res.exit_code, res.term_signal);
  return !res.error;
}

} // namespace

ExecutionResult Execute(const Command& cmd, const ExecutionLimits& limits, spdlog::logger& logger) {
  ExecutionResult res;
  if (cmd.run.empty()) {
    res.error = "Empty command";
    return res;
  }
  if (cancelled) {
    res.cancelled = true;
    res.error = "Execution cancelled";
    return res;
  }
  auto deadline = Clock::now() + std::chrono::milliseconds(limits.timeout_ms);
  size_t max_output = (size_t)limits.max_output_kib * 1024;
  logger.info("Execute {} timeout={}ms", FormatCommand(cmd), limits.timeout_ms);
  if (!cmd.compile.empty() &&
      !RunStep(cmd.compile, std::nullopt, cmd.workdir, deadline, max_output, res, logger)) {
    return res;
  }
  RunStep(cmd.run, cmd.input, cmd.workdir, deadline, max_output, res, logger);
  return res;
}

void CancelExecutions() {
  cancelled = true;
}
