#include <coderun/supervisor.h>

#include <signal.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <cstring>
#include <algorithm>

namespace {

constexpr auto kReapInterval = std::chrono::milliseconds(50);
// after SIGTERM, workers get this long before SIGKILL
constexpr auto kStopGracePeriod = std::chrono::seconds(5);

} // namespace

int RunInterruptible(const Supervisor::WorkerMain& worker_main, const Supervisor::WorkerStop& worker_stop) {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGINT);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  // left blocked in sigwait if worker_main returns on its own; the process exits then
  std::thread([set, worker_stop] {
    int sig = 0;
    if (sigwait(&set, &sig) == 0) worker_stop();
  }).detach();
  return worker_main();
}

Supervisor::Supervisor(int num_workers, WorkerMain worker_main, std::shared_ptr<spdlog::logger> logger,
                       WorkerStop worker_stop) :
    num_workers_(std::max(1, num_workers)),
    worker_main_(std::move(worker_main)),
    worker_stop_(std::move(worker_stop)),
    logger_(std::move(logger)),
    stop_(false),
    spawned_(0) {}

bool Supervisor::SpawnWorker_() {
  pid_t parent = getpid();
  pid_t pid = fork();
  if (pid < 0) {
    logger_->error("Failed to fork worker: {}", strerror(errno));
    return false;
  }
  if (pid == 0) {
    // die with the supervisor
    prctl(PR_SET_PDEATHSIG, SIGTERM);
    if (getppid() != parent) _exit(1);
    signal(SIGTERM, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    int ret = 1;
    try {
      ret = worker_stop_ ? RunInterruptible(worker_main_, worker_stop_) : worker_main_();
    } catch (const std::exception& e) {
      logger_->error("Worker {} terminated by exception: {}", getpid(), e.what());
    }
    _exit(ret); // since forked, atexit() handlers belong to the supervisor
  }
  workers_.insert(pid);
  spawned_++;
  logger_->info("Started worker {}", pid);
  return true;
}

void Supervisor::ReapWorkers_() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    int status = 0;
    pid_t ret = waitpid(*it, &status, WNOHANG);
    if (ret == 0 || (ret < 0 && errno == EINTR)) {
      ++it;
      continue;
    }
    if (ret < 0) {
      logger_->warn("Lost worker {}: {}", *it, strerror(errno));
    } else if (WIFSIGNALED(status)) {
      logger_->warn("Worker {} killed by signal {}", *it, WTERMSIG(status));
    } else {
      logger_->info("Worker {} exited with status {}", *it, WEXITSTATUS(status));
    }
    it = workers_.erase(it);
  }
}

int Supervisor::Run() {
  logger_->info("Supervisor {} keeping {} workers", getpid(), num_workers_);
  while (!stop_) {
    ReapWorkers_();
    while (!stop_ && (int)workers_.size() < num_workers_) {
      if (!SpawnWorker_()) break;
    }
    std::this_thread::sleep_for(kReapInterval);
  }

  logger_->info("Stopping {} workers", workers_.size());
  for (pid_t pid : workers_) kill(pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + kStopGracePeriod;
  while (!workers_.empty() && std::chrono::steady_clock::now() < deadline) {
    ReapWorkers_();
    if (!workers_.empty()) std::this_thread::sleep_for(kReapInterval);
  }
  for (pid_t pid : workers_) {
    logger_->warn("Worker {} did not stop; killing", pid);
    kill(pid, SIGKILL);
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
  }
  workers_.clear();
  logger_->info("Supervisor stopped");
  return 0;
}
