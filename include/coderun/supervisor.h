#ifndef INCLUDE_CODERUN_SUPERVISOR_H_
#define INCLUDE_CODERUN_SUPERVISOR_H_

#include <set>
#include <atomic>
#include <memory>
#include <functional>
#include <sys/types.h>

#include <spdlog/spdlog.h>

// Keeps a fixed number of forked workers alive. A worker that exits for any
//  reason is replaced immediately; there is no backoff.
class Supervisor {
 public:
  // return value is the worker's exit status
  using WorkerMain = std::function<int()>;
  // asks a running WorkerMain to return
  using WorkerStop = std::function<void()>;
 private:
  int num_workers_;
  WorkerMain worker_main_;
  WorkerStop worker_stop_;
  std::shared_ptr<spdlog::logger> logger_;
  std::atomic_bool stop_;
  std::atomic_long spawned_;
  std::set<pid_t> workers_;

  bool SpawnWorker_();
  void ReapWorkers_();
 public:
  // Without worker_stop, SIGTERM kills a worker outright
  Supervisor(int num_workers, WorkerMain worker_main, std::shared_ptr<spdlog::logger> logger,
             WorkerStop worker_stop = nullptr);

  // Blocks until Stop(), then terminates the workers. Exits are noticed within
  //  one reap interval.
  int Run();
  // async-signal-safe
  void Stop() { stop_ = true; }

  long Spawned() const { return spawned_; }
  int NumWorkers() const { return num_workers_; }
};

// Run worker_main with SIGTERM and SIGINT blocked. The first of them calls
//  worker_stop on a helper thread; threads started by worker_main inherit the mask.
int RunInterruptible(const Supervisor::WorkerMain& worker_main, const Supervisor::WorkerStop& worker_stop);

#endif  // INCLUDE_CODERUN_SUPERVISOR_H_
