#include <signal.h>
#include <unistd.h>
#include <sys/sysinfo.h>
#include <cstdlib>
#include <mutex>
#include <chrono>
#include <thread>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <coderun/paths.h>
#include <coderun/logger.h>
#include <coderun/pipeline.h>
#include <coderun/executor.h>
#include <coderun/supervisor.h>
#include <coderun/rate_limiter.h>
#include "config.h"
#include "server.h"

namespace {

int num_workers = get_nprocs();
bool single_worker = false;
std::shared_ptr<spdlog::logger> logger;
Supervisor* supervisor = nullptr;

std::mutex worker_mtx;
RunProgramServer* worker_server = nullptr;
bool worker_stopping = false;

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "coderun-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Listening port shared by all workers (default: $PORT or 3000)");
  parser.add_argument("-w", "--workers")
    .scan<'d', int>()
    .help("Number of worker processes (default: number of CPUs)");
  parser.add_argument("-t", "--threads")
    .scan<'d', int>()
    .help("Number of HTTP threads per worker");
  parser.add_argument("--single")
    .default_value(false)
    .implicit_value(true)
    .help("Serve from this process without forking workers");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: logger->set_level(spdlog::level::warn); break;
    case 1: logger->set_level(spdlog::level::info); break;
    default: logger->set_level(spdlog::level::debug); break;
  }
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file, num_workers, *logger)) exit(1);
  }
  if (!ParsePortEnv(getenv("PORT"))) {
    logger->error("Invalid PORT {}", getenv("PORT"));
    exit(1);
  }
  if (auto val = parser.present<int>("--port")) kPort = val.value();
  if (auto val = parser.present<int>("--workers")) num_workers = val.value();
  if (auto val = parser.present<int>("--threads")) kServerThreads = val.value();
  single_worker = parser["--single"] == true;
}

fs::path ExecutableDir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) return fs::current_path();
  return exe.parent_path();
}

int WorkerMain() {
  RunProgramServer server(logger, Pipeline(logger));
  {
    std::lock_guard lck(worker_mtx);
    if (worker_stopping) return 0;
    worker_server = &server;
  }
  logger->info("Worker {} is running on port {}", getpid(), kPort);
  if (!server.Listen("0.0.0.0", kPort)) {
    logger->error("Worker {} failed to listen on port {}", getpid(), kPort);
    std::lock_guard lck(worker_mtx);
    worker_server = nullptr;
    return 1;
  }
  std::lock_guard lck(worker_mtx);
  worker_server = nullptr;
  logger->info("Worker {} stopped", getpid());
  return 0;
}

// In-flight requests kill their programs and clean up before Listen() returns
void StopWorker() {
  logger->info("Worker {} stopping", getpid());
  CancelExecutions();
  std::unique_lock lck(worker_mtx);
  worker_stopping = true;
  // Stop() has no effect before the server is listening
  while (worker_server && !worker_server->IsRunning()) {
    lck.unlock();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    lck.lock();
  }
  if (worker_server) worker_server->Stop();
}

void HandleStop(int) {
  if (supervisor) supervisor->Stop();
}

} // namespace

int main(int argc, char** argv) {
  logger = CreateLogger("coderun");
  InitLogger();
  ParseArgs(argc, argv);
  if (kWorkspaceRoot.is_relative()) kWorkspaceRoot = ExecutableDir() / kWorkspaceRoot;
  logger->info("Workspace root {}, timeout {}ms", kWorkspaceRoot.c_str(), kExecutionTimeoutMs);
  if (single_worker) return RunInterruptible(WorkerMain, StopWorker);

  Supervisor sup(num_workers, WorkerMain, logger, StopWorker);
  supervisor = &sup;
  struct sigaction sa = {};
  sa.sa_handler = HandleStop;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGTERM, &sa, nullptr);
  sigaction(SIGINT, &sa, nullptr);
  return sup.Run();
}
