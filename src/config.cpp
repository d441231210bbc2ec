#include "config.h"

#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <coderun/paths.h>
#include <coderun/pipeline.h>
#include <coderun/executor.h>
#include <coderun/rate_limiter.h>
#include "server.h"

namespace {

constexpr long kMaxPort = 65535;

} // namespace

bool ParseConfig(const fs::path& conf_path, int& num_workers, spdlog::logger& logger) {
  std::ifstream fin(conf_path);
  if (!fin) {
    logger.error("Cannot read configuration file {}", conf_path.c_str());
    return false;
  }
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  long port = ini[""]["port"] | (long)kPort;
  long workers = ini[""]["workers"] | (long)num_workers;
  long threads = ini[""]["threads"] | (long)kServerThreads;
  long timeout_ms = ini[""]["timeout_ms"] | kExecutionTimeoutMs;
  long max_code_length = ini[""]["max_code_length"] | (long)kMaxCodeLength;
  long max_input_length = ini[""]["max_input_length"] | (long)kMaxInputLength;
  long max_output_kib = ini[""]["max_output_kib"] | kMaxOutputKiB;
  long max_payload_kib = ini[""]["max_payload_kib"] | kMaxPayloadKiB;
  long rate_limit_window_ms = ini[""]["rate_limit_window_ms"] | kRateLimitWindowMs;
  long rate_limit_max = ini[""]["rate_limit_max"] | (long)kRateLimitMax;

  const std::pair<const char*, long> numbers[] = {
    {"port", port}, {"workers", workers}, {"threads", threads}, {"timeout_ms", timeout_ms},
    {"max_code_length", max_code_length}, {"max_input_length", max_input_length},
    {"max_output_kib", max_output_kib}, {"max_payload_kib", max_payload_kib},
    {"rate_limit_window_ms", rate_limit_window_ms}, {"rate_limit_max", rate_limit_max},
  };
  for (auto& [key, value] : numbers) {
    if (value <= 0) {
      logger.error("{}: {} must be positive, got {}", conf_path.c_str(), key, value);
      return false;
    }
  }
  if (port > kMaxPort) {
    logger.error("{}: port {} out of range", conf_path.c_str(), port);
    return false;
  }

  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  kPort = port;
  num_workers = workers;
  kServerThreads = threads;
  kExecutionTimeoutMs = timeout_ms;
  kMaxCodeLength = max_code_length;
  kMaxInputLength = max_input_length;
  kMaxOutputKiB = max_output_kib;
  kMaxPayloadKiB = max_payload_kib;
  kRateLimitWindowMs = rate_limit_window_ms;
  kRateLimitMax = rate_limit_max;
  return true;
}

bool ParsePortEnv(const char* env) {
  if (!env || !*env) return true;
  char* end;
  long port = strtol(env, &end, 10);
  if (*end || port <= 0 || port > kMaxPort) return false;
  kPort = port;
  return true;
}
