#include <coderun/logger.h>

#include <pthread.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// Every color console sink locks this mutex while writing. Hold it across
//  fork() so that the child does not start with the mutex taken by another thread.
namespace {

void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

std::shared_ptr<spdlog::logger> CreateLogger(const std::string& name, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(level);
  logger->set_pattern("[%P] %+");
  return logger;
}

void InitLogger() {
  static bool initialized = false;
  if (initialized) return;
  initialized = true;
  pthread_atfork(Prepare, Parent, Child);
}
