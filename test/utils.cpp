#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <coderun/logger.h>

std::shared_ptr<spdlog::logger> TestLogger() {
  static auto logger = CreateLogger("test", log_level);
  return logger;
}

const fs::path& TestRoot() {
  static fs::path root = [] {
    char path[] = "/tmp/coderun_test_XXXXXX";
    if (!mkdtemp(path)) throw std::runtime_error("Failed to create test root");
    return fs::path(path);
  }();
  return root;
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ret++;
  return ret;
}

bool HasProgram(const std::string& name) {
  const char* path = getenv("PATH");
  if (!path) return false;
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) continue;
    fs::path candidate = fs::path(dir) / name;
    if (access(candidate.c_str(), X_OK) == 0) return true;
  }
  return false;
}

std::string RequestBody(const std::string& code, const std::string& language,
                        const std::vector<std::string>& input) {
  nlohmann::json body{{"code", code}, {"language", language}};
  if (!input.empty()) body["input"] = input;
  return body.dump();
}

void WorkspaceRootTest::SetUp() {
  char path[256];
  snprintf(path, sizeof(path), "%s/root_XXXXXX", TestRoot().c_str());
  ASSERT_NE(mkdtemp(path), nullptr);
  root = path;
  logger = TestLogger();
}

void WorkspaceRootTest::TearDown() {
  EXPECT_EQ(CountEntries(root), 0u) << "workspace left behind in " << root;
  fs::remove_all(root);
}

ExecutionResult RecordingExecutor::operator()(const Command& cmd, const ExecutionLimits&) {
  // the source is the first argument of the first step
  const auto& first = cmd.compile.empty() ? cmd.run : cmd.compile;
  bool present = first.size() > 1 && fs::is_regular_file(first[1]);
  ExecutionResult ret = result;
  if (echo_input && cmd.input) {
    std::ifstream fin(*cmd.input);
    std::stringstream ss;
    ss << fin.rdbuf();
    ret.stdout_data = ss.str();
  }
  std::lock_guard lck(mtx_);
  commands_.push_back(cmd);
  source_present_.push_back(present);
  return ret;
}

size_t RecordingExecutor::Calls() const {
  std::lock_guard lck(mtx_);
  return commands_.size();
}

Command RecordingExecutor::LastCommand() const {
  std::lock_guard lck(mtx_);
  return commands_.empty() ? Command() : commands_.back();
}

std::vector<Command> RecordingExecutor::Commands() const {
  std::lock_guard lck(mtx_);
  return commands_;
}

bool RecordingExecutor::SourcesPresent() const {
  std::lock_guard lck(mtx_);
  for (bool i : source_present_) {
    if (!i) return false;
  }
  return true;
}
