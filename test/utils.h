#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <coderun/pipeline.h>

namespace fs = std::filesystem;

extern spdlog::level::level_enum log_level;

std::shared_ptr<spdlog::logger> TestLogger();
// scratch directory of this test run; removed at exit
const fs::path& TestRoot();
// number of entries directly inside dir; 0 if it does not exist
size_t CountEntries(const fs::path& dir);
// whether an executable is found on PATH
bool HasProgram(const std::string& name);

std::string RequestBody(const std::string& code, const std::string& language,
                        const std::vector<std::string>& input = {});

// Fresh workspace root per test, checked to be empty afterwards
class WorkspaceRootTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  fs::path root;
  std::shared_ptr<spdlog::logger> logger;
};

// Executor stub that records what would have been run
class RecordingExecutor {
  mutable std::mutex mtx_;
  std::vector<Command> commands_;
  std::vector<bool> source_present_;
 public:
  ExecutionResult result;
  // if set, the run step's input file content is echoed as stdout
  bool echo_input;

  RecordingExecutor() : echo_input(false) {}

  ExecutionResult operator()(const Command&, const ExecutionLimits&);
  Executor Get() {
    return [this](const Command& cmd, const ExecutionLimits& limits) { return (*this)(cmd, limits); };
  }
  size_t Calls() const;
  Command LastCommand() const;
  std::vector<Command> Commands() const;
  // whether every recorded command had its source file on disk when executed
  bool SourcesPresent() const;
};

#endif // TEST_UTILS_H_
