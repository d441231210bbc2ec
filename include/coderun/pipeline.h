#ifndef INCLUDE_CODERUN_PIPELINE_H_
#define INCLUDE_CODERUN_PIPELINE_H_

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

#include <spdlog/spdlog.h>

#include "paths.h"
#include "executor.h"
#include "response.h"

// in characters
extern size_t kMaxCodeLength;
// joined input, in characters
extern size_t kMaxInputLength;

struct ExecutionRequest {
  std::string code;
  std::string language;
  std::vector<std::string> input;
};

using Executor = std::function<ExecutionResult(const Command&, const ExecutionLimits&)>;

class Pipeline {
  std::shared_ptr<spdlog::logger> logger_;
  Executor executor_;
  fs::path workspace_root_;
  ExecutionLimits limits_;
 public:
  explicit Pipeline(std::shared_ptr<spdlog::logger> logger);
  Pipeline(std::shared_ptr<spdlog::logger> logger, Executor executor,
           const fs::path& workspace_root = kWorkspaceRoot,
           const ExecutionLimits& limits = ExecutionLimits());

  // body is the JSON request body
  Response Run(const std::string& body) const;
  Response Run(const ExecutionRequest&) const;

  // Returns the rejection if the body is not a well-formed request
  static std::optional<Response> ParseRequest(const std::string& body, ExecutionRequest& req);

  const fs::path& WorkspaceRoot() const { return workspace_root_; }
  const ExecutionLimits& Limits() const { return limits_; }
};

#endif  // INCLUDE_CODERUN_PIPELINE_H_
