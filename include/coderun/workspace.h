#ifndef INCLUDE_CODERUN_WORKSPACE_H_
#define INCLUDE_CODERUN_WORKSPACE_H_

#include <string>
#include <memory>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "paths.h"

class Workspace { // RAII request directory
  fs::path path_;
  std::string token_;
  bool destroyed_;
  std::shared_ptr<spdlog::logger> logger_;
 public:
  // Path() is empty if the directory could not be created
  explicit Workspace(std::shared_ptr<spdlog::logger> logger, const fs::path& root = kWorkspaceRoot);
  ~Workspace() { Destroy(); }
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  const fs::path& Path() const { return path_; }
  const std::string& Token() const { return token_; }
  bool Valid() const { return !path_.empty() && !destroyed_; }

  // Remove the directory; only the first call does anything.
  // Failures are logged and reported by the return value only.
  bool Destroy();
};

#endif  // INCLUDE_CODERUN_WORKSPACE_H_
