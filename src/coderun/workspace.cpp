#include <coderun/workspace.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "utils.h"

namespace {

const char kWorkspaceTemplate[] = "run-XXXXXX";

} // namespace

Workspace::Workspace(std::shared_ptr<spdlog::logger> logger, const fs::path& root) :
    destroyed_(false), logger_(std::move(logger)) {
  std::error_code ec;
  fs::path base = fs::absolute(root, ec);
  if (ec || !CreateDirs(base, *logger_)) return;
  // mkdtemp creates the directory atomically, so tokens never collide even
  //  between worker processes sharing the root
  std::string tmpl = (base / kWorkspaceTemplate).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    logger_->error("Failed creating workspace under {}: {}", base.c_str(), strerror(errno));
    return;
  }
  path_ = buf.data();
  token_ = path_.filename().string();
  logger_->debug("Created workspace {}", path_.c_str());
}

bool Workspace::Destroy() {
  if (path_.empty() || destroyed_) return true;
  destroyed_ = true;
  return RemoveAll(path_, *logger_);
}
