#ifndef INCLUDE_CODERUN_PATHS_H_
#define INCLUDE_CODERUN_PATHS_H_

#include <filesystem>

#include "language.h"

namespace fs = std::filesystem;

// Base directory of request workspaces; relative paths are resolved against
//  the server binary's directory at startup
extern fs::path kWorkspaceRoot;

fs::path WorkspaceInput(const fs::path& workspace);
// compiled artifact of the language; empty for interpreted languages
fs::path WorkspaceProgram(const fs::path& workspace, Language);

#endif  // INCLUDE_CODERUN_PATHS_H_
