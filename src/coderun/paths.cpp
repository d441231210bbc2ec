#include <coderun/paths.h>

fs::path kWorkspaceRoot = "temp";

namespace {

const char kInputFile[] = "input.txt";
const char kNativeProgram[] = "program";
const char kAssemblyProgram[] = "Program.exe";

} // namespace

fs::path WorkspaceInput(const fs::path& workspace) {
  return workspace / kInputFile;
}

fs::path WorkspaceProgram(const fs::path& workspace, Language lang) {
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: return workspace / kNativeProgram;
    case Language::CSHARP: return workspace / kAssemblyProgram;
    case Language::JAVA: [[fallthrough]];
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVASCRIPT: return fs::path();
  }
  __builtin_unreachable();
}
