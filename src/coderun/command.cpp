#include <coderun/command.h>

#include <coderun/paths.h>

namespace {

std::vector<std::string> CompileCommand(Language lang, const fs::path& source, const fs::path& program) {
  switch (lang) {
    case Language::JAVA: return {"javac", source};
    case Language::C: return {"gcc", source, "-o", program};
    case Language::CPP: return {"g++", source, "-o", program};
    case Language::CSHARP: return {"mcs", source, "-out:" + program.string()};
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVASCRIPT: return {};
  }
  __builtin_unreachable();
}

std::vector<std::string> RunCommand(Language lang, const fs::path& source, const fs::path& program) {
  switch (lang) {
    // class files are written beside the source
    case Language::JAVA: return {"java", "-cp", source.parent_path(), source.stem()};
    case Language::PYTHON: return {"python3", source};
    case Language::JAVASCRIPT: return {"node", source};
    case Language::C: [[fallthrough]];
    case Language::CPP: return {program};
    case Language::CSHARP: return {"mono", program};
  }
  __builtin_unreachable();
}

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string ret;
  for (auto& i : args) {
    if (!ret.empty()) ret += ' ';
    ret += i;
  }
  return ret;
}

} // namespace

Command SynthesizeCommand(Language lang, const fs::path& source, const std::optional<fs::path>& input) {
  fs::path workdir = source.parent_path();
  fs::path program = WorkspaceProgram(workdir, lang);
  Command ret;
  ret.compile = CompileCommand(lang, source, program);
  ret.run = RunCommand(lang, source, program);
  ret.workdir = workdir;
  ret.input = input;
  return ret;
}

std::string FormatCommand(const Command& cmd) {
  std::string ret;
  if (!cmd.compile.empty()) ret = JoinArgs(cmd.compile) + " && ";
  ret += JoinArgs(cmd.run);
  if (cmd.input) ret += " < " + cmd.input->string();
  return ret;
}
