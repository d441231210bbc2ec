#ifndef INCLUDE_CODERUN_COMMAND_H_
#define INCLUDE_CODERUN_COMMAND_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "language.h"

namespace fs = std::filesystem;

// Argument vectors are passed to execvp directly; no shell is involved.
// The run step only starts if the compile step (if any) succeeded.
struct Command {
  std::vector<std::string> compile; // empty for interpreted languages
  std::vector<std::string> run;
  fs::path workdir;
  std::optional<fs::path> input; // stdin of the run step; /dev/null if absent
};

Command SynthesizeCommand(Language, const fs::path& source, const std::optional<fs::path>& input);

// shell-like rendering, for logging only
std::string FormatCommand(const Command&);

#endif  // INCLUDE_CODERUN_COMMAND_H_
