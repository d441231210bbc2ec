#ifndef INCLUDE_CODERUN_SOURCE_H_
#define INCLUDE_CODERUN_SOURCE_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "language.h"
#include "workspace.h"

// First identifier following the keyword `class`
std::optional<std::string> JavaClassName(const std::string& code);

// "Program.<ext>", or "<Class>.java" for Java; nullopt if Java code has no class
std::optional<std::string> SourceFileName(Language, const std::string& code);

std::string JoinInput(const std::vector<std::string>& input);

struct SourceFiles {
  fs::path source;
  std::optional<fs::path> input; // only if input lines were supplied
};

// Write code (verbatim) and newline-joined input into the workspace
std::optional<SourceFiles> MaterializeSource(
    const Workspace&, const std::string& file_name, const std::string& code,
    const std::vector<std::string>& input, spdlog::logger&);

#endif  // INCLUDE_CODERUN_SOURCE_H_
