#include <coderun/source.h>

#include <regex>

#include <coderun/paths.h>
#include "utils.h"

namespace {

const char kDefaultStem[] = "Program";

} // namespace

std::optional<std::string> JavaClassName(const std::string& code) {
  static const std::regex kClassRegex(R"(class\s+([a-zA-Z_$][a-zA-Z\d_$]*))");
  std::smatch match;
  if (!std::regex_search(code, match, kClassRegex)) return std::nullopt;
  return match[1].str();
}

std::optional<std::string> SourceFileName(Language lang, const std::string& code) {
  if (lang == Language::JAVA) {
    auto name = JavaClassName(code);
    if (!name) return std::nullopt;
    return *name + CodeExtension(lang);
  }
  return kDefaultStem + std::string(CodeExtension(lang));
}

std::string JoinInput(const std::vector<std::string>& input) {
  std::string ret;
  for (size_t i = 0; i < input.size(); i++) {
    if (i) ret += '\n';
    ret += input[i];
  }
  return ret;
}

std::optional<SourceFiles> MaterializeSource(
    const Workspace& workspace, const std::string& file_name, const std::string& code,
    const std::vector<std::string>& input, spdlog::logger& logger) {
  if (!workspace.Valid()) return std::nullopt;
  SourceFiles ret;
  ret.source = workspace.Path() / file_name;
  if (!WriteFile(ret.source, code, logger)) return std::nullopt;
  if (!input.empty()) {
    fs::path input_path = WorkspaceInput(workspace.Path());
    if (!WriteFile(input_path, JoinInput(input), logger)) return std::nullopt;
    ret.input = input_path;
  }
  return ret;
}
