#include <coderun/classifier.h>

#include <fmt/format.h>
#include <coderun/utils.h>

Response ClassifyExecution(const ExecutionResult& res, const ExecutionLimits& limits) {
  if (res.timed_out) {
    return {Verdict::TIMEOUT, "",
            fmt::format("Execution timed out after {:g} seconds.", limits.timeout_ms / 1000.0)};
  }
  if (res.cancelled) return MakeResponse(Verdict::INTERNAL_ERROR);
  if (res.output_exceeded) return MakeResponse(Verdict::RUNTIME_ERROR, res.error.value_or(""));
  if (res.error) {
    std::string output = TrimWhitespace(res.stderr_data);
    if (output.empty()) output = *res.error;
    // compilers and runtimes both write to stderr; "error" is taken as a compiler diagnostic
    bool compile_error = res.stderr_data.find("error") != std::string::npos;
    return MakeResponse(compile_error ? Verdict::COMPILE_ERROR : Verdict::RUNTIME_ERROR, output);
  }
  return MakeResponse(Verdict::SUCCESS, TrimWhitespace(res.stdout_data));
}
