#ifndef INCLUDE_CODERUN_EXECUTOR_H_
#define INCLUDE_CODERUN_EXECUTOR_H_

#include <string>
#include <optional>

#include <spdlog/spdlog.h>

#include "command.h"

// wall clock budget of compile + run, in milliseconds
extern long kExecutionTimeoutMs;
// per captured stream
extern long kMaxOutputKiB;

struct ExecutionLimits {
  long timeout_ms;
  long max_output_kib;
  ExecutionLimits() : timeout_ms(kExecutionTimeoutMs), max_output_kib(kMaxOutputKiB) {}
  ExecutionLimits(long timeout_ms_, long max_output_kib_) :
      timeout_ms(timeout_ms_), max_output_kib(max_output_kib_) {}
};

struct ExecutionResult {
  // output of both steps, in order
  std::string stdout_data, stderr_data;
  bool timed_out;
  bool output_exceeded;
  bool cancelled; // by CancelExecutions()
  // set if a step could not be started or did not exit with status 0
  std::optional<std::string> error;
  int exit_code; // of the last step started; -1 if signaled or not started
  int term_signal;

  ExecutionResult() : timed_out(false), output_exceeded(false), cancelled(false), exit_code(-1), term_signal(0) {}
  bool Failed() const { return timed_out || error.has_value(); }
};

// Run the compile step then the run step in the command's workdir, each in its
//  own process group. On timeout or output overflow the whole group is killed.
ExecutionResult Execute(const Command&, const ExecutionLimits&, spdlog::logger&);

// Kill the process groups of all running executions in this process and fail
//  later ones immediately. Used when a worker shuts down; cannot be undone.
void CancelExecutions();

#endif  // INCLUDE_CODERUN_EXECUTOR_H_
