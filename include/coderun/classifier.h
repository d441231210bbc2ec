#ifndef INCLUDE_CODERUN_CLASSIFIER_H_
#define INCLUDE_CODERUN_CLASSIFIER_H_

#include "executor.h"
#include "response.h"

// timeout > cancelled (internal error) > output overflow (runtime error) >
//  failure with "error" in stderr (compile error) > other failure > success
Response ClassifyExecution(const ExecutionResult&, const ExecutionLimits&);

#endif  // INCLUDE_CODERUN_CLASSIFIER_H_
