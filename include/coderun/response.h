#ifndef INCLUDE_CODERUN_RESPONSE_H_
#define INCLUDE_CODERUN_RESPONSE_H_

#include <string>

#include <nlohmann/json.hpp>

// name, HTTP status, responseCode, errorMessage
// errorMessage is empty if the message depends on the request (see ClassifyExecution)
#define ENUM_VERDICT_ \
  X(SUCCESS, 200, 201, "") \
  /* execution failures */ \
  X(TIMEOUT, 500, 202, "") \
  X(COMPILE_ERROR, 500, 202, "Compilation error occurred.") \
  X(RUNTIME_ERROR, 500, 202, "Runtime error occurred.") \
  X(INTERNAL_ERROR, 500, 202, "Internal server error occurred.") \
  /* request rejected before execution */ \
  X(INVALID_REQUEST, 400, 203, "") \
  X(INVALID_JAVA_CLASS, 400, 400, "") \
  X(RATE_LIMITED, 429, 429, "Too many requests from this IP, please try again later.")
enum class Verdict {
#define X(name, status, code, message) name,
  ENUM_VERDICT_
#undef X
};

struct Response {
  Verdict verdict;
  std::string output;
  std::string error_message;

  int HttpStatus() const;
  int ResponseCode() const;
  // {"responseCode": ..., "output": ..., "errorMessage": ...}
  nlohmann::json ToJSON() const;
  std::string Dump() const;
};

// Fixed responses
Response MakeResponse(Verdict, const std::string& output = "");
Response InvalidRequest(const std::string& output, bool repeat_message = true);

#endif  // INCLUDE_CODERUN_RESPONSE_H_
