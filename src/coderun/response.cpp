#include <coderun/response.h>
#include <coderun/utils.h>

int Response::HttpStatus() const {
  return VerdictHttpStatus(verdict);
}

int Response::ResponseCode() const {
  return VerdictResponseCode(verdict);
}

nlohmann::json Response::ToJSON() const {
  return {
    {"responseCode", ResponseCode()},
    {"output", output},
    {"errorMessage", error_message},
  };
}

std::string Response::Dump() const {
  using nlohmann::json;
  // output is arbitrary program output; drop invalid UTF-8 instead of throwing
  return ToJSON().dump(-1, ' ', false, json::error_handler_t::ignore);
}

Response MakeResponse(Verdict verdict, const std::string& output) {
  return {verdict, output, VerdictMessage(verdict)};
}

Response InvalidRequest(const std::string& output, bool repeat_message) {
  return {Verdict::INVALID_REQUEST, output, repeat_message ? output : ""};
}
