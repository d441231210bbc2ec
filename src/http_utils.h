#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Request logging & common response headers

#include <string>
#include <httplib.h>

namespace http_utils {

// "combined" access log line
std::string FormatAccessLog(const httplib::Request&, const httplib::Response&);

// cross-origin and hardening headers sent with every response
httplib::Headers DefaultHeaders();

} // namespace http_utils

#endif  // HTTP_UTILS_H_
