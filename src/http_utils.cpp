#include "http_utils.h"

#include <ctime>
#include <fmt/format.h>

namespace http_utils {

namespace {

std::string HeaderOr(const httplib::Request& req, const char* key, const char* fallback) {
  return req.has_header(key) ? req.get_header_value(key) : fallback;
}

std::string LogTime() {
  char buf[64];
  std::time_t now = std::time(nullptr);
  struct tm tm_buf;
  gmtime_r(&now, &tm_buf);
  std::strftime(buf, sizeof(buf), "%d/%b/%Y:%H:%M:%S +0000", &tm_buf);
  return buf;
}

} // namespace

std::string FormatAccessLog(const httplib::Request& req, const httplib::Response& res) {
  return fmt::format("{} - - [{}] \"{} {} {}\" {} {} \"{}\" \"{}\"",
      req.remote_addr, LogTime(), req.method, req.path, req.version, res.status, res.body.size(),
      HeaderOr(req, "Referer", "-"), HeaderOr(req, "User-Agent", "-"));
}

httplib::Headers DefaultHeaders() {
  return {
    {"Access-Control-Allow-Origin", "*"},
    {"X-Content-Type-Options", "nosniff"},
    {"X-Frame-Options", "SAMEORIGIN"},
    {"X-DNS-Prefetch-Control", "off"},
    {"Referrer-Policy", "no-referrer"},
    {"Cross-Origin-Resource-Policy", "same-origin"},
  };
}

} // namespace http_utils
