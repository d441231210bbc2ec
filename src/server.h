#ifndef SERVER_H_
#define SERVER_H_

#include <chrono>
#include <memory>
#include <string>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <coderun/pipeline.h>
#include <coderun/rate_limiter.h>

extern int kPort;
extern int kServerThreads;
extern long kMaxPayloadKiB;

// One worker's HTTP front end: POST /run-program behind the rate limiter
class RunProgramServer {
  std::shared_ptr<spdlog::logger> logger_;
  Pipeline pipeline_;
  RateLimiter limiter_;
  httplib::Server svr_;

  void Setup_(int threads);
  void Reply_(httplib::Response& res, const Response& response) const;
 public:
  RunProgramServer(std::shared_ptr<spdlog::logger> logger, Pipeline pipeline);
  RunProgramServer(std::shared_ptr<spdlog::logger> logger, Pipeline pipeline,
                   std::chrono::milliseconds rate_window, size_t rate_max, int threads);

  // blocks until Stop()
  bool Listen(const std::string& host, int port);
  // returns the port, or -1
  int BindToAnyPort(const std::string& host);
  bool ListenAfterBind();
  bool IsRunning() const { return svr_.is_running(); }
  void Stop() { svr_.stop(); }
};

#endif  // SERVER_H_
