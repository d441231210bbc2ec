#include "server.h"

#include <sys/socket.h>
#include <algorithm>

#include <coderun/utils.h>
#include "http_utils.h"

int kPort = 3000;
int kServerThreads = 8;
long kMaxPayloadKiB = 100;

namespace {

const char kEndpoint[] = "/run-program";
const char kContentType[] = "application/json; charset=utf-8";

} // namespace

RunProgramServer::RunProgramServer(std::shared_ptr<spdlog::logger> logger, Pipeline pipeline) :
    RunProgramServer(std::move(logger), std::move(pipeline),
                     std::chrono::milliseconds(kRateLimitWindowMs), kRateLimitMax, kServerThreads) {}

RunProgramServer::RunProgramServer(std::shared_ptr<spdlog::logger> logger, Pipeline pipeline,
                                   std::chrono::milliseconds rate_window, size_t rate_max, int threads) :
    logger_(std::move(logger)),
    pipeline_(std::move(pipeline)),
    limiter_(rate_window, rate_max) {
  Setup_(threads);
}

void RunProgramServer::Reply_(httplib::Response& res, const Response& response) const {
  res.status = response.HttpStatus();
  res.set_content(response.Dump(), kContentType);
}

void RunProgramServer::Setup_(int threads) {
  using httplib::Server;
  svr_.new_task_queue = [threads] { return new httplib::ThreadPool(std::max(1, threads)); };
  svr_.set_socket_options([](socket_t sock) {
    int yes = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    // every worker binds the same port; the kernel spreads connections among them
    setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
  });
  svr_.set_payload_max_length((size_t)kMaxPayloadKiB * 1024);
  svr_.set_default_headers(http_utils::DefaultHeaders());
  svr_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
    logger_->info("{}", http_utils::FormatAccessLog(req, res));
  });

  svr_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
    // preflight requests are answered before admission control
    if (req.method == "OPTIONS") return Server::HandlerResponse::Unhandled;
    bool admitted = limiter_.Admit(req.remote_addr);
    res.set_header("RateLimit-Limit", std::to_string(limiter_.Limit()));
    res.set_header("RateLimit-Remaining", std::to_string(limiter_.Remaining(req.remote_addr)));
    if (admitted) return Server::HandlerResponse::Unhandled;
    logger_->warn("Rate limit exceeded for {}", req.remote_addr);
    Reply_(res, MakeResponse(Verdict::RATE_LIMITED, VerdictMessage(Verdict::RATE_LIMITED)));
    return Server::HandlerResponse::Handled;
  });

  svr_.Options(kEndpoint, [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET,HEAD,PUT,PATCH,POST,DELETE");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
  });

  svr_.Post(kEndpoint, [this](const httplib::Request& req, httplib::Response& res) {
    try {
      Reply_(res, pipeline_.Run(req.body));
    } catch (const std::exception& e) {
      logger_->error("Unhandled error serving {}: {}", req.remote_addr, e.what());
      Reply_(res, MakeResponse(Verdict::INTERNAL_ERROR));
    }
  });
}

bool RunProgramServer::Listen(const std::string& host, int port) {
  return svr_.listen(host.c_str(), port);
}

int RunProgramServer::BindToAnyPort(const std::string& host) {
  return svr_.bind_to_any_port(host.c_str());
}

bool RunProgramServer::ListenAfterBind() {
  return svr_.listen_after_bind();
}
