#ifndef INCLUDE_CODERUN_RATE_LIMITER_H_
#define INCLUDE_CODERUN_RATE_LIMITER_H_

#include <deque>
#include <mutex>
#include <chrono>
#include <string>
#include <unordered_map>

extern long kRateLimitWindowMs;
extern size_t kRateLimitMax;

// Sliding window limiter keyed by client address. State is local to the process.
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;
 private:
  std::chrono::milliseconds window_;
  size_t max_requests_;
  size_t calls_;
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::deque<Clock::time_point>> hits_;

  void Expire_(std::deque<Clock::time_point>& hits, Clock::time_point now) const;
  void PruneLocked_(Clock::time_point now);
 public:
  RateLimiter();
  RateLimiter(std::chrono::milliseconds window, size_t max_requests);

  // Records the request if admitted; rejected requests are not counted
  bool Admit(const std::string& key, Clock::time_point now = Clock::now());
  size_t Remaining(const std::string& key, Clock::time_point now = Clock::now());
  size_t Limit() const { return max_requests_; }
  std::chrono::milliseconds Window() const { return window_; }

  // Drop clients without hits in the current window
  void Prune(Clock::time_point now = Clock::now());
  size_t TrackedClients() const;
};

#endif  // INCLUDE_CODERUN_RATE_LIMITER_H_
