#include <coderun/rate_limiter.h>

#include <iterator>

long kRateLimitWindowMs = 30'000;
size_t kRateLimitMax = 1000;

namespace {

// prune idle clients every this many calls to Admit
constexpr size_t kPruneInterval = 4096;

} // namespace

RateLimiter::RateLimiter() :
    RateLimiter(std::chrono::milliseconds(kRateLimitWindowMs), kRateLimitMax) {}

RateLimiter::RateLimiter(std::chrono::milliseconds window, size_t max_requests) :
    window_(window), max_requests_(max_requests), calls_(0) {}

void RateLimiter::Expire_(std::deque<Clock::time_point>& hits, Clock::time_point now) const {
  auto window_start = now - window_;
  while (!hits.empty() && hits.front() <= window_start) hits.pop_front();
}

bool RateLimiter::Admit(const std::string& key, Clock::time_point now) {
  std::lock_guard lck(mtx_);
  if (++calls_ % kPruneInterval == 0) PruneLocked_(now);
  auto& hits = hits_[key];
  Expire_(hits, now);
  if (hits.size() >= max_requests_) return false;
  hits.push_back(now);
  return true;
}

size_t RateLimiter::Remaining(const std::string& key, Clock::time_point now) {
  std::lock_guard lck(mtx_);
  auto it = hits_.find(key);
  if (it == hits_.end()) return max_requests_;
  Expire_(it->second, now);
  return it->second.size() >= max_requests_ ? 0 : max_requests_ - it->second.size();
}

void RateLimiter::PruneLocked_(Clock::time_point now) {
  for (auto it = hits_.begin(); it != hits_.end();) {
    Expire_(it->second, now);
    it = it->second.empty() ? hits_.erase(it) : std::next(it);
  }
}

void RateLimiter::Prune(Clock::time_point now) {
  std::lock_guard lck(mtx_);
  PruneLocked_(now);
}

size_t RateLimiter::TrackedClients() const {
  std::lock_guard lck(mtx_);
  return hits_.size();
}
