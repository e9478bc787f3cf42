#include "rate_limiter.hpp"

#include <algorithm>
#include <cmath>

RateLimiter::RateLimiter(double requests_per_second, double burst_size)
  : requests_per_second_(std::max(requests_per_second, 1.0)),
    burst_size_(std::max(burst_size, 1.0)),
    tokens_(burst_size_),
    last_refill_(Clock::now()) {}

std::optional<uint64_t> RateLimiter::allow() {
  return allow(Clock::now());
}

std::optional<uint64_t> RateLimiter::allow(Clock::time_point now) {
  if(now > last_refill_) {
    std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(tokens_ + elapsed.count() * requests_per_second_, burst_size_);
    last_refill_ = now;
  }
  if(tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return std::nullopt;
  }
  double needed = 1.0 - tokens_;
  return static_cast<uint64_t>(std::ceil(needed / requests_per_second_ * 1000.0));
}
