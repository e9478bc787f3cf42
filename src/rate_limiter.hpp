#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

// Token bucket. allow() consumes one token or reports how long until one is
// available.
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(double requests_per_second, double burst_size);

  std::optional<uint64_t> allow();
  std::optional<uint64_t> allow(Clock::time_point now);

  double tokens() const { return tokens_; }

private:
  double requests_per_second_;
  double burst_size_;
  double tokens_;
  Clock::time_point last_refill_;
};
