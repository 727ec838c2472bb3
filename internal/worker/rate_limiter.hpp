#pragma once

#include <chrono>
#include <mutex>

#include "internal/util/cancellation.hpp"

namespace fetchbox::worker {

/*
  Token bucket shared by the execution slots of one worker.

  rate <= 0 disables limiting.
*/
class RateLimiter {
 public:
  explicit RateLimiter(double tokens_per_second, double burst = 1.0);

  // Blocks until a token is taken. Returns false if cancelled first.
  bool Acquire(const util::CancellationToken& cancel);

 private:
  using SteadyClock = std::chrono::steady_clock;

  void Refill(SteadyClock::time_point now);

  const double rate_;
  const double burst_;

  std::mutex              mutex_;
  double                  tokens_;
  SteadyClock::time_point last_refill_;
};

} // namespace fetchbox::worker
