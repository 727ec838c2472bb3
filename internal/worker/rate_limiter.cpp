#include "rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace fetchbox::worker {

namespace {
constexpr std::chrono::milliseconds kMaxWaitSlice{50};
}

RateLimiter::RateLimiter(double tokens_per_second, double burst)
    : rate_(tokens_per_second), burst_(std::max(1.0, burst)), tokens_(std::max(1.0, burst)), last_refill_(SteadyClock::now()) {
}

void RateLimiter::Refill(SteadyClock::time_point now) {
  const std::chrono::duration<double> elapsed = now - last_refill_;
  tokens_                                     = std::min(burst_, tokens_ + elapsed.count() * rate_);
  last_refill_                                = now;
}

bool RateLimiter::Acquire(const util::CancellationToken& cancel) {
  if (rate_ <= 0) return !cancel.IsCancelled();

  for (;;) {
    if (cancel.IsCancelled()) return false;

    std::chrono::duration<double> wait{0};
    {
      std::lock_guard lock(mutex_);
      Refill(SteadyClock::now());
      if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
      }
      wait = std::chrono::duration<double>((1.0 - tokens_) / rate_);
    }

    std::this_thread::sleep_for(std::min<SteadyClock::duration>(std::chrono::duration_cast<SteadyClock::duration>(wait), kMaxWaitSlice));
  }
}

} // namespace fetchbox::worker
