#include "backoff.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include "config/config.pb.h"

namespace fetchbox::retry {

RetryLimits RetryLimits::FromConfig(const fetchbox::runtime::config::RetryConfig& config) {
  RetryLimits limits;
  if (config.base_backoff_ms() > 0) limits.base_backoff = std::chrono::milliseconds(config.base_backoff_ms());
  if (config.max_backoff_ms() > 0) limits.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  if (config.download_retry_limit() > 0) limits.download_retry_limit = config.download_retry_limit();
  if (config.storage_retry_limit() > 0) limits.storage_retry_limit = config.storage_retry_limit();
  return limits;
}

std::chrono::milliseconds BaseDelay(uint32_t attempt, const RetryLimits& limits) {
  const auto base = limits.base_backoff.count();
  const auto max  = limits.max_backoff.count();
  if (attempt <= 1) return std::chrono::milliseconds(std::min(base, max));

  const uint32_t shift = attempt - 1;
  // past 2^40 the product is far beyond any sensible max
  if (shift >= 40 || base > (max >> shift)) return limits.max_backoff;
  return std::chrono::milliseconds(std::min(base << shift, max));
}

std::chrono::milliseconds ApplyJitter(std::chrono::milliseconds delay, double unit_jitter, double jitter_ratio) {
  const double clamped = std::clamp(unit_jitter, -1.0, 1.0);
  const double scaled  = static_cast<double>(delay.count()) * (1.0 + clamped * jitter_ratio);
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(std::max(scaled, 0.0))));
}

uint32_t RetryLimitFor(Phase phase, const RetryLimits& limits) {
  switch (phase) {
    case Phase::kDownload:
      return limits.download_retry_limit;
    case Phase::kUpload:
      return limits.storage_retry_limit;
    case Phase::kSystem:
      return 0;
  }
  return 0;
}

Decision Decide(Phase phase, bool retryable, uint32_t phase_attempt, uint32_t cycle, const RetryLimits& limits, double unit_jitter) {
  Decision decision;
  if (phase == Phase::kSystem || !retryable || phase_attempt >= RetryLimitFor(phase, limits)) {
    decision.action = Decision::Action::kDeadLetter;
    return decision;
  }

  decision.action = Decision::Action::kRetry;
  decision.delay  = ApplyJitter(BaseDelay(cycle, limits), unit_jitter, limits.jitter_ratio);
  return decision;
}

RetryPolicy::RetryPolicy(RetryLimits limits) : limits_(limits) {
}

Decision RetryPolicy::Decide(const TaskFailure& failure, uint32_t phase_attempt, uint32_t cycle) const {
  thread_local std::mt19937_64          rng{std::random_device{}()};
  std::uniform_real_distribution<double> jitter(-1.0, 1.0);
  return retry::Decide(failure.GetPhase(), failure.Retryable(), phase_attempt, cycle, limits_, jitter(rng));
}

} // namespace fetchbox::retry
