#pragma once

#include <chrono>
#include <cstdint>

#include "failure.hpp"

namespace fetchbox::runtime::config {
class RetryConfig;
}

namespace fetchbox::retry {

struct RetryLimits {
  std::chrono::milliseconds base_backoff{500};
  std::chrono::milliseconds max_backoff{60000};
  uint32_t                  download_retry_limit = 5;
  uint32_t                  storage_retry_limit  = 3;
  double                    jitter_ratio         = 0.2;

  static RetryLimits FromConfig(const fetchbox::runtime::config::RetryConfig& config);
};

struct Decision {
  enum class Action {
    kRetry,
    kDeadLetter,
  };

  Action                    action = Action::kDeadLetter;
  std::chrono::milliseconds delay{0};

  bool ShouldRetry() const {
    return action == Action::kRetry;
  }
};

/*
  min(base * 2^(attempt-1), max). attempt is 1-based: the lease cycle that
  just failed.
*/
std::chrono::milliseconds BaseDelay(uint32_t attempt, const RetryLimits& limits);

// unit_jitter in [-1, 1] scales the +/- jitter_ratio band.
std::chrono::milliseconds ApplyJitter(std::chrono::milliseconds delay, double unit_jitter, double jitter_ratio);

uint32_t RetryLimitFor(Phase phase, const RetryLimits& limits);

/*
  Pure decision: non-retryable and System failures dead-letter at once,
  retryable ones dead-letter once phase_attempt (the failing cycle counted
  within its own phase) reaches the limit of that phase. The delay grows
  with cycle, the failing cycle counted across both phases.
*/
Decision Decide(Phase phase, bool retryable, uint32_t phase_attempt, uint32_t cycle, const RetryLimits& limits, double unit_jitter);

/*
  Decide() with a per-thread random jitter source.
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryLimits limits);

  Decision Decide(const TaskFailure& failure, uint32_t phase_attempt, uint32_t cycle) const;

  const RetryLimits& Limits() const {
    return limits_;
  }

 private:
  RetryLimits limits_;
};

} // namespace fetchbox::retry
