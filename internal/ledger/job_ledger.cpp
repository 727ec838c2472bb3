#include "job_ledger.hpp"

#include "internal/observability/logging.hpp"

namespace fetchbox::ledger {

using observability::StringField;
using observability::UIntField;

void JobLedger::OnTaskCompleted(const std::string& job_id, const std::string& resource_id) {
  uint64_t completed = 0;
  {
    std::lock_guard lock(mutex_);
    completed = ++jobs_[job_id].completed;
  }

  FETCHBOX_LOG_INFO("Ledger task completed",
                    {StringField("job_id", job_id), StringField("resource_id", resource_id), UIntField("job_completed", completed)});
}

void JobLedger::OnTaskFailed(const std::string& job_id, const std::string& resource_id, const std::string& failure_code,
                             const std::string& failure_message) {
  uint64_t failed = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           counters = jobs_[job_id];
    failed                   = ++counters.failed;
    counters.last_failure_code = failure_code;
  }

  FETCHBOX_LOG_WARN("Ledger task failed", {StringField("job_id", job_id), StringField("resource_id", resource_id),
                                           StringField("failure_code", failure_code), StringField("failure_message", failure_message),
                                           UIntField("job_failed", failed)});
}

JobCounters JobLedger::Snapshot(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  if (auto it = jobs_.find(job_id); it != jobs_.end()) {
    return it->second;
  }
  return {};
}

} // namespace fetchbox::ledger
