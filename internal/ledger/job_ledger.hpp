#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "ledger_sink.hpp"

namespace fetchbox::ledger {

struct JobCounters {
  uint64_t    completed = 0;
  uint64_t    failed    = 0;
  std::string last_failure_code;
};

/*
  In-memory per-job counters.
*/
class JobLedger final : public LedgerSink {
 public:
  void OnTaskCompleted(const std::string& job_id, const std::string& resource_id) override;

  void OnTaskFailed(const std::string& job_id, const std::string& resource_id, const std::string& failure_code,
                    const std::string& failure_message) override;

  JobCounters Snapshot(const std::string& job_id) const;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, JobCounters> jobs_;
};

} // namespace fetchbox::ledger
