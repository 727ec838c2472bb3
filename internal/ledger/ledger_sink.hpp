#pragma once

#include <string>

namespace fetchbox::ledger {

/*
  Job ledger collaborator. Fire-and-forget status deltas: implementations
  must not throw back into the worker.
*/
class LedgerSink {
 public:
  virtual ~LedgerSink() = default;

  virtual void OnTaskCompleted(const std::string& job_id, const std::string& resource_id) = 0;

  virtual void OnTaskFailed(const std::string& job_id, const std::string& resource_id, const std::string& failure_code,
                            const std::string& failure_message) = 0;
};

} // namespace fetchbox::ledger
