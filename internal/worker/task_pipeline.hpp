#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/db/model/queue_entry_record.hpp"
#include "internal/retry/failure.hpp"
#include "internal/util/cancellation.hpp"
#include "worker_context.hpp"

namespace fetchbox::worker {

enum class Outcome {
  kCompleted,
  kRequeued,
  kDeadLettered,
  kAbandoned, // cancelled, or outcome could not be persisted; lease recovered on restart
  kStale,     // lease no longer ours
};

std::string_view OutcomeName(Outcome outcome);

/*
  One lease cycle of one task:

      resolve proxy tiers -> download (endpoint fallback) -> upload
      -> ack | requeue(now + backoff) | dead-letter

  Every exception is caught here; a task fault never reaches the worker
  loop.
*/
class TaskPipeline {
 public:
  explicit TaskPipeline(std::shared_ptr<const WorkerContext> context);

  Outcome Execute(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const util::CancellationToken& cancel);

  /*
    Download with fallback and upload, no queue side effects.

    Endpoints are tried tier by tier in order. A retryable download failure
    before the body starts moves on to the next endpoint; a non-retryable one
    ends the attempt. When every endpoint failed the last failure is thrown.
  */
  storage::UploadedRef Transfer(const fetchbox::jobs::v1::Task& task, const util::CancellationToken& cancel);

 private:
  Outcome Complete(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const storage::UploadedRef& ref);

  Outcome HandleFailure(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const retry::TaskFailure& failure);

  std::shared_ptr<const WorkerContext> context_;
};

} // namespace fetchbox::worker
