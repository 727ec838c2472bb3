#include "task_pipeline.hpp"

#include <chrono>
#include <optional>

#include "internal/download/request.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace fetchbox::worker {

using observability::IntField;
using observability::StringField;
using observability::UIntField;
using retry::FailureKind;
using retry::TaskCancelled;
using retry::TaskFailure;

std::string_view OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kCompleted:
      return "completed";
    case Outcome::kRequeued:
      return "requeued";
    case Outcome::kDeadLettered:
      return "dead_lettered";
    case Outcome::kAbandoned:
      return "abandoned";
    case Outcome::kStale:
      return "stale";
  }
  return "unknown";
}

TaskPipeline::TaskPipeline(std::shared_ptr<const WorkerContext> context) : context_(std::move(context)) {
}

storage::UploadedRef TaskPipeline::Transfer(const fetchbox::jobs::v1::Task& task, const util::CancellationToken& cancel) {
  std::shared_ptr<const proxy::ResolvedProxyPool> pool;
  try {
    pool = context_->proxies->Resolve(task.proxy_hint());
  } catch (const util::ProxyPoolNotFound& e) {
    throw TaskFailure(FailureKind::kProxyTiersExhausted, e.what());
  }
  if (pool->Empty()) {
    throw TaskFailure(FailureKind::kProxyTiersExhausted, "proxy pool '" + task.proxy_hint() + "' has no endpoints");
  }

  const auto request     = download::BuildRequest(task, context_->default_headers);
  const auto destination = storage::ResolveDestination(task, context_->destination_defaults);

  std::optional<TaskFailure> last_failure;

  for (size_t tier = 0; tier < pool->tiers.size(); ++tier) {
    for (const auto& endpoint : pool->tiers[tier]) {
      if (cancel.IsCancelled()) throw TaskCancelled("task cancelled before download");

      std::unique_ptr<download::ByteStream> body;
      try {
        body = context_->downloader->Fetch(request, endpoint, cancel);
      } catch (const TaskFailure& failure) {
        if (!failure.Retryable()) throw;

        FETCHBOX_LOG_DEBUG("Endpoint failed, falling back",
                           {StringField("resource_id", task.resource_id()), StringField("endpoint", endpoint.Direct() ? "direct" : endpoint.url),
                            UIntField("tier", tier), StringField("failure_code", failure.Code())});
        observability::Metrics::Instance().RecordEndpointFallback(failure.Code());
        last_failure = failure;
        continue;
      }

      return context_->sink->Upload(*body, destination);
    }
  }

  throw *last_failure;
}

Outcome TaskPipeline::Execute(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const util::CancellationToken& cancel) {
  observability::SpanScope span("fetchbox.task.execute");
  span.SetAttribute("fetchbox.sequence", static_cast<std::int64_t>(entry.sequence));
  span.SetAttribute("fetchbox.job_id", entry.task.job_id());
  span.SetAttribute("fetchbox.resource_id", entry.task.resource_id());
  span.SetAttribute("fetchbox.attempt", static_cast<std::int64_t>(entry.attempt_count + 1));

  const auto started = std::chrono::steady_clock::now();

  storage::UploadedRef ref;
  try {
    if (entry.corrupt) {
      throw util::QueueCorruption("queue entry " + std::to_string(entry.sequence) + " has an unreadable task");
    }
    ref = Transfer(entry.task, cancel);
  } catch (const TaskCancelled& e) {
    FETCHBOX_LOG_INFO("Task abandoned on shutdown", {UIntField("sequence", entry.sequence), StringField("reason", e.what())});
    observability::Metrics::Instance().RecordTaskOutcome(OutcomeName(Outcome::kAbandoned), "");
    return Outcome::kAbandoned;
  } catch (const TaskFailure& failure) {
    span.RecordException(failure.what());
    return HandleFailure(entry, worker_id, failure);
  } catch (const util::QueueCorruption& e) {
    span.RecordException(e.what());
    return HandleFailure(entry, worker_id, TaskFailure(FailureKind::kQueueCorruption, e.what()));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return HandleFailure(entry, worker_id, TaskFailure(FailureKind::kInternalFault, e.what()));
  }

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
  observability::Metrics::Instance().ObserveDownloadDurationMs(elapsed.count());

  FETCHBOX_LOG_DEBUG("Task transferred", {UIntField("sequence", entry.sequence), StringField("bucket", ref.bucket), StringField("key", ref.key),
                                          UIntField("bytes", ref.bytes), IntField("duration_ms", static_cast<std::int64_t>(elapsed.count()))});

  return Complete(entry, worker_id, ref);
}

Outcome TaskPipeline::Complete(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const storage::UploadedRef& ref) {
  try {
    context_->queue->Ack(entry.sequence, worker_id);
  } catch (const util::LeaseConflict& e) {
    FETCHBOX_LOG_WARN("Stale lease on ack", {UIntField("sequence", entry.sequence), StringField("error", e.what())});
    return Outcome::kStale;
  } catch (const std::exception& e) {
    FETCHBOX_LOG_ERROR("Ack failed", {UIntField("sequence", entry.sequence), StringField("error", e.what())});
    return Outcome::kAbandoned;
  }

  FETCHBOX_LOG_INFO("Task completed", {UIntField("sequence", entry.sequence), StringField("job_id", entry.task.job_id()),
                                       StringField("resource_id", entry.task.resource_id()), StringField("bucket", ref.bucket),
                                       StringField("key", ref.key), UIntField("bytes", ref.bytes), StringField("checksum", ref.checksum)});

  context_->ledger->OnTaskCompleted(entry.task.job_id(), entry.task.resource_id());
  observability::Metrics::Instance().RecordTaskOutcome(OutcomeName(Outcome::kCompleted), "");
  return Outcome::kCompleted;
}

Outcome TaskPipeline::HandleFailure(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const TaskFailure& failure) {
  const auto     phase         = failure.GetPhase() == retry::Phase::kUpload ? db::model::AttemptPhase::kUpload : db::model::AttemptPhase::kDownload;
  const uint32_t cycle         = entry.attempt_count + 1;
  const uint32_t phase_attempt = entry.NextAttempt(phase);
  const auto     decision      = context_->retry_policy->Decide(failure, phase_attempt, cycle);
  const auto     code          = failure.Code();

  try {
    if (decision.ShouldRetry()) {
      const auto now = util::Now();
      context_->queue->Requeue(entry.sequence, worker_id, now + decision.delay, now, phase);

      FETCHBOX_LOG_INFO("Task requeued", {UIntField("sequence", entry.sequence), StringField("job_id", entry.task.job_id()),
                                          StringField("resource_id", entry.task.resource_id()), StringField("failure_code", code),
                                          UIntField("attempt", cycle), UIntField("phase_attempt", phase_attempt),
                                          IntField("delay_ms", decision.delay.count())});
      observability::Metrics::Instance().RecordTaskOutcome(OutcomeName(Outcome::kRequeued), code);
      return Outcome::kRequeued;
    }

    const auto record = context_->dead_letters->Commit(entry, worker_id, code, failure.what(), util::Now(), phase);

    if (failure.GetPhase() == retry::Phase::kSystem) {
      FETCHBOX_LOG_ERROR("Task dead-lettered on internal fault",
                         {UIntField("sequence", entry.sequence), StringField("job_id", entry.task.job_id()),
                          StringField("resource_id", entry.task.resource_id()), StringField("url", entry.task.url()),
                          StringField("worker_id", worker_id), StringField("failure_code", code), StringField("failure_message", failure.what()),
                          UIntField("attempts", record.attempts), UIntField("total_attempts", record.total_attempts)});
    } else {
      FETCHBOX_LOG_WARN("Task dead-lettered", {UIntField("sequence", entry.sequence), StringField("job_id", entry.task.job_id()),
                                               StringField("resource_id", entry.task.resource_id()), StringField("failure_code", code),
                                               StringField("failure_message", failure.what()), UIntField("attempts", record.attempts),
                                               UIntField("total_attempts", record.total_attempts)});
    }

    context_->ledger->OnTaskFailed(entry.task.job_id(), entry.task.resource_id(), code, failure.what());
    observability::Metrics::Instance().RecordTaskOutcome(OutcomeName(Outcome::kDeadLettered), code);
    return Outcome::kDeadLettered;
  } catch (const util::LeaseConflict& e) {
    FETCHBOX_LOG_WARN("Stale lease on failure report", {UIntField("sequence", entry.sequence), StringField("error", e.what())});
    return Outcome::kStale;
  } catch (const std::exception& e) {
    FETCHBOX_LOG_ERROR("Failure report could not be persisted",
                       {UIntField("sequence", entry.sequence), StringField("failure_code", code), StringField("error", e.what())});
    return Outcome::kAbandoned;
  }
}

} // namespace fetchbox::worker
