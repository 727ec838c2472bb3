#include "admin_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/broker/task_broker.hpp"
#include "internal/deadletter/dead_letter_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/util/errors.hpp"

namespace fetchbox::service {

using namespace fetchbox::admin::v1;
using fetchbox::observability::StringField;

namespace {

constexpr uint32_t kDefaultListLimit = 100;
constexpr uint32_t kMaxListLimit     = 1000;

void ToProto(const db::model::QueueEntryRecord& record, fetchbox::jobs::v1::QueueEntry* out) {
  out->set_sequence(record.sequence);
  *out->mutable_task() = record.task;
  out->set_attempt_count(record.attempt_count);
  out->set_status(record.status);
  out->set_lease_owner(record.lease_owner);
  out->set_lease_expires_at_ms(record.lease_expires_at_ms);
  out->set_visible_after_ms(record.visible_after_ms);
  out->set_updated_at_ms(record.updated_at_ms);
  out->set_upload_attempts(record.upload_attempts);
}

void ToProto(const db::model::DeadLetterRecord& record, fetchbox::jobs::v1::DeadLetterEntry* out) {
  out->set_sequence(record.sequence);
  *out->mutable_task() = record.task;
  out->set_failure_code(record.failure_code);
  out->set_failure_message(record.failure_message);
  out->set_attempts(record.attempts);
  out->set_total_attempts(record.total_attempts);
  out->set_failed_at_ms(record.failed_at_ms);
}

void ValidateTask(const fetchbox::jobs::v1::Task& task) {
  if (task.resource_id().empty()) throw util::InvalidArgument("task.resource_id is required");
  if (task.job_id().empty()) throw util::InvalidArgument("task.job_id is required");
  if (task.url().empty()) throw util::InvalidArgument("task.url is required");
  for (const auto& header : task.headers()) {
    if (header.name().empty()) throw util::InvalidArgument("task header name must not be empty");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(std::string_view route, Fn&& fn) -> decltype(fn()) {
  fetchbox::observability::SpanScope span(route);
  const auto                         started_at = std::chrono::steady_clock::now();
  auto                               elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = fn();
    fetchbox::observability::Metrics::Instance().RecordRequest(route, true);
    fetchbox::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FETCHBOX_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    fetchbox::observability::Metrics::Instance().RecordRequest(route, false);
    fetchbox::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

EnqueueResponse AdminService::Enqueue(const EnqueueRequest& req) {
  return Instrumented("AdminService.Enqueue", [&] {
    ValidateTask(req.task());

    EnqueueResponse resp;
    resp.set_sequence(ctx_.broker->Enqueue(req.task()));
    return resp;
  });
}

GetQueueEntryResponse AdminService::GetQueueEntry(const GetQueueEntryRequest& req) {
  return Instrumented("AdminService.GetQueueEntry", [&] {
    auto entry = ctx_.queue->Get(req.sequence());
    if (!entry) throw util::NotFound("queue entry " + std::to_string(req.sequence()) + " not found");

    GetQueueEntryResponse resp;
    ToProto(*entry, resp.mutable_entry());
    return resp;
  });
}

ListDeadLettersResponse AdminService::ListDeadLetters(const ListDeadLettersRequest& req) {
  return Instrumented("AdminService.ListDeadLetters", [&] {
    const uint32_t limit = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);

    ListDeadLettersResponse resp;
    for (const auto& record : ctx_.dead_letters->List(limit, req.offset(), req.job_id())) {
      ToProto(record, resp.add_entries());
    }
    resp.set_total(ctx_.dead_letters->Count(req.job_id()));
    return resp;
  });
}

GetDeadLetterResponse AdminService::GetDeadLetter(const GetDeadLetterRequest& req) {
  return Instrumented("AdminService.GetDeadLetter", [&] {
    auto record = ctx_.dead_letters->Get(req.sequence());
    if (!record) throw util::NotFound("dead letter " + std::to_string(req.sequence()) + " not found");

    GetDeadLetterResponse resp;
    ToProto(*record, resp.mutable_entry());
    return resp;
  });
}

ReplayDeadLetterResponse AdminService::ReplayDeadLetter(const ReplayDeadLetterRequest& req) {
  return Instrumented("AdminService.ReplayDeadLetter", [&] {
    ReplayDeadLetterResponse resp;
    resp.set_new_sequence(ctx_.dead_letters->Replay(req.sequence()));
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    const auto stats = ctx_.broker->Stats();

    StatsResponse resp;
    resp.set_pending(stats.queue.pending);
    resp.set_leased(stats.queue.leased);
    resp.set_completed(stats.queue.completed);
    resp.set_dead_lettered(stats.queue.dead_lettered);
    resp.set_next_sequence(stats.queue.next_sequence);
    resp.set_dead_letters(stats.dead_letters);
    for (size_t inflight : stats.inflight) {
      resp.add_inflight(inflight);
    }
    return resp;
  });
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return Instrumented("AdminService.Health", [&] {
    HealthResponse resp;
    if (!ctx_.broker->Running()) {
      resp.set_ok(false);
      resp.set_detail("broker is not running");
      return resp;
    }

    ctx_.queue->Stats();
    resp.set_ok(true);
    resp.set_detail("serving");
    return resp;
  });
}

} // namespace fetchbox::service
