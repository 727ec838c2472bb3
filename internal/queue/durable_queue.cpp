#include "durable_queue.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace fetchbox::queue {

using fetchbox::db::model::QueueEntryRecord;
using fetchbox::jobs::v1::QueueStatus;
using fetchbox::observability::StringField;
using fetchbox::observability::UIntField;

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (result) return;
  if (result.code == db::ErrorCode::NotFound) throw util::NotFound(what + ": " + result.message);
  throw util::StoreError(what + ": " + result.message);
}

} // namespace

DurableQueue::DurableQueue(std::shared_ptr<db::QueueRepository> repository, QueueOptions options)
    : repository_(std::move(repository)), options_(options) {
}

void DurableQueue::SetEnqueueListener(std::function<void()> listener) {
  std::lock_guard lock(mutex_);
  enqueue_listener_ = std::move(listener);
}

uint64_t DurableQueue::Enqueue(const fetchbox::jobs::v1::Task& task, util::TimePoint now) {
  std::function<void()> listener;
  uint64_t              sequence = 0;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    db::model::QueueCounts counts;
    Check(repository_->Counts(*tx, counts), "count");
    if (counts.pending + counts.leased >= options_.capacity) {
      throw util::QueueFull("queue at capacity (" + std::to_string(options_.capacity) + " active entries)");
    }

    QueueEntryRecord record;
    record.task             = task;
    record.status           = fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
    record.visible_after_ms = util::ToUnixMillis(now);
    record.updated_at_ms    = record.visible_after_ms;

    Check(repository_->InsertEntry(*tx, record), "enqueue");
    tx->Commit();

    sequence = record.sequence;
    listener = enqueue_listener_;
  }

  if (listener) listener();
  return sequence;
}

std::optional<QueueEntryRecord> DurableQueue::LeaseNext(const std::string& worker_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  const auto now_ms = util::ToUnixMillis(now);
  auto       entry  = repository_->FirstEligible(*tx, now_ms);
  if (!entry) return std::nullopt;

  entry->status              = fetchbox::jobs::v1::QUEUE_STATUS_LEASED;
  entry->lease_owner         = worker_id;
  entry->lease_expires_at_ms = util::ToUnixMillis(now + options_.lease_ttl);
  entry->updated_at_ms       = now_ms;

  Check(repository_->UpdateEntry(*tx, *entry), "lease");
  tx->Commit();
  return entry;
}

QueueEntryRecord DurableQueue::LoadLeased(db::Transaction& tx, uint64_t sequence, const std::string& worker_id) {
  auto entry = repository_->GetEntry(tx, sequence);
  if (!entry) throw util::NotFound("queue entry " + std::to_string(sequence) + " not found");

  if (entry->status != fetchbox::jobs::v1::QUEUE_STATUS_LEASED || entry->lease_owner != worker_id) {
    throw util::LeaseConflict("queue entry " + std::to_string(sequence) + " is not leased by " + worker_id);
  }
  return *entry;
}

void DurableQueue::Ack(uint64_t sequence, const std::string& worker_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  auto entry = LoadLeased(*tx, sequence, worker_id);
  entry.status = fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED;
  entry.attempt_count++;
  entry.lease_owner.clear();
  entry.lease_expires_at_ms = 0;
  entry.updated_at_ms       = util::ToUnixMillis(now);

  Check(repository_->UpdateEntry(*tx, entry), "ack");
  tx->Commit();
}

void DurableQueue::Requeue(uint64_t sequence, const std::string& worker_id, util::TimePoint visible_after, util::TimePoint now,
                           db::model::AttemptPhase phase) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  auto entry = LoadLeased(*tx, sequence, worker_id);
  entry.status = fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
  entry.attempt_count++;
  if (phase == db::model::AttemptPhase::kUpload) entry.upload_attempts++;
  entry.lease_owner.clear();
  entry.lease_expires_at_ms = 0;
  entry.visible_after_ms    = util::ToUnixMillis(visible_after);
  entry.updated_at_ms       = util::ToUnixMillis(now);

  Check(repository_->UpdateEntry(*tx, entry), "requeue");
  tx->Commit();
}

fetchbox::jobs::v1::Task DurableQueue::DeadLetter(uint64_t sequence, const std::string& worker_id, util::TimePoint now,
                                                  db::model::AttemptPhase phase) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  auto entry = LoadLeased(*tx, sequence, worker_id);
  entry.status = fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED;
  entry.attempt_count++;
  if (phase == db::model::AttemptPhase::kUpload) entry.upload_attempts++;
  entry.lease_owner.clear();
  entry.lease_expires_at_ms = 0;
  entry.updated_at_ms       = util::ToUnixMillis(now);

  Check(repository_->UpdateEntry(*tx, entry), "dead_letter");
  tx->Commit();
  return entry.task;
}

uint64_t DurableQueue::RecoverExpiredLeases(util::TimePoint now, const std::string& live_owner_prefix) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  const auto now_ms    = util::ToUnixMillis(now);
  uint64_t   recovered = 0;
  for (auto& entry : repository_->ListByStatus(*tx, fetchbox::jobs::v1::QUEUE_STATUS_LEASED)) {
    if (entry.lease_expires_at_ms >= now_ms) continue;
    if (!live_owner_prefix.empty() && entry.lease_owner.compare(0, live_owner_prefix.size(), live_owner_prefix) == 0) continue;

    FETCHBOX_LOG_INFO("Recovering expired lease", {UIntField("sequence", entry.sequence), StringField("lease_owner", entry.lease_owner),
                                                   UIntField("attempt_count", entry.attempt_count)});

    entry.status = fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
    entry.lease_owner.clear();
    entry.lease_expires_at_ms = 0;
    entry.visible_after_ms    = now_ms;
    entry.updated_at_ms       = now_ms;
    Check(repository_->UpdateEntry(*tx, entry), "recover");
    ++recovered;
  }

  tx->Commit();
  return recovered;
}

uint64_t DurableQueue::PruneTerminal(util::TimePoint cutoff) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  uint64_t deleted = 0;
  Check(repository_->DeleteTerminalBefore(*tx, util::ToUnixMillis(cutoff), deleted), "prune");
  tx->Commit();
  return deleted;
}

std::optional<QueueEntryRecord> DurableQueue::Get(uint64_t sequence) {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  auto            entry = repository_->GetEntry(*tx, sequence);
  tx->Commit();
  return entry;
}

db::model::QueueCounts DurableQueue::Stats() {
  db::model::QueueCounts counts;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    Check(repository_->Counts(*tx, counts), "count");
    tx->Commit();
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.SetQueueDepth("pending", counts.pending);
  metrics.SetQueueDepth("leased", counts.leased);
  metrics.SetQueueDepth("completed", counts.completed);
  metrics.SetQueueDepth("dead_lettered", counts.dead_lettered);
  return counts;
}

} // namespace fetchbox::queue
