#include "dead_letter_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fetchbox::deadletter {

using fetchbox::db::model::DeadLetterRecord;
using fetchbox::observability::StringField;
using fetchbox::observability::UIntField;

namespace {

void Check(const db::Result& result, const std::string& what) {
  if (!result) throw util::StoreError(what + ": " + result.message);
}

} // namespace

DeadLetterStore::DeadLetterStore(std::shared_ptr<db::DeadLetterRepository> repository, std::shared_ptr<queue::DurableQueue> queue)
    : repository_(std::move(repository)), queue_(std::move(queue)) {
}

DeadLetterRecord DeadLetterStore::Commit(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const std::string& failure_code,
                                         const std::string& failure_message, util::TimePoint now, db::model::AttemptPhase phase) {
  DeadLetterRecord record;
  record.sequence        = entry.sequence;
  record.task            = entry.task;
  record.failure_code    = failure_code;
  record.failure_message = failure_message;
  record.attempts        = entry.NextAttempt(phase);
  record.total_attempts  = entry.attempt_count + 1;
  record.failed_at_ms    = util::ToUnixMillis(now);

  if (!Insert(record)) {
    FETCHBOX_LOG_WARN("Dead letter already recorded", {UIntField("sequence", entry.sequence)});
  }

  queue_->DeadLetter(entry.sequence, worker_id, now, phase);
  return record;
}

bool DeadLetterStore::Insert(const DeadLetterRecord& record) {
  std::lock_guard lock(mutex_);
  auto            tx       = repository_->Begin();
  bool            inserted = false;
  Check(repository_->InsertIfAbsent(*tx, record, inserted), "dead letter insert");
  tx->Commit();
  return inserted;
}

std::optional<DeadLetterRecord> DeadLetterStore::Get(uint64_t sequence) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->Get(*tx, sequence);
  tx->Commit();
  return record;
}

std::vector<DeadLetterRecord> DeadLetterStore::List(uint32_t limit, uint32_t offset, const std::string& job_id) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->List(*tx, limit, offset, job_id);
  tx->Commit();
  return records;
}

uint64_t DeadLetterStore::Count(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  const auto      count = repository_->Count(*tx, job_id);
  tx->Commit();
  return count;
}

uint64_t DeadLetterStore::Replay(uint64_t sequence, util::TimePoint now) {
  auto record = Get(sequence);
  if (!record) throw util::NotFound("dead letter " + std::to_string(sequence) + " not found");

  const uint64_t new_sequence = queue_->Enqueue(record->task, now);

  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    Check(repository_->InsertReplay(*tx, {sequence, new_sequence, util::ToUnixMillis(now)}), "replay audit");
    tx->Commit();
  }

  FETCHBOX_LOG_INFO("Replayed dead letter", {UIntField("sequence", sequence), UIntField("new_sequence", new_sequence),
                                             StringField("job_id", record->task.job_id()), StringField("resource_id", record->task.resource_id())});
  return new_sequence;
}

std::vector<db::model::ReplayRecord> DeadLetterStore::Replays(uint64_t sequence) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            replays = repository_->ListReplays(*tx, sequence);
  tx->Commit();
  return replays;
}

uint64_t DeadLetterStore::Prune(util::TimePoint cutoff) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  uint64_t        deleted = 0;
  Check(repository_->DeleteBefore(*tx, util::ToUnixMillis(cutoff), deleted), "dead letter prune");
  tx->Commit();
  return deleted;
}

} // namespace fetchbox::deadletter
