#include "internal/deadletter/dead_letter_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_dead_letter_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using fetchbox::deadletter::DeadLetterStore;
using fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED;
using fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
using fetchbox::jobs::v1::Task;
using fetchbox::queue::DurableQueue;
using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<DurableQueue>    queue;
  std::shared_ptr<DeadLetterStore> store;
};

Fixture MakeFixture(uint64_t capacity = 100) {
  fetchbox::queue::QueueOptions options;
  options.capacity = capacity;

  Fixture f;
  f.queue = std::make_shared<DurableQueue>(std::make_shared<fetchbox::db::memory::MemoryQueueRepository>(), options);
  f.store = std::make_shared<DeadLetterStore>(std::make_shared<fetchbox::db::memory::MemoryDeadLetterRepository>(), f.queue);
  return f;
}

Task MakeTask(const std::string& resource_id, const std::string& job_id) {
  Task task;
  task.set_resource_id(resource_id);
  task.set_job_id(job_id);
  task.set_url("http://example.invalid/" + resource_id);
  return task;
}

// Enqueues, leases and dead-letters one task the way a worker would.
uint64_t DeadLetterOne(Fixture& f, const std::string& resource_id, const std::string& job_id, fetchbox::util::TimePoint now) {
  f.queue->Enqueue(MakeTask(resource_id, job_id), now);
  auto leased = f.queue->LeaseNext("w1", now);
  assert(leased);
  f.store->Commit(*leased, "w1", "download.http_status.404", "not found", now);
  return leased->sequence;
}

void TestCommitRecordsFailureAndMarksQueue() {
  auto       f   = MakeFixture();
  const auto now = fetchbox::util::Now();

  f.queue->Enqueue(MakeTask("r1", "job-a"), now);
  auto leased = f.queue->LeaseNext("w1", now);
  f.queue->Requeue(leased->sequence, "w1", now, now);
  leased = f.queue->LeaseNext("w1", now);
  assert(leased && leased->attempt_count == 1);

  const auto record = f.store->Commit(*leased, "w1", "download.timeout", "timed out", now);
  assert(record.attempts == 2);

  auto stored = f.store->Get(leased->sequence);
  assert(stored);
  assert(stored->task.resource_id() == "r1");
  assert(stored->failure_code == "download.timeout");
  assert(stored->failure_message == "timed out");
  assert(stored->attempts == 2);
  assert(stored->total_attempts == 2);
  assert(stored->failed_at_ms == fetchbox::util::ToUnixMillis(now));

  auto entry = f.queue->Get(leased->sequence);
  assert(entry && entry->status == QUEUE_STATUS_DEAD_LETTERED);
  assert(entry->attempt_count == 2);
}

void TestUploadCommitRecordsUploadAttempts() {
  auto       f   = MakeFixture();
  const auto now = fetchbox::util::Now();
  using fetchbox::db::model::AttemptPhase;

  f.queue->Enqueue(MakeTask("r1", "job-a"), now);
  for (int i = 0; i < 4; ++i) {
    auto leased = f.queue->LeaseNext("w1", now);
    f.queue->Requeue(leased->sequence, "w1", now, now);
  }
  auto leased = f.queue->LeaseNext("w1", now);
  f.queue->Requeue(leased->sequence, "w1", now, now, AttemptPhase::kUpload);
  leased = f.queue->LeaseNext("w1", now);
  assert(leased && leased->attempt_count == 5);

  const auto record = f.store->Commit(*leased, "w1", "upload.throttled", "slow down", now, AttemptPhase::kUpload);
  assert(record.attempts == 2);
  assert(record.total_attempts == 6);

  const auto stored = f.store->Get(leased->sequence);
  assert(stored && stored->attempts == 2 && stored->total_attempts == 6);

  auto entry = f.queue->Get(leased->sequence);
  assert(entry && entry->upload_attempts == 2);
  assert(entry->attempt_count == 6);
}

void TestInsertIsIdempotent() {
  auto f = MakeFixture();

  fetchbox::db::model::DeadLetterRecord record;
  record.sequence     = 7;
  record.task         = MakeTask("r7", "job-a");
  record.failure_code = "upload.access_denied";
  record.attempts     = 1;

  assert(f.store->Insert(record));

  auto second         = record;
  second.failure_code = "system.internal_fault";
  assert(!f.store->Insert(second));

  assert(f.store->Get(7)->failure_code == "upload.access_denied");
  assert(f.store->Count() == 1);
}

void TestReplayEnqueuesFreshEntry() {
  auto       f        = MakeFixture();
  const auto now      = fetchbox::util::Now();
  const auto sequence = DeadLetterOne(f, "r1", "job-a", now);

  const auto new_sequence = f.store->Replay(sequence, now + 1s);
  assert(new_sequence > sequence);

  auto fresh = f.queue->Get(new_sequence);
  assert(fresh && fresh->status == QUEUE_STATUS_PENDING);
  assert(fresh->attempt_count == 0);
  assert(fresh->task.resource_id() == "r1");

  // The entry itself is untouched; each replay is audited.
  assert(f.store->Get(sequence)->failure_code == "download.http_status.404");
  const auto second = f.store->Replay(sequence, now + 2s);
  assert(second > new_sequence);

  const auto replays = f.store->Replays(sequence);
  assert(replays.size() == 2);
  assert(replays[0].new_sequence == new_sequence);
  assert(replays[1].new_sequence == second);
  assert(f.store->Count() == 1);
}

void TestReplayOfUnknownSequenceThrows() {
  auto f = MakeFixture();

  bool thrown = false;
  try {
    f.store->Replay(42);
  } catch (const fetchbox::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
}

void TestReplayRespectsQueueCapacity() {
  auto       f        = MakeFixture(1);
  const auto now      = fetchbox::util::Now();
  const auto sequence = DeadLetterOne(f, "r1", "job-a", now);
  f.queue->Enqueue(MakeTask("blocker", "job-a"), now);

  bool thrown = false;
  try {
    f.store->Replay(sequence, now);
  } catch (const fetchbox::util::QueueFull&) {
    thrown = true;
  }
  assert(thrown);
  assert(f.store->Replays(sequence).empty());
}

void TestListFiltersByJobAndPages() {
  auto       f   = MakeFixture();
  const auto now = fetchbox::util::Now();

  const auto a1 = DeadLetterOne(f, "a1", "job-a", now);
  DeadLetterOne(f, "b1", "job-b", now);
  const auto a2 = DeadLetterOne(f, "a2", "job-a", now);
  const auto a3 = DeadLetterOne(f, "a3", "job-a", now);

  assert(f.store->Count() == 4);
  assert(f.store->Count("job-a") == 3);
  assert(f.store->Count("job-z") == 0);

  auto all = f.store->List(10);
  assert(all.size() == 4);
  for (size_t i = 1; i < all.size(); ++i) assert(all[i - 1].sequence < all[i].sequence);

  auto page = f.store->List(2, 0, "job-a");
  assert(page.size() == 2);
  assert(page[0].sequence == a1 && page[1].sequence == a2);

  page = f.store->List(2, 2, "job-a");
  assert(page.size() == 1 && page[0].sequence == a3);
}

void TestPruneRemovesOldEntries() {
  auto       f   = MakeFixture();
  const auto now = fetchbox::util::Now();

  const auto old_sequence = DeadLetterOne(f, "old", "job-a", now - 48h);
  const auto new_sequence = DeadLetterOne(f, "new", "job-a", now);

  assert(f.store->Prune(now - 24h) == 1);
  assert(!f.store->Get(old_sequence));
  assert(f.store->Get(new_sequence));
}

} // namespace

int main() {
  TestCommitRecordsFailureAndMarksQueue();
  TestUploadCommitRecordsUploadAttempts();
  TestInsertIsIdempotent();
  TestReplayEnqueuesFreshEntry();
  TestReplayOfUnknownSequenceThrows();
  TestReplayRespectsQueueCapacity();
  TestListFiltersByJobAndPages();
  TestPruneRemovesOldEntries();

  std::cout << "fetchbox_unit_dead_letter_store: pass\n";
  return 0;
}
