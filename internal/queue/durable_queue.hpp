#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "fetchbox/jobs/v1/task.pb.h"
#include "internal/db/api/queue_repository.hpp"
#include "internal/util/time.hpp"

namespace fetchbox::queue {

struct QueueOptions {
  uint64_t                  capacity = 100000;
  std::chrono::milliseconds lease_ttl{300000};
};

/*
  Durable task queue.

  Lifecycle of an entry:

      Pending -> Leased -> Completed
                        -> Pending (requeued, visible_after set)
                        -> DeadLettered

  Every operation runs in its own repository transaction under one mutex,
  so lease/ack/requeue/dead-letter are atomic for concurrent workers and no
  two workers ever hold the same sequence.

  Ack, Requeue and DeadLetter each close one lease cycle and bump
  attempt_count exactly once; they throw util::LeaseConflict when the
  entry is not Leased by the caller. A failed cycle charged to
  AttemptPhase::kUpload also bumps upload_attempts.
*/
class DurableQueue {
 public:
  DurableQueue(std::shared_ptr<db::QueueRepository> repository, QueueOptions options);

  // Throws util::QueueFull when Pending+Leased reached capacity.
  uint64_t Enqueue(const fetchbox::jobs::v1::Task& task, util::TimePoint now = util::Now());

  std::optional<db::model::QueueEntryRecord> LeaseNext(const std::string& worker_id, util::TimePoint now = util::Now());

  void Ack(uint64_t sequence, const std::string& worker_id, util::TimePoint now = util::Now());

  void Requeue(uint64_t sequence, const std::string& worker_id, util::TimePoint visible_after, util::TimePoint now = util::Now(),
               db::model::AttemptPhase phase = db::model::AttemptPhase::kDownload);

  fetchbox::jobs::v1::Task DeadLetter(uint64_t sequence, const std::string& worker_id, util::TimePoint now = util::Now(),
                                      db::model::AttemptPhase phase = db::model::AttemptPhase::kDownload);

  /*
    Startup scan: Leased entries whose lease expired before now go back to
    Pending, visible immediately, attempt_count untouched (the interrupted
    cycle never reported an outcome). Returns the number of entries reset.

    Leases whose owner starts with live_owner_prefix belong to workers of
    this process and are left alone, so a running attempt is never handed
    out twice.
  */
  uint64_t RecoverExpiredLeases(util::TimePoint now = util::Now(), const std::string& live_owner_prefix = {});

  // Deletes Completed/DeadLettered entries last touched before cutoff.
  uint64_t PruneTerminal(util::TimePoint cutoff);

  std::optional<db::model::QueueEntryRecord> Get(uint64_t sequence);

  db::model::QueueCounts Stats();

  // Invoked after every successful enqueue (outside the queue lock).
  void SetEnqueueListener(std::function<void()> listener);

 private:
  db::model::QueueEntryRecord LoadLeased(db::Transaction& tx, uint64_t sequence, const std::string& worker_id);

  std::shared_ptr<db::QueueRepository> repository_;
  QueueOptions                         options_;

  std::mutex            mutex_;
  std::function<void()> enqueue_listener_;
};

} // namespace fetchbox::queue
