#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/dead_letter_repository.hpp"
#include "internal/db/model/queue_entry_record.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/util/time.hpp"

namespace fetchbox::deadletter {

/*
  Durable store for tasks that cannot succeed without operator action.

  Entries are immutable: the first write for a queue sequence wins and
  replay never touches the entry, it only appends to the replay audit.
*/
class DeadLetterStore {
 public:
  DeadLetterStore(std::shared_ptr<db::DeadLetterRepository> repository, std::shared_ptr<queue::DurableQueue> queue);

  /*
    Moves a leased entry to the dead-letter store.

    The DLQ row is written first and the queue entry marked second. A crash
    in between leaves the entry Leased; startup recovery redelivers it and
    the second insert for the same sequence is ignored.

    attempts records the cycles spent in `phase`, the one that failed;
    total_attempts records every cycle including this one.
  */
  db::model::DeadLetterRecord Commit(const db::model::QueueEntryRecord& entry, const std::string& worker_id, const std::string& failure_code,
                                     const std::string& failure_message, util::TimePoint now = util::Now(),
                                     db::model::AttemptPhase phase = db::model::AttemptPhase::kDownload);

  // false when an entry for this sequence already exists
  bool Insert(const db::model::DeadLetterRecord& record);

  std::optional<db::model::DeadLetterRecord> Get(uint64_t sequence);

  std::vector<db::model::DeadLetterRecord> List(uint32_t limit, uint32_t offset = 0, const std::string& job_id = {});

  uint64_t Count(const std::string& job_id = {});

  /*
    Re-enqueues the task as a fresh entry (attempt_count 0, Pending).
    Returns the new sequence. util::QueueFull propagates.
  */
  uint64_t Replay(uint64_t sequence, util::TimePoint now = util::Now());

  std::vector<db::model::ReplayRecord> Replays(uint64_t sequence);

  uint64_t Prune(util::TimePoint cutoff);

 private:
  std::shared_ptr<db::DeadLetterRepository> repository_;
  std::shared_ptr<queue::DurableQueue>      queue_;
  std::mutex                                mutex_;
};

} // namespace fetchbox::deadletter
