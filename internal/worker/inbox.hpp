#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/db/model/queue_entry_record.hpp"

namespace fetchbox::worker {

/*
  Bounded blocking queue of leased entries, one per worker.

  Only the broker pushes; the worker's execution slots pop.
*/
class Inbox {
 public:
  explicit Inbox(size_t capacity);

  bool TryPush(db::model::QueueEntryRecord entry);

  // Blocks until an entry is available. After Shutdown() remaining entries
  // are still handed out, then nullopt.
  std::optional<db::model::QueueEntryRecord> Pop();

  void Shutdown();

  // Drops undelivered entries; returns how many. Their leases stay held
  // and are recovered on the next start.
  size_t Clear();

  size_t Size() const;
  size_t Capacity() const {
    return capacity_;
  }

 private:
  const size_t capacity_;

  mutable std::mutex                      mutex_;
  std::condition_variable                 cv_;
  std::deque<db::model::QueueEntryRecord> entries_;
  bool                                    shutdown_ = false;
};

} // namespace fetchbox::worker
