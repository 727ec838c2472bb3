#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fetchbox/jobs/v1/task.pb.h"
#include "internal/db/model/queue_entry_record.hpp"
#include "internal/worker/worker.hpp"

namespace fetchbox::broker {

struct BrokerOptions {
  std::string               instance_id; // prefix of every worker id
  size_t                    worker_count = 4;
  worker::WorkerOptions     worker;
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds prune_interval{60000};
  std::chrono::milliseconds completed_retention{86400000};
  std::chrono::milliseconds dead_letter_retention{0}; // 0 = keep forever
  // how long Shutdown waits for cancelled slots to return
  std::chrono::milliseconds stop_timeout{5000};
};

struct BrokerStats {
  db::model::QueueCounts queue;
  uint64_t               dead_letters = 0;
  std::vector<size_t>    inflight; // per worker: queued in its inbox plus executing
};

/*
  Single dispatcher over the durable queue.

  The dispatch thread leases entries on behalf of the least-loaded worker
  with free in-flight capacity; ties go round-robin. When every worker
  is full nothing more is leased, so surplus work stays Pending in the
  queue. It wakes on enqueue, on a freed worker slot and every poll
  interval (requeued entries become visible by time alone).
*/
class TaskBroker {
 public:
  TaskBroker(BrokerOptions options, std::shared_ptr<const worker::WorkerContext> context);
  ~TaskBroker();

  TaskBroker(const TaskBroker&)            = delete;
  TaskBroker& operator=(const TaskBroker&) = delete;

  // Throws util::QueueFull.
  uint64_t Enqueue(const fetchbox::jobs::v1::Task& task);

  // Recovers expired leases, starts workers, dispatch and housekeeping.
  void Start();

  /*
    Stops leasing, lets workers finish in-flight entries until the grace
    deadline, then cancels the rest (their leases are recovered on the next
    start). Returns true if everything drained in time.

    Never blocks much past grace + stop_timeout. Slots still inside a call
    that ignores cancellation (a blocking object store upload) are logged
    and left running; the destructor joins them.
  */
  bool Shutdown(std::chrono::milliseconds grace);

  BrokerStats Stats();

  bool Running() const {
    return running_;
  }

  // Leases and hands out entries until workers are full or nothing is
  // eligible. Returns the number dispatched.
  size_t DispatchOnce();

  // Prunes terminal entries and reclaims expired leases of dead processes.
  void Housekeep();

 private:
  void DispatchLoop();
  void HousekeepingLoop();
  void Wake();

  // nullptr when every worker is full
  worker::Worker* NextWorkerWithCapacity();

  BrokerOptions                                options_;
  std::shared_ptr<const worker::WorkerContext> context_;

  std::vector<std::unique_ptr<worker::Worker>> workers_;
  size_t                                       next_worker_ = 0;

  std::atomic<bool> running_{false};
  std::thread       dispatch_thread_;
  std::thread       housekeeping_thread_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    wake_ = false;

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
};

} // namespace fetchbox::broker
