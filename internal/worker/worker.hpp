#pragma once

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "inbox.hpp"
#include "internal/util/cancellation.hpp"
#include "rate_limiter.hpp"
#include "task_pipeline.hpp"

namespace fetchbox::worker {

struct WorkerOptions {
  size_t concurrency           = 1;
  size_t max_inflight          = 8;
  double rate_limit_per_second = 10.0;
};

/*
  One logical worker: an inbox, a rate limiter and `concurrency` execution
  slots (threads) that pop entries and run them through the pipeline.

  In-flight counts entries queued in the inbox plus entries executing.
*/
class Worker {
 public:
  Worker(std::string id, WorkerOptions options, std::shared_ptr<const WorkerContext> context);
  ~Worker();

  Worker(const Worker&)            = delete;
  Worker& operator=(const Worker&) = delete;

  const std::string& Id() const {
    return id_;
  }

  void Start();

  // False when at max in-flight or shutting down.
  bool TryAssign(db::model::QueueEntryRecord entry);

  bool HasCapacity() const;
  size_t InFlight() const;

  // Execution slots whose thread has not returned yet.
  size_t LiveSlots() const;

  // Stops accepting work; slots finish what is already assigned.
  void Shutdown();

  // true once nothing is in flight
  bool WaitUntilDrained(std::chrono::steady_clock::time_point deadline);

  // Abandons queued entries and signals executing tasks to stop.
  void Cancel();

  /*
    true once every slot thread has returned. A slot blocked in a call that
    does not observe cancellation (an object store write, for one) keeps
    running until that call returns.
  */
  bool WaitUntilStopped(std::chrono::steady_clock::time_point deadline);

  // Blocks until every slot thread has returned.
  void Join();

  // Invoked whenever an in-flight slot frees up.
  void SetSlotListener(std::function<void()> listener);

 private:
  void Run();
  void Release();

  const std::string                    id_;
  const WorkerOptions                  options_;
  std::shared_ptr<const WorkerContext> context_;

  TaskPipeline            pipeline_;
  Inbox                   inbox_;
  RateLimiter             limiter_;
  util::CancellationToken cancel_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
  std::atomic<size_t>      inflight_{0};
  std::atomic<size_t>      live_slots_{0};

  std::mutex              drain_mutex_;
  std::condition_variable drain_cv_;
  std::function<void()>   slot_listener_;
};

} // namespace fetchbox::worker
