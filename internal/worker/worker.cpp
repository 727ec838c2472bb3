#include "worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace fetchbox::worker {

using observability::StringField;
using observability::UIntField;

Worker::Worker(std::string id, WorkerOptions options, std::shared_ptr<const WorkerContext> context)
    : id_(std::move(id)),
      options_(options),
      context_(context),
      pipeline_(std::move(context)),
      inbox_(std::max<size_t>(1, options.max_inflight)),
      limiter_(options.rate_limit_per_second) {
}

Worker::~Worker() {
  Shutdown();
  Join();
}

void Worker::Start() {
  running_ = true;
  const size_t slots = std::max<size_t>(1, options_.concurrency);
  live_slots_        = slots;
  threads_.reserve(slots);
  for (size_t i = 0; i < slots; ++i) {
    threads_.emplace_back(&Worker::Run, this);
  }
}

bool Worker::TryAssign(db::model::QueueEntryRecord entry) {
  if (!running_) return false;

  size_t current = inflight_.load();
  do {
    if (current >= inbox_.Capacity()) return false;
  } while (!inflight_.compare_exchange_weak(current, current + 1));

  if (!inbox_.TryPush(std::move(entry))) {
    Release();
    return false;
  }
  return true;
}

bool Worker::HasCapacity() const {
  return running_ && inflight_.load() < inbox_.Capacity();
}

size_t Worker::InFlight() const {
  return inflight_.load();
}

size_t Worker::LiveSlots() const {
  return live_slots_.load();
}

void Worker::Shutdown() {
  running_ = false;
  inbox_.Shutdown();
}

bool Worker::WaitUntilDrained(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lock(drain_mutex_);
  return drain_cv_.wait_until(lock, deadline, [&] { return inflight_.load() == 0; });
}

void Worker::Cancel() {
  cancel_.Cancel();
  const size_t dropped = inbox_.Clear();
  for (size_t i = 0; i < dropped; ++i) {
    Release();
  }
  if (dropped > 0) {
    FETCHBOX_LOG_WARN("Abandoned queued entries", {StringField("worker_id", id_), UIntField("entries", dropped)});
  }
}

bool Worker::WaitUntilStopped(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock lock(drain_mutex_);
  return drain_cv_.wait_until(lock, deadline, [&] { return live_slots_.load() == 0; });
}

void Worker::Join() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void Worker::SetSlotListener(std::function<void()> listener) {
  std::lock_guard lock(drain_mutex_);
  slot_listener_ = std::move(listener);
}

void Worker::Release() {
  std::function<void()> listener;
  {
    std::lock_guard lock(drain_mutex_);
    inflight_.fetch_sub(1);
    listener = slot_listener_;
  }
  drain_cv_.notify_all();
  if (listener) listener();
}

void Worker::Run() {
  for (;;) {
    auto entry = inbox_.Pop();
    if (!entry) break;

    if (!limiter_.Acquire(cancel_)) {
      FETCHBOX_LOG_INFO("Task abandoned on shutdown", {UIntField("sequence", entry->sequence), StringField("worker_id", id_)});
      Release();
      continue;
    }

    const auto outcome = pipeline_.Execute(*entry, id_, cancel_);
    FETCHBOX_LOG_DEBUG("Lease cycle finished",
                       {UIntField("sequence", entry->sequence), StringField("worker_id", id_), StringField("outcome", OutcomeName(outcome))});
    Release();
  }

  {
    std::lock_guard lock(drain_mutex_);
    live_slots_.fetch_sub(1);
  }
  drain_cv_.notify_all();
}

} // namespace fetchbox::worker
