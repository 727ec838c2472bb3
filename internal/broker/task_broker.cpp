#include "task_broker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace fetchbox::broker {

using observability::IntField;
using observability::StringField;
using observability::UIntField;

TaskBroker::TaskBroker(BrokerOptions options, std::shared_ptr<const worker::WorkerContext> context)
    : options_(std::move(options)), context_(std::move(context)) {
  const size_t count = std::max<size_t>(1, options_.worker_count);
  workers_.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    auto worker = std::make_unique<worker::Worker>(options_.instance_id + "-w" + std::to_string(i), options_.worker, context_);
    worker->SetSlotListener([this] { Wake(); });
    workers_.push_back(std::move(worker));
  }

  context_->queue->SetEnqueueListener([this] { Wake(); });
}

TaskBroker::~TaskBroker() {
  if (running_) Shutdown(std::chrono::milliseconds(0));
  for (auto& worker : workers_) {
    worker->SetSlotListener({});
    worker->Join();
  }
  context_->queue->SetEnqueueListener({});
}

uint64_t TaskBroker::Enqueue(const fetchbox::jobs::v1::Task& task) {
  return context_->queue->Enqueue(task);
}

void TaskBroker::Start() {
  if (running_) return;

  const auto recovered = context_->queue->RecoverExpiredLeases(util::Now());
  FETCHBOX_LOG_INFO("Startup lease recovery finished", {UIntField("recovered", recovered)});

  for (auto& worker : workers_) {
    worker->Start();
  }

  running_             = true;
  dispatch_thread_     = std::thread(&TaskBroker::DispatchLoop, this);
  housekeeping_thread_ = std::thread(&TaskBroker::HousekeepingLoop, this);

  FETCHBOX_LOG_INFO("Broker started", {StringField("instance_id", options_.instance_id), UIntField("workers", workers_.size()),
                                       UIntField("concurrency", options_.worker.concurrency),
                                       UIntField("max_inflight_per_worker", options_.worker.max_inflight)});
}

bool TaskBroker::Shutdown(std::chrono::milliseconds grace) {
  if (!running_.exchange(false)) return true;

  Wake();
  {
    std::lock_guard lock(stop_mutex_);
  }
  stop_cv_.notify_all();
  if (dispatch_thread_.joinable()) dispatch_thread_.join();
  if (housekeeping_thread_.joinable()) housekeeping_thread_.join();

  for (auto& worker : workers_) {
    worker->Shutdown();
  }

  const auto deadline = std::chrono::steady_clock::now() + grace;
  bool       drained  = true;
  for (auto& worker : workers_) {
    drained = worker->WaitUntilDrained(deadline) && drained;
  }

  if (!drained) {
    FETCHBOX_LOG_WARN("Shutdown grace expired, abandoning in-flight tasks", {IntField("grace_ms", grace.count())});
    for (auto& worker : workers_) {
      worker->Cancel();
    }
  }

  const auto stop_deadline = std::chrono::steady_clock::now() + options_.stop_timeout;
  bool       stopped       = true;
  for (auto& worker : workers_) {
    if (worker->WaitUntilStopped(stop_deadline)) {
      worker->Join();
      continue;
    }
    stopped = false;
    FETCHBOX_LOG_ERROR("Worker slots still running after cancellation",
                       {StringField("worker_id", worker->Id()), UIntField("slots", worker->LiveSlots()),
                        UIntField("inflight", worker->InFlight()), IntField("stop_timeout_ms", options_.stop_timeout.count())});
  }

  FETCHBOX_LOG_INFO("Broker stopped", {observability::BoolField("drained", drained), observability::BoolField("stopped", stopped)});
  return drained && stopped;
}

BrokerStats TaskBroker::Stats() {
  BrokerStats stats;
  stats.queue        = context_->queue->Stats();
  stats.dead_letters = context_->dead_letters->Count();
  stats.inflight.reserve(workers_.size());
  for (const auto& worker : workers_) {
    stats.inflight.push_back(worker->InFlight());
  }
  return stats;
}

worker::Worker* TaskBroker::NextWorkerWithCapacity() {
  worker::Worker* best       = nullptr;
  size_t          best_index = 0;
  size_t          best_load  = 0;
  for (size_t i = 0; i < workers_.size(); ++i) {
    const size_t index = (next_worker_ + i) % workers_.size();
    auto*        worker = workers_[index].get();
    if (!worker->HasCapacity()) continue;

    const size_t load = worker->InFlight();
    if (best == nullptr || load < best_load) {
      best       = worker;
      best_index = index;
      best_load  = load;
    }
  }
  if (best != nullptr) next_worker_ = (best_index + 1) % workers_.size();
  return best;
}

size_t TaskBroker::DispatchOnce() {
  size_t dispatched = 0;

  while (running_) {
    auto* target = NextWorkerWithCapacity();
    if (target == nullptr) break;

    auto entry = context_->queue->LeaseNext(target->Id());
    if (!entry) break;

    const auto sequence = entry->sequence;
    if (!target->TryAssign(std::move(*entry))) {
      FETCHBOX_LOG_WARN("Worker refused leased entry, left for recovery", {UIntField("sequence", sequence), StringField("worker_id", target->Id())});
      break;
    }
    ++dispatched;
  }

  return dispatched;
}

void TaskBroker::Housekeep() {
  const auto now = util::Now();

  const auto pruned = context_->queue->PruneTerminal(now - options_.completed_retention);
  if (pruned > 0) {
    FETCHBOX_LOG_INFO("Pruned terminal queue entries", {UIntField("entries", pruned)});
  }

  if (options_.dead_letter_retention.count() > 0) {
    const auto expired = context_->dead_letters->Prune(now - options_.dead_letter_retention);
    if (expired > 0) {
      FETCHBOX_LOG_INFO("Pruned dead letters", {UIntField("entries", expired)});
    }
  }

  if (!options_.instance_id.empty()) {
    const auto recovered = context_->queue->RecoverExpiredLeases(now, options_.instance_id + "-");
    if (recovered > 0) {
      FETCHBOX_LOG_INFO("Reclaimed leases of a previous process", {UIntField("recovered", recovered)});
      Wake();
    }
  }
}

void TaskBroker::Wake() {
  {
    std::lock_guard lock(wake_mutex_);
    wake_ = true;
  }
  wake_cv_.notify_one();
}

void TaskBroker::DispatchLoop() {
  while (running_) {
    try {
      DispatchOnce();
    } catch (const std::exception& e) {
      FETCHBOX_LOG_ERROR("Dispatch pass failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, options_.poll_interval, [&] { return wake_ || !running_; });
    wake_ = false;
  }
}

void TaskBroker::HousekeepingLoop() {
  for (;;) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, options_.prune_interval, [&] { return !running_.load(); })) return;
    }

    try {
      Housekeep();
    } catch (const std::exception& e) {
      FETCHBOX_LOG_ERROR("Housekeeping pass failed", {StringField("error", e.what())});
    }
  }
}

} // namespace fetchbox::broker
