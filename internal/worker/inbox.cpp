#include "inbox.hpp"

#include <algorithm>

namespace fetchbox::worker {

Inbox::Inbox(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {
}

bool Inbox::TryPush(db::model::QueueEntryRecord entry) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || entries_.size() >= capacity_) return false;
    entries_.push_back(std::move(entry));
  }
  cv_.notify_one();
  return true;
}

std::optional<db::model::QueueEntryRecord> Inbox::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !entries_.empty(); });

  if (entries_.empty()) return std::nullopt;

  auto entry = std::move(entries_.front());
  entries_.pop_front();
  return entry;
}

void Inbox::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t Inbox::Clear() {
  std::lock_guard lock(mutex_);
  const size_t    dropped = entries_.size();
  entries_.clear();
  return dropped;
}

size_t Inbox::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace fetchbox::worker
