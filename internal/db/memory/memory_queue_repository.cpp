#include "memory_queue_repository.hpp"

namespace fetchbox::db::memory {

using fetchbox::jobs::v1::QueueStatus;

using QueueTransaction = MemoryTransaction<MemoryQueueRepository::State>;

static QueueTransaction& TX(db::Transaction& tx) {
  return static_cast<QueueTransaction&>(tx);
}

static bool IsTerminal(QueueStatus status) {
  return status == fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED || status == fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED;
}

MemoryQueueRepository::MemoryQueueRepository() = default;

std::unique_ptr<db::Transaction> MemoryQueueRepository::Begin() {
  return std::make_unique<QueueTransaction>(store_);
}

Result MemoryQueueRepository::InsertEntry(Transaction& t, model::QueueEntryRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_sequence++;
  s.entries.emplace(r.sequence, r);
  return Result::Ok();
}

std::optional<model::QueueEntryRecord> MemoryQueueRepository::GetEntry(Transaction& t, uint64_t sequence) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(sequence);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

std::optional<model::QueueEntryRecord> MemoryQueueRepository::FirstEligible(Transaction& t, uint64_t now_ms) {
  for (const auto& [sequence, entry] : TX(t).View().entries) {
    if (entry.status == fetchbox::jobs::v1::QUEUE_STATUS_PENDING && entry.visible_after_ms <= now_ms) {
      return entry;
    }
  }
  return std::nullopt;
}

Result MemoryQueueRepository::UpdateEntry(Transaction& t, const model::QueueEntryRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.sequence);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, "queue entry " + std::to_string(r.sequence));

  auto& stored               = it->second;
  stored.status              = r.status;
  stored.attempt_count       = r.attempt_count;
  stored.upload_attempts     = r.upload_attempts;
  stored.lease_owner         = r.lease_owner;
  stored.lease_expires_at_ms = r.lease_expires_at_ms;
  stored.visible_after_ms    = r.visible_after_ms;
  stored.updated_at_ms       = r.updated_at_ms;
  return Result::Ok();
}

std::vector<model::QueueEntryRecord> MemoryQueueRepository::ListByStatus(Transaction& t, QueueStatus status) {
  std::vector<model::QueueEntryRecord> out;
  for (const auto& [_, entry] : TX(t).View().entries) {
    if (entry.status == status) out.push_back(entry);
  }
  return out;
}

Result MemoryQueueRepository::Counts(Transaction& t, model::QueueCounts& counts) {
  const auto& s = TX(t).View();
  counts        = {};
  counts.next_sequence = s.next_sequence;
  for (const auto& [_, entry] : s.entries) {
    switch (entry.status) {
      case fetchbox::jobs::v1::QUEUE_STATUS_PENDING:
        ++counts.pending;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_LEASED:
        ++counts.leased;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED:
        ++counts.completed;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED:
        ++counts.dead_lettered;
        break;
      default:
        break;
    }
  }
  return Result::Ok();
}

Result MemoryQueueRepository::DeleteTerminalBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto& entries = TX(t).Mutable().entries;
  deleted       = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    if (IsTerminal(it->second.status) && it->second.updated_at_ms < cutoff_ms) {
      it = entries.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace fetchbox::db::memory
