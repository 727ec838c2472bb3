#include "memory_dead_letter_repository.hpp"

namespace fetchbox::db::memory {

using DeadLetterTransaction = MemoryTransaction<MemoryDeadLetterRepository::State>;

static DeadLetterTransaction& TX(db::Transaction& tx) {
  return static_cast<DeadLetterTransaction&>(tx);
}

static bool MatchesJob(const model::DeadLetterRecord& r, const std::string& job_id) {
  return job_id.empty() || r.task.job_id() == job_id;
}

MemoryDeadLetterRepository::MemoryDeadLetterRepository() = default;

std::unique_ptr<db::Transaction> MemoryDeadLetterRepository::Begin() {
  return std::make_unique<DeadLetterTransaction>(store_);
}

Result MemoryDeadLetterRepository::InsertIfAbsent(Transaction& t, const model::DeadLetterRecord& r, bool& inserted) {
  inserted = TX(t).Mutable().entries.emplace(r.sequence, r).second;
  return Result::Ok();
}

std::optional<model::DeadLetterRecord> MemoryDeadLetterRepository::Get(Transaction& t, uint64_t sequence) {
  const auto& entries = TX(t).View().entries;
  auto        it      = entries.find(sequence);
  if (it == entries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeadLetterRecord> MemoryDeadLetterRepository::List(Transaction& t, uint32_t limit, uint32_t offset, const std::string& job_id) {
  std::vector<model::DeadLetterRecord> out;
  uint32_t                             skipped = 0;
  for (const auto& [_, record] : TX(t).View().entries) {
    if (!MatchesJob(record, job_id)) continue;
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= limit) break;
    out.push_back(record);
  }
  return out;
}

uint64_t MemoryDeadLetterRepository::Count(Transaction& t, const std::string& job_id) {
  uint64_t count = 0;
  for (const auto& [_, record] : TX(t).View().entries) {
    if (MatchesJob(record, job_id)) ++count;
  }
  return count;
}

Result MemoryDeadLetterRepository::InsertReplay(Transaction& t, const model::ReplayRecord& r) {
  TX(t).Mutable().replays.push_back(r);
  return Result::Ok();
}

std::vector<model::ReplayRecord> MemoryDeadLetterRepository::ListReplays(Transaction& t, uint64_t dead_letter_sequence) {
  std::vector<model::ReplayRecord> out;
  for (const auto& replay : TX(t).View().replays) {
    if (replay.dead_letter_sequence == dead_letter_sequence) out.push_back(replay);
  }
  return out;
}

Result MemoryDeadLetterRepository::DeleteBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto& entries = TX(t).Mutable().entries;
  deleted       = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    if (it->second.failed_at_ms < cutoff_ms) {
      it = entries.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace fetchbox::db::memory
