#pragma once

#include <map>

#include "internal/db/api/queue_repository.hpp"
#include "memory_tx.hpp"

namespace fetchbox::db::memory {

class MemoryQueueRepository final : public db::QueueRepository {
public:
  MemoryQueueRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntry(Transaction&, model::QueueEntryRecord&) override;
  std::optional<model::QueueEntryRecord> GetEntry(Transaction&, uint64_t) override;
  std::optional<model::QueueEntryRecord> FirstEligible(Transaction&, uint64_t now_ms) override;
  Result UpdateEntry(Transaction&, const model::QueueEntryRecord&) override;
  std::vector<model::QueueEntryRecord> ListByStatus(Transaction&, fetchbox::jobs::v1::QueueStatus) override;
  Result Counts(Transaction&, model::QueueCounts& counts) override;
  Result DeleteTerminalBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;

  struct State {
    std::map<uint64_t, model::QueueEntryRecord> entries; // ordered by sequence
    uint64_t next_sequence = 1;
  };

private:
  MemoryStore<State> store_;
};

}
