#pragma once

#include <map>

#include "internal/db/api/dead_letter_repository.hpp"
#include "memory_tx.hpp"

namespace fetchbox::db::memory {

class MemoryDeadLetterRepository final : public db::DeadLetterRepository {
public:
  MemoryDeadLetterRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertIfAbsent(Transaction&, const model::DeadLetterRecord&, bool& inserted) override;
  std::optional<model::DeadLetterRecord> Get(Transaction&, uint64_t) override;
  std::vector<model::DeadLetterRecord> List(Transaction&, uint32_t limit, uint32_t offset, const std::string& job_id) override;
  uint64_t Count(Transaction&, const std::string& job_id) override;
  Result InsertReplay(Transaction&, const model::ReplayRecord&) override;
  std::vector<model::ReplayRecord> ListReplays(Transaction&, uint64_t dead_letter_sequence) override;
  Result DeleteBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;

  struct State {
    std::map<uint64_t, model::DeadLetterRecord> entries;
    std::vector<model::ReplayRecord>            replays;
  };

private:
  MemoryStore<State> store_;
};

}
