#pragma once

#include <memory>

#include "internal/db/api/queue_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fetchbox::db::sqlite {

/*
  Queue entries live in queue_entries keyed by sequence; the task is the
  serialized protobuf. queue_meta.next_sequence is the persisted counter.
*/
class SqliteQueueRepository final : public db::QueueRepository {
public:
  explicit SqliteQueueRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntry(Transaction&, model::QueueEntryRecord&) override;
  std::optional<model::QueueEntryRecord> GetEntry(Transaction&, uint64_t) override;
  std::optional<model::QueueEntryRecord> FirstEligible(Transaction&, uint64_t now_ms) override;
  Result UpdateEntry(Transaction&, const model::QueueEntryRecord&) override;
  std::vector<model::QueueEntryRecord> ListByStatus(Transaction&, fetchbox::jobs::v1::QueueStatus) override;
  Result Counts(Transaction&, model::QueueCounts& counts) override;
  Result DeleteTerminalBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;

private:
  static SqliteTransaction& TX(Transaction&);

  std::shared_ptr<SqliteDB> db_;
};

}
