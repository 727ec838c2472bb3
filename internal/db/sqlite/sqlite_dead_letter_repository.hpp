#pragma once

#include <memory>

#include "internal/db/api/dead_letter_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fetchbox::db::sqlite {

class SqliteDeadLetterRepository final : public db::DeadLetterRepository {
public:
  explicit SqliteDeadLetterRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertIfAbsent(Transaction&, const model::DeadLetterRecord&, bool& inserted) override;
  std::optional<model::DeadLetterRecord> Get(Transaction&, uint64_t) override;
  std::vector<model::DeadLetterRecord> List(Transaction&, uint32_t limit, uint32_t offset, const std::string& job_id) override;
  uint64_t Count(Transaction&, const std::string& job_id) override;
  Result InsertReplay(Transaction&, const model::ReplayRecord&) override;
  std::vector<model::ReplayRecord> ListReplays(Transaction&, uint64_t dead_letter_sequence) override;
  Result DeleteBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) override;

private:
  static SqliteTransaction& TX(Transaction&);

  std::shared_ptr<SqliteDB> db_;
};

}
