#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dead_letter_record.hpp"

namespace fetchbox::db {

/*
  Dead-letter repository. Entries are keyed by the queue sequence they came
  from and never updated once written.
*/

class DeadLetterRepository {
 public:
  virtual ~DeadLetterRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // First write wins; inserted=false when the sequence already exists.
  virtual Result InsertIfAbsent(Transaction&, const model::DeadLetterRecord& r, bool& inserted) = 0;

  virtual std::optional<model::DeadLetterRecord> Get(Transaction&, uint64_t sequence) = 0;

  // Ascending sequence; empty job_id means all jobs.
  virtual std::vector<model::DeadLetterRecord> List(Transaction&, uint32_t limit, uint32_t offset, const std::string& job_id) = 0;

  virtual uint64_t Count(Transaction&, const std::string& job_id) = 0;

  virtual Result InsertReplay(Transaction&, const model::ReplayRecord& r) = 0;

  virtual std::vector<model::ReplayRecord> ListReplays(Transaction&, uint64_t dead_letter_sequence) = 0;

  virtual Result DeleteBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) = 0;
};

} // namespace fetchbox::db
