#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/queue_entry_record.hpp"

namespace fetchbox::db {

/*
  Queue repository.

  Rows are keyed by sequence; ordered scans return ascending sequence.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertEntry allocates the sequence from a persisted counter in the
    same transaction, so a sequence is never handed out twice even after
    the row was pruned or the process restarted
*/

class QueueRepository {
 public:
  virtual ~QueueRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Assigns r.sequence.
  virtual Result InsertEntry(Transaction&, model::QueueEntryRecord& r) = 0;

  virtual std::optional<model::QueueEntryRecord> GetEntry(Transaction&, uint64_t sequence) = 0;

  // Lowest-sequence Pending entry with visible_after <= now_ms.
  virtual std::optional<model::QueueEntryRecord> FirstEligible(Transaction&, uint64_t now_ms) = 0;

  // Writes the mutable columns (status, attempts, lease, visibility).
  virtual Result UpdateEntry(Transaction&, const model::QueueEntryRecord& r) = 0;

  virtual std::vector<model::QueueEntryRecord> ListByStatus(Transaction&, fetchbox::jobs::v1::QueueStatus status) = 0;

  // Fails rather than under-count, so capacity checks never pass on error.
  virtual Result Counts(Transaction&, model::QueueCounts& counts) = 0;

  // Removes Completed/DeadLettered entries last updated before cutoff_ms.
  virtual Result DeleteTerminalBefore(Transaction&, uint64_t cutoff_ms, uint64_t& deleted) = 0;
};

} // namespace fetchbox::db
