#include "sqlite_queue_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_bind.hpp"

namespace fetchbox::db::sqlite {

using fetchbox::db::ErrorCode;
using fetchbox::db::Result;
using fetchbox::jobs::v1::QueueStatus;

namespace {

constexpr const char* kSelectColumns =
    "SELECT sequence,status,attempt_count,lease_owner,lease_expires_at_ms,visible_after_ms,updated_at_ms,task,upload_attempts "
    "FROM queue_entries ";

model::QueueEntryRecord ReadEntry(sqlite3_stmt* st) {
  model::QueueEntryRecord r;
  r.sequence            = ColU64(st, 0);
  r.status              = static_cast<QueueStatus>(sqlite3_column_int(st, 1));
  r.attempt_count       = static_cast<uint32_t>(sqlite3_column_int(st, 2));
  r.lease_owner         = ColText(st, 3);
  r.lease_expires_at_ms = ColU64(st, 4);
  r.visible_after_ms    = ColU64(st, 5);
  r.updated_at_ms       = ColU64(st, 6);
  r.upload_attempts     = static_cast<uint32_t>(sqlite3_column_int(st, 8));

  const auto blob = ColBlob(st, 7);
  r.corrupt       = !r.task.ParseFromString(blob);
  return r;
}

} // namespace

SqliteQueueRepository::SqliteQueueRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  sql::RunMigrations(*db_, sql::QueueSchema());
}

std::unique_ptr<db::Transaction> SqliteQueueRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteQueueRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteQueueRepository::InsertEntry(Transaction& t, model::QueueEntryRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT value FROM queue_meta WHERE key='next_sequence';", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::Corruption, "queue_meta.next_sequence missing");
  }
  const uint64_t sequence = ColU64(st, 0);
  sqlite3_finalize(st);

  if (sqlite3_prepare_v2(db, "UPDATE queue_meta SET value=? WHERE key='next_sequence';", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st, 1, sequence + 1);
  rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (auto res = Translate(db, rc); !res) return res;

  const char* sql =
      "INSERT INTO queue_entries(sequence,status,attempt_count,lease_owner,lease_expires_at_ms,visible_after_ms,updated_at_ms,task,"
      "upload_attempts) VALUES(?,?,?,?,?,?,?,?,?);";
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  std::string blob;
  if (!r.task.SerializeToString(&blob)) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::InternalError, "task serialization failed");
  }

  BindU64(st, 1, sequence);
  sqlite3_bind_int(st, 2, static_cast<int>(r.status));
  sqlite3_bind_int(st, 3, static_cast<int>(r.attempt_count));
  BindText(st, 4, r.lease_owner);
  BindU64(st, 5, r.lease_expires_at_ms);
  BindU64(st, 6, r.visible_after_ms);
  BindU64(st, 7, r.updated_at_ms);
  BindBlob(st, 8, blob);
  sqlite3_bind_int(st, 9, static_cast<int>(r.upload_attempts));

  rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto res = Translate(db, rc);
  if (res) r.sequence = sequence;
  return res;
}

std::optional<model::QueueEntryRecord> SqliteQueueRepository::GetEntry(Transaction& t, uint64_t sequence) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kSelectColumns) + "WHERE sequence=?;";
  sqlite3_stmt*     st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindU64(st, 1, sequence);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadEntry(st);
  sqlite3_finalize(st);
  return r;
}

std::optional<model::QueueEntryRecord> SqliteQueueRepository::FirstEligible(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kSelectColumns) + "WHERE status=? AND visible_after_ms<=? ORDER BY sequence LIMIT 1;";
  sqlite3_stmt*     st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  sqlite3_bind_int(st, 1, static_cast<int>(fetchbox::jobs::v1::QUEUE_STATUS_PENDING));
  BindU64(st, 2, now_ms);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadEntry(st);
  sqlite3_finalize(st);
  return r;
}

Result SqliteQueueRepository::UpdateEntry(Transaction& t, const model::QueueEntryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE queue_entries SET status=?,attempt_count=?,lease_owner=?,lease_expires_at_ms=?,visible_after_ms=?,updated_at_ms=?,"
      "upload_attempts=? WHERE sequence=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int(st, 1, static_cast<int>(r.status));
  sqlite3_bind_int(st, 2, static_cast<int>(r.attempt_count));
  BindText(st, 3, r.lease_owner);
  BindU64(st, 4, r.lease_expires_at_ms);
  BindU64(st, 5, r.visible_after_ms);
  BindU64(st, 6, r.updated_at_ms);
  sqlite3_bind_int(st, 7, static_cast<int>(r.upload_attempts));
  BindU64(st, 8, r.sequence);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto res = Translate(db, rc);
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "queue entry " + std::to_string(r.sequence));
  return res;
}

std::vector<model::QueueEntryRecord> SqliteQueueRepository::ListByStatus(Transaction& t, QueueStatus status) {
  auto* db = TX(t).Handle();

  std::vector<model::QueueEntryRecord> out;

  const std::string sql = std::string(kSelectColumns) + "WHERE status=? ORDER BY sequence;";
  sqlite3_stmt*     st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return out;

  sqlite3_bind_int(st, 1, static_cast<int>(status));
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadEntry(st));
  }

  sqlite3_finalize(st);
  return out;
}

Result SqliteQueueRepository::Counts(Transaction& t, model::QueueCounts& counts) {
  auto* db = TX(t).Handle();
  counts   = {};

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT status, COUNT(*) FROM queue_entries GROUP BY status;", -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    const auto     status = static_cast<QueueStatus>(sqlite3_column_int(st, 0));
    const uint64_t count  = ColU64(st, 1);
    switch (status) {
      case fetchbox::jobs::v1::QUEUE_STATUS_PENDING:
        counts.pending = count;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_LEASED:
        counts.leased = count;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED:
        counts.completed = count;
        break;
      case fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED:
        counts.dead_lettered = count;
        break;
      default:
        break;
    }
  }
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) return Result::Err(rc == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::IOError, sqlite3_errmsg(db));

  if (sqlite3_prepare_v2(db, "SELECT value FROM queue_meta WHERE key='next_sequence';", -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) counts.next_sequence = ColU64(st, 0);
  sqlite3_finalize(st);
  if (rc != SQLITE_ROW) return Result::Err(ErrorCode::Corruption, "queue_meta.next_sequence missing");

  return Result::Ok();
}

Result SqliteQueueRepository::DeleteTerminalBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM queue_entries WHERE status IN (?,?) AND updated_at_ms<?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int(st, 1, static_cast<int>(fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED));
  sqlite3_bind_int(st, 2, static_cast<int>(fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED));
  BindU64(st, 3, cutoff_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto res = Translate(db, rc);
  if (res) deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return res;
}

} // namespace fetchbox::db::sqlite
