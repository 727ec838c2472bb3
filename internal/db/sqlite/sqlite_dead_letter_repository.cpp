#include "sqlite_dead_letter_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_bind.hpp"

namespace fetchbox::db::sqlite {

using fetchbox::db::ErrorCode;
using fetchbox::db::Result;

namespace {

model::DeadLetterRecord ReadRecord(sqlite3_stmt* st) {
  model::DeadLetterRecord r;
  r.sequence        = ColU64(st, 0);
  r.failure_code    = ColText(st, 1);
  r.failure_message = ColText(st, 2);
  r.attempts        = static_cast<uint32_t>(sqlite3_column_int(st, 3));
  r.failed_at_ms    = ColU64(st, 4);
  r.total_attempts  = static_cast<uint32_t>(sqlite3_column_int(st, 6));
  // an undecodable task still lists; the codes above carry the diagnosis
  if (!r.task.ParseFromString(ColBlob(st, 5))) r.task.Clear();
  return r;
}

} // namespace

SqliteDeadLetterRepository::SqliteDeadLetterRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  sql::RunMigrations(*db_, sql::DeadLetterSchema());
}

std::unique_ptr<db::Transaction> SqliteDeadLetterRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteDeadLetterRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteDeadLetterRepository::InsertIfAbsent(Transaction& t, const model::DeadLetterRecord& r, bool& inserted) {
  auto* db = TX(t).Handle();
  inserted = false;

  const char* sql =
      "INSERT OR IGNORE INTO dead_letters(sequence,job_id,resource_id,failure_code,failure_message,attempts,failed_at_ms,task,"
      "total_attempts) VALUES(?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  std::string blob;
  if (!r.task.SerializeToString(&blob)) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::InternalError, "task serialization failed");
  }

  BindU64(st, 1, r.sequence);
  BindText(st, 2, r.task.job_id());
  BindText(st, 3, r.task.resource_id());
  BindText(st, 4, r.failure_code);
  BindText(st, 5, r.failure_message);
  sqlite3_bind_int(st, 6, static_cast<int>(r.attempts));
  BindU64(st, 7, r.failed_at_ms);
  BindBlob(st, 8, blob);
  sqlite3_bind_int(st, 9, static_cast<int>(r.total_attempts));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto res = Translate(db, rc);
  if (res) inserted = sqlite3_changes(db) > 0;
  return res;
}

std::optional<model::DeadLetterRecord> SqliteDeadLetterRepository::Get(Transaction& t, uint64_t sequence) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT sequence,failure_code,failure_message,attempts,failed_at_ms,task,total_attempts FROM dead_letters WHERE sequence=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindU64(st, 1, sequence);
  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadRecord(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::DeadLetterRecord> SqliteDeadLetterRepository::List(Transaction& t, uint32_t limit, uint32_t offset,
                                                                       const std::string& job_id) {
  auto* db = TX(t).Handle();

  std::vector<model::DeadLetterRecord> out;

  const char* sql =
      "SELECT sequence,failure_code,failure_message,attempts,failed_at_ms,task,total_attempts FROM dead_letters "
      "WHERE (?='' OR job_id=?) ORDER BY sequence LIMIT ? OFFSET ?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return out;

  BindText(st, 1, job_id);
  BindText(st, 2, job_id);
  BindU64(st, 3, limit);
  BindU64(st, 4, offset);

  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadRecord(st));
  }

  sqlite3_finalize(st);
  return out;
}

uint64_t SqliteDeadLetterRepository::Count(Transaction& t, const std::string& job_id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM dead_letters WHERE (?='' OR job_id=?);", -1, &st, nullptr) != SQLITE_OK) return 0;

  BindText(st, 1, job_id);
  BindText(st, 2, job_id);

  uint64_t count = 0;
  if (sqlite3_step(st) == SQLITE_ROW) count = ColU64(st, 0);
  sqlite3_finalize(st);
  return count;
}

Result SqliteDeadLetterRepository::InsertReplay(Transaction& t, const model::ReplayRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO dead_letter_replays(dead_letter_sequence,new_sequence,replayed_at_ms) VALUES(?,?,?);", -1, &st,
                         nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.dead_letter_sequence);
  BindU64(st, 2, r.new_sequence);
  BindU64(st, 3, r.replayed_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  return Translate(db, rc);
}

std::vector<model::ReplayRecord> SqliteDeadLetterRepository::ListReplays(Transaction& t, uint64_t dead_letter_sequence) {
  auto* db = TX(t).Handle();

  std::vector<model::ReplayRecord> out;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db,
                         "SELECT dead_letter_sequence,new_sequence,replayed_at_ms FROM dead_letter_replays "
                         "WHERE dead_letter_sequence=? ORDER BY new_sequence;",
                         -1, &st, nullptr) != SQLITE_OK)
    return out;

  BindU64(st, 1, dead_letter_sequence);
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back({ColU64(st, 0), ColU64(st, 1), ColU64(st, 2)});
  }

  sqlite3_finalize(st);
  return out;
}

Result SqliteDeadLetterRepository::DeleteBefore(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM dead_letters WHERE failed_at_ms<?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, cutoff_ms);
  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto res = Translate(db, rc);
  if (res) deleted = static_cast<uint64_t>(sqlite3_changes(db));
  return res;
}

} // namespace fetchbox::db::sqlite
