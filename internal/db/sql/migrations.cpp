#include "migrations.hpp"

namespace fetchbox::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& QueueSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS queue_entries (sequence INTEGER PRIMARY KEY, status INTEGER NOT NULL, attempt_count INTEGER NOT NULL, upload_attempts INTEGER NOT NULL DEFAULT 0, lease_owner TEXT NOT NULL DEFAULT '', lease_expires_at_ms INTEGER NOT NULL DEFAULT 0, visible_after_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL, task BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS queue_entries_eligible ON queue_entries(status, visible_after_ms, sequence);",
      "CREATE TABLE IF NOT EXISTS queue_meta (key TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO queue_meta(key, value) VALUES('next_sequence', 1);"};
  return kSchema;
}

const std::vector<std::string>& DeadLetterSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS dead_letters (sequence INTEGER PRIMARY KEY, job_id TEXT NOT NULL, resource_id TEXT NOT NULL, failure_code TEXT NOT NULL, failure_message TEXT NOT NULL, attempts INTEGER NOT NULL, total_attempts INTEGER NOT NULL DEFAULT 0, failed_at_ms INTEGER NOT NULL, task BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS dead_letters_job ON dead_letters(job_id, sequence);",
      "CREATE TABLE IF NOT EXISTS dead_letter_replays (dead_letter_sequence INTEGER NOT NULL, new_sequence INTEGER NOT NULL, replayed_at_ms INTEGER NOT NULL, PRIMARY KEY(dead_letter_sequence, new_sequence));"};
  return kSchema;
}

} // namespace fetchbox::db::sql
