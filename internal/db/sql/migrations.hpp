#pragma once

#include <string>
#include <vector>

namespace fetchbox::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS / INSERT OR IGNORE).
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& QueueSchema();
const std::vector<std::string>& DeadLetterSchema();

} // namespace fetchbox::db::sql
