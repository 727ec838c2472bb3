#include "sqlite_db.hpp"

#include <stdexcept>

namespace fetchbox::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite store " + path_ + ": " + reason);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) == SQLITE_OK) return;

  std::string reason = error ? error : sqlite3_errmsg(db_);
  sqlite3_free(error);
  throw std::runtime_error(path_ + ": " + reason);
}

void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");
  // a requeue or dead-letter must survive power loss, not only a crash
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }
}

} // namespace fetchbox::db::sqlite
