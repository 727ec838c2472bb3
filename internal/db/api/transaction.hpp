#pragma once

namespace fetchbox::db {

/*
  Unit of work spanning one or more repository calls.

  A queue state change (row update plus the sequence counter, or a
  dead-letter insert plus its replay audit row) lands entirely or not at
  all. An uncommitted transaction rolls back when destroyed.

  SQLite opens it with BEGIN IMMEDIATE; the memory backend works on a
  private copy of the tables that replaces the shared one on Commit().
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace fetchbox::db
