#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>

#include "internal/db/api/transaction.hpp"

namespace fetchbox::db::memory {

// Tables of one in-memory store plus a version bumped on every commit.
template <typename State>
struct MemoryStore {
  std::mutex mutex;
  State      committed;
  uint64_t   version = 0;
};

/*
  Works on a private copy of the store taken at construction. Commit()
  publishes the copy, and fails if another transaction committed in
  between (callers serialize writers, so this only trips on misuse).
*/
template <typename State>
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore<State>& store) : store_(store) {
    std::scoped_lock lock(store_.mutex);
    working_      = store_.committed;
    base_version_ = store_.version;
  }

  // Nothing to undo: an abandoned copy is simply dropped.
  ~MemoryTransaction() override = default;

  void Commit() override {
    if (done_) throw std::logic_error("memory transaction already finished");

    std::scoped_lock lock(store_.mutex);
    if (store_.version != base_version_) {
      throw std::runtime_error("memory store changed under an open transaction");
    }
    store_.committed = std::move(working_);
    ++store_.version;
    committed_ = true;
    done_      = true;
  }

  void Rollback() override { done_ = true; }

  bool IsCommitted() const override { return committed_; }

  State&       Mutable() { return working_; }
  const State& View() const { return working_; }

 private:
  MemoryStore<State>& store_;
  State               working_;
  uint64_t            base_version_ = 0;
  bool                committed_    = false;
  bool                done_         = false;
};

} // namespace fetchbox::db::memory
