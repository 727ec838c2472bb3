#pragma once

#include <atomic>

namespace fetchbox::util {

/*
  Shared shutdown flag polled by blocking waits and transfer callbacks.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace fetchbox::util
