#include "internal/worker/rate_limiter.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/worker/inbox.hpp"

namespace {

using fetchbox::util::CancellationToken;
using fetchbox::worker::Inbox;
using fetchbox::worker::RateLimiter;
using namespace std::chrono_literals;

fetchbox::db::model::QueueEntryRecord Entry(uint64_t sequence) {
  fetchbox::db::model::QueueEntryRecord entry;
  entry.sequence = sequence;
  return entry;
}

void TestLimiterPacesAcquisitions() {
  RateLimiter       limiter(20.0);
  CancellationToken cancel;

  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 11; ++i) {
    assert(limiter.Acquire(cancel));
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;

  // one token up front, ten more at 20/s
  assert(elapsed >= 400ms);
}

void TestBurstIsAvailableUpFront() {
  RateLimiter       limiter(0.01, 2.0);
  CancellationToken cancel;

  const auto start = std::chrono::steady_clock::now();
  assert(limiter.Acquire(cancel));
  assert(limiter.Acquire(cancel));
  assert(std::chrono::steady_clock::now() - start < 1s);
}

void TestUnlimitedRate() {
  RateLimiter       limiter(0.0);
  CancellationToken cancel;
  for (int i = 0; i < 1000; ++i) {
    assert(limiter.Acquire(cancel));
  }
  cancel.Cancel();
  assert(!limiter.Acquire(cancel));
}

void TestAcquireReturnsOnCancel() {
  RateLimiter       limiter(0.001);
  CancellationToken cancel;
  assert(limiter.Acquire(cancel));

  std::thread canceller([&] {
    std::this_thread::sleep_for(100ms);
    cancel.Cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  assert(!limiter.Acquire(cancel));
  assert(std::chrono::steady_clock::now() - start < 5s);
  canceller.join();
}

void TestInboxBoundsAndOrder() {
  Inbox inbox(2);
  assert(inbox.Capacity() == 2);
  assert(inbox.TryPush(Entry(1)));
  assert(inbox.TryPush(Entry(2)));
  assert(!inbox.TryPush(Entry(3)));
  assert(inbox.Size() == 2);

  assert(inbox.Pop()->sequence == 1);
  assert(inbox.TryPush(Entry(3)));
  assert(inbox.Pop()->sequence == 2);
  assert(inbox.Pop()->sequence == 3);
  assert(inbox.Size() == 0);
}

void TestInboxShutdownDrainsThenStops() {
  Inbox inbox(4);
  assert(inbox.TryPush(Entry(1)));
  inbox.Shutdown();

  assert(!inbox.TryPush(Entry(2)));
  assert(inbox.Pop()->sequence == 1);
  assert(!inbox.Pop());
}

void TestInboxWakesBlockedConsumers() {
  Inbox                 inbox(4);
  std::atomic<int>      received{0};
  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i) {
    consumers.emplace_back([&] {
      while (inbox.Pop()) received++;
    });
  }

  for (uint64_t s = 1; s <= 3; ++s) {
    while (!inbox.TryPush(Entry(s))) std::this_thread::sleep_for(1ms);
  }
  while (inbox.Size() > 0) std::this_thread::sleep_for(1ms);

  inbox.Shutdown();
  for (auto& consumer : consumers) consumer.join();
  assert(received.load() == 3);
}

void TestInboxClearReportsDropped() {
  Inbox inbox(3);
  assert(inbox.TryPush(Entry(1)));
  assert(inbox.TryPush(Entry(2)));
  assert(inbox.Clear() == 2);
  assert(inbox.Size() == 0);
}

} // namespace

int main() {
  TestLimiterPacesAcquisitions();
  TestBurstIsAvailableUpFront();
  TestUnlimitedRate();
  TestAcquireReturnsOnCancel();
  TestInboxBoundsAndOrder();
  TestInboxShutdownDrainsThenStops();
  TestInboxWakesBlockedConsumers();
  TestInboxClearReportsDropped();

  std::cout << "fetchbox_unit_rate_limiter: pass\n";
  return 0;
}
