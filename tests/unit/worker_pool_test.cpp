#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/async/worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace {

using waypoint::async::WorkerPool;

void TestSubmitReturnsResult() {
  WorkerPool pool("test", 2);
  auto       future = pool.Submit([] { return 21 * 2; });
  assert(future.get() == 42);

  auto failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  bool threw   = false;
  try {
    (void)failing.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSingleThreadRunsInOrder() {
  WorkerPool       loop("loop", 1);
  std::vector<int> seen;
  for (int i = 0; i < 100; ++i) {
    loop.Post([&seen, i] { seen.push_back(i); });
  }
  loop.Submit([] {}).get();

  assert(seen.size() == 100);
  for (int i = 0; i < 100; ++i) {
    assert(seen[i] == i);
  }
}

void TestStopDrainsQueuedTasks() {
  std::atomic<int> done{0};
  WorkerPool       pool("drain", 3);
  for (int i = 0; i < 50; ++i) {
    pool.Post([&done] {
      std::this_thread::sleep_for(std::chrono::microseconds(100));
      done.fetch_add(1);
    });
  }
  pool.Stop();
  assert(done.load() == 50);

  bool rejected = false;
  try {
    pool.Post([] {});
  } catch (const waypoint::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);

  // stopping twice is harmless
  pool.Stop();
}

void TestFailingTaskKeepsWorkerAlive() {
  WorkerPool loop("loop", 1);
  loop.Post([] { throw std::runtime_error("logged and dropped"); });
  assert(loop.Submit([] { return 7; }).get() == 7);
}

void TestStopFromWorkerThread() {
  std::atomic<int> done{0};
  {
    WorkerPool pool("self-stop", 2);
    for (int i = 0; i < 10; ++i) {
      pool.Post([&done] { done.fetch_add(1); });
    }
    pool.Submit([&pool] { pool.Stop(); }).get();
    assert(done.load() == 10);

    bool rejected = false;
    try {
      pool.Post([] {});
    } catch (const waypoint::util::InvalidState&) {
      rejected = true;
    }
    assert(rejected);
    // the destructor on this thread joins the worker that called Stop()
  }
  assert(done.load() == 10);
}

void TestWorkerThreadIdentity() {
  WorkerPool pool("identity", 2);
  assert(!pool.OnWorkerThread());
  assert(pool.Submit([&pool] { return pool.OnWorkerThread(); }).get());
  assert(pool.size() == 2);
  assert(pool.name() == "identity");
}

} // namespace

int main() {
  TestSubmitReturnsResult();
  TestSingleThreadRunsInOrder();
  TestStopDrainsQueuedTasks();
  TestFailingTaskKeepsWorkerAlive();
  TestStopFromWorkerThread();
  TestWorkerThreadIdentity();

  std::cout << "waypoint_unit_worker_pool: pass\n";
  return 0;
}
