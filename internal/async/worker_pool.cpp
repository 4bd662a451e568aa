#include "worker_pool.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace waypoint::async {

WorkerPool::WorkerPool(std::string name, std::size_t threads) : name_(std::move(name)) {
  const auto count = std::max<std::size_t>(threads, 1);
  threads_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Post(TaskQueue::Task task) {
  queue_.Enqueue(std::move(task));
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  const auto self = std::this_thread::get_id();
  for (auto& thread : threads_) {
    // a worker cannot join itself; it stays joinable for an outside caller
    if (thread.joinable() && thread.get_id() != self) {
      thread.join();
    }
  }
}

bool WorkerPool::OnWorkerThread() const {
  const auto self = std::this_thread::get_id();
  return std::any_of(threads_.begin(), threads_.end(), [&](const std::thread& t) { return t.get_id() == self; });
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      WAYPOINT_LOG_ERROR("worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace waypoint::async
