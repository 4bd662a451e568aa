#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace waypoint::async {

/*
  Thread-safe blocking queue for pool workers.

  After Shutdown() the queue drains: Dequeue keeps returning queued tasks
  and then nullopt, Enqueue throws util::InvalidState.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  void Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace waypoint::async
