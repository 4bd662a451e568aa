#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "task_queue.hpp"

namespace waypoint::async {

/*
  Fixed set of threads draining one TaskQueue.

  A pool of one thread is an event loop: tasks run strictly in submission
  order and never overlap, which is how the postgres saver keeps its
  connection single-threaded.
*/
class WorkerPool {
 public:
  WorkerPool(std::string name, std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Fire and forget. Throws util::InvalidState after Stop().
  void Post(TaskQueue::Task task);

  // The future carries the result or the exception thrown by fn.
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using R   = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut  = task->get_future();
    Post([task] { (*task)(); });
    return fut;
  }

  /*
    Drains queued tasks and joins the workers. Called from a task, it joins
    every other worker; the calling thread is joined by the next Stop() or
    the destructor on a thread outside the pool. The pool must not be
    destroyed from one of its own threads.
  */
  void Stop();

  bool OnWorkerThread() const;

  const std::string& name() const {
    return name_;
  }

  std::size_t size() const {
    return threads_.size();
  }

 private:
  void Run();

  std::string              name_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
};

} // namespace waypoint::async
