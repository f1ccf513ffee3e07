#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace coordinator::scheduling {

/*
  Fixed set of threads draining one TaskQueue of closures.

  Stop() refuses new work, lets queued tasks finish and joins.
*/
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(std::string name, std::size_t threads, std::size_t capacity = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // false when the queue is full or the pool is stopping
  bool Submit(Task task);

  std::size_t Pending() const;

 private:
  void Run();

  std::string              name_;
  std::size_t              thread_count_;
  TaskQueue<Task>          queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace coordinator::scheduling
