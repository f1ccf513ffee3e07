#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace coordinator::scheduling {

WorkerPool::WorkerPool(std::string name, std::size_t threads, std::size_t capacity)
    : name_(std::move(name)), thread_count_(threads == 0 ? 1 : threads), queue_(capacity) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool WorkerPool::Submit(Task task) {
  return queue_.TryEnqueue(std::move(task));
}

std::size_t WorkerPool::Pending() const {
  return queue_.Size();
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      COORDINATOR_LOG_ERROR("worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace coordinator::scheduling
