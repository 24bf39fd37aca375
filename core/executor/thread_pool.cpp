#include "core/executor/thread_pool.hpp"

namespace s3r {

ThreadPool::ThreadPool(size_t threads) {
  CHECK_GT(threads, 0);
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
}

void ThreadPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cond_.wait(lk, [this]() { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        // stopping_ and nothing left to run
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cond_.notify_all();
  for (auto& worker : workers_) {
    worker.join();
  }
}

}  // namespace s3r
