#pragma once

#include <future>

#include "core/executor/abstract_executor.hpp"
#include "core/executor/thread_pool.hpp"

namespace s3r {

// AbstractExecutor on top of a ThreadPool. Shared by every object store
// request issued from one process.
class Executor : public AbstractExecutor {
 public:
  explicit Executor(size_t threads) : thread_pool_(threads) {}
  virtual std::future<void> Add(const std::function<void()>& func) override;

 private:
  ThreadPool thread_pool_;
};

}  // namespace s3r
