#include "core/executor/executor.hpp"

namespace s3r {

std::future<void> Executor::Add(const std::function<void()>& func) {
  CHECK(func);
  return thread_pool_.Submit(func);
}

}  // namespace s3r
