#pragma once

#include <functional>
#include <future>

namespace s3r {

/*
 * Runs void->void tasks asynchronously.
 * The returned future becomes ready once the task has run.
 */
class AbstractExecutor {
 public:
  virtual ~AbstractExecutor() {}
  virtual std::future<void> Add(const std::function<void()>& func) = 0;
};

}  // namespace s3r
