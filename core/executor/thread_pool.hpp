#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "glog/logging.h"

namespace s3r {

/*
 * Fixed size pool of worker threads draining a FIFO task queue.
 * The destructor runs every queued task before joining the workers.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();

  template <class F>
  auto Submit(F&& f) -> std::future<decltype(f())>;


 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex mu_;
  std::condition_variable cond_;
  bool stopping_ = false;
};

template <class F>
auto ThreadPool::Submit(F&& f) -> std::future<decltype(f())> {
  using ResultT = decltype(f());
  auto task = std::make_shared<std::packaged_task<ResultT()>>(std::forward<F>(f));
  std::future<ResultT> result = task->get_future();
  {
    std::lock_guard<std::mutex> lk(mu_);
    CHECK(!stopping_) << "Submit on a stopped ThreadPool";
    tasks_.push([task]() { (*task)(); });
  }
  cond_.notify_one();
  return result;
}

}  // namespace s3r
