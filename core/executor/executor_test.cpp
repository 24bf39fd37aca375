#include "gtest/gtest.h"
#include "glog/logging.h"

#include "core/executor/executor.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace s3r {
namespace {

class TestExecutor : public testing::Test {};

TEST_F(TestExecutor, Construct) {
  Executor executor(4);
}

TEST_F(TestExecutor, FuturesCompleteAfterTask) {
  Executor executor(4);
  std::atomic<int> a(0);
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 10; ++ i) {
    futures.push_back(executor.Add([&a](){ a.fetch_add(1); }));
  }
  for (auto& f : futures) {
    f.get();
  }
  EXPECT_EQ(a, 10);
}

TEST_F(TestExecutor, FulfilPromiseFromTask) {
  Executor executor(2);
  auto promise = std::make_shared<std::promise<int>>();
  auto result = promise->get_future();
  executor.Add([promise]() { promise->set_value(42); });
  EXPECT_EQ(result.get(), 42);
}

TEST_F(TestExecutor, UsableThroughInterface) {
  std::shared_ptr<AbstractExecutor> executor = std::make_shared<Executor>(1);
  bool ran = false;
  executor->Add([&ran]() { ran = true; }).get();
  EXPECT_TRUE(ran);
}

}  // namespace
}  // namespace s3r
