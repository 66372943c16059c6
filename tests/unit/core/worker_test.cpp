#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include "docmind_core/async/worker.hpp"

namespace docmind_tests {

using namespace docmind_core::async;

class WorkerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    // Workers exit once the queue is closed and drained
    queue_.close();
    worker_.reset();
  }

  JobQueue queue_;
  std::unique_ptr<Worker> worker_ = std::make_unique<Worker>(1, queue_);
};

TEST_F(WorkerTest, RunsQueuedJobsInOrder) {
  std::vector<int> order;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(queue_.push([&order, i] { order.push_back(i); }));
  }
  EXPECT_EQ(queue_.pending(), 5u);

  worker_->start();
  queue_.close();
  worker_->join();

  EXPECT_THAT(order, ::testing::ElementsAre(0, 1, 2, 3, 4));
  EXPECT_EQ(queue_.pending(), 0u);
}

TEST_F(WorkerTest, FailingJobDoesNotStopTheWorker) {
  std::atomic<int> completed{0};
  queue_.push([] { throw std::runtime_error("job failed"); });
  queue_.push([&completed] { ++completed; });

  worker_->start();
  queue_.close();
  worker_->join();

  EXPECT_EQ(completed.load(), 1);
}

TEST_F(WorkerTest, StartTwiceThrows) {
  worker_->start();
  EXPECT_THROW(worker_->start(), std::runtime_error);
}

TEST(JobQueueTest, ClosedQueueRefusesJobsButDrains) {
  JobQueue queue;
  queue.push([] {});
  queue.close();

  EXPECT_FALSE(queue.push([] {}));
  EXPECT_TRUE(queue.pop().has_value());
  EXPECT_FALSE(queue.pop().has_value());

  queue.reopen();
  EXPECT_TRUE(queue.push([] {}));
  EXPECT_EQ(queue.pending(), 1u);
}

}  // namespace docmind_tests
