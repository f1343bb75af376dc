#include <chrono>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "MessageQueue.hpp"

using testing::ElementsAre;

class MessageQueueTest : public testing::Test {
 protected:
  MessageQueue<int> queue{3};
};

TEST_F(MessageQueueTest, testDrainPreservesOrder) {
  queue.push(1);
  queue.push(2);
  queue.push(3);
  EXPECT_THAT(queue.drain(), ElementsAre(1, 2, 3));
  EXPECT_EQ(0u, queue.size());
}

TEST_F(MessageQueueTest, testOverflowDropsOldest) {
  EXPECT_TRUE(queue.push(1));
  EXPECT_TRUE(queue.push(2));
  EXPECT_TRUE(queue.push(3));
  EXPECT_FALSE(queue.push(4));
  EXPECT_THAT(queue.drain(), ElementsAre(2, 3, 4));
}

TEST_F(MessageQueueTest, testWaitTimesOutWhenEmpty) {
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(queue.waitAndDrain(std::chrono::milliseconds(10)).empty());
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(9));
}

TEST_F(MessageQueueTest, testWaitWakesOnPush) {
  std::thread producer([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    queue.push(7);
  });
  const auto items = queue.waitAndDrain(std::chrono::seconds(5));
  producer.join();
  EXPECT_THAT(items, ElementsAre(7));
}

TEST_F(MessageQueueTest, testCloseReleasesWaiters) {
  queue.close();
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(queue.waitAndDrain(std::chrono::seconds(5)).empty());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
  queue.reopen();
  queue.push(1);
  EXPECT_EQ(1u, queue.size());
}
