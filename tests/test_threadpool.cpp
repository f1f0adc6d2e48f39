#include "global/include/threadpool.hpp"
#include "global/include/safe_queue.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>

TEST(SafeQueueTest, PopsInOrderAndRefusesAfterClose) {
    safe_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.size(), 2u);

    int value = 0;
    ASSERT_TRUE(queue.try_pop(value));
    EXPECT_EQ(value, 1);

    queue.close();
    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(3));
    // 关闭后还能取出剩余元素
    ASSERT_TRUE(queue.wait_and_pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(queue.wait_and_pop(value));
}

TEST(ThreadPoolTest, ShutdownDrainsSubmittedTasks) {
    thread_pool pool(4);
    pool.init();
    EXPECT_TRUE(pool.is_running());

    std::atomic<int> counter{0};
    for (int i = 0; i < 200; ++i) {
        pool.submit([&counter]() { ++counter; });
    }
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_EQ(counter.load(), 200);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    thread_pool pool(1);
    pool.init();
    std::atomic<int> counter{0};
    pool.submit([]() { throw std::runtime_error("boom"); });
    pool.submit([&counter]() { ++counter; });
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1);
}
