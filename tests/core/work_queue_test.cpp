#include <gtest/gtest.h>
#include "rms/core/work_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using rms::WorkQueue;

TEST(WorkQueue, PushAndPop) {
    WorkQueue<int> queue;

    queue.push(42);
    queue.push(100);

    auto val1 = queue.pop();
    ASSERT_TRUE(val1.has_value());
    EXPECT_EQ(val1.value(), 42);

    auto val2 = queue.pop();
    ASSERT_TRUE(val2.has_value());
    EXPECT_EQ(val2.value(), 100);
}

TEST(WorkQueue, TryPop) {
    WorkQueue<int> queue;

    auto val = queue.try_pop();
    EXPECT_FALSE(val.has_value());  // Empty queue

    queue.push(123);

    val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
}

TEST(WorkQueue, PopTimeout) {
    WorkQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(duration.count(), 90);
}

TEST(WorkQueue, CloseDrainsThenEnds) {
    WorkQueue<int> queue;

    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(3));

    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(WorkQueue, EraseIf) {
    WorkQueue<int> queue;
    for (int i = 0; i < 10; ++i) {
        queue.push(i);
    }

    auto removed = queue.erase_if([](int v) { return v % 2 == 0; });

    EXPECT_EQ(removed, 5u);
    EXPECT_EQ(queue.size(), 5u);
    EXPECT_EQ(queue.pop().value(), 1);
}

TEST(WorkQueue, CloseWakesBlockedConsumers) {
    WorkQueue<int> queue;
    std::atomic<int> finished{0};

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&]() {
            auto val = queue.pop();
            if (!val.has_value()) {
                finished++;
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    for (auto& t : consumers) {
        t.join();
    }

    EXPECT_EQ(finished, 3);
}

TEST(WorkQueue, ProducerConsumer) {
    WorkQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);  // Sum of 0..99
}
