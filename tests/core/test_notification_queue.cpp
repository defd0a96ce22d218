// test_notification_queue.cpp — Тесты канала уведомлений ядро → UI

#include <gtest/gtest.h>
#include "oreonpickup/NotificationQueue.h"
#include <thread>
#include <chrono>
#include <vector>

using namespace OreonPickup;
using namespace std::chrono_literals;

TEST(NotificationQueueTest, FifoOrder) {
    NotificationQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.tryPop(), 1);
    EXPECT_EQ(queue.tryPop(), 2);
    EXPECT_EQ(queue.tryPop(), 3);
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(NotificationQueueTest, WaitPopTimesOut) {
    NotificationQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.waitPop(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(NotificationQueueTest, WaitPopWakesOnPushFromAnotherThread) {
    NotificationQueue<std::string> queue;

    std::thread producer([&]() {
        std::this_thread::sleep_for(20ms);
        queue.push("peer-added");
    });

    auto item = queue.waitPop(2000ms);
    producer.join();

    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "peer-added");
}

TEST(NotificationQueueTest, CloseWakesWaitersAndDropsPushes) {
    NotificationQueue<int> queue;

    std::thread closer([&]() {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    EXPECT_FALSE(queue.waitPop().has_value());
    closer.join();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.push(42));
    EXPECT_EQ(queue.size(), 0u);
}

TEST(NotificationQueueTest, ItemsPushedBeforeCloseAreStillDrained) {
    NotificationQueue<int> queue;
    queue.push(7);
    queue.close();

    EXPECT_EQ(queue.waitPop(), 7);
    EXPECT_FALSE(queue.waitPop().has_value());
}

TEST(NotificationQueueTest, ResetReopens) {
    NotificationQueue<int> queue;
    queue.push(1);
    queue.close();
    queue.reset();

    EXPECT_FALSE(queue.isClosed());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.tryPop(), 2);
}

TEST(NotificationQueueTest, BoundedQueueDropsOldest) {
    NotificationQueue<int> queue(3);
    for (int i = 1; i <= 5; ++i) {
        EXPECT_TRUE(queue.push(i));
    }

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(queue.tryPop(), 3);
    EXPECT_EQ(queue.tryPop(), 4);
    EXPECT_EQ(queue.tryPop(), 5);
}

TEST(NotificationQueueTest, ManyProducers) {
    NotificationQueue<int> queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&queue]() {
            for (int i = 0; i < 250; ++i) queue.push(i);
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_EQ(queue.size(), 1000u);
}
