#include <gtest/gtest.h>

#include "util/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace astream::util
{
using namespace std::chrono_literals;

TEST(BoundedQueue, KeepsFifoOrder)
{
    BoundedQueue<int> q(8);
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(q.push(i));
    for (int i = 0; i < 5; ++i) EXPECT_EQ(q.pop(), i);
}

TEST(BoundedQueue, CloseDrainsThenSignalsEndOfInput)
{
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    q.close();

    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 2);
    EXPECT_EQ(q.pop(), std::nullopt);
    EXPECT_TRUE(q.closed());
}

TEST(BoundedQueue, CloseWakesABlockedConsumer)
{
    BoundedQueue<int> q(1);
    std::optional<int> got = 7;
    std::thread consumer([&] { got = q.pop(); });

    std::this_thread::sleep_for(50ms);
    q.close();
    consumer.join();
    EXPECT_EQ(got, std::nullopt);
}

TEST(BoundedQueue, CloseWakesABlockedProducer)
{
    BoundedQueue<int> q(1);
    q.push(0);
    std::atomic<int> result {-1};
    std::thread producer([&] { result = q.push(1) ? 1 : 0; });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(result.load(), -1);
    q.close();
    producer.join();
    EXPECT_EQ(result.load(), 0);
}

// capacity 1 + slow consumer: the second push waits for the first pop
TEST(BoundedQueue, FullQueueBlocksProducerUntilConsumerPops)
{
    using clk = std::chrono::steady_clock;
    BoundedQueue<int> q(1);

    clk::time_point pushed[3];
    std::thread producer([&] {
        for (int i = 0; i < 3; ++i) {
            q.push(i);
            pushed[i] = clk::now();
        }
        q.close();
    });

    std::vector<int>              seen;
    std::vector<clk::time_point>  popped;
    while (true) {
        std::this_thread::sleep_for(100ms);          // slow consumer
        auto v = q.pop();
        if (!v) break;
        popped.push_back(clk::now());
        seen.push_back(*v);
    }
    producer.join();

    ASSERT_EQ(seen, (std::vector<int>{0, 1, 2}));
    EXPECT_LE(q.size(), 1u);
    // push i+1 only completed after pop i took place
    EXPECT_GE(pushed[1], popped[0] - 5ms);
    EXPECT_GE(pushed[2], popped[1] - 5ms);
    EXPECT_GE(pushed[2] - pushed[0], 150ms);
}

} // namespace astream::util
