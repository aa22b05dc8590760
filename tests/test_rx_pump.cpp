#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "transport/rx_pump.hpp"

using namespace transport;
using namespace std::chrono_literals;

TEST(RxPump, DeliversInOrderOffTheProducerThread)
{
    std::mutex              bus;  // stands in for the transport's event-loop lock
    std::mutex              mu;
    std::condition_variable cv;
    std::vector<Frame>      got;
    std::thread::id         consumer;

    RxPump pump;
    ASSERT_TRUE(pump.start([&](const Frame &f) {
        // would self-deadlock if the producer's thread ran this
        std::lock_guard<std::mutex> b(bus);
        std::lock_guard<std::mutex> lk(mu);
        consumer = std::this_thread::get_id();
        got.push_back(f);
        cv.notify_all();
    }));

    {
        std::lock_guard<std::mutex> b(bus);
        const std::uint8_t          one[] = {1};
        const std::uint8_t          two[] = {2, 2};
        const std::uint8_t          three[] = {3, 3, 3};
        EXPECT_TRUE(pump.push(one, sizeof(one)));
        EXPECT_TRUE(pump.push(two, sizeof(two)));
        EXPECT_TRUE(pump.push(three, sizeof(three)));
    }

    std::unique_lock<std::mutex> lk(mu);
    ASSERT_TRUE(cv.wait_for(lk, 5s, [&] { return got.size() == 3; }));
    EXPECT_EQ(got[0], (Frame{1}));
    EXPECT_EQ(got[1], (Frame{2, 2}));
    EXPECT_EQ(got[2], (Frame{3, 3, 3}));
    EXPECT_NE(consumer, std::this_thread::get_id());
    lk.unlock();
    pump.stop();
}

TEST(RxPump, FullQueueDropsAndCounts)
{
    std::promise<void> entered;
    std::promise<void> release;
    auto               gate = release.get_future().share();
    bool               first = true;

    RxPump pump(2);
    ASSERT_TRUE(pump.start([&](const Frame &) {
        if (first)
        {
            first = false;
            entered.set_value();
            gate.wait();
        }
    }));

    const std::uint8_t b[] = {0xAA};
    ASSERT_TRUE(pump.push(b, sizeof(b)));
    ASSERT_EQ(entered.get_future().wait_for(5s), std::future_status::ready);

    // the worker is busy with the first frame
    EXPECT_TRUE(pump.push(b, sizeof(b)));
    EXPECT_TRUE(pump.push(b, sizeof(b)));
    EXPECT_FALSE(pump.push(b, sizeof(b)));
    EXPECT_EQ(pump.queued(), 2u);
    EXPECT_EQ(pump.overflows(), 1u);

    release.set_value();
    pump.stop();
}

TEST(RxPump, RefusesWhenStoppedOrEmpty)
{
    RxPump             pump;
    const std::uint8_t b[] = {0x01};
    EXPECT_FALSE(pump.push(b, sizeof(b)));
    EXPECT_FALSE(pump.start(nullptr));

    ASSERT_TRUE(pump.start([](const Frame &) {}));
    EXPECT_FALSE(pump.push(nullptr, 0));
    EXPECT_FALSE(pump.push(b, 0));
    pump.stop();
    EXPECT_FALSE(pump.push(b, sizeof(b)));
}
