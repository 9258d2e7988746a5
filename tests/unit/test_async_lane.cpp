#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <gtest/gtest.h>
#include "server/async_lane.hpp"

namespace {

using mcptools::server::AsyncLane;

TEST(AsyncLaneTest, RunsEverySubmittedTask) {
    std::atomic<int> count{0};
    {
        AsyncLane lane(2);
        for (int i = 0; i < 10; ++i) {
            lane.submit([&count]() { count.fetch_add(1); });
        }
        lane.wait_idle();
        EXPECT_EQ(count.load(), 10);
    }
}

TEST(AsyncLaneTest, RunsTasksConcurrently) {
    AsyncLane lane(2);
    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;
    bool both_seen = false;

    auto rendezvous = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        ++arrived;
        cv.notify_all();
        if (cv.wait_for(lock, std::chrono::seconds(5), [&]() { return arrived >= 2; })) {
            both_seen = true;
        }
    };
    lane.submit(rendezvous);
    lane.submit(rendezvous);
    lane.wait_idle();

    EXPECT_EQ(arrived, 2);
    EXPECT_TRUE(both_seen);
}

TEST(AsyncLaneTest, TaskExceptionDoesNotStopWorkers) {
    AsyncLane lane(1);
    std::atomic<bool> ran_after{false};
    lane.submit([]() { throw std::runtime_error("boom"); });
    lane.submit([&ran_after]() { ran_after.store(true); });
    lane.wait_idle();
    EXPECT_TRUE(ran_after.load());
}

TEST(AsyncLaneTest, WaitIdleReturnsImmediatelyWhenEmpty) {
    AsyncLane lane(3);
    EXPECT_EQ(lane.max_in_flight(), 3u);
    lane.wait_idle();
}

}  // namespace
