#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mcptools::server {

    // Fixed set of worker threads for network-backed tool calls. At most
    // `max_in_flight` tasks run at once and at most as many wait in the queue;
    // submit() blocks beyond that.
    class AsyncLane {
    public:
        explicit AsyncLane(std::size_t max_in_flight = 4);
        ~AsyncLane();

        AsyncLane(const AsyncLane&) = delete;
        AsyncLane& operator=(const AsyncLane&) = delete;

        void submit(std::function<void()> task);

        // Blocks until the queue is empty and no task is running.
        void wait_idle();

        std::size_t max_in_flight() const { return max_in_flight_; }

    private:
        void worker_loop();

        std::size_t max_in_flight_;
        std::mutex mutex_;
        std::condition_variable task_ready_;
        std::condition_variable slot_free_;
        std::condition_variable idle_;
        std::deque<std::function<void()>> queue_;
        std::size_t running_ = 0;
        bool stopping_ = false;
        std::vector<std::thread> workers_;
    };

} // namespace mcptools::server
