#include "server/async_lane.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcptools::server {

AsyncLane::AsyncLane(const std::size_t max_in_flight)
    : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {
    workers_.reserve(max_in_flight_);
    for (std::size_t i = 0; i < max_in_flight_; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

AsyncLane::~AsyncLane() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_ready_.notify_all();
    slot_free_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void AsyncLane::submit(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_free_.wait(lock, [this]() { return queue_.size() < max_in_flight_ || stopping_; });
    if (stopping_) {
        return;
    }
    queue_.push_back(std::move(task));
    lock.unlock();
    task_ready_.notify_one();
}

void AsyncLane::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void AsyncLane::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_ready_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }
        slot_free_.notify_one();

        try {
            task();
        } catch (const std::exception& ex) {
            MCPTOOLS_LOG_ERROR(std::string("async task failed: ") + ex.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            if (queue_.empty() && running_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

}  // namespace mcptools::server
