#include "timer_queue.hpp"
#include <spdlog/spdlog.h>

TimerQueue::TimerQueue() {
    thread_ = std::thread(&TimerQueue::run, this);
}

TimerQueue::~TimerQueue() {
    shutdown();
}

bool TimerQueue::schedule(int64_t delay_ms, std::function<void()> task) {
    if (delay_ms < 0) delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        auto due = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        queue_.push(Entry{due, next_seq_++, std::move(task)});
    }
    cv_.notify_one();
    return true;
}

void TimerQueue::shutdown() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
        dropped = queue_.size();
        queue_ = decltype(queue_)();
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    if (dropped > 0) {
        spdlog::warn("Timer queue stopped with {} tasks not yet due", dropped);
    }
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            continue;
        }

        TimePoint due = queue_.top().due;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Entry next = queue_.top();
        queue_.pop();
        lock.unlock();

        try {
            next.task();
        } catch (const std::exception& e) {
            spdlog::error("Timer task failed: {}", e.what());
        }

        lock.lock();
    }
}
