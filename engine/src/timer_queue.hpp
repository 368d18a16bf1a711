#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// One thread running tasks once their delay has elapsed, earliest first
class TimerQueue {
public:
    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Returns false once shutdown has begun
    bool schedule(int64_t delay_ms, std::function<void()> task);

    // Drops tasks that are not yet due, then joins
    void shutdown();

    size_t pending() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct Entry {
        TimePoint due;
        uint64_t seq;
        std::function<void()> task;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            return a.due != b.due ? a.due > b.due : a.seq > b.seq;
        }
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    uint64_t next_seq_ = 0;
    bool stopping_ = false;
    std::thread thread_;

    void run();
};
