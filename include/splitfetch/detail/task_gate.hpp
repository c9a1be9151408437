#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace splitfetch::detail {

// limit 0 never blocks
class TaskGate {
public:
    explicit TaskGate(std::size_t limit) : limit_(limit) {}

    TaskGate(const TaskGate&) = delete;
    TaskGate& operator=(const TaskGate&) = delete;

    void acquire() {
        if (limit_ == 0) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return active_ < limit_; });
        ++active_;
    }

    void release() {
        if (limit_ == 0) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        cv_.notify_one();
    }

private:
    const std::size_t limit_;
    std::size_t active_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
};

class GateSlot {
public:
    explicit GateSlot(TaskGate& gate) : gate_(gate) { gate_.acquire(); }
    ~GateSlot() { gate_.release(); }

    GateSlot(const GateSlot&) = delete;
    GateSlot& operator=(const GateSlot&) = delete;

private:
    TaskGate& gate_;
};

} // namespace splitfetch::detail
