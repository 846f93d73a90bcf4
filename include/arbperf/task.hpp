// ArbPerf - Task
// Unit of scheduled work owned by the executor until done

#ifndef ARBPERF_TASK_HPP
#define ARBPERF_TASK_HPP

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "types.hpp"

namespace arbperf {

struct Task {
    using TaskId = uint64_t;

    // Body with its arguments already bound; throws on failure
    std::function<std::any()> function;

    TaskPriority priority{TaskPriority::Normal};
    ResourceType resource_type{ResourceType::CPU};
    Clock::time_point created_at{Clock::now()};
    TaskId id{next_id()};

    std::optional<std::chrono::milliseconds> timeout{};
    int retries{0};
    int max_retries{3};
    std::chrono::milliseconds retry_delay{1000};

    Task() = default;
    explicit Task(std::function<std::any()> fn, TaskPriority prio = TaskPriority::Normal)
        : function(std::move(fn)), priority(prio) {}

    // Non-copyable: the executor and the submitter share one instance
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Result/error state, written once by the executor
    void finish(std::any value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return;
            result_ = std::move(value);
            done_ = true;
        }
        cv_.notify_all();
    }

    void fail(std::exception_ptr err) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return;
            error_ = std::move(err);
            done_ = true;
        }
        cv_.notify_all();
    }

    void cancel(std::exception_ptr err) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) return;
            error_ = std::move(err);
            cancelled_ = true;
            done_ = true;
        }
        cv_.notify_all();
    }

    // Block until done
    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return done_; });
    }

    [[nodiscard]] bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

    [[nodiscard]] bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    [[nodiscard]] std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    // Only meaningful once done() and error() is null
    [[nodiscard]] const std::any& result() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

private:
    static TaskId next_id() {
        static std::atomic<TaskId> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::any result_;
    std::exception_ptr error_;
    bool done_{false};
    bool cancelled_{false};
};

using TaskPtr = std::shared_ptr<Task>;

// Lower priority value first, then FIFO by submission sequence
struct TaskCompare {
    template <typename Entry>
    bool operator()(const Entry& a, const Entry& b) const {
        if (a.task->priority != b.task->priority) {
            return static_cast<int>(a.task->priority) > static_cast<int>(b.task->priority);
        }
        return a.seq > b.seq;
    }
};

}  // namespace arbperf

#endif  // ARBPERF_TASK_HPP
