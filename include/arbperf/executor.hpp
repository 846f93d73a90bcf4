// ArbPerf - Work-Stealing Executor
// Per-worker priority lanes, idle-time stealing and CPU-aware throttling

#ifndef ARBPERF_EXECUTOR_HPP
#define ARBPERF_EXECUTOR_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"
#include "task.hpp"

namespace arbperf {

// Bounded priority lane owned by one worker. Priority order holds within a
// lane only; once stealing happens there is no ordering across lanes.
class WorkerQueue {
public:
    explicit WorkerQueue(std::size_t capacity);

    // Non-copyable
    WorkerQueue(const WorkerQueue&) = delete;
    WorkerQueue& operator=(const WorkerQueue&) = delete;

    // Wait up to `wait` for space; false if still full or closed
    bool push(TaskPtr task, std::chrono::milliseconds wait);
    bool try_push(TaskPtr task);

    // Highest-priority task, waiting up to `timeout`; nullptr on timeout
    TaskPtr pop_for(std::chrono::milliseconds timeout);

    // Non-blocking: nullptr if the lane lock is busy or the lane is empty
    TaskPtr try_steal();

    std::size_t size() const noexcept { return size_.load(std::memory_order_acquire); }
    std::size_t capacity() const noexcept { return capacity_; }

    void close();
    void reopen();
    std::vector<TaskPtr> drain();

private:
    struct Entry {
        TaskPtr task;
        uint64_t seq;
    };

    void push_locked(TaskPtr task);
    TaskPtr pop_locked();

    const std::size_t capacity_;
    std::priority_queue<Entry, std::vector<Entry>, TaskCompare> pq_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::atomic<std::size_t> size_{0};
    uint64_t next_seq_{0};
    bool closed_{false};
};

class WorkStealingExecutor {
public:
    explicit WorkStealingExecutor(ExecutorConfig config = {});
    ~WorkStealingExecutor();

    // Non-copyable
    WorkStealingExecutor(const WorkStealingExecutor&) = delete;
    WorkStealingExecutor& operator=(const WorkStealingExecutor&) = delete;

    // Lifecycle. stop() waits up to shutdown_timeout for running bodies; a body
    // still running after that is abandoned and its task cancelled. Queued
    // tasks are cancelled whether or not the executor was started.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Enqueue onto the shortest lane; throws std::runtime_error if the lane
    // stays full for submit_timeout
    void submit(const TaskPtr& task);

    // Enqueue onto a specific lane
    void submit_to(std::size_t worker, const TaskPtr& task);

    // One steal attempt on behalf of `thief`: the most loaded peer is robbed
    // only when its size exceeds steal_threshold and its lock is free
    TaskPtr try_steal(std::size_t thief);

    std::size_t num_workers() const noexcept { return queues_.size(); }

    struct Stats {
        std::size_t workers;
        bool running;
        uint64_t completed_tasks;
        uint64_t failed_tasks;
        uint64_t retried_tasks;
        uint64_t stolen_tasks;
        uint64_t throttled_count;
        uint64_t cancelled_tasks;
        uint64_t abandoned_tasks;
        double last_cpu_percent;
        double throttle_factor;
        std::vector<std::size_t> queue_sizes;
        std::size_t total_queued;
        std::size_t max_tasks_per_worker;
        std::size_t steal_threshold;
        double max_cpu_percent;
        double throttle_threshold;
    };
    Stats get_stats() const;

private:
    // Task currently inside a body on one worker. Shared with the worker thread
    // so an abandoned worker never touches the executor again.
    struct WorkerSlot {
        std::mutex mutex;
        std::condition_variable idle;
        TaskPtr current;
        bool abandoned{false};
    };
    using WorkerSlotPtr = std::shared_ptr<WorkerSlot>;

    void worker_loop(std::size_t worker_id, WorkerSlotPtr slot);
    bool should_throttle();
    // False when stop() abandoned the slot while the body ran
    bool execute(const TaskPtr& task, WorkerSlot& slot);
    void shutdown_workers();
    std::size_t cancel_pending();
    std::any run_attempt(const TaskPtr& task);
    void handle_failure(const TaskPtr& task, std::exception_ptr err);
    bool sleep_unless_stopped(std::chrono::milliseconds d);
    std::size_t shortest_queue() const;
    void cancel_task(const TaskPtr& task);

    ExecutorConfig config_;
    std::vector<std::unique_ptr<WorkerQueue>> queues_;
    std::vector<std::thread> workers_;
    std::vector<WorkerSlotPtr> slots_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;

    // Interrupts retry/throttle sleeps on stop
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    // Tasks sleeping before a retry, cancelled on stop
    std::mutex retry_mutex_;
    std::vector<TaskPtr> retry_pending_;

    // Statistics
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};
    std::atomic<uint64_t> retried_tasks_{0};
    std::atomic<uint64_t> stolen_tasks_{0};
    std::atomic<uint64_t> throttled_count_{0};
    std::atomic<uint64_t> cancelled_tasks_{0};
    std::atomic<uint64_t> abandoned_tasks_{0};
    std::atomic<double> last_cpu_percent_{0.0};
    std::atomic<double> throttle_factor_{1.0};
};

void to_json(nlohmann::json& j, const WorkStealingExecutor::Stats& stats);

}  // namespace arbperf

#endif  // ARBPERF_EXECUTOR_HPP
