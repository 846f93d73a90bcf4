// ArbPerf - Batched I/O Manager
// Priority-ordered file reads/writes grouped into batches and run on a
// bounded worker pool

#ifndef ARBPERF_BATCHED_IO_HPP
#define ARBPERF_BATCHED_IO_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "config.hpp"
#include "types.hpp"

namespace arbperf {

struct IORequest {
    enum class Kind : uint8_t { Read, Write };

    Kind kind{Kind::Read};
    TaskPriority priority{TaskPriority::Normal};
    std::filesystem::path path;
    std::string data;  // write payload
    bool binary{false};
    uint64_t seq{0};

    std::promise<std::string> read_result;
    std::promise<std::size_t> write_result;

    void fail(std::exception_ptr err);
};

using IORequestPtr = std::shared_ptr<IORequest>;

// Bounded priority queue feeding one batcher
class IORequestQueue {
public:
    explicit IORequestQueue(std::size_t capacity);

    // Non-copyable
    IORequestQueue(const IORequestQueue&) = delete;
    IORequestQueue& operator=(const IORequestQueue&) = delete;

    // Blocks while full; false once closed
    bool push(IORequestPtr req);

    // Blocks until size >= max_batch, or the queue is non-empty and interval
    // has passed since the previous batch. Empty result means closed.
    std::vector<IORequestPtr> next_batch(std::size_t max_batch,
                                         std::chrono::milliseconds interval);

    std::size_t size() const;
    void close();
    void reopen();
    std::vector<IORequestPtr> drain();

private:
    struct Compare {
        bool operator()(const IORequestPtr& a, const IORequestPtr& b) const {
            if (a->priority != b->priority) {
                return static_cast<int>(a->priority) > static_cast<int>(b->priority);
            }
            return a->seq > b->seq;
        }
    };

    const std::size_t capacity_;
    std::priority_queue<IORequestPtr, std::vector<IORequestPtr>, Compare> pq_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    Clock::time_point last_batch_{Clock::now()};
    uint64_t next_seq_{0};
    bool closed_{false};
};

// Completed operations per window of at least one second. The throttle state
// follows the rate of the last closed window.
class IORateMeter {
public:
    IORateMeter(double max_ops_per_second, double throttle_ops_per_second,
                std::size_t history_size = 100);

    // Non-copyable
    IORateMeter(const IORateMeter&) = delete;
    IORateMeter& operator=(const IORateMeter&) = delete;

    void record(Clock::time_point now = Clock::now());

    // (throttling, factor); factor is 1.0 when not throttling and never below 0.1
    std::pair<bool, double> should_throttle(Clock::time_point now = Clock::now());

    double ops_per_second() const;
    double current_factor() const;  // as of the last closed window
    std::vector<double> history() const;
    uint64_t throttle_count() const;

    double max_ops_per_second() const noexcept { return max_ops_; }
    double throttle_ops_per_second() const noexcept { return throttle_ops_; }

private:
    void roll(Clock::time_point now);  // caller holds mutex_

    const double max_ops_;
    const double throttle_ops_;
    const std::size_t history_size_;

    mutable std::mutex mutex_;
    Clock::time_point window_start_{Clock::now()};
    uint64_t window_ops_{0};
    double last_rate_{0.0};
    std::deque<double> history_;
    bool throttling_{false};
    double factor_{1.0};
    uint64_t throttle_count_{0};
};

class BatchedIOManager {
public:
    explicit BatchedIOManager(IOConfig config = {});
    ~BatchedIOManager();

    // Non-copyable
    BatchedIOManager(const BatchedIOManager&) = delete;
    BatchedIOManager& operator=(const BatchedIOManager&) = delete;

    // Lifecycle; calls below start the manager if needed
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Blocking calls; rethrow the I/O error of this item only
    std::string read_file(const std::filesystem::path& path, bool binary = false,
                          TaskPriority priority = TaskPriority::Normal);
    std::size_t write_file(const std::filesystem::path& path, std::string data,
                           bool binary = false, TaskPriority priority = TaskPriority::Normal);

    std::future<std::string> read_file_async(const std::filesystem::path& path,
                                             bool binary = false,
                                             TaskPriority priority = TaskPriority::Normal);
    std::future<std::size_t> write_file_async(const std::filesystem::path& path,
                                              std::string data, bool binary = false,
                                              TaskPriority priority = TaskPriority::Normal);

    // Current I/O rate state; batches are delayed while throttling
    std::pair<bool, double> should_throttle() { return rate_meter_.should_throttle(); }
    std::vector<double> rate_history() const { return rate_meter_.history(); }

    struct Stats {
        bool running;
        uint64_t read_ops;
        uint64_t write_ops;
        uint64_t bytes_read;
        uint64_t bytes_written;
        uint64_t read_batches;
        uint64_t write_batches;
        uint64_t failures;
        uint64_t cancelled;
        std::size_t read_queue_size;
        std::size_t write_queue_size;
        std::size_t pending_jobs;
        std::size_t jobs_capacity;
        double ops_per_second;
        double throttle_factor;
        uint64_t throttle_count;
        double max_ops_per_second;
        double throttle_ops_per_second;
        std::size_t max_batch_size;
        std::chrono::milliseconds batch_interval;
        std::size_t max_workers;
        std::size_t max_queue_size;
    };
    Stats get_stats() const;

private:
    void enqueue(IORequestQueue& queue, const IORequestPtr& req);
    void batcher_loop(IORequestQueue& queue, IORequest::Kind kind);
    void run_batch(std::vector<IORequestPtr>& batch, IORequest::Kind kind);
    void throttle_pause();
    void io_worker_loop();
    void perform(IORequest& req);
    void cancel(IORequest& req);

    IOConfig config_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;

    IORequestQueue read_queue_;
    IORequestQueue write_queue_;
    std::thread read_batcher_;
    std::thread write_batcher_;

    // Worker pool; jobs_ holds at most jobs_capacity_ requests
    std::deque<IORequestPtr> jobs_;
    std::size_t jobs_capacity_{1};
    mutable std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::condition_variable jobs_space_;
    std::vector<std::thread> io_workers_;
    bool jobs_closed_{false};

    // Statistics
    std::atomic<uint64_t> read_ops_{0};
    std::atomic<uint64_t> write_ops_{0};
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<uint64_t> read_batches_{0};
    std::atomic<uint64_t> write_batches_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> cancelled_{0};

    IORateMeter rate_meter_;
};

void to_json(nlohmann::json& j, const BatchedIOManager::Stats& stats);

}  // namespace arbperf

#endif  // ARBPERF_BATCHED_IO_HPP
