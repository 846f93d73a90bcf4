// ArbPerf - Batched I/O Manager Implementation

#include "arbperf/batched_io.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "arbperf/errors.hpp"
#include "arbperf/logging.hpp"

namespace arbperf {

void IORequest::fail(std::exception_ptr err) {
    if (kind == Kind::Read) {
        read_result.set_exception(std::move(err));
    } else {
        write_result.set_exception(std::move(err));
    }
}

// =============================================================================
// IORequestQueue
// =============================================================================

IORequestQueue::IORequestQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool IORequestQueue::push(IORequestPtr req) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || pq_.size() < capacity_; });
        if (closed_) return false;
        req->seq = next_seq_++;
        pq_.push(std::move(req));
    }
    not_empty_.notify_one();
    return true;
}

std::vector<IORequestPtr> IORequestQueue::next_batch(std::size_t max_batch,
                                                     std::chrono::milliseconds interval) {
    max_batch = std::max<std::size_t>(1, max_batch);
    std::vector<IORequestPtr> batch;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (closed_) return {};
            if (pq_.size() >= max_batch) break;
            if (!pq_.empty()) {
                auto deadline = last_batch_ + interval;
                if (Clock::now() >= deadline) break;
                not_empty_.wait_until(lock, deadline, [&] {
                    return closed_ || pq_.size() >= max_batch;
                });
                continue;
            }
            not_empty_.wait(lock);
        }

        while (!pq_.empty() && batch.size() < max_batch) {
            batch.push_back(pq_.top());
            pq_.pop();
        }
        last_batch_ = Clock::now();
    }
    not_full_.notify_all();
    return batch;
}

std::size_t IORequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pq_.size();
}

void IORequestQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void IORequestQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    last_batch_ = Clock::now();
}

std::vector<IORequestPtr> IORequestQueue::drain() {
    std::vector<IORequestPtr> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!pq_.empty()) {
            out.push_back(pq_.top());
            pq_.pop();
        }
    }
    not_full_.notify_all();
    return out;
}

// =============================================================================
// IORateMeter
// =============================================================================

IORateMeter::IORateMeter(double max_ops_per_second, double throttle_ops_per_second,
                         std::size_t history_size)
    : max_ops_(max_ops_per_second),
      throttle_ops_(throttle_ops_per_second),
      history_size_(std::max<std::size_t>(1, history_size)) {}

void IORateMeter::roll(Clock::time_point now) {
    auto elapsed = std::chrono::duration<double>(now - window_start_).count();
    if (elapsed < 1.0) return;

    last_rate_ = static_cast<double>(window_ops_) / elapsed;
    history_.push_back(last_rate_);
    while (history_.size() > history_size_) history_.pop_front();
    window_ops_ = 0;
    window_start_ = now;

    bool was_throttling = throttling_;
    throttling_ = last_rate_ > throttle_ops_;
    factor_ = throttling_ ? throttle_factor(last_rate_, throttle_ops_, max_ops_) : 1.0;
    if (throttling_ && !was_throttling) {
        ++throttle_count_;
        logging::get("io")->warn("I/O throttling engaged: {:.1f} ops/s (threshold {:.1f}), factor {:.2f}",
                                 last_rate_, throttle_ops_, factor_);
    } else if (!throttling_ && was_throttling) {
        logging::get("io")->info("I/O throttling released: {:.1f} ops/s", last_rate_);
    }
}

void IORateMeter::record(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll(now);
    ++window_ops_;
}

std::pair<bool, double> IORateMeter::should_throttle(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll(now);
    return {throttling_, factor_};
}

double IORateMeter::ops_per_second() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_rate_;
}

std::vector<double> IORateMeter::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

double IORateMeter::current_factor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factor_;
}

uint64_t IORateMeter::throttle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throttle_count_;
}

// =============================================================================
// BatchedIOManager
// =============================================================================

BatchedIOManager::BatchedIOManager(IOConfig config)
    : config_(std::move(config)),
      read_queue_(config_.max_queue_size),
      write_queue_(config_.max_queue_size),
      rate_meter_(config_.max_ops_per_second, config_.throttle_ops_per_second) {
    if (config_.max_workers == 0) config_.max_workers = 1;
    jobs_capacity_ = config_.max_workers * std::max<std::size_t>(1, config_.max_batch_size);
}

BatchedIOManager::~BatchedIOManager() {
    stop();
}

void BatchedIOManager::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) return;

    read_queue_.reopen();
    write_queue_.reopen();
    {
        std::lock_guard<std::mutex> jobs_lock(jobs_mutex_);
        jobs_closed_ = false;
    }

    for (std::size_t i = 0; i < config_.max_workers; ++i) {
        io_workers_.emplace_back(&BatchedIOManager::io_worker_loop, this);
    }
    read_batcher_ = std::thread(&BatchedIOManager::batcher_loop, this,
                                std::ref(read_queue_), IORequest::Kind::Read);
    write_batcher_ = std::thread(&BatchedIOManager::batcher_loop, this,
                                 std::ref(write_queue_), IORequest::Kind::Write);

    running_.store(true);
    logging::get("io")->debug("BatchedIOManager started with {} I/O workers",
                              config_.max_workers);
}

void BatchedIOManager::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) return;
    running_.store(false);

    // Close everything first so a batcher blocked on a full job queue wakes up
    read_queue_.close();
    write_queue_.close();
    std::deque<IORequestPtr> pending;
    {
        std::lock_guard<std::mutex> jobs_lock(jobs_mutex_);
        jobs_closed_ = true;
        pending.swap(jobs_);
    }
    jobs_cv_.notify_all();
    jobs_space_.notify_all();

    if (read_batcher_.joinable()) read_batcher_.join();
    if (write_batcher_.joinable()) write_batcher_.join();

    std::size_t abandoned = 0;
    for (auto* queue : {&read_queue_, &write_queue_}) {
        for (auto& req : queue->drain()) {
            cancel(*req);
            ++abandoned;
        }
    }

    // Items already running finish; the rest are cancelled
    for (auto& req : pending) {
        cancel(*req);
        ++abandoned;
    }
    for (auto& worker : io_workers_) {
        if (worker.joinable()) worker.join();
    }
    io_workers_.clear();

    logging::get("io")->debug("BatchedIOManager stopped ({} requests cancelled)", abandoned);
}

void BatchedIOManager::cancel(IORequest& req) {
    req.fail(std::make_exception_ptr(
        CancelledError("I/O request for " + req.path.string() + " cancelled by shutdown")));
    cancelled_.fetch_add(1, std::memory_order_relaxed);
}

void BatchedIOManager::enqueue(IORequestQueue& queue, const IORequestPtr& req) {
    if (!running_.load()) {
        start();
    }
    if (!queue.push(req)) {
        cancel(*req);
    }
}

std::future<std::string> BatchedIOManager::read_file_async(const std::filesystem::path& path,
                                                           bool binary, TaskPriority priority) {
    auto req = std::make_shared<IORequest>();
    req->kind = IORequest::Kind::Read;
    req->priority = priority;
    req->path = path;
    req->binary = binary;
    auto future = req->read_result.get_future();
    enqueue(read_queue_, req);
    return future;
}

std::future<std::size_t> BatchedIOManager::write_file_async(const std::filesystem::path& path,
                                                            std::string data, bool binary,
                                                            TaskPriority priority) {
    auto req = std::make_shared<IORequest>();
    req->kind = IORequest::Kind::Write;
    req->priority = priority;
    req->path = path;
    req->data = std::move(data);
    req->binary = binary;
    auto future = req->write_result.get_future();
    enqueue(write_queue_, req);
    return future;
}

std::string BatchedIOManager::read_file(const std::filesystem::path& path, bool binary,
                                        TaskPriority priority) {
    return read_file_async(path, binary, priority).get();
}

std::size_t BatchedIOManager::write_file(const std::filesystem::path& path, std::string data,
                                         bool binary, TaskPriority priority) {
    return write_file_async(path, std::move(data), binary, priority).get();
}

void BatchedIOManager::batcher_loop(IORequestQueue& queue, IORequest::Kind kind) {
    auto log = logging::get("io");
    while (true) {
        auto batch = queue.next_batch(config_.max_batch_size, config_.batch_interval);
        if (batch.empty()) break;

        try {
            throttle_pause();
            run_batch(batch, kind);
        } catch (const std::exception& e) {
            log->error("Error in {} batcher: {}",
                       kind == IORequest::Kind::Read ? "read" : "write", e.what());
        }
    }
}

// Stretches the batch interval by 1/factor while the I/O rate is over threshold
void BatchedIOManager::throttle_pause() {
    auto [throttling, factor] = rate_meter_.should_throttle();
    if (!throttling) return;

    auto base = std::max(config_.batch_interval, std::chrono::milliseconds(10));
    auto pause = std::chrono::duration_cast<std::chrono::milliseconds>(
        base * (1.0 / factor - 1.0));
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    jobs_space_.wait_for(lock, pause, [this] { return jobs_closed_; });
}

void BatchedIOManager::run_batch(std::vector<IORequestPtr>& batch, IORequest::Kind kind) {
    auto log = logging::get("io");
    if (kind == IORequest::Kind::Read) {
        read_batches_.fetch_add(1, std::memory_order_relaxed);
    } else {
        write_batches_.fetch_add(1, std::memory_order_relaxed);
    }

    std::map<std::filesystem::path, std::vector<IORequestPtr>> groups;
    for (auto& req : batch) {
        groups[req->path.parent_path()].push_back(req);
    }

    for (auto& [dir, items] : groups) {
        if (kind == IORequest::Kind::Write && !dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                log->error("Cannot create directory {}: {}", dir.string(), ec.message());
                for (auto& req : items) {
                    failures_.fetch_add(1, std::memory_order_relaxed);
                    req->fail(std::make_exception_ptr(std::runtime_error(
                        "Cannot create directory " + dir.string() + ": " + ec.message())));
                }
                continue;
            }
        }

        for (auto& req : items) {
            std::unique_lock<std::mutex> lock(jobs_mutex_);
            jobs_space_.wait(lock, [this] {
                return jobs_closed_ || jobs_.size() < jobs_capacity_;
            });
            if (jobs_closed_) {
                lock.unlock();
                cancel(*req);
                continue;
            }
            jobs_.push_back(req);
            lock.unlock();
            jobs_cv_.notify_one();
        }
    }

    log->trace("Dispatched {} batch of {} items in {} groups",
               kind == IORequest::Kind::Read ? "read" : "write", batch.size(), groups.size());
}

void BatchedIOManager::io_worker_loop() {
    while (true) {
        IORequestPtr req;
        {
            std::unique_lock<std::mutex> lock(jobs_mutex_);
            jobs_cv_.wait(lock, [this] { return jobs_closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return;
            req = std::move(jobs_.front());
            jobs_.pop_front();
        }
        jobs_space_.notify_one();
        perform(*req);
    }
}

void BatchedIOManager::perform(IORequest& req) {
    auto mode = req.binary ? std::ios::binary : std::ios::openmode{};
    try {
        if (req.kind == IORequest::Kind::Read) {
            std::ifstream in(req.path, std::ios::in | mode);
            if (!in.is_open()) {
                throw std::runtime_error("Cannot open file: " + req.path.string());
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            if (in.bad()) {
                throw std::runtime_error("Read failed: " + req.path.string());
            }
            std::string content = buffer.str();
            read_ops_.fetch_add(1, std::memory_order_relaxed);
            rate_meter_.record();
            bytes_read_.fetch_add(content.size(), std::memory_order_relaxed);
            req.read_result.set_value(std::move(content));
        } else {
            std::ofstream out(req.path, std::ios::out | std::ios::trunc | mode);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot open file for writing: " + req.path.string());
            }
            out.write(req.data.data(), static_cast<std::streamsize>(req.data.size()));
            out.flush();
            if (!out) {
                throw std::runtime_error("Write failed: " + req.path.string());
            }
            write_ops_.fetch_add(1, std::memory_order_relaxed);
            rate_meter_.record();
            bytes_written_.fetch_add(req.data.size(), std::memory_order_relaxed);
            req.write_result.set_value(req.data.size());
        }
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        logging::get("io")->debug("I/O request for {} failed: {}", req.path.string(), e.what());
        req.fail(std::current_exception());
    }
}

BatchedIOManager::Stats BatchedIOManager::get_stats() const {
    Stats stats{};
    stats.running = running_.load();
    stats.read_ops = read_ops_.load(std::memory_order_relaxed);
    stats.write_ops = write_ops_.load(std::memory_order_relaxed);
    stats.bytes_read = bytes_read_.load(std::memory_order_relaxed);
    stats.bytes_written = bytes_written_.load(std::memory_order_relaxed);
    stats.read_batches = read_batches_.load(std::memory_order_relaxed);
    stats.write_batches = write_batches_.load(std::memory_order_relaxed);
    stats.failures = failures_.load(std::memory_order_relaxed);
    stats.cancelled = cancelled_.load(std::memory_order_relaxed);
    stats.read_queue_size = read_queue_.size();
    stats.write_queue_size = write_queue_.size();
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        stats.pending_jobs = jobs_.size();
    }
    stats.jobs_capacity = jobs_capacity_;
    stats.ops_per_second = rate_meter_.ops_per_second();
    stats.throttle_factor = rate_meter_.current_factor();
    stats.throttle_count = rate_meter_.throttle_count();
    stats.max_ops_per_second = rate_meter_.max_ops_per_second();
    stats.throttle_ops_per_second = rate_meter_.throttle_ops_per_second();
    stats.max_batch_size = config_.max_batch_size;
    stats.batch_interval = config_.batch_interval;
    stats.max_workers = config_.max_workers;
    stats.max_queue_size = config_.max_queue_size;
    return stats;
}

void to_json(nlohmann::json& j, const BatchedIOManager::Stats& stats) {
    j = nlohmann::json{
        {"running", stats.running},
        {"read_ops", stats.read_ops},
        {"write_ops", stats.write_ops},
        {"bytes_read", stats.bytes_read},
        {"bytes_written", stats.bytes_written},
        {"read_batches", stats.read_batches},
        {"write_batches", stats.write_batches},
        {"failures", stats.failures},
        {"cancelled", stats.cancelled},
        {"read_queue_size", stats.read_queue_size},
        {"write_queue_size", stats.write_queue_size},
        {"pending_jobs", stats.pending_jobs},
        {"jobs_capacity", stats.jobs_capacity},
        {"ops_per_second", stats.ops_per_second},
        {"throttle_factor", stats.throttle_factor},
        {"throttle_count", stats.throttle_count},
        {"max_ops_per_second", stats.max_ops_per_second},
        {"throttle_ops_per_second", stats.throttle_ops_per_second},
        {"max_batch_size", stats.max_batch_size},
        {"batch_interval_ms", stats.batch_interval.count()},
        {"max_workers", stats.max_workers},
        {"max_queue_size", stats.max_queue_size},
    };
}

}  // namespace arbperf
