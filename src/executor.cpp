// ArbPerf - Work-Stealing Executor Implementation

#include "arbperf/executor.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "arbperf/errors.hpp"
#include "arbperf/logging.hpp"
#include "arbperf/system_monitor.hpp"

namespace arbperf {

// =============================================================================
// WorkerQueue
// =============================================================================

WorkerQueue::WorkerQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void WorkerQueue::push_locked(TaskPtr task) {
    pq_.push(Entry{std::move(task), next_seq_++});
    size_.store(pq_.size(), std::memory_order_release);
}

TaskPtr WorkerQueue::pop_locked() {
    TaskPtr task = pq_.top().task;
    pq_.pop();
    size_.store(pq_.size(), std::memory_order_release);
    return task;
}

bool WorkerQueue::push(TaskPtr task, std::chrono::milliseconds wait) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool has_room = not_full_.wait_for(lock, wait, [this] {
            return closed_ || pq_.size() < capacity_;
        });
        if (!has_room || closed_) return false;
        push_locked(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

bool WorkerQueue::try_push(TaskPtr task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || pq_.size() >= capacity_) return false;
        push_locked(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

TaskPtr WorkerQueue::pop_for(std::chrono::milliseconds timeout) {
    TaskPtr task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait_for(lock, timeout, [this] {
            return closed_ || !pq_.empty();
        });
        if (!ready || pq_.empty()) return nullptr;
        task = pop_locked();
    }
    not_full_.notify_one();
    return task;
}

TaskPtr WorkerQueue::try_steal() {
    TaskPtr task;
    {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock() || pq_.empty()) return nullptr;
        task = pop_locked();
    }
    not_full_.notify_one();
    return task;
}

void WorkerQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void WorkerQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

std::vector<TaskPtr> WorkerQueue::drain() {
    std::vector<TaskPtr> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(pq_.size());
        while (!pq_.empty()) out.push_back(pop_locked());
    }
    not_full_.notify_all();
    return out;
}

// =============================================================================
// WorkStealingExecutor
// =============================================================================

WorkStealingExecutor::WorkStealingExecutor(ExecutorConfig config)
    : config_(std::move(config)) {
    if (config_.num_workers == 0) {
        config_.num_workers = std::max(1u, std::thread::hardware_concurrency());
    }
    if (!config_.cpu_probe) {
        config_.cpu_probe = [] { return process_cpu_percent(); };
    }

    queues_.reserve(config_.num_workers);
    for (std::size_t i = 0; i < config_.num_workers; ++i) {
        queues_.push_back(std::make_unique<WorkerQueue>(config_.max_tasks_per_worker));
    }

    logging::get("executor")->debug("WorkStealingExecutor initialized with {} workers",
                                    config_.num_workers);
}

WorkStealingExecutor::~WorkStealingExecutor() {
    stop();
}

void WorkStealingExecutor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }

    slots_.clear();
    for (std::size_t i = 0; i < queues_.size(); ++i) {
        slots_.push_back(std::make_shared<WorkerSlot>());
        workers_.emplace_back(&WorkStealingExecutor::worker_loop, this, i, slots_[i]);
    }

    logging::get("executor")->debug("Started {} workers", queues_.size());
}

void WorkStealingExecutor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool expected = true;
    const bool was_running = running_.compare_exchange_strong(expected, false);

    if (was_running) {
        shutdown_workers();
    }

    // Nothing may be left without a final state, started or not
    std::size_t cancelled = cancel_pending();

    if (was_running) {
        // Reopen lanes so the executor can be restarted
        for (auto& q : queues_) q->reopen();
        logging::get("executor")->debug("WorkStealingExecutor stopped ({} tasks cancelled)",
                                        cancelled);
    } else if (cancelled > 0) {
        logging::get("executor")->debug("Cancelled {} tasks queued on an idle executor",
                                        cancelled);
    }
}

void WorkStealingExecutor::shutdown_workers() {
    auto log = logging::get("executor");

    // Wake sleepers and pollers
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
    }
    sleep_cv_.notify_all();
    for (auto& q : queues_) q->close();

    const auto deadline = Clock::now() + config_.shutdown_timeout;
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        WorkerSlot& slot = *slots_[i];
        TaskPtr abandoned;
        {
            std::unique_lock<std::mutex> lock(slot.mutex);
            if (!slot.idle.wait_until(lock, deadline, [&slot] { return !slot.current; })) {
                slot.abandoned = true;
                abandoned = std::move(slot.current);
            }
        }

        if (abandoned) {
            // The body keeps running; the worker exits without touching us again
            workers_[i].detach();
            abandoned_tasks_.fetch_add(1, std::memory_order_relaxed);
            abandoned->cancel(std::make_exception_ptr(CancelledError(
                "Task " + std::to_string(abandoned->id) + " abandoned after " +
                std::to_string(config_.shutdown_timeout.count()) + " ms shutdown grace period")));
            cancelled_tasks_.fetch_add(1, std::memory_order_relaxed);
            log->warn("Worker {} abandoned running task {} on shutdown", i, abandoned->id);
        } else if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
    slots_.clear();
}

std::size_t WorkStealingExecutor::cancel_pending() {
    std::size_t cancelled = 0;
    for (auto& q : queues_) {
        for (auto& task : q->drain()) {
            cancel_task(task);
            ++cancelled;
        }
    }

    std::lock_guard<std::mutex> lock(retry_mutex_);
    for (auto& task : retry_pending_) {
        cancel_task(task);
        ++cancelled;
    }
    retry_pending_.clear();
    return cancelled;
}

void WorkStealingExecutor::cancel_task(const TaskPtr& task) {
    task->cancel(std::make_exception_ptr(
        CancelledError("Task " + std::to_string(task->id) + " cancelled by executor shutdown")));
    cancelled_tasks_.fetch_add(1, std::memory_order_relaxed);
}

std::size_t WorkStealingExecutor::shortest_queue() const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < queues_.size(); ++i) {
        if (queues_[i]->size() < queues_[best]->size()) best = i;
    }
    return best;
}

void WorkStealingExecutor::submit(const TaskPtr& task) {
    submit_to(shortest_queue(), task);
}

void WorkStealingExecutor::submit_to(std::size_t worker, const TaskPtr& task) {
    if (!task || !task->function) {
        throw std::invalid_argument("Task has no function");
    }
    if (worker >= queues_.size()) {
        throw std::invalid_argument("Worker " + std::to_string(worker) + " out of range");
    }

    if (!queues_[worker]->push(task, config_.submit_timeout)) {
        throw std::runtime_error("Worker queue " + std::to_string(worker) +
                                 " is full; task " + std::to_string(task->id) + " rejected");
    }

    logging::get("executor")->trace("Submitted task {} to worker {}", task->id, worker);
}

TaskPtr WorkStealingExecutor::try_steal(std::size_t thief) {
    if (queues_.size() < 2) return nullptr;

    std::size_t victim = thief;
    std::size_t victim_size = 0;
    for (std::size_t i = 0; i < queues_.size(); ++i) {
        if (i == thief) continue;
        std::size_t sz = queues_[i]->size();
        if (victim == thief || sz > victim_size) {
            victim = i;
            victim_size = sz;
        }
    }

    if (victim == thief || victim_size <= config_.steal_threshold) {
        return nullptr;
    }

    TaskPtr task = queues_[victim]->try_steal();
    if (task) {
        stolen_tasks_.fetch_add(1, std::memory_order_relaxed);
        logging::get("executor")->trace("Worker {} stole task {} from worker {}",
                                        thief, task->id, victim);
    }
    return task;
}

bool WorkStealingExecutor::should_throttle() {
    double limit = std::max(config_.throttle_threshold, config_.max_cpu_percent);
    double cpu = config_.cpu_probe();
    last_cpu_percent_.store(cpu, std::memory_order_relaxed);
    throttle_factor_.store(throttle_factor(cpu, limit, 100.0), std::memory_order_relaxed);
    if (cpu > limit) {
        throttled_count_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    return false;
}

bool WorkStealingExecutor::sleep_unless_stopped(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    return !sleep_cv_.wait_for(lock, d, [this] { return !running_.load(); });
}

void WorkStealingExecutor::worker_loop(std::size_t worker_id, WorkerSlotPtr slot) {
    auto log = logging::get("executor");
    WorkerQueue& own = *queues_[worker_id];

    while (running_.load()) {
        try {
            if (should_throttle()) {
                // Back off longer the further CPU is past the limit
                auto pause = std::chrono::duration_cast<std::chrono::milliseconds>(
                    config_.throttle_sleep / throttle_factor_.load(std::memory_order_relaxed));
                sleep_unless_stopped(pause);
                continue;
            }

            TaskPtr task = own.pop_for(config_.poll_interval);
            if (!task) {
                if (!running_.load()) break;
                task = try_steal(worker_id);
                if (!task) continue;
            }

            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (!running_.load()) {
                    cancel_task(task);
                    break;
                }
                slot->current = task;
            }

            if (!execute(task, *slot)) {
                log->debug("Worker {} abandoned during shutdown", worker_id);
                return;
            }
        } catch (const std::exception& e) {
            log->error("Error in worker {}: {}", worker_id, e.what());
            sleep_unless_stopped(config_.poll_interval);
        }
    }

    log->debug("Worker {} exiting", worker_id);
}

std::any WorkStealingExecutor::run_attempt(const TaskPtr& task) {
    if (!task->timeout) {
        return task->function();
    }

    // The attempt is abandoned, not interrupted, when the timeout expires
    auto attempt = std::make_shared<std::packaged_task<std::any()>>(task->function);
    auto future = attempt->get_future();
    std::thread([attempt] { (*attempt)(); }).detach();

    if (future.wait_for(*task->timeout) == std::future_status::timeout) {
        throw TaskTimeoutError("Task " + std::to_string(task->id) + " timed out after " +
                               std::to_string(task->timeout->count()) + " ms");
    }
    return future.get();
}

bool WorkStealingExecutor::execute(const TaskPtr& task, WorkerSlot& slot) {
    std::any value;
    std::exception_ptr err;
    try {
        value = run_attempt(task);
    } catch (const std::exception&) {
        err = std::current_exception();
    } catch (...) {
        err = std::make_exception_ptr(TaskExecutionError(
            "Task " + std::to_string(task->id) + " raised a non-standard exception"));
    }

    // Past this point the executor may be destroyed if the slot was abandoned
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.abandoned) return false;
        slot.current.reset();
    }
    slot.idle.notify_all();

    if (!err) {
        task->finish(std::move(value));
        completed_tasks_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    handle_failure(task, err);
    return true;
}

void WorkStealingExecutor::handle_failure(const TaskPtr& task, std::exception_ptr err) {
    auto log = logging::get("executor");
    failed_tasks_.fetch_add(1, std::memory_order_relaxed);

    if (task->retries >= task->max_retries) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(err);
        } catch (const std::exception& e) {
            what = e.what();
        }
        log->error("Task {} failed after {} retries: {}", task->id, task->retries, what);
        task->fail(err);
        return;
    }

    task->retries++;
    retried_tasks_.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        retry_pending_.push_back(task);
    }
    bool slept = sleep_unless_stopped(task->retry_delay);
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        auto it = std::find(retry_pending_.begin(), retry_pending_.end(), task);
        if (it == retry_pending_.end()) return;  // stop() already cancelled it
        retry_pending_.erase(it);
    }

    if (!slept || !running_.load()) {
        cancel_task(task);
        return;
    }

    // Never block a worker on its own backpressure
    std::size_t first = shortest_queue();
    for (std::size_t i = 0; i < queues_.size(); ++i) {
        if (queues_[(first + i) % queues_.size()]->try_push(task)) {
            log->debug("Retrying task {} (attempt {}/{})", task->id, task->retries,
                       task->max_retries);
            return;
        }
    }

    log->error("Task {} could not be resubmitted: all worker queues full", task->id);
    task->fail(err);
}

WorkStealingExecutor::Stats WorkStealingExecutor::get_stats() const {
    Stats stats{};
    stats.workers = queues_.size();
    stats.running = running_.load();
    stats.completed_tasks = completed_tasks_.load(std::memory_order_relaxed);
    stats.failed_tasks = failed_tasks_.load(std::memory_order_relaxed);
    stats.retried_tasks = retried_tasks_.load(std::memory_order_relaxed);
    stats.stolen_tasks = stolen_tasks_.load(std::memory_order_relaxed);
    stats.throttled_count = throttled_count_.load(std::memory_order_relaxed);
    stats.cancelled_tasks = cancelled_tasks_.load(std::memory_order_relaxed);
    stats.abandoned_tasks = abandoned_tasks_.load(std::memory_order_relaxed);
    stats.last_cpu_percent = last_cpu_percent_.load(std::memory_order_relaxed);
    stats.throttle_factor = throttle_factor_.load(std::memory_order_relaxed);
    stats.total_queued = 0;
    for (const auto& q : queues_) {
        stats.queue_sizes.push_back(q->size());
        stats.total_queued += q->size();
    }
    stats.max_tasks_per_worker = config_.max_tasks_per_worker;
    stats.steal_threshold = config_.steal_threshold;
    stats.max_cpu_percent = config_.max_cpu_percent;
    stats.throttle_threshold = config_.throttle_threshold;
    return stats;
}

void to_json(nlohmann::json& j, const WorkStealingExecutor::Stats& stats) {
    j = nlohmann::json{
        {"workers", stats.workers},
        {"running", stats.running},
        {"completed_tasks", stats.completed_tasks},
        {"failed_tasks", stats.failed_tasks},
        {"retried_tasks", stats.retried_tasks},
        {"stolen_tasks", stats.stolen_tasks},
        {"throttled_count", stats.throttled_count},
        {"cancelled_tasks", stats.cancelled_tasks},
        {"abandoned_tasks", stats.abandoned_tasks},
        {"last_cpu_percent", stats.last_cpu_percent},
        {"throttle_factor", stats.throttle_factor},
        {"queue_sizes", stats.queue_sizes},
        {"total_queued", stats.total_queued},
        {"max_tasks_per_worker", stats.max_tasks_per_worker},
        {"steal_threshold", stats.steal_threshold},
        {"max_cpu_percent", stats.max_cpu_percent},
        {"throttle_threshold", stats.throttle_threshold},
    };
}

}  // namespace arbperf
