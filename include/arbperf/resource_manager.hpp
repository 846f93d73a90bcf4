// ArbPerf - Resource Manager
// Facade over the executor, object pools, batched I/O and usage monitoring

#ifndef ARBPERF_RESOURCE_MANAGER_HPP
#define ARBPERF_RESOURCE_MANAGER_HPP

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "batched_io.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "object_pool.hpp"
#include "system_monitor.hpp"
#include "task.hpp"
#include "types.hpp"

namespace arbperf {

// Per-call scheduling options for ResourceManager::submit_task
struct TaskOptions {
    TaskPriority priority = TaskPriority::Normal;
    ResourceType resource_type = ResourceType::CPU;
    std::optional<std::chrono::milliseconds> timeout;
    int retries = 0;
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
};

class ResourceManager {
public:
    explicit ResourceManager(const Config& config = {});
    ~ResourceManager();

    // Non-copyable
    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // Lifecycle
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // =========================================================================
    // Object pools
    // =========================================================================

    template <typename T>
    std::shared_ptr<ObjectPool<T>> create_object_pool(
        const std::string& name, typename ObjectPool<T>::Factory factory,
        std::size_t max_size = 100,
        typename ObjectPool<T>::Duration ttl = std::chrono::seconds(60),
        typename ObjectPool<T>::Validator validation_func = {}) {
        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        if (pools_.count(name)) {
            throw std::invalid_argument("Pool " + name + " already exists");
        }
        auto pool = std::make_shared<ObjectPool<T>>(std::move(factory), max_size, ttl,
                                                    std::move(validation_func));
        pools_.emplace(name, pool);
        return pool;
    }

    template <typename T>
    std::shared_ptr<T> get_object(const std::string& pool_name) {
        return find_pool<T>(pool_name)->get();
    }

    template <typename T>
    void release_object(const std::string& pool_name, const std::shared_ptr<T>& obj) {
        find_pool<T>(pool_name)->release(obj);
    }

    // =========================================================================
    // Tasks
    // =========================================================================

    // Run func(args...) on the executor and block for its result. Arguments
    // are copied into the task. The last error is rethrown as the original
    // exception once retries are exhausted.
    template <typename F, typename... Args>
    auto submit_task(const TaskOptions& options, F&& func, Args&&... args)
        -> std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...> {
        using R = std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...>;

        auto body = [fn = std::forward<F>(func),
                     bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> std::any {
            if constexpr (std::is_void_v<R>) {
                std::apply(fn, bound);
                return {};
            } else {
                return std::any(std::apply(fn, bound));
            }
        };

        auto task = std::make_shared<Task>(std::move(body), options.priority);
        task->resource_type = options.resource_type;
        task->timeout = options.timeout;
        task->retries = options.retries;
        task->max_retries = options.max_retries;
        task->retry_delay = options.retry_delay;

        ensure_started();
        executor_.submit(task);
        task->wait();

        if (auto err = task->error()) {
            std::rethrow_exception(err);
        }
        if constexpr (!std::is_void_v<R>) {
            return std::any_cast<R>(task->result());
        }
    }

    template <typename F, typename... Args>
    auto submit_task(F&& func, Args&&... args)
        -> std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...> {
        return submit_task(TaskOptions{}, std::forward<F>(func), std::forward<Args>(args)...);
    }

    // =========================================================================
    // I/O
    // =========================================================================

    std::string read_file(const std::filesystem::path& path, bool binary = false,
                          TaskPriority priority = TaskPriority::Normal);
    std::size_t write_file(const std::filesystem::path& path, std::string data,
                           bool binary = false, TaskPriority priority = TaskPriority::Normal);

    // =========================================================================
    // Monitoring
    // =========================================================================

    // Fresh sample; CPU is measured since the previous sample
    ResourceUsage get_resource_usage();
    std::vector<ResourceUsage> get_usage_history() const;
    uint64_t gc_count() const { return gc_count_.load(); }

    // Executor, I/O, pool and resource statistics as one document
    nlohmann::json get_stats() const;

    WorkStealingExecutor& executor() { return executor_; }
    BatchedIOManager& io() { return io_; }

private:
    void ensure_started();
    void monitor_loop();
    void check_usage(const ResourceUsage& usage);
    void reclaim_memory();

    template <typename T>
    std::shared_ptr<ObjectPool<T>> find_pool(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        auto it = pools_.find(name);
        if (it == pools_.end()) {
            throw std::invalid_argument("Pool " + name + " does not exist");
        }
        auto pool = std::dynamic_pointer_cast<ObjectPool<T>>(it->second);
        if (!pool) {
            throw std::invalid_argument("Pool " + name + " holds a different object type");
        }
        return pool;
    }

    ResourceConfig config_;
    WorkStealingExecutor executor_;
    BatchedIOManager io_;
    SystemMonitor monitor_;

    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;

    // Pools (name -> type-erased pool)
    std::unordered_map<std::string, std::shared_ptr<PoolBase>> pools_;
    mutable std::shared_mutex pools_mutex_;

    // Monitor
    std::thread monitor_thread_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_{false};

    std::deque<ResourceUsage> history_;
    mutable std::mutex history_mutex_;
    std::atomic<uint64_t> gc_count_{0};
};

}  // namespace arbperf

#endif  // ARBPERF_RESOURCE_MANAGER_HPP
