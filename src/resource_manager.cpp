// ArbPerf - Resource Manager Implementation

#include "arbperf/resource_manager.hpp"

#include <malloc.h>

#include "arbperf/logging.hpp"

namespace arbperf {

ResourceManager::ResourceManager(const Config& config)
    : config_(config.resources),
      executor_(config.executor),
      io_(config.io) {
    if (config_.history_size == 0) config_.history_size = 1;
}

ResourceManager::~ResourceManager() {
    stop();

    std::unique_lock<std::shared_mutex> lock(pools_mutex_);
    for (auto& [name, pool] : pools_) {
        pool->shutdown();
    }
    pools_.clear();
}

void ResourceManager::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) return;

    executor_.start();
    io_.start();

    {
        std::lock_guard<std::mutex> monitor_lock(monitor_mutex_);
        monitor_stop_ = false;
    }
    monitor_thread_ = std::thread(&ResourceManager::monitor_loop, this);

    running_.store(true);
    logging::get("resources")->debug("ResourceManager started");
}

void ResourceManager::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) return;
    running_.store(false);

    {
        std::lock_guard<std::mutex> monitor_lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    executor_.stop();
    io_.stop();

    logging::get("resources")->debug("ResourceManager stopped");
}

void ResourceManager::ensure_started() {
    if (!running_.load()) {
        start();
    }
}

std::string ResourceManager::read_file(const std::filesystem::path& path, bool binary,
                                       TaskPriority priority) {
    ensure_started();
    return io_.read_file(path, binary, priority);
}

std::size_t ResourceManager::write_file(const std::filesystem::path& path, std::string data,
                                        bool binary, TaskPriority priority) {
    ensure_started();
    return io_.write_file(path, std::move(data), binary, priority);
}

ResourceUsage ResourceManager::get_resource_usage() {
    return monitor_.sample();
}

std::vector<ResourceUsage> ResourceManager::get_usage_history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return {history_.begin(), history_.end()};
}

void ResourceManager::monitor_loop() {
    auto log = logging::get("resources");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            if (monitor_cv_.wait_for(lock, config_.monitor_interval,
                                     [this] { return monitor_stop_; })) {
                break;
            }
        }

        try {
            ResourceUsage usage = monitor_.sample();
            {
                std::lock_guard<std::mutex> lock(history_mutex_);
                history_.push_back(usage);
                while (history_.size() > config_.history_size) {
                    history_.pop_front();
                }
            }
            check_usage(usage);
        } catch (const std::exception& e) {
            log->error("Error in resource monitor: {}", e.what());
        }
    }
}

void ResourceManager::check_usage(const ResourceUsage& usage) {
    auto log = logging::get("resources");

    if (usage.memory_percent > config_.max_memory_percent) {
        log->warn("High memory usage: {:.1f}% (limit {:.1f}%)", usage.memory_percent,
                  config_.max_memory_percent);
        reclaim_memory();
    }

    // Throttling is enforced by the executor's own probe
    if (usage.cpu_percent > config_.max_cpu_percent) {
        log->warn("High CPU usage: {:.1f}% (limit {:.1f}%)", usage.cpu_percent,
                  config_.max_cpu_percent);
    }
}

void ResourceManager::reclaim_memory() {
    std::size_t evicted = 0;
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        for (auto& [name, pool] : pools_) {
            evicted += pool->evict_expired();
        }
    }
    ::malloc_trim(0);
    gc_count_.fetch_add(1);

    logging::get("resources")->debug("Memory reclamation evicted {} pooled objects", evicted);
}

nlohmann::json ResourceManager::get_stats() const {
    nlohmann::json stats;
    stats["executor"] = executor_.get_stats();
    stats["io"] = io_.get_stats();

    nlohmann::json pools = nlohmann::json::object();
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        for (const auto& [name, pool] : pools_) {
            pools[name] = pool->get_stats();
        }
    }
    stats["pools"] = std::move(pools);

    nlohmann::json resources;
    resources["running"] = running_.load();
    resources["gc_count"] = gc_count_.load();
    resources["max_cpu_percent"] = config_.max_cpu_percent;
    resources["max_memory_percent"] = config_.max_memory_percent;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        resources["history_size"] = history_.size();
        resources["current"] = history_.empty() ? nlohmann::json(nullptr)
                                                : nlohmann::json(history_.back());
    }
    stats["resources"] = std::move(resources);

    return stats;
}

}  // namespace arbperf
