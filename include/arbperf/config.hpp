// ArbPerf - Configuration
// Builder pattern for fluent configuration, loadable from TOML

#ifndef ARBPERF_CONFIG_HPP
#define ARBPERF_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace arbperf {

// Logging settings
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    std::optional<std::string> file;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 3;
};

// Work-stealing executor settings
struct ExecutorConfig {
    std::size_t num_workers = 0;  // 0 = hardware concurrency
    std::size_t max_tasks_per_worker = 100;
    std::size_t steal_threshold = 5;
    double max_cpu_percent = 80.0;
    double throttle_threshold = 90.0;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds throttle_sleep{100};
    std::chrono::milliseconds submit_timeout{5000};
    std::chrono::milliseconds shutdown_timeout{5000};  // grace period for running bodies on stop

    // Current process CPU percent; defaults to the /proc sampler when empty
    std::function<double()> cpu_probe;
};

// Batched I/O settings
struct IOConfig {
    std::size_t max_batch_size = 100;
    std::chrono::milliseconds batch_interval{100};
    std::size_t max_workers = 4;
    std::size_t max_queue_size = 1000;
    double max_ops_per_second = 1000.0;
    double throttle_ops_per_second = 800.0;
};

// Resource monitor settings
struct ResourceConfig {
    double max_cpu_percent = 80.0;
    double max_memory_percent = 80.0;
    std::chrono::milliseconds monitor_interval{1000};
    std::size_t history_size = 100;
};

// Shared memory settings
struct SharedMemoryConfig {
    std::string base_dir;  // empty = <temp>/arbperf/shared_memory
    std::chrono::milliseconds lock_timeout{10000};
    std::size_t metrics_region_size = 1024 * 1024;
    std::size_t state_region_size = 1024 * 1024;
    double default_metrics_ttl = 10.0;  // seconds
};

// Main configuration
class Config {
public:
    LoggingConfig logging;
    ExecutorConfig executor;
    IOConfig io;
    ResourceConfig resources;
    SharedMemoryConfig shared_memory;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& set_log_level(std::string_view level) {
        logging.level = std::string(level);
        return *this;
    }

    Config& set_log_file(std::string_view path) {
        logging.file = std::string(path);
        return *this;
    }

    Config& set_workers(std::size_t n) {
        executor.num_workers = n;
        return *this;
    }

    Config& set_steal_threshold(std::size_t n) {
        executor.steal_threshold = n;
        return *this;
    }

    Config& set_cpu_limits(double max_cpu, double throttle) {
        executor.max_cpu_percent = max_cpu;
        executor.throttle_threshold = throttle;
        resources.max_cpu_percent = max_cpu;
        return *this;
    }

    Config& set_max_memory_percent(double pct) {
        resources.max_memory_percent = pct;
        return *this;
    }

    Config& set_batching(std::size_t max_batch, std::chrono::milliseconds interval) {
        io.max_batch_size = max_batch;
        io.batch_interval = interval;
        return *this;
    }

    Config& set_io_workers(std::size_t n) {
        io.max_workers = n;
        return *this;
    }

    Config& set_shared_memory_dir(std::string_view dir) {
        shared_memory.base_dir = std::string(dir);
        return *this;
    }

    Config& set_lock_timeout(std::chrono::milliseconds timeout) {
        shared_memory.lock_timeout = timeout;
        return *this;
    }
};

}  // namespace arbperf

#endif  // ARBPERF_CONFIG_HPP
