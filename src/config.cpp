// ArbPerf - Configuration Implementation

#include "arbperf/config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arbperf {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing "# comment" that is not inside a quoted string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

size_t to_size(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        long long v = std::stoll(value, &pos);
        if (pos != value.size() || v < 0) throw std::invalid_argument(value);
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
}

double to_double(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
}

std::chrono::milliseconds to_ms(const std::string& key, const std::string& value) {
    return std::chrono::milliseconds(static_cast<int64_t>(to_size(key, value)));
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                current_section = trim(line.substr(1, end - 1));
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "logging" || current_section == "general") {
            if (key == "log_level" || key == "level") config.logging.level = value;
            else if (key == "pattern") config.logging.pattern = value;
            else if (key == "file" || key == "log_file") config.logging.file = value;
            else if (key == "max_file_size") config.logging.max_file_size = to_size(key, value);
            else if (key == "max_files") config.logging.max_files = to_size(key, value);
        }
        else if (current_section == "executor") {
            if (key == "num_workers") config.executor.num_workers = to_size(key, value);
            else if (key == "max_tasks_per_worker") config.executor.max_tasks_per_worker = to_size(key, value);
            else if (key == "steal_threshold") config.executor.steal_threshold = to_size(key, value);
            else if (key == "max_cpu_percent") config.executor.max_cpu_percent = to_double(key, value);
            else if (key == "throttle_threshold") config.executor.throttle_threshold = to_double(key, value);
            else if (key == "poll_interval_ms") config.executor.poll_interval = to_ms(key, value);
            else if (key == "throttle_sleep_ms") config.executor.throttle_sleep = to_ms(key, value);
            else if (key == "submit_timeout_ms") config.executor.submit_timeout = to_ms(key, value);
            else if (key == "shutdown_timeout_ms") config.executor.shutdown_timeout = to_ms(key, value);
        }
        else if (current_section == "io") {
            if (key == "max_batch_size") config.io.max_batch_size = to_size(key, value);
            else if (key == "batch_interval_ms") config.io.batch_interval = to_ms(key, value);
            else if (key == "max_workers") config.io.max_workers = to_size(key, value);
            else if (key == "max_queue_size") config.io.max_queue_size = to_size(key, value);
            else if (key == "max_ops_per_second") config.io.max_ops_per_second = to_double(key, value);
            else if (key == "throttle_ops_per_second") config.io.throttle_ops_per_second = to_double(key, value);
        }
        else if (current_section == "resources") {
            if (key == "max_cpu_percent") config.resources.max_cpu_percent = to_double(key, value);
            else if (key == "max_memory_percent") config.resources.max_memory_percent = to_double(key, value);
            else if (key == "monitor_interval_ms") config.resources.monitor_interval = to_ms(key, value);
            else if (key == "history_size") config.resources.history_size = to_size(key, value);
        }
        else if (current_section == "shared_memory") {
            if (key == "base_dir") config.shared_memory.base_dir = value;
            else if (key == "lock_timeout_ms") config.shared_memory.lock_timeout = to_ms(key, value);
            else if (key == "metrics_region_size") config.shared_memory.metrics_region_size = to_size(key, value);
            else if (key == "state_region_size") config.shared_memory.state_region_size = to_size(key, value);
            else if (key == "default_metrics_ttl") config.shared_memory.default_metrics_ttl = to_double(key, value);
        }
    }

    return config;
}

}  // namespace arbperf
