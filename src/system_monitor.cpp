// ArbPerf - System Monitor Implementation

#include "arbperf/system_monitor.hpp"

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace arbperf {

namespace {

// utime + stime from /proc/self/stat, in clock ticks
uint64_t read_process_ticks() {
    std::ifstream stat_file("/proc/self/stat");
    if (!stat_file.is_open()) return 0;

    std::string content;
    std::getline(stat_file, content);

    // comm may contain spaces; fields resume after the last ')'
    auto paren = content.rfind(')');
    if (paren == std::string::npos) return 0;

    std::istringstream iss(content.substr(paren + 1));
    std::string field;
    uint64_t utime = 0, stime = 0;
    for (int i = 0; i < 13 && iss >> field; ++i) {
        if (i == 11) utime = std::stoull(field);
        if (i == 12) stime = std::stoull(field);
    }
    return utime + stime;
}

// Value of a "Key:   <n> kB" line
uint64_t read_kb_field(const char* path, const std::string& key) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    std::string line;
    while (std::getline(file, line)) {
        if (line.compare(0, key.size(), key) == 0) {
            std::istringstream iss(line.substr(key.size()));
            uint64_t value = 0;
            iss >> value;
            return value;
        }
    }
    return 0;
}

void read_process_io(ResourceUsage& usage) {
    std::ifstream io_file("/proc/self/io");
    if (!io_file.is_open()) return;

    std::string key;
    uint64_t value = 0;
    while (io_file >> key >> value) {
        if (key == "read_bytes:") usage.io_read_bytes = value;
        else if (key == "write_bytes:") usage.io_write_bytes = value;
    }
}

void read_network(ResourceUsage& usage) {
    std::ifstream dev("/proc/net/dev");
    if (!dev.is_open()) return;

    std::string line;
    // Two header lines
    std::getline(dev, line);
    std::getline(dev, line);

    while (std::getline(dev, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::istringstream iss(line.substr(colon + 1));
        uint64_t fields[9] = {};
        for (auto& f : fields) {
            if (!(iss >> f)) break;
        }
        usage.net_recv_bytes += fields[0];
        usage.net_sent_bytes += fields[8];
    }
}

}  // namespace

SystemMonitor::SystemMonitor()
    : cores_(std::max(1u, std::thread::hardware_concurrency())),
      ticks_per_second_(std::max(1L, ::sysconf(_SC_CLK_TCK))) {}

double SystemMonitor::cpu_percent() {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t ticks = read_process_ticks();
    auto now = Clock::now();

    if (!primed_) {
        primed_ = true;
        last_cpu_ticks_ = ticks;
        last_time_ = now;
        return 0.0;
    }

    double elapsed = std::chrono::duration<double>(now - last_time_).count();
    if (elapsed <= 0.0) return 0.0;

    double cpu_seconds = static_cast<double>(ticks - std::min(ticks, last_cpu_ticks_)) /
                         static_cast<double>(ticks_per_second_);
    last_cpu_ticks_ = ticks;
    last_time_ = now;

    double pct = 100.0 * cpu_seconds / (elapsed * cores_);
    return std::clamp(pct, 0.0, 100.0);
}

double SystemMonitor::memory_percent() const {
    uint64_t rss_kb = read_kb_field("/proc/self/status", "VmRSS:");
    uint64_t total_kb = read_kb_field("/proc/meminfo", "MemTotal:");
    if (total_kb == 0) return 0.0;
    return 100.0 * static_cast<double>(rss_kb) / static_cast<double>(total_kb);
}

ResourceUsage SystemMonitor::sample() {
    ResourceUsage usage;
    usage.cpu_percent = cpu_percent();
    usage.memory_percent = memory_percent();
    read_process_io(usage);
    read_network(usage);
    usage.timestamp = wall_time_seconds();
    return usage;
}

double process_cpu_percent() {
    static SystemMonitor monitor;
    static std::mutex mutex;
    static Clock::time_point last_refresh{};
    static double cached = 0.0;

    std::lock_guard<std::mutex> lock(mutex);
    auto now = Clock::now();
    if (now - last_refresh >= std::chrono::milliseconds(100)) {
        cached = monitor.cpu_percent();
        last_refresh = now;
    }
    return cached;
}

void to_json(nlohmann::json& j, const ResourceUsage& usage) {
    j = nlohmann::json{
        {"memory_percent", usage.memory_percent},
        {"cpu_percent", usage.cpu_percent},
        {"io_read_bytes", usage.io_read_bytes},
        {"io_write_bytes", usage.io_write_bytes},
        {"network_recv_bytes", usage.net_recv_bytes},
        {"network_sent_bytes", usage.net_sent_bytes},
        {"timestamp", usage.timestamp},
    };
}

}  // namespace arbperf
