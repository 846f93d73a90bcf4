// ArbPerf - Core Types
// Priorities, resource tags and usage snapshots shared across the layer

#ifndef ARBPERF_TYPES_HPP
#define ARBPERF_TYPES_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace arbperf {

using Clock = std::chrono::steady_clock;

// Lower value runs first
enum class TaskPriority : uint8_t {
    Critical = 0,
    High = 1,
    Normal = 2,
    Low = 3,
    Background = 4
};

enum class ResourceType : uint8_t {
    Memory,
    CPU,
    IO,
    Network,
    Custom
};

constexpr std::string_view to_string(TaskPriority p) noexcept {
    switch (p) {
        case TaskPriority::Critical: return "critical";
        case TaskPriority::High: return "high";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::Low: return "low";
        case TaskPriority::Background: return "background";
    }
    return "unknown";
}

constexpr std::string_view to_string(ResourceType r) noexcept {
    switch (r) {
        case ResourceType::Memory: return "memory";
        case ResourceType::CPU: return "cpu";
        case ResourceType::IO: return "io";
        case ResourceType::Network: return "network";
        case ResourceType::Custom: return "custom";
    }
    return "unknown";
}

// Seconds since the Unix epoch; comparable across processes
inline double wall_time_seconds() noexcept {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

// 1.0 at or below threshold, falling linearly to a floor of 0.1 at ceiling
inline double throttle_factor(double value, double threshold, double ceiling) noexcept {
    if (value <= threshold) return 1.0;
    if (ceiling <= threshold) return 0.1;
    double excess = (value - threshold) / (ceiling - threshold);
    return std::max(0.1, 1.0 - excess);
}

// Point-in-time process resource usage
struct ResourceUsage {
    double memory_percent = 0.0;
    double cpu_percent = 0.0;
    uint64_t io_read_bytes = 0;
    uint64_t io_write_bytes = 0;
    uint64_t net_recv_bytes = 0;
    uint64_t net_sent_bytes = 0;
    double timestamp = 0.0;
};

void to_json(nlohmann::json& j, const ResourceUsage& usage);

}  // namespace arbperf

#endif  // ARBPERF_TYPES_HPP
