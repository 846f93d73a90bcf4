// ArbPerf - System Monitor
// Process CPU/memory/I/O and host network counters read from /proc

#ifndef ARBPERF_SYSTEM_MONITOR_HPP
#define ARBPERF_SYSTEM_MONITOR_HPP

#include <cstdint>
#include <mutex>

#include "types.hpp"

namespace arbperf {

class SystemMonitor {
public:
    SystemMonitor();

    // Process CPU since the previous call, normalized to 0..100 over all cores.
    // The first call primes the counters and returns 0.
    double cpu_percent();

    // Resident set size as a percentage of physical memory
    double memory_percent() const;

    // Full snapshot; unreadable sources contribute 0
    ResourceUsage sample();

private:
    std::mutex mutex_;
    uint64_t last_cpu_ticks_{0};
    Clock::time_point last_time_{};
    bool primed_{false};
    unsigned cores_;
    long ticks_per_second_;
};

// Process-wide CPU percent, refreshed at most every 100ms; default executor probe
double process_cpu_percent();

}  // namespace arbperf

#endif  // ARBPERF_SYSTEM_MONITOR_HPP
