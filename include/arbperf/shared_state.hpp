// ArbPerf - Shared Metrics and State
// TTL-aware metric snapshots and versioned state cells on top of shared regions

#ifndef ARBPERF_SHARED_STATE_HPP
#define ARBPERF_SHARED_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "shared_memory.hpp"

namespace arbperf {

// =============================================================================
// SharedMetricsStore
// =============================================================================

// One region per metric type, holding {data, timestamp}. The type -> region
// map and per-type TTLs live in the "metrics_registry" region so every
// process sees the same layout.
class SharedMetricsStore {
public:
    using UpdateFn = std::function<nlohmann::json(const nlohmann::json&)>;

    static constexpr const char* REGISTRY_REGION = "metrics_registry";
    static constexpr std::size_t REGISTRY_SIZE = 64 * 1024;

    explicit SharedMetricsStore(SharedMemoryManager& shm, std::size_t region_size = 1024 * 1024,
                                double default_ttl = 10.0);

    // Non-copyable
    SharedMetricsStore(const SharedMetricsStore&) = delete;
    SharedMetricsStore& operator=(const SharedMetricsStore&) = delete;

    // Creates or loads the registry region; other calls do this on demand
    void initialize();

    void set_ttl(const std::string& metric_type, double ttl_seconds);
    double get_ttl(const std::string& metric_type) const;

    void store_metrics(const std::string& metric_type, const nlohmann::json& metrics);

    // nullopt when unknown, stale, missing or corrupt
    std::optional<nlohmann::json> get_metrics(const std::string& metric_type);

    // update_fn receives the current data ({} if never written)
    void update_metrics(const std::string& metric_type, const UpdateFn& update_fn);

    // {type: data} for every fresh metric type
    nlohmann::json get_all_metrics();

    // Resets stale entries to empty data; returns how many were reset
    std::size_t clear_expired_metrics();

private:
    void ensure_initialized();
    void load(const nlohmann::json& registry);
    void refresh();
    void publish(const char* section, const std::string& metric_type, nlohmann::json value);
    std::string ensure_region(const std::string& metric_type);
    std::optional<std::string> find_region(const std::string& metric_type) const;
    bool is_stale(const std::string& metric_type, const nlohmann::json& entry) const;

    SharedMemoryManager& shm_;
    const std::size_t region_size_;
    const double default_ttl_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> regions_;
    std::map<std::string, double> ttls_;
    bool initialized_{false};

    std::mutex create_mutex_;
};

// =============================================================================
// SharedStateManager
// =============================================================================

// Versioned state cells holding {data, version, timestamp}. Writers may pass
// the version they last saw; a mismatch raises VersionConflictError.
class SharedStateManager {
public:
    using ChangeCallback = std::function<void(const nlohmann::json&, uint64_t)>;

    static constexpr const char* REGISTRY_REGION = "state_registry";
    static constexpr std::size_t REGISTRY_SIZE = 64 * 1024;

    explicit SharedStateManager(SharedMemoryManager& shm, std::size_t region_size = 1024 * 1024);

    // Non-copyable
    SharedStateManager(const SharedStateManager&) = delete;
    SharedStateManager& operator=(const SharedStateManager&) = delete;

    void initialize();

    // Returns the new version
    uint64_t set_state(const std::string& state_name, const nlohmann::json& state,
                       std::optional<uint64_t> version = std::nullopt);

    // (data, version); throws MemoryRegionNotFoundError for unknown names
    std::pair<nlohmann::json, uint64_t> get_state(const std::string& state_name);

    // Invoked synchronously after each successful set_state of this name
    void register_change_callback(const std::string& state_name, ChangeCallback callback);

private:
    void ensure_initialized();
    void load(const nlohmann::json& registry);
    void refresh();
    std::string ensure_region(const std::string& state_name);
    std::optional<std::string> find_region(const std::string& state_name) const;
    void notify(const std::string& state_name, const nlohmann::json& state, uint64_t version);

    SharedMemoryManager& shm_;
    const std::size_t region_size_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> regions_;
    std::map<std::string, std::vector<ChangeCallback>> callbacks_;
    bool initialized_{false};

    std::mutex create_mutex_;
};

}  // namespace arbperf

#endif  // ARBPERF_SHARED_STATE_HPP
