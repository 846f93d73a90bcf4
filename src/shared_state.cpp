// ArbPerf - Shared Metrics and State Implementation

#include "arbperf/shared_state.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#include "arbperf/errors.hpp"
#include "arbperf/logging.hpp"
#include "arbperf/types.hpp"

namespace arbperf {

using nlohmann::json;

namespace {

std::string unique_region_name(const std::string& prefix, const std::string& key) {
    std::random_device rd;
    std::ostringstream oss;
    oss << prefix << "_" << key << "_" << std::hex << std::setfill('0') << std::setw(8) << rd()
        << std::setw(8) << rd();
    return oss.str();
}

// Creates the registry region if absent (tolerating a concurrent creator) and
// returns its contents with every section present
json open_registry(SharedMemoryManager& shm, const char* name, std::size_t size, RegionType type,
                   const std::vector<std::string>& sections) {
    if (!shm.region_exists(name)) {
        json schema = json::object();
        for (const auto& section : sections) schema[section] = "object";
        try {
            shm.create_region(name, size, type, schema);
        } catch (const std::invalid_argument&) {
            if (!shm.region_exists(name)) throw;
        }
    }

    json snapshot;
    shm.update_data(name, [&](const json& current) {
        json registry = current.is_object() ? current : json::object();
        for (const auto& section : sections) {
            if (!registry.contains(section) || !registry[section].is_object()) {
                registry[section] = json::object();
            }
        }
        snapshot = registry;
        return registry;
    });
    return snapshot;
}

}  // namespace

// =============================================================================
// SharedMetricsStore
// =============================================================================

SharedMetricsStore::SharedMetricsStore(SharedMemoryManager& shm, std::size_t region_size,
                                       double default_ttl)
    : shm_(shm), region_size_(region_size), default_ttl_(default_ttl) {}

void SharedMetricsStore::initialize() {
    json registry = open_registry(shm_, REGISTRY_REGION, REGISTRY_SIZE, RegionType::Metrics,
                                  {"metrics_regions", "ttl_values"});
    load(registry);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initialized_ = true;
    }
    logging::get("shm")->debug("SharedMetricsStore initialized");
}

void SharedMetricsStore::ensure_initialized() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return;
    }
    initialize();
}

void SharedMetricsStore::load(const json& registry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : registry.at("metrics_regions").items()) {
        if (entry.value().is_string()) {
            regions_[entry.key()] = entry.value().get<std::string>();
        }
    }
    for (const auto& entry : registry.at("ttl_values").items()) {
        if (entry.value().is_number()) {
            ttls_[entry.key()] = entry.value().get<double>();
        }
    }
}

void SharedMetricsStore::refresh() {
    json registry = shm_.read_data(REGISTRY_REGION);
    if (!registry.is_object() || !registry.contains("metrics_regions") ||
        !registry.contains("ttl_values")) {
        throw CorruptDataError("Metrics registry is malformed");
    }
    load(registry);
}

void SharedMetricsStore::publish(const char* section, const std::string& metric_type,
                                 json value) {
    shm_.update_data(REGISTRY_REGION, [&](const json& current) {
        json registry = current.is_object() ? current : json::object();
        registry[section][metric_type] = value;
        return registry;
    });
}

void SharedMetricsStore::set_ttl(const std::string& metric_type, double ttl_seconds) {
    if (ttl_seconds <= 0.0) {
        throw std::invalid_argument("TTL must be positive");
    }
    ensure_initialized();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ttls_[metric_type] = ttl_seconds;
    }
    publish("ttl_values", metric_type, ttl_seconds);
}

double SharedMetricsStore::get_ttl(const std::string& metric_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ttls_.find(metric_type);
    return it != ttls_.end() ? it->second : default_ttl_;
}

std::optional<std::string> SharedMetricsStore::find_region(const std::string& metric_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = regions_.find(metric_type);
    if (it == regions_.end()) return std::nullopt;
    return it->second;
}

std::string SharedMetricsStore::ensure_region(const std::string& metric_type) {
    ensure_initialized();
    if (auto region = find_region(metric_type)) return *region;

    std::lock_guard<std::mutex> create_lock(create_mutex_);

    // Another process may have registered this type already
    refresh();
    if (auto region = find_region(metric_type)) return *region;

    std::string name = unique_region_name("metrics", metric_type);
    shm_.create_region(name, region_size_, RegionType::Metrics);
    publish("metrics_regions", metric_type, name);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        regions_[metric_type] = name;
    }

    logging::get("shm")->debug("Created metrics region {} for {}", name, metric_type);
    return name;
}

bool SharedMetricsStore::is_stale(const std::string& metric_type, const json& entry) const {
    if (!entry.is_object() || !entry.contains("timestamp") || !entry["timestamp"].is_number()) {
        return true;
    }
    return wall_time_seconds() - entry["timestamp"].get<double>() > get_ttl(metric_type);
}

void SharedMetricsStore::store_metrics(const std::string& metric_type, const json& metrics) {
    std::string region = ensure_region(metric_type);
    shm_.write_data(region, json{{"data", metrics}, {"timestamp", wall_time_seconds()}});
}

std::optional<json> SharedMetricsStore::get_metrics(const std::string& metric_type) {
    auto log = logging::get("shm");
    try {
        ensure_initialized();
        auto region = find_region(metric_type);
        if (!region) {
            refresh();
            region = find_region(metric_type);
        }
        if (!region) return std::nullopt;

        json entry = shm_.read_data(*region);
        if (is_stale(metric_type, entry)) return std::nullopt;
        return entry.contains("data") ? entry["data"] : json::object();
    } catch (const MemoryRegionNotFoundError& e) {
        log->error("Error reading metrics for {}: {}", metric_type, e.what());
    } catch (const CorruptDataError& e) {
        log->error("Error reading metrics for {}: {}", metric_type, e.what());
    }
    return std::nullopt;
}

void SharedMetricsStore::update_metrics(const std::string& metric_type,
                                        const UpdateFn& update_fn) {
    std::string region = ensure_region(metric_type);
    shm_.update_data(region, [&](const json& current) {
        json data = json::object();
        if (current.is_object() && current.contains("data")) {
            data = current["data"];
        }
        return json{{"data", update_fn(data)}, {"timestamp", wall_time_seconds()}};
    });
}

json SharedMetricsStore::get_all_metrics() {
    try {
        ensure_initialized();
        refresh();
    } catch (const SharedMemoryError& e) {
        logging::get("shm")->error("Cannot refresh metrics registry: {}", e.what());
    }

    std::vector<std::string> types;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [type, region] : regions_) types.push_back(type);
    }

    json result = json::object();
    for (const auto& type : types) {
        auto metrics = get_metrics(type);
        if (metrics && !metrics->empty()) {
            result[type] = std::move(*metrics);
        }
    }
    return result;
}

std::size_t SharedMetricsStore::clear_expired_metrics() {
    auto log = logging::get("shm");
    ensure_initialized();

    std::vector<std::pair<std::string, std::string>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.assign(regions_.begin(), regions_.end());
    }

    std::size_t cleared = 0;
    for (const auto& [type, region] : entries) {
        try {
            bool reset = false;
            shm_.update_data(region, [&](const json& current) {
                if (!current.is_null() && !is_stale(type, current)) return current;
                reset = !current.is_null();
                return json{{"data", json::object()}, {"timestamp", wall_time_seconds()}};
            });
            if (reset) ++cleared;
        } catch (const SharedMemoryError& e) {
            log->error("Error clearing expired metrics for {}: {}", type, e.what());
        }
    }
    return cleared;
}

// =============================================================================
// SharedStateManager
// =============================================================================

SharedStateManager::SharedStateManager(SharedMemoryManager& shm, std::size_t region_size)
    : shm_(shm), region_size_(region_size) {}

void SharedStateManager::initialize() {
    json registry = open_registry(shm_, REGISTRY_REGION, REGISTRY_SIZE, RegionType::State,
                                  {"state_regions"});
    load(registry);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initialized_ = true;
    }
    logging::get("shm")->debug("SharedStateManager initialized");
}

void SharedStateManager::ensure_initialized() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) return;
    }
    initialize();
}

void SharedStateManager::load(const json& registry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : registry.at("state_regions").items()) {
        if (entry.value().is_string()) {
            regions_[entry.key()] = entry.value().get<std::string>();
        }
    }
}

void SharedStateManager::refresh() {
    json registry = shm_.read_data(REGISTRY_REGION);
    if (!registry.is_object() || !registry.contains("state_regions")) {
        throw CorruptDataError("State registry is malformed");
    }
    load(registry);
}

std::optional<std::string> SharedStateManager::find_region(const std::string& state_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = regions_.find(state_name);
    if (it == regions_.end()) return std::nullopt;
    return it->second;
}

std::string SharedStateManager::ensure_region(const std::string& state_name) {
    ensure_initialized();
    if (auto region = find_region(state_name)) return *region;

    std::lock_guard<std::mutex> create_lock(create_mutex_);
    refresh();
    if (auto region = find_region(state_name)) return *region;

    std::string name = unique_region_name("state", state_name);
    shm_.create_region(name, region_size_, RegionType::State);
    shm_.write_data(name, json{{"data", json::object()}, {"version", 0}});

    shm_.update_data(REGISTRY_REGION, [&](const json& current) {
        json registry = current.is_object() ? current : json::object();
        registry["state_regions"][state_name] = name;
        return registry;
    });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        regions_[state_name] = name;
    }

    logging::get("shm")->debug("Created state region {} for {}", name, state_name);
    return name;
}

uint64_t SharedStateManager::set_state(const std::string& state_name, const json& state,
                                       std::optional<uint64_t> version) {
    std::string region = ensure_region(state_name);

    uint64_t new_version = 0;
    shm_.update_data(region, [&](const json& current) {
        uint64_t current_version = 0;
        if (current.is_object() && current.contains("version") &&
            current["version"].is_number_integer()) {
            current_version = current["version"].get<uint64_t>();
        }

        if (version && *version != current_version) {
            throw VersionConflictError("Version mismatch for " + state_name + ": expected " +
                                           std::to_string(*version) + ", got " +
                                           std::to_string(current_version),
                                       *version, current_version);
        }

        new_version = current_version + 1;
        return json{{"data", state}, {"version", new_version}, {"timestamp", wall_time_seconds()}};
    });

    notify(state_name, state, new_version);
    return new_version;
}

std::pair<json, uint64_t> SharedStateManager::get_state(const std::string& state_name) {
    ensure_initialized();
    auto region = find_region(state_name);
    if (!region) {
        refresh();
        region = find_region(state_name);
    }
    if (!region) {
        throw MemoryRegionNotFoundError("State '" + state_name + "' not found");
    }

    json entry = shm_.read_data(*region);
    if (!entry.is_object() || !entry.contains("data") || !entry.contains("version")) {
        throw CorruptDataError("State '" + state_name + "' is malformed");
    }
    return {entry["data"], entry["version"].get<uint64_t>()};
}

void SharedStateManager::register_change_callback(const std::string& state_name,
                                                  ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[state_name].push_back(std::move(callback));
}

void SharedStateManager::notify(const std::string& state_name, const json& state,
                                uint64_t version) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(state_name);
        if (it == callbacks_.end()) return;
        callbacks = it->second;
    }

    auto log = logging::get("shm");
    for (auto& callback : callbacks) {
        try {
            callback(state, version);
        } catch (const std::exception& e) {
            log->error("Error in state change callback for {}: {}", state_name, e.what());
        } catch (...) {
            log->error("Error in state change callback for {}: non-standard exception",
                       state_name);
        }
    }
}

}  // namespace arbperf
