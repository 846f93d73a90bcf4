// ArbPerf - Shared Memory
// Named memory-mapped regions with flock-based cross-process locking,
// a persistent registry and length-prefixed JSON payloads

#ifndef ARBPERF_SHARED_MEMORY_HPP
#define ARBPERF_SHARED_MEMORY_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"

namespace arbperf {

enum class RegionType : uint8_t {
    Metrics,
    State,
    Cache,
    Config,
    Custom
};

constexpr std::string_view to_string(RegionType t) noexcept {
    switch (t) {
        case RegionType::Metrics: return "metrics";
        case RegionType::State: return "state";
        case RegionType::Cache: return "cache";
        case RegionType::Config: return "config";
        case RegionType::Custom: return "custom";
    }
    return "custom";
}

// Throws std::invalid_argument for unknown names
RegionType region_type_from_string(std::string_view s);

enum class LockType : uint8_t {
    Read,       // shared
    Write,      // exclusive
    Exclusive   // exclusive, held across a read-modify-write
};

struct MemoryRegionInfo {
    std::string name;
    std::string path;
    std::size_t size = 0;
    RegionType type = RegionType::Custom;
    std::optional<nlohmann::json> schema;
    double created_at = 0.0;
    double last_accessed = 0.0;
    uint64_t access_count = 0;
    std::string lock_path;
};

void to_json(nlohmann::json& j, const MemoryRegionInfo& info);
void from_json(const nlohmann::json& j, MemoryRegionInfo& info);

// Shallow type-tag check of top-level keys. Tags: string, number, boolean,
// object, array; anything else is accepted. Throws SchemaValidationError.
void validate_schema(const nlohmann::json& value, const nlohmann::json& schema);

// =============================================================================
// Scoped acquisitions
// =============================================================================

// flock(2) on a lock file, released on destruction
class FileLock {
public:
    // Retries a non-blocking flock until `timeout`, then throws LockAcquisitionError.
    // Without `create`, a missing lock file raises MemoryRegionNotFoundError.
    FileLock(const std::string& path, bool exclusive, std::chrono::milliseconds timeout,
             bool create = true);
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // Non-copyable
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool exclusive() const noexcept { return exclusive_; }

private:
    void release() noexcept;

    int fd_ = -1;
    bool exclusive_ = false;
};

// Locked, mapped view of one region. Unmaps, closes and unlocks on destruction.
class MappedRegion {
public:
    MappedRegion(MemoryRegionInfo info, FileLock lock, int fd, void* addr, bool writable);
    ~MappedRegion();

    MappedRegion(MappedRegion&& other) noexcept;
    MappedRegion& operator=(MappedRegion&&) = delete;

    // Non-copyable
    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    uint8_t* data() noexcept { return static_cast<uint8_t*>(addr_); }
    const uint8_t* data() const noexcept { return static_cast<const uint8_t*>(addr_); }
    std::size_t size() const noexcept { return info_.size; }
    bool writable() const noexcept { return writable_; }
    const MemoryRegionInfo& info() const noexcept { return info_; }

private:
    MemoryRegionInfo info_;
    FileLock lock_;
    int fd_;
    void* addr_;
    bool writable_;
};

// =============================================================================
// SharedMemoryManager
// =============================================================================

class SharedMemoryManager {
public:
    using UpdateFn = std::function<nlohmann::json(const nlohmann::json&)>;

    explicit SharedMemoryManager(SharedMemoryConfig config = {});

    // Non-copyable
    SharedMemoryManager(const SharedMemoryManager&) = delete;
    SharedMemoryManager& operator=(const SharedMemoryManager&) = delete;

    const std::filesystem::path& base_dir() const noexcept { return base_dir_; }
    const SharedMemoryConfig& config() const noexcept { return config_; }

    // Region lifecycle
    MemoryRegionInfo create_region(const std::string& name, std::size_t size, RegionType type,
                                   std::optional<nlohmann::json> schema = std::nullopt);
    bool delete_region(const std::string& name);

    std::optional<MemoryRegionInfo> get_region_info(const std::string& name) const;
    std::vector<MemoryRegionInfo> list_regions(std::optional<RegionType> type = std::nullopt) const;
    bool region_exists(const std::string& name) const;

    // Lock and map; Read takes a shared lock, Write/Exclusive an exclusive one
    MappedRegion open_region(const std::string& name, LockType lock_type = LockType::Read);

    // Payload access. Layout at `offset`: u32 big-endian length, then compact JSON.
    std::size_t write_data(const std::string& name, const nlohmann::json& value,
                           std::size_t offset = 0, bool validate = true);
    nlohmann::json read_data(const std::string& name, std::size_t offset = 0);

    // Atomic read-modify-write; a never-written region passes null to update_fn
    std::size_t update_data(const std::string& name, const UpdateFn& update_fn,
                            std::size_t offset = 0, bool validate = true);

private:
    using Registry = std::map<std::string, MemoryRegionInfo>;

    FileLock lock_registry(bool exclusive) const;
    Registry load_registry() const;           // caller holds the registry lock
    void save_registry(const Registry& registry) const;

    // Bumps access stats and returns the current info
    MemoryRegionInfo touch_region(const std::string& name);

    std::size_t encode(MappedRegion& region, std::size_t offset, const nlohmann::json& value,
                       bool validate) const;
    // nullopt when the region was never written at `offset`
    std::optional<nlohmann::json> decode(const MappedRegion& region, std::size_t offset) const;

    SharedMemoryConfig config_;
    std::filesystem::path base_dir_;
    std::filesystem::path registry_path_;
    std::filesystem::path registry_lock_path_;

    mutable std::mutex registry_mutex_;
    std::mutex update_mutex_;
};

}  // namespace arbperf

#endif  // ARBPERF_SHARED_MEMORY_HPP
