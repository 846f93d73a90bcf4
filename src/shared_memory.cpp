// ArbPerf - Shared Memory Implementation

#include "arbperf/shared_memory.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "arbperf/errors.hpp"
#include "arbperf/logging.hpp"
#include "arbperf/types.hpp"

namespace arbperf {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t HEADER_SIZE = 4;
constexpr auto LOCK_RETRY_INTERVAL = std::chrono::milliseconds(5);

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void check_name(const std::string& name) {
    if (name.empty() || name.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid region name: '" + name + "'");
    }
}

std::string random_suffix() {
    std::random_device rd;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << rd();
    return oss.str();
}

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void write_be32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

}  // namespace

RegionType region_type_from_string(std::string_view s) {
    if (s == "metrics") return RegionType::Metrics;
    if (s == "state") return RegionType::State;
    if (s == "cache") return RegionType::Cache;
    if (s == "config") return RegionType::Config;
    if (s == "custom") return RegionType::Custom;
    throw std::invalid_argument("Unknown region type: " + std::string(s));
}

void to_json(nlohmann::json& j, const MemoryRegionInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"path", info.path},
        {"size", info.size},
        {"type", std::string(to_string(info.type))},
        {"schema", info.schema ? *info.schema : nlohmann::json(nullptr)},
        {"created_at", info.created_at},
        {"last_accessed", info.last_accessed},
        {"access_count", info.access_count},
        {"lock_path", info.lock_path},
    };
}

void from_json(const nlohmann::json& j, MemoryRegionInfo& info) {
    j.at("name").get_to(info.name);
    j.at("path").get_to(info.path);
    j.at("size").get_to(info.size);
    info.type = region_type_from_string(j.at("type").get<std::string>());
    if (j.contains("schema") && !j.at("schema").is_null()) {
        info.schema = j.at("schema");
    } else {
        info.schema.reset();
    }
    j.at("created_at").get_to(info.created_at);
    j.at("last_accessed").get_to(info.last_accessed);
    j.at("access_count").get_to(info.access_count);
    j.at("lock_path").get_to(info.lock_path);
}

void validate_schema(const nlohmann::json& value, const nlohmann::json& schema) {
    if (!schema.is_object()) return;
    if (!value.is_object()) {
        throw SchemaValidationError("Value must be an object, got " +
                                    std::string(value.type_name()));
    }

    for (const auto& field : schema.items()) {
        auto it = value.find(field.key());
        if (it == value.end()) {
            throw SchemaValidationError("Missing required field: " + field.key());
        }
        if (!field.value().is_string()) continue;

        const auto& tag = field.value().get_ref<const std::string&>();
        bool ok = true;
        if (tag == "string") ok = it->is_string();
        else if (tag == "number") ok = it->is_number();  // excludes booleans
        else if (tag == "boolean") ok = it->is_boolean();
        else if (tag == "object") ok = it->is_object();
        else if (tag == "array") ok = it->is_array();

        if (!ok) {
            throw SchemaValidationError("Field '" + field.key() + "' must be " + tag +
                                        ", got " + it->type_name());
        }
    }
}

// =============================================================================
// FileLock
// =============================================================================

FileLock::FileLock(const std::string& path, bool exclusive, std::chrono::milliseconds timeout,
                   bool create)
    : exclusive_(exclusive) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CLOEXEC | (create ? O_CREAT : 0), 0644);
    if (fd_ < 0) {
        if (!create && errno == ENOENT) {
            throw MemoryRegionNotFoundError("Lock file " + path + " no longer exists");
        }
        throw LockAcquisitionError(errno_message("Cannot open lock file " + path));
    }

    const int op = (exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
    const auto deadline = Clock::now() + timeout;
    while (::flock(fd_, op) != 0) {
        int err = errno;
        if (err == EINTR) continue;
        if (err != EWOULDBLOCK || Clock::now() >= deadline) {
            ::close(fd_);
            fd_ = -1;
            if (err == EWOULDBLOCK) {
                throw LockAcquisitionError("Timed out after " + std::to_string(timeout.count()) +
                                           " ms waiting for lock " + path);
            }
            throw LockAcquisitionError("flock failed on " + path + ": " + std::strerror(err));
        }
        std::this_thread::sleep_for(LOCK_RETRY_INTERVAL);
    }
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), exclusive_(other.exclusive_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        exclusive_ = other.exclusive_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

// =============================================================================
// MappedRegion
// =============================================================================

MappedRegion::MappedRegion(MemoryRegionInfo info, FileLock lock, int fd, void* addr,
                           bool writable)
    : info_(std::move(info)), lock_(std::move(lock)), fd_(fd), addr_(addr), writable_(writable) {}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept
    : info_(std::move(other.info_)),
      lock_(std::move(other.lock_)),
      fd_(other.fd_),
      addr_(other.addr_),
      writable_(other.writable_) {
    other.fd_ = -1;
    other.addr_ = nullptr;
}

MappedRegion::~MappedRegion() {
    if (addr_ != nullptr) {
        ::munmap(addr_, info_.size);
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
    // lock_ releases last
}

// =============================================================================
// SharedMemoryManager
// =============================================================================

SharedMemoryManager::SharedMemoryManager(SharedMemoryConfig config)
    : config_(std::move(config)) {
    base_dir_ = config_.base_dir.empty()
                    ? fs::temp_directory_path() / "arbperf" / "shared_memory"
                    : fs::path(config_.base_dir);
    fs::create_directories(base_dir_);

    registry_path_ = base_dir_ / "registry.json";
    registry_lock_path_ = base_dir_ / "registry.lock";

    logging::get("shm")->debug("SharedMemoryManager using {}", base_dir_.string());
}

FileLock SharedMemoryManager::lock_registry(bool exclusive) const {
    return FileLock(registry_lock_path_.string(), exclusive, config_.lock_timeout);
}

SharedMemoryManager::Registry SharedMemoryManager::load_registry() const {
    Registry registry;

    std::error_code ec;
    if (!fs::exists(registry_path_, ec)) {
        return registry;
    }

    std::ifstream in(registry_path_);
    if (!in.is_open()) {
        throw CorruptDataError("Cannot read registry " + registry_path_.string());
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("regions") ||
        !doc.at("regions").is_object()) {
        throw CorruptDataError("Registry " + registry_path_.string() + " is corrupt");
    }

    try {
        for (const auto& entry : doc.at("regions").items()) {
            registry.emplace(entry.key(), entry.value().get<MemoryRegionInfo>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw CorruptDataError("Registry entry is malformed: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw CorruptDataError("Registry entry is malformed: " + std::string(e.what()));
    }
    return registry;
}

void SharedMemoryManager::save_registry(const Registry& registry) const {
    nlohmann::json regions = nlohmann::json::object();
    for (const auto& [name, info] : registry) {
        regions[name] = info;
    }
    nlohmann::json doc{{"version", 1}, {"regions", std::move(regions)}};

    fs::path tmp = registry_path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw SharedMemoryError("Cannot write registry " + tmp.string());
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            throw SharedMemoryError("Failed writing registry " + tmp.string());
        }
    }
    fs::rename(tmp, registry_path_);
}

MemoryRegionInfo SharedMemoryManager::create_region(const std::string& name, std::size_t size,
                                                    RegionType type,
                                                    std::optional<nlohmann::json> schema) {
    check_name(name);
    if (size <= HEADER_SIZE) {
        throw std::invalid_argument("Region size must exceed " + std::to_string(HEADER_SIZE) +
                                    " bytes");
    }
    if (schema && !schema->is_object()) {
        throw std::invalid_argument("Schema must be a JSON object");
    }

    std::lock_guard<std::mutex> guard(registry_mutex_);
    FileLock registry_lock = lock_registry(true);
    Registry registry = load_registry();

    if (registry.count(name)) {
        throw std::invalid_argument("Region " + name + " already exists");
    }

    const std::string stem = name + "_" + random_suffix();
    const fs::path data_path = base_dir_ / (stem + ".dat");
    const fs::path lock_path = base_dir_ / (stem + ".lock");

    int fd = ::open(data_path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw SharedMemoryError(errno_message("Cannot create " + data_path.string()));
    }
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        std::string msg = errno_message("Cannot size " + data_path.string());
        ::close(fd);
        ::unlink(data_path.c_str());
        throw SharedMemoryError(msg);
    }
    ::close(fd);

    int lock_fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        std::string msg = errno_message("Cannot create " + lock_path.string());
        ::unlink(data_path.c_str());
        throw SharedMemoryError(msg);
    }
    ::close(lock_fd);

    MemoryRegionInfo info;
    info.name = name;
    info.path = data_path.string();
    info.size = size;
    info.type = type;
    info.schema = std::move(schema);
    info.created_at = wall_time_seconds();
    info.last_accessed = info.created_at;
    info.access_count = 0;
    info.lock_path = lock_path.string();

    registry.emplace(name, info);
    try {
        save_registry(registry);
    } catch (...) {
        std::error_code ec;
        fs::remove(data_path, ec);
        fs::remove(lock_path, ec);
        throw;
    }

    logging::get("shm")->debug("Created region {} ({} bytes, {})", name, size, to_string(type));
    return info;
}

bool SharedMemoryManager::delete_region(const std::string& name) {
    auto log = logging::get("shm");

    std::lock_guard<std::mutex> guard(registry_mutex_);
    FileLock registry_lock = lock_registry(true);
    Registry registry = load_registry();

    auto it = registry.find(name);
    if (it == registry.end()) {
        throw MemoryRegionNotFoundError("Region " + name + " not found");
    }
    const MemoryRegionInfo info = it->second;

    FileLock region_lock(info.lock_path, true, config_.lock_timeout);

    const fs::path data_path = info.path;
    fs::path tombstone = data_path;
    tombstone += ".deleting";

    std::error_code ec;
    bool had_data = fs::exists(data_path, ec);
    if (had_data) {
        fs::rename(data_path, tombstone, ec);
        if (ec) {
            throw SharedMemoryError("Cannot retire " + data_path.string() + ": " + ec.message());
        }
    }

    registry.erase(it);
    try {
        save_registry(registry);
    } catch (...) {
        if (had_data) {
            std::error_code restore_ec;
            fs::rename(tombstone, data_path, restore_ec);
            if (restore_ec) {
                log->error("Cannot restore {}: {}", data_path.string(), restore_ec.message());
            }
        }
        throw;
    }

    if (had_data && !fs::remove(tombstone, ec) && ec) {
        log->error("Cannot remove {}: {}", tombstone.string(), ec.message());
    }
    if (!fs::remove(info.lock_path, ec) && ec) {
        log->error("Cannot remove {}: {}", info.lock_path, ec.message());
    }

    log->debug("Deleted region {}", name);
    return true;
}

std::optional<MemoryRegionInfo> SharedMemoryManager::get_region_info(
    const std::string& name) const {
    FileLock registry_lock = lock_registry(false);
    Registry registry = load_registry();
    auto it = registry.find(name);
    if (it == registry.end()) return std::nullopt;
    return it->second;
}

std::vector<MemoryRegionInfo> SharedMemoryManager::list_regions(
    std::optional<RegionType> type) const {
    FileLock registry_lock = lock_registry(false);
    Registry registry = load_registry();

    std::vector<MemoryRegionInfo> out;
    for (auto& [name, info] : registry) {
        if (!type || info.type == *type) out.push_back(info);
    }
    return out;
}

bool SharedMemoryManager::region_exists(const std::string& name) const {
    return get_region_info(name).has_value();
}

MemoryRegionInfo SharedMemoryManager::touch_region(const std::string& name) {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    FileLock registry_lock = lock_registry(true);
    Registry registry = load_registry();

    auto it = registry.find(name);
    if (it == registry.end()) {
        throw MemoryRegionNotFoundError("Region " + name + " not found");
    }
    it->second.last_accessed = wall_time_seconds();
    it->second.access_count++;
    save_registry(registry);
    return it->second;
}

MappedRegion SharedMemoryManager::open_region(const std::string& name, LockType lock_type) {
    MemoryRegionInfo info = touch_region(name);
    const bool writable = lock_type != LockType::Read;

    // A concurrent delete_region removes the lock file; never resurrect it
    FileLock lock(info.lock_path, writable, config_.lock_timeout, false);

    int fd = ::open(info.path.c_str(), (writable ? O_RDWR : O_RDONLY) | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            throw MemoryRegionNotFoundError("Region " + name + " has no backing file");
        }
        throw SharedMemoryError(errno_message("Cannot open " + info.path));
    }

    int prot = writable ? (PROT_READ | PROT_WRITE) : PROT_READ;
    void* addr = ::mmap(nullptr, info.size, prot, MAP_SHARED, fd, 0);
    if (addr == MAP_FAILED) {
        std::string msg = errno_message("Cannot map " + info.path);
        ::close(fd);
        throw SharedMemoryError(msg);
    }

    return MappedRegion(std::move(info), std::move(lock), fd, addr, writable);
}

std::size_t SharedMemoryManager::encode(MappedRegion& region, std::size_t offset,
                                        const nlohmann::json& value, bool validate) const {
    const MemoryRegionInfo& info = region.info();
    if (validate && info.schema) {
        validate_schema(value, *info.schema);
    }

    const std::string payload = value.dump();
    if (offset > info.size || info.size - offset < HEADER_SIZE ||
        payload.size() > info.size - offset - HEADER_SIZE) {
        throw std::invalid_argument("Payload of " + std::to_string(payload.size()) +
                                    " bytes does not fit region " + info.name + " (" +
                                    std::to_string(info.size) + " bytes) at offset " +
                                    std::to_string(offset));
    }
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Payload exceeds 4 GiB");
    }

    uint8_t* base = region.data() + offset;
    const std::size_t room = info.size - offset - HEADER_SIZE;
    const std::size_t previous = std::min<std::size_t>(read_be32(base), room);

    write_be32(base, static_cast<uint32_t>(payload.size()));
    std::memcpy(base + HEADER_SIZE, payload.data(), payload.size());
    if (previous > payload.size()) {
        std::memset(base + HEADER_SIZE + payload.size(), 0, previous - payload.size());
    }

    return payload.size() + HEADER_SIZE;
}

std::optional<nlohmann::json> SharedMemoryManager::decode(const MappedRegion& region,
                                                          std::size_t offset) const {
    const std::string& name = region.info().name;
    const std::size_t size = region.size();
    if (offset > size || size - offset < HEADER_SIZE) {
        throw CorruptDataError("Header at offset " + std::to_string(offset) +
                               " exceeds region " + name);
    }

    const uint8_t* base = region.data() + offset;
    const uint32_t length = read_be32(base);
    if (length == 0) {
        return std::nullopt;
    }
    if (length > size - offset - HEADER_SIZE) {
        throw CorruptDataError("Payload length " + std::to_string(length) + " exceeds region " +
                               name);
    }

    const auto* begin = reinterpret_cast<const char*>(base + HEADER_SIZE);
    nlohmann::json value = nlohmann::json::parse(begin, begin + length, nullptr, false);
    if (value.is_discarded()) {
        throw CorruptDataError("Region " + name + " holds unparsable data");
    }
    return value;
}

std::size_t SharedMemoryManager::write_data(const std::string& name, const nlohmann::json& value,
                                            std::size_t offset, bool validate) {
    MappedRegion region = open_region(name, LockType::Write);
    return encode(region, offset, value, validate);
}

nlohmann::json SharedMemoryManager::read_data(const std::string& name, std::size_t offset) {
    MappedRegion region = open_region(name, LockType::Read);
    auto value = decode(region, offset);
    if (!value) {
        throw CorruptDataError("Region " + name + " has no data at offset " +
                               std::to_string(offset));
    }
    return std::move(*value);
}

std::size_t SharedMemoryManager::update_data(const std::string& name, const UpdateFn& update_fn,
                                             std::size_t offset, bool validate) {
    std::lock_guard<std::mutex> guard(update_mutex_);
    MappedRegion region = open_region(name, LockType::Exclusive);

    nlohmann::json current = decode(region, offset).value_or(nlohmann::json(nullptr));
    nlohmann::json updated = update_fn(current);
    return encode(region, offset, updated, validate);
}

}  // namespace arbperf
