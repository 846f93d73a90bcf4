// ArbPerf - Error Types
// Exception hierarchy shared by the scheduler, pool, I/O and shared-memory layers

#ifndef ARBPERF_ERRORS_HPP
#define ARBPERF_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace arbperf {

// Base for every error raised by this library (programmer errors such as
// duplicate names or oversized payloads use std::invalid_argument instead)
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Shared memory
// =============================================================================

class SharedMemoryError : public Error {
public:
    explicit SharedMemoryError(const std::string& msg) : Error(msg) {}
};

// Timed out acquiring a region or registry lock file
class LockAcquisitionError : public SharedMemoryError {
public:
    explicit LockAcquisitionError(const std::string& msg) : SharedMemoryError(msg) {}
};

class MemoryRegionNotFoundError : public SharedMemoryError {
public:
    explicit MemoryRegionNotFoundError(const std::string& msg) : SharedMemoryError(msg) {}
};

class SchemaValidationError : public SharedMemoryError {
public:
    explicit SchemaValidationError(const std::string& msg) : SharedMemoryError(msg) {}
};

// Malformed length header, unparsable payload, or unreadable registry
class CorruptDataError : public SharedMemoryError {
public:
    explicit CorruptDataError(const std::string& msg) : SharedMemoryError(msg) {}
};

// Expected state version did not match the stored one
class VersionConflictError : public Error {
public:
    VersionConflictError(const std::string& msg, uint64_t expected, uint64_t actual)
        : Error(msg), expected_(expected), actual_(actual) {}

    [[nodiscard]] uint64_t expected() const noexcept { return expected_; }
    [[nodiscard]] uint64_t actual() const noexcept { return actual_; }

private:
    uint64_t expected_;
    uint64_t actual_;
};

// =============================================================================
// Tasks and I/O
// =============================================================================

class TaskTimeoutError : public Error {
public:
    explicit TaskTimeoutError(const std::string& msg) : Error(msg) {}
};

// Raised in place of a task body exception that does not derive from std::exception
class TaskExecutionError : public Error {
public:
    explicit TaskExecutionError(const std::string& msg) : Error(msg) {}
};

// Task or I/O operation abandoned because its owner was stopped
class CancelledError : public Error {
public:
    explicit CancelledError(const std::string& msg) : Error(msg) {}
};

}  // namespace arbperf

#endif  // ARBPERF_ERRORS_HPP
