// ArbPerf - Logging
// Named spdlog loggers per component, configured from LoggingConfig

#ifndef ARBPERF_LOGGING_HPP
#define ARBPERF_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config.hpp"

namespace arbperf::logging {

// Apply level, pattern and optional rotating file sink. Registered arbperf
// loggers are replaced; instances already handed out keep their old settings.
void init(const LoggingConfig& config);

// Shared logger named "arbperf.<component>", created on first use
std::shared_ptr<spdlog::logger> get(const std::string& component);

}  // namespace arbperf::logging

#endif  // ARBPERF_LOGGING_HPP
