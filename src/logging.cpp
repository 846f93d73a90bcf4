// ArbPerf - Logging Implementation

#include "arbperf/logging.hpp"

#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace arbperf::logging {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = LoggingConfig{}.pattern;
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// Caller holds state().mutex
void ensure_default_sink(LoggingState& s) {
    if (s.sinks.empty()) {
        s.sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
}

// Caller holds state().mutex
std::shared_ptr<spdlog::logger> make_logger(LoggingState& s, const std::string& name) {
    ensure_default_sink(s);
    auto lg = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    lg->set_level(s.level);
    lg->set_pattern(s.pattern);
    return lg;
}

}  // namespace

void init(const LoggingConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.level = spdlog::level::from_str(config.level);
    s.pattern = config.pattern;

    s.sinks.clear();
    ensure_default_sink(s);
    if (config.file) {
        s.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *config.file, config.max_file_size, config.max_files));
    }

    // Loggers created before init are replaced, never mutated: threads holding
    // the old instance keep logging to its old sinks
    std::vector<std::string> names;
    spdlog::apply_all([&names](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->name().rfind("arbperf.", 0) == 0) names.push_back(lg->name());
    });
    for (const auto& name : names) {
        spdlog::drop(name);
        spdlog::register_logger(make_logger(s, name));
    }
}

std::shared_ptr<spdlog::logger> get(const std::string& component) {
    const std::string name = "arbperf." + component;
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto lg = make_logger(s, name);
    spdlog::register_logger(lg);
    return lg;
}

}  // namespace arbperf::logging
