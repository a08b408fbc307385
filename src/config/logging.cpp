#include "testbed/logging.hpp"
#include "testbed/platform.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace testbed {

namespace {

constexpr const char* kLoggerName = "testbed";

std::optional<spdlog::level::level_enum> to_spdlog_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    return to_spdlog_level(level).has_value();
}

std::string effective_log_level(const std::string& configured) {
    if (auto env = get_env("TESTBED_LOG_LEVEL")) {
        if (is_valid_log_level(*env)) return *env;
    }
    return is_valid_log_level(configured) ? configured : "info";
}

void init_logging(const std::string& level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    std::string effective = effective_log_level(level);
    spdlog::set_level(*to_spdlog_level(effective));

    if (auto env = get_env("TESTBED_LOG_LEVEL")) {
        if (!is_valid_log_level(*env)) {
            spdlog::warn("ignoring invalid TESTBED_LOG_LEVEL '{}'", *env);
        }
    }
}

} // namespace testbed
