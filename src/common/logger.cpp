#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace nestkv {

void init_default_logger(spdlog::level::level_enum level) {
    // Idempotent: tests and the CLI may both initialize.
    if (auto existing = spdlog::get("nestkv")) {
        existing->set_level(level);
        spdlog::set_default_logger(existing);
        return;
    }

    auto logger = spdlog::stderr_color_mt("nestkv");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::optional<spdlog::level::level_enum> try_parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    return try_parse_log_level(s).value_or(spdlog::level::info);
}

} // namespace nestkv
