#pragma once

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace nestkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger.  Logs go to stderr so that stdout
// carries nothing but command output.
// Call once at program start before any logging; later calls only change the
// level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::warn);

// Parse a log-level string ("trace", "debug", "info", …, "off").
// Returns std::nullopt on unrecognised input.
[[nodiscard]] std::optional<spdlog::level::level_enum> try_parse_log_level(const std::string& s);

// As above, but returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace nestkv
