#pragma once

/// @file include/chit/logging.hpp
/// @brief Process-wide spdlog logger for the geometry service.
///
/// Every module logs through the single named logger `chit`. It is created
/// lazily with a colour stdout sink, so library code and tests can log
/// without explicit initialisation; the executable calls `init()` once with
/// the configured level.

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chit::log {

/// Name of the shared logger.
inline constexpr const char* LOGGER_NAME = "chit";

/// The shared logger (created on first use).
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off".
[[nodiscard]] std::optional<spdlog::level::level_enum>
parse_level(std::string_view name) noexcept;

/// Set the level and pattern of the shared logger. Unknown level names keep
/// the current level and return false.
bool init(std::string_view level);

} // namespace chit::log
