/// @file src/core/logging.cpp
/// @brief Shared spdlog logger.

#include "chit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace chit::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stdout_color_mt(LOGGER_NAME);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

std::optional<spdlog::level::level_enum>
parse_level(std::string_view name) noexcept {
    if (name == "trace")                      return spdlog::level::trace;
    if (name == "debug")                      return spdlog::level::debug;
    if (name == "info")                       return spdlog::level::info;
    if (name == "warn" || name == "warning")  return spdlog::level::warn;
    if (name == "error")                      return spdlog::level::err;
    if (name == "critical")                   return spdlog::level::critical;
    if (name == "off")                        return spdlog::level::off;
    return std::nullopt;
}

bool init(std::string_view level) {
    auto lg = logger();
    const auto parsed = parse_level(level);
    if (!parsed) {
        lg->warn("unknown log level '{}', keeping '{}'",
                 level, spdlog::level::to_string_view(lg->level()));
        return false;
    }
    lg->set_level(*parsed);
    lg->flush_on(spdlog::level::warn);
    return true;
}

} // namespace chit::log
