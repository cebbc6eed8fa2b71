#pragma once

#include <concepts>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace stepwise {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

inline auto operator<<(std::ostream& os, log_level level) -> std::ostream& {
    switch (level) {
        case log_level::trace:
            return os << "TRACE";
        case log_level::debug:
            return os << "DEBUG";
        case log_level::info:
            return os << "INFO";
        case log_level::warning:
            return os << "WARNING";
        case log_level::error:
            return os << "ERROR";
        case log_level::critical:
            return os << "CRITICAL";
        default:
            return os << "UNKNOWN";
    }
}

// Structured fields attached to a log record
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept for structured logging
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields fields
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, fields) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;

    { logger.debug(message, fields) } -> std::same_as<void>;
    { logger.info(message, fields) } -> std::same_as<void>;
    { logger.warning(message, fields) } -> std::same_as<void>;
    { logger.error(message, fields) } -> std::same_as<void>;
};

} // namespace stepwise
