#pragma once

#include <concepts>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace statecheck {

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
        case log_level::trace:    return os << "trace";
        case log_level::debug:    return os << "debug";
        case log_level::info:     return os << "info";
        case log_level::warning:  return os << "warning";
        case log_level::error:    return os << "error";
        case log_level::critical: return os << "critical";
        default:                  return os << "unknown";
    }
}

using key_value_list = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept for structured logging
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    key_value_list key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;

    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

// Logger that discards everything, for quiet test runs
class noop_logger {
public:
    auto log([[maybe_unused]] log_level level, [[maybe_unused]] std::string_view message) -> void {}

    auto log(
        [[maybe_unused]] log_level level,
        [[maybe_unused]] std::string_view message,
        [[maybe_unused]] const key_value_list& key_value_pairs
    ) -> void {}

    auto trace([[maybe_unused]] std::string_view message) -> void {}
    auto debug([[maybe_unused]] std::string_view message) -> void {}
    auto info([[maybe_unused]] std::string_view message) -> void {}
    auto warning([[maybe_unused]] std::string_view message) -> void {}
    auto error([[maybe_unused]] std::string_view message) -> void {}
    auto critical([[maybe_unused]] std::string_view message) -> void {}
};

static_assert(diagnostic_logger<noop_logger>, "noop_logger must satisfy diagnostic_logger concept");

} // namespace statecheck
