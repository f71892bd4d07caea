#pragma once

#include <statecheck/logger.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace statecheck {

// Thread-safe console logger. Messages at error level and above go to the
// error stream, everything else to the output stream.
class console_logger {
public:
    explicit console_logger(
        log_level min_level = log_level::info,
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr
    )
        : _min_level(min_level)
        , _out(&out)
        , _err(&err) {}

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(log_level level, std::string_view message, const key_value_list& key_value_pairs) -> void {
        if (level < _min_level.load(std::memory_order_relaxed)) {
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " [statecheck] "
               << level_to_string(level) << ": "
               << message;

        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }

        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto critical(std::string_view message) -> void { log(log_level::critical, message); }

    auto set_min_level(log_level level) -> void {
        _min_level.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level.load(std::memory_order_relaxed);
    }

private:
    std::atomic<log_level> _min_level;
    std::ostream* _out;
    std::ostream* _err;
    mutable std::mutex _mutex;

    [[nodiscard]] static auto level_to_string(log_level level) -> std::string_view {
        switch (level) {
            case log_level::trace:    return "TRACE";
            case log_level::debug:    return "DEBUG";
            case log_level::info:     return "INFO";
            case log_level::warning:  return "WARNING";
            case log_level::error:    return "ERROR";
            case log_level::critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return *_err;
        }
        return *_out;
    }

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace statecheck
