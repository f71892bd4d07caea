#pragma once

#include <statecheck/exceptions.hpp>
#include <statecheck/logger.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace statecheck {

/**
 * @brief Configuration of a stateful test run
 */
struct config {
    // Minimum number of commands in a generated sequence
    std::size_t min_sequence_size{1};

    // Maximum number of commands in a generated sequence
    std::size_t max_sequence_size{100};

    // Once no more commands can be deleted from a failing sequence, also try
    // to simplify the arguments of the individual commands
    bool shrink_commands{false};

    // Base seed; each trial derives its own seed from it. A random seed is
    // drawn (and logged) when unset.
    std::optional<std::uint64_t> seed{};

    // Number of independent trials
    std::size_t trials{256};

    // Upper bound on candidate sequences executed while shrinking one failure
    std::size_t max_shrink_iterations{10000};

    // The delete phase never leaves fewer commands than this
    std::size_t min_shrink_size{1};

    // Trials are spread over this many threads; shrinking stays on the caller
    std::size_t worker_threads{1};

    // Minimum level of the default console logger
    log_level verbosity{log_level::info};
};

inline auto validate_config(const config& cfg) -> void {
    if (cfg.min_sequence_size == 0) {
        throw configuration_exception("min_sequence_size must be greater than 0");
    }

    if (cfg.max_sequence_size < cfg.min_sequence_size) {
        throw configuration_exception(
            "max_sequence_size (" + std::to_string(cfg.max_sequence_size) +
            ") must not be smaller than min_sequence_size (" +
            std::to_string(cfg.min_sequence_size) + ")");
    }

    if (cfg.trials == 0) {
        throw configuration_exception("trials must be greater than 0");
    }

    if (cfg.min_shrink_size == 0) {
        throw configuration_exception("min_shrink_size must be greater than 0");
    }

    if (cfg.worker_threads == 0) {
        throw configuration_exception("worker_threads must be greater than 0");
    }
}

} // namespace statecheck
