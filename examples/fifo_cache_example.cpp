/**
 * Example: Stateful test of a bounded FIFO cache
 *
 * Runs the same cache model against two implementations. The correct cache
 * passes every trial. The buggy cache moves overwritten keys to the back of
 * the eviction order, which the model catches; the failing command sequence
 * is then shrunk and printed together with its JSON report.
 */

#include "fifo_cache.hpp"

#include <statecheck/statecheck.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>

using namespace statecheck;
using namespace statecheck::examples;

namespace {
    constexpr std::size_t max_cache_size = 10;
    constexpr std::size_t max_command_sequence_size = 100;
    constexpr std::size_t max_shrink_iterations = 100;
    constexpr std::uint64_t example_seed = 20211117;

    auto example_config() -> config {
        config cfg;
        cfg.max_sequence_size = max_command_sequence_size;
        cfg.max_shrink_iterations = max_shrink_iterations;
        cfg.seed = example_seed;
        return cfg;
    }
}

int main() {
    try {
        console_logger logger(log_level::info);

        std::cout << "=== Correct FIFO cache ===\n";
        auto correct = execute_plan(example_config(), fifo_cache_model(max_cache_size),
            [] { return cache_system<fifo_cache>(max_cache_size); }, logger);
        std::cout << "Outcome: " << correct.outcome() << " after " << correct.trials_run() << " trials\n\n";

        std::cout << "=== Buggy FIFO cache ===\n";
        auto buggy = execute_plan(example_config(), fifo_cache_model(max_cache_size),
            [] { return cache_system<buggy_fifo_cache>(max_cache_size); }, logger);
        std::cout << "Outcome: " << buggy.outcome() << " after " << buggy.trials_run() << " trials\n";

        if (buggy.is_failed()) {
            const auto& failure = buggy.failure();
            std::cout << failure << "\n";
            std::cout << "Reproduce the original sequence with trial seed " << failure.seed << "\n";
        }
        std::cout << to_json_string(buggy) << "\n";

        return correct.is_passed() && buggy.is_failed() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Example failed: " << e.what() << "\n";
        return 1;
    }
}
