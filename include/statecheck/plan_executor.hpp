#pragma once

#include <statecheck/command_sequence.hpp>
#include <statecheck/concepts.hpp>
#include <statecheck/config.hpp>
#include <statecheck/console_logger.hpp>
#include <statecheck/exceptions.hpp>
#include <statecheck/logger.hpp>
#include <statecheck/plan_result.hpp>
#include <statecheck/sequence_strategy.hpp>
#include <statecheck/sequence_value_tree.hpp>
#include <statecheck/types.hpp>

#include <folly/Executor.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace statecheck {

/**
 * @brief Runs trials of a model against freshly built systems under test
 *
 * Every trial generates one command sequence from its own seed and runs it
 * against a new system from the factory. The first failing trial (by trial
 * index) is shrunk: candidates from the sequence's shrink search are run
 * against new systems, kept while they still fail and reverted once they
 * pass, until the search is exhausted or the iteration budget is spent.
 *
 * Any failure counts as a reproduction while shrinking, so the reported
 * error can differ from the one that started the shrink. The original error
 * is kept in the result and the change is logged as a warning.
 *
 * With worker_threads > 1 the factory and the model's copy constructor are
 * called from several threads at once.
 */
template<state_machine M, system_under_test_factory<M> F, diagnostic_logger Logger = console_logger>
class plan_executor {
public:
    using command_type = typename M::command_type;
    using result_type = typename M::result_type;
    using sequence_type = command_sequence<M>;
    using tree_type = sequence_value_tree<M>;

    /**
     * @throws configuration_exception if the configuration is invalid
     */
    plan_executor(config cfg, M model, F factory, Logger& logger)
        : _config(validated(std::move(cfg)))
        , _strategy(std::move(model), _config)
        , _factory(std::move(factory))
        , _logger(logger) {}

    auto run() -> plan_result<M> {
        auto base_seed = _config.seed ? *_config.seed : random_seed();
        _logger.log(log_level::info, "Starting stateful test run", {
            {"seed", std::to_string(base_seed)},
            {"trials", std::to_string(_config.trials)},
            {"worker_threads", std::to_string(_config.worker_threads)}
        });

        if (_config.worker_threads > 1) {
            return run_parallel(base_seed);
        }
        return run_sequential(base_seed);
    }

    // Run one sequence against a new system and capture how it failed, if it did
    auto try_run(sequence_type sequence) -> std::optional<captured_failure> {
        auto handle = _factory();
        try {
            sequence.run(detail::deref(handle));
        } catch (const postcondition_exception& e) {
            return captured_failure{failure_kind::postcondition, e.what(), std::current_exception()};
        } catch (const system_under_test_exception& e) {
            return captured_failure{failure_kind::system_under_test, e.what(), std::current_exception()};
        }
        return std::nullopt;
    }

private:
    struct trial_failure {
        std::unique_ptr<tree_type> tree;
        captured_failure error;
    };

    struct trial_outcome {
        std::size_t trial;
        std::uint64_t seed;
        bool skipped{false};
        std::optional<trial_failure> failure{};
        std::optional<std::string> abort_reason{};
    };

    config _config;
    sequence_strategy<M> _strategy;
    F _factory;
    Logger& _logger;

    static auto validated(config cfg) -> config {
        validate_config(cfg);
        return cfg;
    }

    static auto random_seed() -> std::uint64_t {
        std::random_device device;
        return (static_cast<std::uint64_t>(device()) << 32) | static_cast<std::uint64_t>(device());
    }

    auto run_trial(std::size_t trial, std::uint64_t base_seed) -> trial_outcome {
        trial_outcome outcome{trial, derive_trial_seed(base_seed, trial)};
        rng_type rng(outcome.seed);

        std::unique_ptr<tree_type> tree;
        try {
            tree = _strategy.new_tree(rng);
        } catch (const generation_exception& e) {
            outcome.abort_reason = e.what();
            return outcome;
        }

        auto error = try_run(tree->current());
        if (error) {
            outcome.failure = trial_failure{std::move(tree), std::move(*error)};
        }
        return outcome;
    }

    auto run_sequential(std::uint64_t base_seed) -> plan_result<M> {
        for (std::size_t trial = 0; trial < _config.trials; ++trial) {
            auto outcome = run_trial(trial, base_seed);
            if (auto result = conclude(std::move(outcome), base_seed)) {
                return std::move(*result);
            }
        }
        _logger.log(log_level::info, "All trials passed", {{"trials", std::to_string(_config.trials)}});
        return plan_result<M>::passed(_config.trials, base_seed);
    }

    auto run_parallel(std::uint64_t base_seed) -> plan_result<M> {
        folly::CPUThreadPoolExecutor executor(_config.worker_threads);
        std::atomic<std::size_t> first_conclusive{_config.trials};

        std::vector<folly::Future<trial_outcome>> futures;
        futures.reserve(_config.trials);
        for (std::size_t trial = 0; trial < _config.trials; ++trial) {
            futures.push_back(folly::via(folly::getKeepAliveToken(executor), [this, trial, base_seed, &first_conclusive]() {
                if (trial > first_conclusive.load()) {
                    return trial_outcome{trial, derive_trial_seed(base_seed, trial), true};
                }
                auto outcome = run_trial(trial, base_seed);
                if (outcome.failure || outcome.abort_reason) {
                    auto seen = first_conclusive.load();
                    while (trial < seen && !first_conclusive.compare_exchange_weak(seen, trial)) {
                    }
                }
                return outcome;
            }));
        }

        auto results = folly::collectAll(std::move(futures)).get();
        executor.join();

        // Trial order decides, not completion order, so a seed reproduces the same report
        for (auto& result : results) {
            auto outcome = std::move(result.value());
            if (outcome.skipped) {
                continue;
            }
            if (auto conclusion = conclude(std::move(outcome), base_seed)) {
                return std::move(*conclusion);
            }
        }
        _logger.log(log_level::info, "All trials passed", {{"trials", std::to_string(_config.trials)}});
        return plan_result<M>::passed(_config.trials, base_seed);
    }

    // Turns a failing or aborted trial into the final result
    auto conclude(trial_outcome outcome, std::uint64_t base_seed) -> std::optional<plan_result<M>> {
        auto trial_str = std::to_string(outcome.trial);
        auto seed_str = std::to_string(outcome.seed);

        if (outcome.abort_reason) {
            _logger.log(log_level::error, "Trial aborted during command generation", {
                {"trial", trial_str},
                {"seed", seed_str},
                {"reason", *outcome.abort_reason}
            });
            return plan_result<M>::aborted(outcome.trial + 1, base_seed, std::move(*outcome.abort_reason));
        }

        if (!outcome.failure) {
            return std::nullopt;
        }

        _logger.log(log_level::warning, "Trial failed, shrinking", {
            {"trial", trial_str},
            {"seed", seed_str},
            {"length", std::to_string(outcome.failure->tree->num_included())},
            {"error", outcome.failure->error.message}
        });

        auto failure = shrink(std::move(*outcome.failure), outcome.trial, outcome.seed);

        std::ostringstream report;
        report << failure;
        _logger.log(log_level::error, report.str(), {
            {"trial", trial_str},
            {"seed", seed_str},
            {"kind", to_string(failure.kind)}
        });

        return plan_result<M>::failed(outcome.trial + 1, base_seed, std::move(failure));
    }

    auto shrink(trial_failure failure, std::size_t trial, std::uint64_t seed) -> minimal_failure<M> {
        auto& tree = *failure.tree;
        auto original = tree.current();
        auto best = original;
        auto best_error = failure.error;

        std::size_t iterations = 0;
        while (iterations < _config.max_shrink_iterations && tree.simplify()) {
            ++iterations;
            auto candidate = tree.current();
            if (auto error = try_run(candidate)) {
                _logger.log(log_level::debug, "Shrink step kept", {
                    {"iteration", std::to_string(iterations)},
                    {"length", std::to_string(candidate.size())}
                });
                best = std::move(candidate);
                best_error = std::move(*error);
            } else if (!tree.complicate()) {
                _logger.log(log_level::warning, "Shrink step passed but could not be reverted", {
                    {"iteration", std::to_string(iterations)},
                    {"step", to_string(tree.next_step())}
                });
            }
        }

        if (iterations == _config.max_shrink_iterations) {
            _logger.log(log_level::info, "Shrink iteration budget exhausted", {
                {"max_shrink_iterations", std::to_string(_config.max_shrink_iterations)}
            });
        }

        minimal_failure<M> result{
            std::move(best),
            std::move(original),
            trial,
            seed,
            iterations,
            best_error.kind,
            std::move(best_error.message),
            best_error.error,
            failure.error.kind,
            failure.error.message
        };

        if (result.failure_changed()) {
            _logger.log(log_level::warning, "Shrinking changed the failure; the minimal case may show a different problem", {
                {"original_kind", to_string(result.original_kind)},
                {"original_error", result.original_message},
                {"minimal_kind", to_string(result.kind)},
                {"minimal_error", result.message}
            });
        }
        return result;
    }
};

/**
 * @brief Run a stateful property test
 *
 * @param cfg Run configuration
 * @param model Reference model; copied for every trial
 * @param factory Builds a new system under test for every run
 * @param logger Destination for progress and the final report
 * @throws configuration_exception if `cfg` is invalid
 */
template<state_machine M, system_under_test_factory<M> F, diagnostic_logger Logger>
auto execute_plan(config cfg, M model, F factory, Logger& logger) -> plan_result<M> {
    plan_executor<M, F, Logger> executor(std::move(cfg), std::move(model), std::move(factory), logger);
    return executor.run();
}

// Same as above, logging to the console at cfg.verbosity
template<state_machine M, system_under_test_factory<M> F>
auto execute_plan(config cfg, M model, F factory) -> plan_result<M> {
    console_logger logger(cfg.verbosity);
    return execute_plan(std::move(cfg), std::move(model), std::move(factory), logger);
}

// Rebuild the sequence a trial generated from its reported seed
template<state_machine M>
auto regenerate_sequence(const config& cfg, M model, std::uint64_t trial_seed) -> command_sequence<M> {
    validate_config(cfg);
    sequence_strategy<M> strategy(std::move(model), cfg);
    rng_type rng(trial_seed);
    return strategy.new_tree(rng)->current();
}

} // namespace statecheck
