#pragma once

#include <statecheck/command_sequence.hpp>
#include <statecheck/concepts.hpp>
#include <statecheck/types.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace statecheck {

enum class plan_outcome : std::uint8_t {
    passed,
    failed,
    aborted
};

inline auto operator<<(std::ostream& os, plan_outcome outcome) -> std::ostream& {
    switch (outcome) {
        case plan_outcome::passed:  return os << "passed";
        case plan_outcome::failed:  return os << "failed";
        case plan_outcome::aborted: return os << "aborted";
        default:                    return os << "unknown";
    }
}

// Error captured from a failing run of a command sequence
struct captured_failure {
    failure_kind kind;
    std::string message;
    std::exception_ptr error;
};

/**
 * @brief Minimal counterexample found for a failing trial
 *
 * `error` is the failure of the minimal sequence. Shrinking accepts any
 * failure as a reproduction, so it may differ from the failure of the
 * originally generated sequence, which is kept in `original_kind` and
 * `original_message`.
 */
template<state_machine M>
struct minimal_failure {
    command_sequence<M> sequence;
    command_sequence<M> original_sequence;
    std::size_t trial;
    std::uint64_t seed;
    std::size_t shrink_iterations;
    failure_kind kind;
    std::string message;
    std::exception_ptr error;
    failure_kind original_kind;
    std::string original_message;

    [[nodiscard]] auto failure_changed() const -> bool {
        return kind != original_kind || message != original_message;
    }

    [[noreturn]] auto rethrow() const -> void {
        std::rethrow_exception(error);
    }
};

template<state_machine M>
auto operator<<(std::ostream& os, const minimal_failure<M>& failure) -> std::ostream& {
    return os << "Found minimal failing case " << failure.sequence
              << " (" << failure.sequence.size() << " of " << failure.original_sequence.size()
              << " commands, trial " << failure.trial
              << ", seed " << failure.seed
              << ", " << failure.shrink_iterations << " shrink iterations): "
              << failure.message;
}

/**
 * @brief Outcome of a stateful test run
 */
template<state_machine M>
class plan_result {
public:
    static auto passed(std::size_t trials_run, std::uint64_t seed) -> plan_result {
        return plan_result(plan_outcome::passed, trials_run, seed, std::nullopt, {});
    }

    static auto failed(std::size_t trials_run, std::uint64_t seed, minimal_failure<M> failure) -> plan_result {
        return plan_result(plan_outcome::failed, trials_run, seed, std::move(failure), {});
    }

    static auto aborted(std::size_t trials_run, std::uint64_t seed, std::string reason) -> plan_result {
        return plan_result(plan_outcome::aborted, trials_run, seed, std::nullopt, std::move(reason));
    }

    [[nodiscard]] auto outcome() const -> plan_outcome { return _outcome; }
    [[nodiscard]] auto is_passed() const -> bool { return _outcome == plan_outcome::passed; }
    [[nodiscard]] auto is_failed() const -> bool { return _outcome == plan_outcome::failed; }
    [[nodiscard]] auto is_aborted() const -> bool { return _outcome == plan_outcome::aborted; }

    // Number of trials that were started
    [[nodiscard]] auto trials_run() const -> std::size_t { return _trials_run; }

    // Base seed the trial seeds were derived from
    [[nodiscard]] auto seed() const -> std::uint64_t { return _seed; }

    /**
     * @throws std::logic_error if the run did not fail
     */
    [[nodiscard]] auto failure() const -> const minimal_failure<M>& {
        if (!_failure) {
            throw std::logic_error("plan_result holds no failure (outcome is not failed)");
        }
        return *_failure;
    }

    [[nodiscard]] auto abort_reason() const -> const std::string& { return _abort_reason; }

private:
    plan_result(
        plan_outcome outcome,
        std::size_t trials_run,
        std::uint64_t seed,
        std::optional<minimal_failure<M>> failure,
        std::string abort_reason
    )
        : _outcome(outcome)
        , _trials_run(trials_run)
        , _seed(seed)
        , _failure(std::move(failure))
        , _abort_reason(std::move(abort_reason)) {}

    plan_outcome _outcome;
    std::size_t _trials_run;
    std::uint64_t _seed;
    std::optional<minimal_failure<M>> _failure;
    std::string _abort_reason;
};

} // namespace statecheck
