#pragma once

#include <statecheck/exceptions.hpp>

#include <concepts>
#include <cstdint>
#include <ostream>
#include <random>
#include <sstream>
#include <string>

namespace statecheck {

// The single deterministic random source threaded through generation
using rng_type = std::mt19937_64;

// Relative sampling weight of a command shape. Signed so that a model
// returning a negative weight is reported instead of wrapping around.
using weight_type = std::int64_t;

// Values that can be written to an output stream for failure reports
template<typename T>
concept printable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

// Render a printable value the way it appears in failure reports
template<printable T>
auto to_string(const T& value) -> std::string {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Build a postcondition failure from the offending command and both results
template<printable Command, printable Expected, printable Actual>
auto make_postcondition_exception(const Command& command, const Expected& expected, const Actual& actual)
    -> postcondition_exception {
    return postcondition_exception(to_string(command), to_string(expected), to_string(actual));
}

// Kind of error that made a trial fail
enum class failure_kind : std::uint8_t {
    postcondition,
    system_under_test
};

inline auto operator<<(std::ostream& os, failure_kind kind) -> std::ostream& {
    switch (kind) {
        case failure_kind::postcondition:
            return os << "postcondition";
        case failure_kind::system_under_test:
            return os << "system_under_test";
        default:
            return os << "unknown";
    }
}

// Derive an independent seed for trial `index` from the base seed (splitmix64)
inline auto derive_trial_seed(std::uint64_t base_seed, std::uint64_t index) -> std::uint64_t {
    std::uint64_t z = base_seed + (index + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // namespace statecheck
