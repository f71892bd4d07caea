#pragma once

#include <statecheck/exceptions.hpp>
#include <statecheck/types.hpp>
#include <statecheck/value_tree.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace statecheck {

// One legal command shape and how often it should be sampled relative to the others
template<typename Command>
struct weighted_strategy {
    weight_type weight;
    strategy<Command> generator;
};

/**
 * @brief State-conditioned weighted command sampler
 *
 * Built from the weighted list a model returns for its current state. The
 * list is turned into a cumulative distribution and every draw uses the
 * caller's random source, so a seed fully determines the choices.
 */
template<typename Command>
class command_generator {
public:
    /**
     * @throws generation_exception if the list is empty, a weight is not
     *         positive, or the total weight overflows
     */
    explicit command_generator(std::vector<weighted_strategy<Command>> choices)
        : _choices(std::move(choices)) {
        if (_choices.empty()) {
            throw generation_exception("model returned no legal commands");
        }

        _cumulative.reserve(_choices.size());
        std::uint64_t total = 0;
        for (std::size_t i = 0; i < _choices.size(); ++i) {
            auto weight = _choices[i].weight;
            if (weight <= 0) {
                throw generation_exception(
                    "command weight at position " + std::to_string(i) +
                    " must be positive, got " + std::to_string(weight));
            }
            auto unsigned_weight = static_cast<std::uint64_t>(weight);
            if (total > std::numeric_limits<std::uint64_t>::max() - unsigned_weight) {
                throw generation_exception("total command weight overflows");
            }
            total += unsigned_weight;
            _cumulative.push_back(total);
        }
    }

    // Index of the next sampled choice
    [[nodiscard]] auto pick(rng_type& rng) const -> std::size_t {
        std::uniform_int_distribution<std::uint64_t> dist(0, _cumulative.back() - 1);
        auto ticket = dist(rng);
        auto it = std::upper_bound(_cumulative.begin(), _cumulative.end(), ticket);
        return static_cast<std::size_t>(std::distance(_cumulative.begin(), it));
    }

    // Sample one choice and generate a shrinkable command from it
    [[nodiscard]] auto generate(rng_type& rng) const -> value_tree_ptr<Command> {
        return _choices[pick(rng)].generator.new_tree(rng);
    }

    [[nodiscard]] auto size() const -> std::size_t { return _choices.size(); }

    [[nodiscard]] auto total_weight() const -> std::uint64_t { return _cumulative.back(); }

private:
    std::vector<weighted_strategy<Command>> _choices;
    std::vector<std::uint64_t> _cumulative;
};

} // namespace statecheck
