#pragma once

#include <statecheck/command_generator.hpp>
#include <statecheck/concepts.hpp>
#include <statecheck/config.hpp>
#include <statecheck/exceptions.hpp>
#include <statecheck/sequence_value_tree.hpp>

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace statecheck {

/**
 * @brief Builds candidate command sequences by walking a model clone
 *
 * Each new tree draws its length uniformly from [min_size, max_size] and
 * asks the model for the commands legal in its current state before every
 * draw, so generated sequences only contain commands the model allows at
 * that point.
 */
template<state_machine M>
class sequence_strategy {
public:
    using command_type = typename M::command_type;

    sequence_strategy(
        M model,
        std::size_t min_size,
        std::size_t max_size,
        bool shrink_commands = false,
        std::size_t min_shrink_size = 1
    )
        : _model(std::move(model))
        , _min_size(min_size)
        , _max_size(max_size)
        , _shrink_commands(shrink_commands)
        , _min_shrink_size(min_shrink_size) {
        if (_max_size < _min_size) {
            throw configuration_exception(
                "max_sequence_size (" + std::to_string(_max_size) +
                ") must not be smaller than min_sequence_size (" +
                std::to_string(_min_size) + ")");
        }
    }

    sequence_strategy(M model, const config& cfg)
        : sequence_strategy(
            std::move(model),
            cfg.min_sequence_size,
            cfg.max_sequence_size,
            cfg.shrink_commands,
            cfg.min_shrink_size) {}

    /**
     * @throws generation_exception if the model yields an unusable weight list
     */
    [[nodiscard]] auto new_tree(rng_type& rng) const -> std::unique_ptr<sequence_value_tree<M>> {
        std::uniform_int_distribution<std::size_t> length_dist(_min_size, _max_size);
        auto length = length_dist(rng);

        M model = _model;
        model.reset();

        std::vector<value_tree_ptr<command_type>> elements;
        elements.reserve(length);
        while (elements.size() < length) {
            command_generator<command_type> generator(model.commands());
            auto element = generator.generate(rng);
            if (!element) {
                throw generation_exception(
                    "command strategy produced no value at position " + std::to_string(elements.size()));
            }
            model.next_state(element->current());
            elements.push_back(std::move(element));
        }

        model.reset();
        return std::make_unique<sequence_value_tree<M>>(
            std::move(elements), std::move(model), _shrink_commands, _min_shrink_size);
    }

    [[nodiscard]] auto min_size() const -> std::size_t { return _min_size; }
    [[nodiscard]] auto max_size() const -> std::size_t { return _max_size; }

private:
    M _model;
    std::size_t _min_size;
    std::size_t _max_size;
    bool _shrink_commands;
    std::size_t _min_shrink_size;
};

} // namespace statecheck
