#pragma once

#include <statecheck/command_sequence.hpp>
#include <statecheck/concepts.hpp>
#include <statecheck/value_tree.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace statecheck {

// Step of the sequence shrink search
struct shrink_step {
    enum class phase : std::uint8_t {
        delete_command,
        shrink_command
    };

    phase kind;
    std::size_t index;

    auto operator==(const shrink_step&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const shrink_step& step) -> std::ostream& {
    switch (step.kind) {
        case shrink_step::phase::delete_command:
            return os << "delete_command(" << step.index << ")";
        case shrink_step::phase::shrink_command:
            return os << "shrink_command(" << step.index << ")";
        default:
            return os << "unknown(" << step.index << ")";
    }
}

/**
 * @brief Shrink search over a generated command sequence
 *
 * Two greedy phases. First every position is tried for deletion, front to
 * back, as long as more than min_shrink_size commands remain. Then, if
 * command shrinking is enabled, every remaining command is simplified
 * locally through its own value tree. Deleted positions keep their index so
 * that complicate() can restore them in place.
 *
 * Survivors are replayed as generated. Deleting a command does not re-check
 * that the commands after it are still legal for the shortened history, so a
 * shrunk sequence may fail for a reason the model would never have
 * generated. Test authors should keep this in mind when reading a minimal
 * counterexample.
 */
template<state_machine M>
class sequence_value_tree final : public value_tree<command_sequence<M>> {
public:
    using command_type = typename M::command_type;

    sequence_value_tree(
        std::vector<value_tree_ptr<command_type>> elements,
        M model,
        bool shrink_commands,
        std::size_t min_shrink_size = 1
    )
        : _elements(std::move(elements))
        , _included(_elements.size(), true)
        , _model(std::move(model))
        , _shrink_commands(shrink_commands)
        , _min_shrink_size(std::max<std::size_t>(min_shrink_size, 1))
        , _num_included(_elements.size())
        , _step{shrink_step::phase::delete_command, 0} {
        for (const auto& element : _elements) {
            if (!element) {
                throw std::invalid_argument("sequence_value_tree requires non-null elements");
            }
        }
    }

    [[nodiscard]] auto current() const -> command_sequence<M> override {
        std::vector<command_type> commands;
        commands.reserve(_num_included);
        for (std::size_t i = 0; i < _elements.size(); ++i) {
            if (_included[i]) {
                commands.push_back(_elements[i]->current());
            }
        }
        M model = _model;
        model.reset();
        return command_sequence<M>(std::move(commands), std::move(model));
    }

    auto simplify() -> bool override {
        if (_step.kind == shrink_step::phase::delete_command) {
            auto index = _step.index;
            if (index >= _elements.size() || _num_included <= _min_shrink_size) {
                _step = {shrink_step::phase::shrink_command, 0};
            } else {
                _included[index] = false;
                --_num_included;
                _last_accepted = _step;
                _step = {shrink_step::phase::delete_command, index + 1};
                return true;
            }
        }

        if (_shrink_commands) {
            while (_step.index < _elements.size()) {
                auto index = _step.index;
                if (_included[index] && _elements[index]->simplify()) {
                    _last_accepted = _step;
                    return true;
                }
                _step.index = index + 1;
            }
        }

        // Exhausted: the last reduction is final and cannot be reverted
        _last_accepted.reset();
        return false;
    }

    auto complicate() -> bool override {
        if (!_last_accepted) {
            return false;
        }

        auto step = *_last_accepted;
        if (step.kind == shrink_step::phase::delete_command) {
            _included[step.index] = true;
            ++_num_included;
            _last_accepted.reset();
            return true;
        }

        if (_elements[step.index]->complicate()) {
            return true;
        }
        _last_accepted.reset();
        return false;
    }

    [[nodiscard]] auto size() const -> std::size_t { return _elements.size(); }
    [[nodiscard]] auto num_included() const -> std::size_t { return _num_included; }
    [[nodiscard]] auto is_included(std::size_t index) const -> bool { return _included.at(index); }
    [[nodiscard]] auto next_step() const -> const shrink_step& { return _step; }
    [[nodiscard]] auto last_accepted_step() const -> const std::optional<shrink_step>& { return _last_accepted; }

private:
    std::vector<value_tree_ptr<command_type>> _elements;
    std::vector<bool> _included;
    M _model;
    bool _shrink_commands;
    std::size_t _min_shrink_size;
    std::size_t _num_included;
    shrink_step _step;
    std::optional<shrink_step> _last_accepted;
};

} // namespace statecheck
