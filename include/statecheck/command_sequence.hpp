#pragma once

#include <statecheck/concepts.hpp>
#include <statecheck/exceptions.hpp>
#include <statecheck/types.hpp>

#include <cstddef>
#include <exception>
#include <ostream>
#include <utility>
#include <vector>

namespace statecheck {

/**
 * @brief Ordered commands paired with the model that replays them
 *
 * run() executes the commands one at a time against a system under test,
 * checking every result against the model before advancing it. The first
 * failure ends the run: later commands were generated assuming the earlier
 * ones succeeded.
 */
template<state_machine M>
class command_sequence {
public:
    using command_type = typename M::command_type;
    using result_type = typename M::result_type;

    command_sequence(std::vector<command_type> commands, M model)
        : _commands(std::move(commands))
        , _model(std::move(model)) {}

    /**
     * @throws system_under_test_exception if the system throws while running a command
     * @throws postcondition_exception if the model rejects a result
     */
    template<typename Sut>
    requires system_under_test<Sut, command_type, result_type>
    auto run(Sut& sut) -> void {
        _model.reset();
        for (const auto& command : _commands) {
            result_type result = execute(sut, command);
            _model.postcondition(command, result);
            _model.next_state(command);
        }
    }

    [[nodiscard]] auto commands() const -> const std::vector<command_type>& { return _commands; }
    [[nodiscard]] auto size() const -> std::size_t { return _commands.size(); }
    [[nodiscard]] auto empty() const -> bool { return _commands.empty(); }
    [[nodiscard]] auto model() const -> const M& { return _model; }

    auto begin() const { return _commands.begin(); }
    auto end() const { return _commands.end(); }

private:
    std::vector<command_type> _commands;
    M _model;

    template<typename Sut>
    static auto execute(Sut& sut, const command_type& command) -> result_type {
        try {
            return sut.run(command);
        } catch (const std::exception& e) {
            throw system_under_test_exception(to_string(command), e.what(), std::current_exception());
        } catch (...) {
            throw system_under_test_exception(to_string(command), "unknown exception", std::current_exception());
        }
    }
};

template<state_machine M>
auto operator<<(std::ostream& os, const command_sequence<M>& sequence) -> std::ostream& {
    os << "[";
    bool first = true;
    for (const auto& command : sequence) {
        if (!first) {
            os << ", ";
        }
        os << command;
        first = false;
    }
    return os << "]";
}

} // namespace statecheck
