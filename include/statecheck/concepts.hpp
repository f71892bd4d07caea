#pragma once

#include <statecheck/command_generator.hpp>
#include <statecheck/types.hpp>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace statecheck {

/**
 * @brief Reference model of the system under test
 *
 * - reset() returns the model to its canonical initial state
 * - commands() lists the commands that are legal in the current state,
 *   each with a positive sampling weight
 * - postcondition() throws postcondition_exception when a result is not
 *   what the current state predicts
 * - next_state() applies a command to the model
 *
 * Models are copied to obtain independent clones for generation and replay.
 */
template<typename M>
concept state_machine = requires(
    M model,
    const M const_model,
    const typename M::command_type& command,
    const typename M::result_type& result
) {
    typename M::command_type;
    typename M::result_type;
    requires std::copy_constructible<M>;
    requires std::copy_constructible<typename M::command_type>;
    requires printable<typename M::command_type>;

    { model.reset() } -> std::same_as<void>;
    { const_model.commands() } -> std::same_as<std::vector<weighted_strategy<typename M::command_type>>>;
    { const_model.postcondition(command, result) } -> std::same_as<void>;
    { model.next_state(command) } -> std::same_as<void>;
};

/**
 * @brief Real system driven with the commands of a model
 *
 * run() applies one command and returns its result; any exception it throws
 * counts as a failure of the system.
 */
template<typename S, typename Command, typename Result>
concept system_under_test = requires(S& sut, const Command& command) {
    { sut.run(command) } -> std::convertible_to<Result>;
};

namespace detail {

template<typename T>
struct is_pointer_like : std::false_type {};

template<typename T, typename D>
struct is_pointer_like<std::unique_ptr<T, D>> : std::true_type {};

template<typename T>
struct is_pointer_like<std::shared_ptr<T>> : std::true_type {};

template<typename T>
struct is_pointer_like<T*> : std::true_type {};

// Reach the system under test through the handle a factory returned
template<typename Handle>
auto deref(Handle& handle) -> decltype(auto) {
    if constexpr (is_pointer_like<std::remove_cvref_t<Handle>>::value) {
        return (*handle);
    } else {
        return (handle);
    }
}

template<typename F>
using sut_handle_t = std::invoke_result_t<F&>;

template<typename F>
using sut_t = std::remove_cvref_t<decltype(deref(std::declval<sut_handle_t<F>&>()))>;

} // namespace detail

/**
 * @brief Nullary callable producing a fresh system under test per trial,
 *        either by value or through a std::unique_ptr / std::shared_ptr
 */
template<typename F, typename M>
concept system_under_test_factory =
    state_machine<M> &&
    std::invocable<F&> &&
    system_under_test<detail::sut_t<F>, typename M::command_type, typename M::result_type>;

} // namespace statecheck
