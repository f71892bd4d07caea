#pragma once

#include <statecheck/types.hpp>

#include <rapidcheck.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace statecheck {

/**
 * @brief A generated value together with its local shrinking state
 *
 * simplify() moves to a strictly simpler candidate and returns false once no
 * simpler candidate remains. complicate() reverts the last simplify() when
 * the simpler candidate turned out not to reproduce the failure; the next
 * simplify() then tries a less aggressive reduction.
 *
 * Implementations must satisfy the round-trip law: simplify() immediately
 * followed by complicate() restores current() to its previous value.
 */
template<typename T>
class value_tree {
public:
    using value_type = T;

    virtual ~value_tree() = default;

    [[nodiscard]] virtual auto current() const -> T = 0;
    virtual auto simplify() -> bool = 0;
    virtual auto complicate() -> bool = 0;
};

template<typename T>
using value_tree_ptr = std::unique_ptr<value_tree<T>>;

namespace detail {

// Greedy walk over a rapidcheck shrink tree.
//
// _accepted is the last node known to reproduce the failure and _candidates
// holds its untried shrinks. simplify() takes the next candidate; a
// simplify() that follows another simplify() means the previous candidate
// was kept, so the walk descends into its shrinks. complicate() drops the
// pending candidate and leaves the remaining siblings for the next try.
template<typename T>
class shrinkable_value_tree final : public value_tree<T> {
public:
    explicit shrinkable_value_tree(rc::Shrinkable<T> root)
        : _accepted(std::move(root))
        , _accepted_value(_accepted.value())
        , _current(_accepted_value)
        , _candidates(_accepted.shrinks()) {}

    [[nodiscard]] auto current() const -> T override { return _current; }

    auto simplify() -> bool override {
        if (_pending) {
            _accepted = std::move(*_pending);
            _accepted_value = _current;
            _candidates = _accepted.shrinks();
            _pending.reset();
        }

        auto next = _candidates.next();
        if (!next) {
            return false;
        }
        _current = (*next).value();
        _pending.emplace(std::move(*next));
        return true;
    }

    auto complicate() -> bool override {
        if (!_pending) {
            return false;
        }
        _pending.reset();
        _current = _accepted_value;
        return true;
    }

private:
    rc::Shrinkable<T> _accepted;
    T _accepted_value;
    T _current;
    rc::Seq<rc::Shrinkable<T>> _candidates;
    std::optional<rc::Shrinkable<T>> _pending;
};

} // namespace detail

/**
 * @brief Copyable recipe for generating value trees of T
 *
 * Wraps a rapidcheck generator. Each tree is drawn from an rc::Random keyed
 * by the caller's engine, so the same engine state always yields the same
 * value and the same shrink candidates.
 */
template<typename T>
class strategy {
public:
    using value_type = T;

    explicit strategy(rc::Gen<T> generator)
        : _generator(std::move(generator)) {}

    [[nodiscard]] auto new_tree(rng_type& rng) const -> value_tree_ptr<T> {
        rc::Random::Key key{};
        for (auto& word : key) {
            word = static_cast<std::uint64_t>(rng());
        }
        return std::make_unique<detail::shrinkable_value_tree<T>>(_generator(rc::Random(key)));
    }

    [[nodiscard]] auto generator() const -> const rc::Gen<T>& { return _generator; }

    // Transform generated values; shrinking still happens on the source values
    template<typename F>
    requires std::invocable<const F&, const T&>
    [[nodiscard]] auto map(F fn) const -> strategy<std::invoke_result_t<const F&, const T&>> {
        using U = std::invoke_result_t<const F&, const T&>;
        return strategy<U>(rc::gen::map(_generator, [fn = std::move(fn)](const T& value) -> U {
            return fn(value);
        }));
    }

private:
    rc::Gen<T> _generator;
};

} // namespace statecheck
