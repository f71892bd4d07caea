#pragma once

#include <statecheck/value_tree.hpp>

#include <rapidcheck.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace statecheck {

// Always generates `value`
template<typename T>
auto just(T value) -> strategy<T> {
    return strategy<T>(rc::gen::just(std::move(value)));
}

// Uniform integer in [lo, hi], shrinking toward the value in range closest to zero
template<std::integral T>
requires (!std::same_as<T, bool>)
auto integers(T lo, T hi) -> strategy<T> {
    if (hi < lo) {
        throw std::invalid_argument("integers() requires lo <= hi");
    }
    T target = std::clamp(T{0}, lo, hi);
    return strategy<T>(rc::Gen<T>([lo, hi, target](const rc::Random& random, int size) {
        T value{};
        if (hi < std::numeric_limits<T>::max()) {
            value = rc::gen::inRange<T>(lo, static_cast<T>(hi + 1))(random, size).value();
        } else if (lo > std::numeric_limits<T>::min()) {
            // [lo, max] is [lo - 1, max) shifted up by one
            value = static_cast<T>(rc::gen::inRange<T>(static_cast<T>(lo - 1), hi)(random, size).value() + 1);
        } else {
            value = static_cast<T>(rc::Random(random).next());
        }
        return rc::shrinkable::shrinkRecur(value, [target](T x) { return rc::shrink::towards<T>(x, target); });
    }));
}

// Fair coin, shrinking true to false
inline auto booleans() -> strategy<bool> {
    return strategy<bool>(rc::gen::element(false, true));
}

// One of the given values, shrinking toward earlier entries
template<typename T>
auto elements(std::vector<T> values) -> strategy<T> {
    if (values.empty()) {
        throw std::invalid_argument("elements() requires at least one value");
    }
    return strategy<T>(rc::gen::elementOf(std::move(values)));
}

// Independent pair, shrinking the first component to the end, then the second
template<typename A, typename B>
auto pairs(strategy<A> first, strategy<B> second) -> strategy<std::pair<A, B>> {
    return strategy<std::pair<A, B>>(rc::gen::pair(first.generator(), second.generator()));
}

// Picks one alternative uniformly; the picked alternative does the shrinking
template<typename T>
auto one_of(std::vector<strategy<T>> alternatives) -> strategy<T> {
    if (alternatives.empty()) {
        throw std::invalid_argument("one_of() requires at least one alternative");
    }
    std::vector<rc::Gen<T>> generators;
    generators.reserve(alternatives.size());
    for (const auto& alternative : alternatives) {
        generators.push_back(alternative.generator());
    }
    auto pick = rc::gen::noShrink(rc::gen::inRange<std::size_t>(0, generators.size()));
    return strategy<T>(rc::gen::mapcat(pick, [generators](std::size_t index) {
        return generators[index];
    }));
}

template<typename T>
auto one_of(std::initializer_list<strategy<T>> alternatives) -> strategy<T> {
    return one_of(std::vector<strategy<T>>(alternatives));
}

} // namespace statecheck
