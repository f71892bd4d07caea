#pragma once

#include <statecheck/statecheck.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace statecheck::examples {

/**
 * Bounded cache with first-in-first-out eviction
 *
 * - Values are read by key
 * - The cache can be emptied on demand
 * - Once the capacity is reached, the oldest written key is evicted
 * - Overwriting a key, even with a different value, keeps its position
 */
class fifo_cache {
public:
    explicit fifo_cache(std::size_t capacity)
        : _capacity(capacity) {
        if (_capacity == 0) {
            throw std::invalid_argument("fifo_cache capacity must be greater than 0");
        }
    }

    [[nodiscard]] auto get(std::int64_t key) const -> std::optional<std::int64_t> {
        auto it = find(key);
        if (it == _entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto set(std::int64_t key, std::int64_t value) -> void {
        auto it = find(key);
        if (it != _entries.end()) {
            it->second = value;
            return;
        }
        if (_entries.size() == _capacity) {
            _entries.pop_front();
        }
        _entries.emplace_back(key, value);
    }

    auto flush() -> void { _entries.clear(); }

    [[nodiscard]] auto size() const -> std::size_t { return _entries.size(); }

private:
    using entry = std::pair<std::int64_t, std::int64_t>;

    std::size_t _capacity;
    std::deque<entry> _entries;

    auto find(std::int64_t key) -> std::deque<entry>::iterator {
        return std::find_if(_entries.begin(), _entries.end(), [key](const entry& e) { return e.first == key; });
    }

    [[nodiscard]] auto find(std::int64_t key) const -> std::deque<entry>::const_iterator {
        return std::find_if(_entries.begin(), _entries.end(), [key](const entry& e) { return e.first == key; });
    }
};

// Moves an overwritten key to the back of the eviction order
class buggy_fifo_cache {
public:
    explicit buggy_fifo_cache(std::size_t capacity)
        : _capacity(capacity) {}

    [[nodiscard]] auto get(std::int64_t key) const -> std::optional<std::int64_t> {
        auto it = std::find_if(_order.begin(), _order.end(),
            [key](const auto& e) { return e.first == key; });
        if (it == _order.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto set(std::int64_t key, std::int64_t value) -> void {
        auto it = std::find_if(_order.begin(), _order.end(),
            [key](const auto& e) { return e.first == key; });
        if (it != _order.end()) {
            _order.erase(it);
        } else if (_order.size() == _capacity) {
            _order.pop_front();
        }
        _order.emplace_back(key, value);
    }

    auto flush() -> void { _order.clear(); }

private:
    std::size_t _capacity;
    std::deque<std::pair<std::int64_t, std::int64_t>> _order;
};

struct cache_command {
    enum class kind : std::uint8_t { get, set, flush };

    kind type;
    std::int64_t key{0};
    std::int64_t value{0};

    static auto get(std::int64_t key) -> cache_command { return {kind::get, key, 0}; }
    static auto set(std::int64_t key, std::int64_t value) -> cache_command { return {kind::set, key, value}; }
    static auto flush() -> cache_command { return {kind::flush, 0, 0}; }

    auto operator==(const cache_command&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const cache_command& command) -> std::ostream& {
    switch (command.type) {
        case cache_command::kind::get:
            return os << "Get { key: " << command.key << " }";
        case cache_command::kind::set:
            return os << "Set { key: " << command.key << ", value: " << command.value << " }";
        case cache_command::kind::flush:
            return os << "Flush";
        default:
            return os << "Unknown";
    }
}

// Value a Get returned, if any; Set and Flush always return none
struct cache_result {
    std::optional<std::int64_t> value;

    auto operator==(const cache_result&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const cache_result& result) -> std::ostream& {
    if (result.value) {
        return os << "Some(" << *result.value << ")";
    }
    return os << "None";
}

// Adapts a cache to the command interface
template<typename Cache>
class cache_system {
public:
    explicit cache_system(std::size_t capacity)
        : _cache(capacity) {}

    auto run(const cache_command& command) -> cache_result {
        switch (command.type) {
            case cache_command::kind::get:
                return {_cache.get(command.key)};
            case cache_command::kind::set:
                _cache.set(command.key, command.value);
                return {};
            case cache_command::kind::flush:
                _cache.flush();
                return {};
        }
        throw std::logic_error("unknown cache command");
    }

private:
    Cache _cache;
};

/**
 * Reference model of fifo_cache
 *
 * Every key remembers the position it was first written at. The entry at the
 * lowest live position is the one a full cache evicts next.
 */
class fifo_cache_model {
public:
    using command_type = cache_command;
    using result_type = cache_result;

    explicit fifo_cache_model(std::size_t capacity)
        : _capacity(capacity) {}

    auto reset() -> void {
        _entries.clear();
        _min_index = 0;
        _max_index = 0;
    }

    auto commands() const -> std::vector<weighted_strategy<cache_command>> {
        std::vector<weighted_strategy<cache_command>> choices;
        choices.push_back({1, keys().map([](std::int64_t key) { return cache_command::get(key); })});
        choices.push_back({3, pairs(keys(), values()).map([](const std::pair<std::int64_t, std::int64_t>& kv) {
            return cache_command::set(kv.first, kv.second);
        })});
        if (!_entries.empty()) {
            choices.push_back({1, just(cache_command::flush())});
        }
        return choices;
    }

    auto postcondition(const cache_command& command, const cache_result& result) const -> void {
        if (command.type != cache_command::kind::get) {
            return;
        }
        cache_result expected;
        if (auto it = _entries.find(command.key); it != _entries.end()) {
            expected.value = it->second.value;
        }
        if (result != expected) {
            throw make_postcondition_exception(command, expected, result);
        }
    }

    auto next_state(const cache_command& command) -> void {
        switch (command.type) {
            case cache_command::kind::get:
                break;
            case cache_command::kind::set:
                apply_set(command.key, command.value);
                break;
            case cache_command::kind::flush:
                reset();
                break;
        }
    }

    [[nodiscard]] auto capacity() const -> std::size_t { return _capacity; }

private:
    struct entry {
        std::size_t index;
        std::int64_t value;
    };

    std::size_t _capacity;
    std::unordered_map<std::int64_t, entry> _entries;
    std::size_t _min_index{0};
    std::size_t _max_index{0};

    // Mostly keys from a small range so that reads and overwrites hit
    auto keys() const -> strategy<std::int64_t> {
        return one_of<std::int64_t>({
            integers<std::int64_t>(1, static_cast<std::int64_t>(_capacity)),
            integers<std::int64_t>(std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max())
        });
    }

    static auto values() -> strategy<std::int64_t> {
        return integers<std::int64_t>(std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max());
    }

    auto apply_set(std::int64_t key, std::int64_t value) -> void {
        if (auto it = _entries.find(key); it != _entries.end()) {
            it->second.value = value;
            return;
        }
        if (_entries.size() == _capacity) {
            auto oldest = std::find_if(_entries.begin(), _entries.end(),
                [this](const auto& e) { return e.second.index == _min_index; });
            if (oldest != _entries.end()) {
                _entries.erase(oldest);
            }
            ++_min_index;
        }
        _entries.emplace(key, entry{_max_index, value});
        ++_max_index;
    }
};

static_assert(state_machine<fifo_cache_model>);
static_assert(system_under_test<cache_system<fifo_cache>, cache_command, cache_result>);
static_assert(system_under_test<cache_system<buggy_fifo_cache>, cache_command, cache_result>);

} // namespace statecheck::examples
