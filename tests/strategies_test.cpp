#define BOOST_TEST_MODULE strategies_test
#include <boost/test/unit_test.hpp>

#include <statecheck/strategies.hpp>

#include <rapidcheck.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace statecheck;

namespace {
    constexpr std::size_t property_test_iterations = 200;

    // Drive a tree the way the shrink loop does: keep a candidate while
    // `fails` holds for it, revert it otherwise
    template<typename T, typename Predicate>
    auto shrink_with(value_tree<T>& tree, Predicate fails, std::size_t budget = 10000) -> T {
        T best = tree.current();
        std::size_t steps = 0;
        while (steps < budget && tree.simplify()) {
            ++steps;
            if (fails(tree.current())) {
                best = tree.current();
            } else {
                BOOST_REQUIRE(tree.complicate());
            }
        }
        BOOST_REQUIRE_LT(steps, budget);
        return best;
    }
}

BOOST_AUTO_TEST_CASE(just_never_shrinks, * boost::unit_test::timeout(10)) {
    rng_type rng(1);
    auto tree = just(std::string("value")).new_tree(rng);

    BOOST_CHECK_EQUAL(tree->current(), "value");
    BOOST_CHECK(!tree->simplify());
    BOOST_CHECK(!tree->complicate());
    BOOST_CHECK_EQUAL(tree->current(), "value");
}

BOOST_AUTO_TEST_CASE(integers_stay_in_range, * boost::unit_test::timeout(10)) {
    rng_type rng(7);
    auto gen = integers<int>(-50, 75);

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto tree = gen.new_tree(rng);
        auto value = tree->current();
        BOOST_CHECK_GE(value, -50);
        BOOST_CHECK_LE(value, 75);

        while (tree->simplify()) {
            BOOST_CHECK_GE(tree->current(), -50);
            BOOST_CHECK_LE(tree->current(), 75);
        }
    }
}

BOOST_AUTO_TEST_CASE(integers_shrink_to_zero_when_everything_fails, * boost::unit_test::timeout(10)) {
    rng_type rng(11);
    auto gen = integers<std::int64_t>(-1000000, 1000000);

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto tree = gen.new_tree(rng);
        auto minimal = shrink_with(*tree, [](std::int64_t) { return true; });
        BOOST_CHECK_EQUAL(minimal, 0);
    }
}

BOOST_AUTO_TEST_CASE(integers_shrink_toward_range_bound_closest_to_zero, * boost::unit_test::timeout(10)) {
    rng_type rng(3);

    auto positive = integers<int>(10, 20).new_tree(rng);
    BOOST_CHECK_EQUAL(shrink_with(*positive, [](int) { return true; }), 10);

    auto negative = integers<int>(-20, -10).new_tree(rng);
    BOOST_CHECK_EQUAL(shrink_with(*negative, [](int) { return true; }), -10);
}

BOOST_AUTO_TEST_CASE(integers_find_smallest_failing_threshold, * boost::unit_test::timeout(10)) {
    rng_type rng(5);
    auto gen = integers<std::int64_t>(0, 100000);

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto tree = gen.new_tree(rng);
        auto original = tree->current();
        auto threshold = original / 3;
        auto minimal = shrink_with(*tree, [threshold](std::int64_t v) { return v >= threshold; });
        BOOST_CHECK_EQUAL(minimal, threshold);
    }
}

BOOST_AUTO_TEST_CASE(integers_negative_values_shrink_upward, * boost::unit_test::timeout(10)) {
    rng_type rng(9);
    auto tree = integers<int>(-5000, -1).new_tree(rng);
    auto original = tree->current();

    auto threshold = original / 2;
    auto minimal = shrink_with(*tree, [threshold](int v) { return v <= threshold; });
    BOOST_CHECK_EQUAL(minimal, std::min(threshold, -1));
}

BOOST_AUTO_TEST_CASE(integers_full_range_does_not_overflow, * boost::unit_test::timeout(10)) {
    rng_type rng(13);
    auto gen = integers<std::int64_t>(
        std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max());

    for (std::size_t i = 0; i < 20; ++i) {
        auto tree = gen.new_tree(rng);
        BOOST_CHECK_EQUAL(shrink_with(*tree, [](std::int64_t) { return true; }), 0);
    }
}

BOOST_AUTO_TEST_CASE(simplify_then_complicate_restores_value, * boost::unit_test::timeout(10)) {
    rng_type rng(17);
    auto gen = integers<int>(-10000, 10000);

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto tree = gen.new_tree(rng);
        // Walk a few accepted steps first so the law is checked mid-search too
        std::uniform_int_distribution<int> accepted_steps(0, 3);
        for (int s = accepted_steps(rng); s > 0 && tree->simplify(); --s) {
        }

        auto before = tree->current();
        if (tree->simplify()) {
            BOOST_CHECK(tree->complicate());
            BOOST_CHECK_EQUAL(tree->current(), before);
        }
    }
}

BOOST_AUTO_TEST_CASE(complicate_without_pending_step_fails, * boost::unit_test::timeout(10)) {
    rng_type rng(19);
    auto gen = integers<int>(100, 200);
    auto tree = gen.new_tree(rng);
    while (tree->current() == 100) {
        tree = gen.new_tree(rng);
    }

    BOOST_CHECK(!tree->complicate());
    BOOST_REQUIRE(tree->simplify());
    BOOST_CHECK(tree->complicate());
    BOOST_CHECK(!tree->complicate());
}

BOOST_AUTO_TEST_CASE(booleans_shrink_to_false, * boost::unit_test::timeout(10)) {
    rng_type rng(23);
    bool saw_true = false;
    bool saw_false = false;

    for (std::size_t i = 0; i < 100; ++i) {
        auto tree = booleans().new_tree(rng);
        (tree->current() ? saw_true : saw_false) = true;
        BOOST_CHECK(!shrink_with(*tree, [](bool) { return true; }));
    }
    BOOST_CHECK(saw_true);
    BOOST_CHECK(saw_false);
}

BOOST_AUTO_TEST_CASE(elements_shrink_toward_first_entry, * boost::unit_test::timeout(10)) {
    rng_type rng(29);
    auto gen = elements<std::string>({"alpha", "beta", "gamma", "delta"});

    std::set<std::string> seen;
    for (std::size_t i = 0; i < 100; ++i) {
        auto tree = gen.new_tree(rng);
        seen.insert(tree->current());
        BOOST_CHECK_EQUAL(shrink_with(*tree, [](const std::string&) { return true; }), "alpha");
    }
    BOOST_CHECK_EQUAL(seen.size(), 4u);
}

BOOST_AUTO_TEST_CASE(elements_requires_values, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_THROW(elements<int>({}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(integers_rejects_inverted_range, * boost::unit_test::timeout(10)) {
    BOOST_CHECK_THROW(integers<int>(5, 4), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(one_of_draws_from_every_alternative, * boost::unit_test::timeout(10)) {
    rng_type rng(31);
    auto gen = one_of<int>({integers<int>(1, 9), integers<int>(100, 109)});

    bool low = false;
    bool high = false;
    for (std::size_t i = 0; i < 200; ++i) {
        auto tree = gen.new_tree(rng);
        auto value = tree->current();
        if (value < 10) {
            low = true;
            BOOST_CHECK_EQUAL(shrink_with(*tree, [](int) { return true; }), 1);
        } else {
            high = true;
            BOOST_CHECK_EQUAL(shrink_with(*tree, [](int) { return true; }), 100);
        }
    }
    BOOST_CHECK(low);
    BOOST_CHECK(high);
}

BOOST_AUTO_TEST_CASE(map_shrinks_through_source_value, * boost::unit_test::timeout(10)) {
    rng_type rng(37);
    auto gen = integers<int>(0, 1000).map([](int v) { return std::to_string(v) + "ms"; });

    auto tree = gen.new_tree(rng);
    BOOST_CHECK(tree->current().ends_with("ms"));
    BOOST_CHECK_EQUAL(shrink_with(*tree, [](const std::string&) { return true; }), "0ms");
}

BOOST_AUTO_TEST_CASE(same_seed_same_values, * boost::unit_test::timeout(10)) {
    auto gen = integers<std::uint32_t>(0, 1u << 30);
    rng_type first(99);
    rng_type second(99);

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        BOOST_CHECK_EQUAL(gen.new_tree(first)->current(), gen.new_tree(second)->current());
    }
}

BOOST_AUTO_TEST_CASE(pairs_shrink_first_then_second, * boost::unit_test::timeout(10)) {
    rng_type rng(41);
    auto gen = pairs(integers<int>(0, 1000), integers<int>(0, 1000));

    for (std::size_t i = 0; i < property_test_iterations; ++i) {
        auto tree = gen.new_tree(rng);
        auto original = tree->current();
        auto minimal = shrink_with(*tree, [](const std::pair<int, int>& p) { return p.first + p.second >= 500; });
        if (original.first + original.second >= 500) {
            BOOST_CHECK_EQUAL(minimal.first + minimal.second, 500);
            BOOST_CHECK_EQUAL(minimal.first, std::max(0, 500 - original.second));
        }
    }
}

BOOST_AUTO_TEST_CASE(wraps_custom_generators, * boost::unit_test::timeout(10)) {
    rng_type rng(43);
    strategy<std::vector<int>> gen(rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 10)));

    for (std::size_t i = 0; i < 20; ++i) {
        auto tree = gen.new_tree(rng);
        auto original = tree->current();
        auto minimal = shrink_with(*tree, [](const std::vector<int>& v) { return !v.empty(); });
        if (!original.empty()) {
            BOOST_CHECK((minimal == std::vector<int>{0}));
        }
    }
}

BOOST_AUTO_TEST_CASE(exhausted_tree_keeps_its_value, * boost::unit_test::timeout(10)) {
    rng_type rng(47);
    auto tree = integers<int>(1, 1000).new_tree(rng);

    auto minimal = shrink_with(*tree, [](int) { return true; });
    BOOST_CHECK_EQUAL(minimal, 1);
    BOOST_CHECK(!tree->simplify());
    BOOST_CHECK(!tree->complicate());
    BOOST_CHECK_EQUAL(tree->current(), 1);
}
