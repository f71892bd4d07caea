#define BOOST_TEST_MODULE report_test
#include <boost/test/unit_test.hpp>

#include "test_models.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <string>

using namespace statecheck;
using namespace statecheck::test;

namespace {
    auto text_of(const boost::json::value& value) -> std::string {
        return boost::json::value_to<std::string>(value);
    }

    auto failing_result() -> plan_result<plan_model> {
        auto plan = make_plan("DDUDU");
        recording_logger logger;
        return execute_plan(plan_config(plan.size()), plan_model(plan), [] { return echo_system{}; }, logger);
    }
}

BOOST_AUTO_TEST_CASE(failed_run_serializes_minimal_case, * boost::unit_test::timeout(30)) {
    auto result = failing_result();
    BOOST_REQUIRE(result.is_failed());

    auto obj = to_json(result);
    BOOST_CHECK_EQUAL(text_of(obj.at("outcome")), "failed");
    BOOST_CHECK_EQUAL(obj.at("seed").as_uint64(), 42u);
    BOOST_CHECK_EQUAL(obj.at("trials_run").as_uint64(), 1u);
    BOOST_CHECK(obj.find("abort_reason") == obj.end());

    const auto& failure = obj.at("failure").as_object();
    BOOST_CHECK_EQUAL(failure.at("trial").as_uint64(), 0u);
    BOOST_CHECK_EQUAL(failure.at("length").as_uint64(), 2u);
    BOOST_CHECK_EQUAL(failure.at("original_length").as_uint64(), 5u);
    BOOST_CHECK_EQUAL(text_of(failure.at("kind")), "postcondition");
    BOOST_CHECK_EQUAL(text_of(failure.at("original_kind")), "postcondition");
    BOOST_CHECK_EQUAL(text_of(failure.at("message")), result.failure().message);

    const auto& commands = failure.at("commands").as_array();
    BOOST_REQUIRE_EQUAL(commands.size(), 2u);
    BOOST_CHECK_EQUAL(text_of(commands[0]), "Up { tag: 1 }");
    BOOST_CHECK_EQUAL(text_of(commands[1]), "Up { tag: 2 }");
}

BOOST_AUTO_TEST_CASE(aborted_run_serializes_reason, * boost::unit_test::timeout(10)) {
    config cfg;
    cfg.seed = 3;
    recording_logger logger;
    auto result = execute_plan(cfg, weight_table_model({0}), [] { return label_echo_system{}; }, logger);
    BOOST_REQUIRE(result.is_aborted());

    auto obj = to_json(result);
    BOOST_CHECK_EQUAL(text_of(obj.at("outcome")), "aborted");
    BOOST_CHECK_EQUAL(text_of(obj.at("abort_reason")), result.abort_reason());
    BOOST_CHECK(obj.find("failure") == obj.end());
}

BOOST_AUTO_TEST_CASE(passed_run_serializes_counts, * boost::unit_test::timeout(30)) {
    config cfg;
    cfg.seed = 11;
    cfg.trials = 8;
    recording_logger logger;
    auto result = execute_plan(cfg, weight_table_model({1, 1}), [] { return label_echo_system{}; }, logger);
    BOOST_REQUIRE(result.is_passed());

    auto parsed = boost::json::parse(to_json_string(result)).as_object();
    BOOST_CHECK_EQUAL(text_of(parsed.at("outcome")), "passed");
    BOOST_CHECK(parsed.at("trials_run") == boost::json::value(8));
    BOOST_CHECK(parsed.find("failure") == parsed.end());
    BOOST_CHECK(parsed.find("abort_reason") == parsed.end());
}
