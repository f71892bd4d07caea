#pragma once

#include <statecheck/plan_result.hpp>
#include <statecheck/types.hpp>

#include <boost/json.hpp>

#include <string>

namespace statecheck {

// Machine-readable form of a minimal counterexample
template<state_machine M>
auto to_json(const minimal_failure<M>& failure) -> boost::json::object {
    boost::json::array commands;
    for (const auto& command : failure.sequence) {
        commands.emplace_back(to_string(command));
    }

    boost::json::object obj;
    obj["trial"] = failure.trial;
    obj["seed"] = failure.seed;
    obj["shrink_iterations"] = failure.shrink_iterations;
    obj["length"] = failure.sequence.size();
    obj["original_length"] = failure.original_sequence.size();
    obj["kind"] = to_string(failure.kind);
    obj["message"] = failure.message;
    obj["original_kind"] = to_string(failure.original_kind);
    obj["original_message"] = failure.original_message;
    obj["commands"] = std::move(commands);
    return obj;
}

template<state_machine M>
auto to_json(const plan_result<M>& result) -> boost::json::object {
    boost::json::object obj;
    obj["outcome"] = to_string(result.outcome());
    obj["seed"] = result.seed();
    obj["trials_run"] = result.trials_run();
    if (result.is_failed()) {
        obj["failure"] = to_json(result.failure());
    }
    if (result.is_aborted()) {
        obj["abort_reason"] = result.abort_reason();
    }
    return obj;
}

template<state_machine M>
auto to_json_string(const plan_result<M>& result) -> std::string {
    return boost::json::serialize(to_json(result));
}

} // namespace statecheck
