#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace statecheck {

// Base exception for all statecheck errors
class statecheck_exception : public std::runtime_error {
public:
    explicit statecheck_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid run configuration, raised before any trial starts
class configuration_exception : public statecheck_exception {
public:
    explicit configuration_exception(const std::string& message)
        : statecheck_exception("Invalid configuration: " + message) {}
};

// The model produced no usable weighted command distribution.
// Aborts sequence generation; there is nothing to shrink.
class generation_exception : public statecheck_exception {
public:
    explicit generation_exception(const std::string& message)
        : statecheck_exception("Command generation failed: " + message) {}
};

// The system under test failed while executing a command
class system_under_test_exception : public statecheck_exception {
public:
    system_under_test_exception(std::string command, const std::string& reason, std::exception_ptr source)
        : statecheck_exception(
            "System under test failed on command " + command + ": " + reason
        )
        , _command(std::move(command))
        , _reason(reason)
        , _source(std::move(source)) {}

    auto get_command() const -> const std::string& { return _command; }
    auto get_reason() const -> const std::string& { return _reason; }

    // The exception originally thrown by the system under test
    auto get_source() const -> std::exception_ptr { return _source; }

private:
    std::string _command;
    std::string _reason;
    std::exception_ptr _source;
};

// The model and the system under test disagree on the result of a command
class postcondition_exception : public statecheck_exception {
public:
    postcondition_exception(std::string command, std::string expected, std::string actual)
        : statecheck_exception(
            "Postcondition does not hold. Command: " + command +
            ". Expected result: " + expected +
            ". Actual result: " + actual
        )
        , _command(std::move(command))
        , _expected(std::move(expected))
        , _actual(std::move(actual)) {}

    auto get_command() const -> const std::string& { return _command; }
    auto get_expected() const -> const std::string& { return _expected; }
    auto get_actual() const -> const std::string& { return _actual; }

private:
    std::string _command;
    std::string _expected;
    std::string _actual;
};

} // namespace statecheck
