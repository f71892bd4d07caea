#pragma once

#include <statecheck/command_generator.hpp>
#include <statecheck/command_sequence.hpp>
#include <statecheck/concepts.hpp>
#include <statecheck/config.hpp>
#include <statecheck/console_logger.hpp>
#include <statecheck/exceptions.hpp>
#include <statecheck/logger.hpp>
#include <statecheck/plan_executor.hpp>
#include <statecheck/plan_result.hpp>
#include <statecheck/report.hpp>
#include <statecheck/sequence_strategy.hpp>
#include <statecheck/sequence_value_tree.hpp>
#include <statecheck/strategies.hpp>
#include <statecheck/types.hpp>
#include <statecheck/value_tree.hpp>
