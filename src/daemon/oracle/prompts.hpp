#pragma once

#include "errors.hpp"
#include "task_context.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// Oracle prompt construction and response parsing. Pure functions.
namespace prompts {

// Recent output is cut to its last 3000 characters; the history section lists
// the last five decisions that were not auto-resolved.
std::string coordination(const TaskContext& task, std::string_view prompt_text,
                         std::string_view recent_output);

std::string turn_complete(const TaskContext& task, std::string_view turn_output);

std::string idle_check(const TaskContext& task, std::string_view recent_output,
                       int idle_minutes, uint32_t check_number, uint32_t max_checks);

// Parse the first {...} span of the model output.
// Rejects unknown actions and a "respond" carrying neither text nor keys.
std::expected<CoordinationDecision, OracleError> parse_decision(std::string_view output);

} // namespace prompts
