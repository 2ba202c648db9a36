#include "oracle/prompts.hpp"
#include "text/utf8.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace prompts {

namespace {

constexpr size_t OUTPUT_CHARS = 3000;
constexpr size_t HISTORY_ENTRIES = 5;

constexpr std::string_view RESPONSE_FORMAT =
    "Respond with ONLY a JSON object:\n"
    R"({"action": "respond|complete|escalate|ignore", "response": "...", "useKeys": false, "keys": [], "reasoning": "..."})";

std::string header(const TaskContext& task, std::string_view situation) {
    return std::format(
        "You are an orchestrator supervising a fleet of coding agents. "
        "A {} coding agent (\"{}\", session: {}) {}\n\n"
        "Original task: \"{}\"\n"
        "Working directory: {}\n",
        task.agent_type, task.label, task.session_id, situation,
        task.original_task, task.workdir);
}

std::string history(const TaskContext& task) {
    std::vector<const Decision*> recent;
    for (auto& d : task.decisions) {
        if (d.kind != DecisionKind::AutoResolved) recent.push_back(&d);
    }
    if (recent.empty()) return {};
    if (recent.size() > HISTORY_ENTRIES) {
        recent.erase(recent.begin(), recent.end() - HISTORY_ENTRIES);
    }

    std::string out = "\nPrevious decisions for this session:\n";
    for (size_t i = 0; i < recent.size(); ++i) {
        auto& d = *recent[i];
        out += std::format("  {}. [{}] prompt=\"{}\" -> {}", i + 1, to_string(d.event),
                           d.prompt_text, to_string(d.kind));
        if (d.response) out += std::format(" (\"{}\")", *d.response);
        out += std::format(": {}\n", d.reasoning);
    }
    return out;
}

std::string output_section(std::string_view title, std::string_view output) {
    return std::format("\n{}:\n---\n{}\n---\n\n", title, utf8::tail(output, OUTPUT_CHARS));
}

OracleError parse_error(std::string msg) {
    return OracleError{OracleError::Kind::Parse, std::move(msg)};
}

} // namespace

std::string coordination(const TaskContext& task, std::string_view prompt_text,
                         std::string_view recent_output) {
    std::string p = header(task, "is blocked and waiting for input.");
    p += history(task);
    p += output_section("Recent terminal output (last 50 lines)", recent_output);
    p += std::format("The agent is showing this blocking prompt:\n\"{}\"\n\n", prompt_text);
    p +=
        "Decide how to respond. Your options:\n\n"
        "1. \"respond\": send a response to unblock the agent. For text prompts (Y/n, questions), "
        "set \"response\" to the text to send. For TUI menus or interactive prompts that need "
        "special keys, set \"useKeys\": true and \"keys\" to the key sequence "
        "(e.g. [\"enter\"], [\"down\",\"enter\"], [\"y\",\"enter\"]).\n\n"
        "2. \"complete\": the original task has been fulfilled. The agent has finished its work "
        "(e.g. code written, PR created, tests passed) and is back at the idle prompt.\n\n"
        "3. \"escalate\": the prompt requires human judgment (design decisions, ambiguous "
        "requirements, security-sensitive actions). Do NOT respond yourself.\n\n"
        "4. \"ignore\": the prompt is not actually blocking or is already being handled.\n\n"
        "Guidelines:\n"
        "- For tool approval prompts (file writes, shell commands), respond \"y\" or use keys [\"enter\"] to approve.\n"
        "- For Y/n confirmations that align with the original task, respond \"y\".\n"
        "- For design questions or choices that could go either way, escalate.\n"
        "- For error recovery prompts, respond if the path forward is clear.\n"
        "- If the output shows a PR was just created, do not use \"complete\" yet; ask the agent to "
        "review the PR and verify each test plan item first.\n"
        "- When in doubt, escalate. Asking the human is better than a wrong choice.\n\n";
    p += RESPONSE_FORMAT;
    return p;
}

std::string turn_complete(const TaskContext& task, std::string_view turn_output) {
    std::string p = header(task, "just finished a turn and is back at the idle prompt waiting for input.");
    p += history(task);
    p += output_section("Output from this turn", turn_output);
    p +=
        "The agent completed a turn. Decide if the OVERALL task is done or if more work is needed.\n\n"
        "Coding agents work in multiple turns. A single turn completing does NOT mean the task is "
        "done. Verify that EVERY objective in the original task has been addressed in the output "
        "before declaring \"complete\".\n\n"
        "Your options:\n\n"
        "1. \"respond\": the agent finished a step but the overall task is NOT done yet. Set "
        "\"response\" to the next instruction (e.g. \"Now run the tests\", \"Continue with the next "
        "part\"). This is the default; most turns are intermediate steps.\n\n"
        "2. \"complete\": all objectives of the original task have been met and you can point to "
        "evidence in the output for each of them.\n\n"
        "3. \"escalate\": something looks wrong or you are unsure whether the task is complete.\n\n"
        "4. \"ignore\": should not normally be used here.\n\n"
        "Guidelines:\n"
        "- Before choosing \"complete\", enumerate each objective and check the output for evidence. "
        "If any objective lacks evidence, use \"respond\" with the missing work.\n"
        "- If the agent only read or analyzed code, it has not done the work yet; send a follow-up.\n"
        "- If the output shows errors or failing tests, send a follow-up to fix them.\n"
        "- If the working directory is a git clone, the changes must be committed, pushed and a pull "
        "request created before the task is complete.\n"
        "- Creating a PR is never the final step: first ask the agent to review the PR and confirm "
        "every test plan item passes.\n"
        "- Keep follow-up instructions concise and specific.\n\n";
    p += RESPONSE_FORMAT;
    return p;
}

std::string idle_check(const TaskContext& task, std::string_view recent_output,
                       int idle_minutes, uint32_t check_number, uint32_t max_checks) {
    std::string p = header(task, std::format(
        "has been idle for {} minutes with no events or output changes.", idle_minutes));
    p += std::format("Idle check: {} of {} (session will be force-escalated after {})\n",
                     check_number, max_checks, max_checks);
    p += history(task);
    p += output_section("Recent terminal output (last 50 lines)", recent_output);
    p +=
        "The session has gone silent. Analyze the terminal output and decide:\n\n"
        "1. \"complete\": the task is done; the objectives were met and the agent is back at the idle prompt.\n\n"
        "2. \"respond\": the agent appears stuck or waiting for input that was not detected as a "
        "blocking prompt. Send a message to nudge it (e.g. \"continue\").\n\n"
        "3. \"escalate\": something looks wrong or unclear. The human should review.\n\n"
        "4. \"ignore\": the agent is still actively working (compiling, running tests). The idle "
        "period is expected.\n\n"
        "Guidelines:\n"
        "- If the output ends with a command prompt and the task objectives are met, use \"complete\".\n"
        "- If the output shows an error or the agent seems stuck in a loop, escalate.\n"
        "- If the agent is clearly mid-operation, use \"ignore\".\n";
    p += std::format("- On check {} of {}, if unsure, lean toward \"escalate\" rather than \"ignore\".\n\n",
                     check_number, max_checks);
    p += RESPONSE_FORMAT;
    return p;
}

std::expected<CoordinationDecision, OracleError> parse_decision(std::string_view output) {
    auto open = output.find('{');
    auto close = output.rfind('}');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::unexpected(parse_error("no JSON object in oracle output"));
    }

    json j;
    try {
        j = json::parse(output.substr(open, close - open + 1));
    } catch (const json::exception& e) {
        return std::unexpected(parse_error(std::string("JSON parse error: ") + e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected(parse_error("oracle output is not an object"));
    }

    auto action_it = j.find("action");
    if (action_it == j.end() || !action_it->is_string()) {
        return std::unexpected(parse_error("missing action"));
    }
    auto action = parse_decision_kind(action_it->get<std::string>());
    if (!action) {
        return std::unexpected(parse_error("unknown action: " + action_it->get<std::string>()));
    }

    CoordinationDecision d;
    d.action = *action;

    auto reasoning_it = j.find("reasoning");
    if (reasoning_it != j.end() && reasoning_it->is_string() && !reasoning_it->get<std::string>().empty()) {
        d.reasoning = reasoning_it->get<std::string>();
    } else {
        d.reasoning = "No reasoning provided";
    }

    if (d.action == DecisionKind::Respond) {
        auto use_keys = j.find("useKeys");
        auto keys = j.find("keys");
        auto response = j.find("response");

        if (use_keys != j.end() && use_keys->is_boolean() && use_keys->get<bool>() &&
            keys != j.end() && keys->is_array()) {
            d.use_keys = true;
            for (auto& k : *keys) {
                d.keys.push_back(k.is_string() ? k.get<std::string>() : k.dump());
            }
        } else if (response != j.end() && response->is_string()) {
            d.response = response->get<std::string>();
        } else {
            return std::unexpected(parse_error("respond without response or keys"));
        }
    }

    return d;
}

} // namespace prompts
