#include "decision_loop.hpp"

#include "oracle/prompts.hpp"
#include "text/sanitize.hpp"
#include "text/utf8.hpp"

#include <format>

using json = nlohmann::json;

namespace {

constexpr size_t RECENT_OUTPUT_LINES = 50;

json decision_json(const CoordinationDecision& d) {
    json j = {
        {"action", std::string(to_string(d.action))},
        {"reasoning", d.reasoning},
        {"useKeys", d.use_keys},
    };
    if (d.response) j["response"] = *d.response;
    if (d.use_keys) j["keys"] = d.keys;
    return j;
}

std::string excerpt(std::string_view s, size_t n) {
    if (s.size() <= n) return std::string(s);
    return std::string(utf8::head(s, n)) + "...";
}

} // namespace

DecisionLoop::DecisionLoop(TaskRegistry& registry, SessionControl& sessions,
                           ModelTransport& oracle, EventSink& sink,
                           DecisionPolicy policy, LogFn log)
    : registry_(registry), sessions_(sessions), oracle_(oracle), sink_(sink),
      policy_(policy), supervision_(policy.supervision), log_(std::move(log)) {}

DecisionLoop::Result DecisionLoop::handle_blocked(const std::string& session_id, TaskContext& task,
                                                  const BlockedEvent& event) {
    const auto& prompt_text = event.prompt_info.prompt;

    // Already answered by a rule; count it towards the safety valve.
    if (event.auto_responded) {
        uint32_t count = 0;
        {
            auto lock = registry_.lock();
            count = ++task.auto_resolved_count;
            task.decisions.push_back(Decision{
                .timestamp = std::chrono::system_clock::now(),
                .event = DecisionEvent::Blocked,
                .prompt_text = prompt_text,
                .kind = DecisionKind::AutoResolved,
                .reasoning = "Handled by auto-response rules",
                .response = std::nullopt,
            });
        }
        broadcast("blocked_auto_resolved", session_id,
                  {{"prompt", prompt_text}, {"auto_resolved_count", count}});
        return {};
    }

    if (registry_.is_in_flight(session_id)) {
        log(std::format("Skipping blocked event for {} (decision in flight)", session_id));
        return {};
    }

    auto level = supervision();
    broadcast("blocked", session_id,
              {{"prompt", prompt_text}, {"supervision", std::string(to_string(level))}});

    if (task.auto_resolved_count >= policy_.max_auto_responses) {
        record(task, DecisionEvent::Blocked, prompt_text, DecisionKind::Escalate,
               std::format("Escalating after {} consecutive auto-responses", policy_.max_auto_responses));
        broadcast("escalation", session_id,
                  {{"prompt", prompt_text}, {"reason", "max_auto_responses_exceeded"}});
        return {};
    }

    switch (level) {
        case Supervision::Autonomous:
            return decide_autonomously(session_id, task, prompt_text);
        case Supervision::Confirm:
            return decide_for_confirmation(session_id, task, prompt_text);
        case Supervision::Notify:
            record(task, DecisionEvent::Blocked, prompt_text, DecisionKind::Escalate,
                   "Supervision level is notify, broadcasting only");
            return {};
    }
    return {};
}

DecisionLoop::Result DecisionLoop::decide_autonomously(const std::string& session_id, TaskContext& task,
                                                       const std::string& prompt_text) {
    InFlightGuard guard(registry_, session_id);
    if (!guard) {
        log(std::format("Skipping duplicate decision for {} (in flight)", session_id));
        return {};
    }

    auto output = recent_output(session_id);
    auto decision = ask_oracle(prompts::coordination(task, prompt_text, output));

    if (!decision) {
        record(task, DecisionEvent::Blocked, prompt_text, DecisionKind::Escalate,
               std::format("Oracle returned invalid coordination response ({})",
                           to_string(decision.error().kind)));
        broadcast("escalation", session_id,
                  {{"prompt", prompt_text}, {"reason", "invalid_oracle_response"}});
        return {};
    }

    if (decision->action == DecisionKind::Respond) {
        decay_auto_resolved(task);
    }
    record(task, DecisionEvent::Blocked, prompt_text, decision->action, decision->reasoning,
           decision->recorded_response());
    broadcast("coordination_decision", session_id, decision_json(*decision));

    log(std::format("Decision for \"{}\": {}: {}", task.label, to_string(decision->action),
                    excerpt(decision->reasoning, 120)));

    return execute_decision(session_id, task, *decision);
}

DecisionLoop::Result DecisionLoop::decide_for_confirmation(const std::string& session_id, TaskContext& task,
                                                           const std::string& prompt_text) {
    InFlightGuard guard(registry_, session_id);
    if (!guard) return {};

    auto output = recent_output(session_id);
    auto decision = ask_oracle(prompts::coordination(task, prompt_text, output));

    CoordinationDecision suggested;
    if (decision) {
        suggested = *decision;
    } else {
        suggested.action = DecisionKind::Escalate;
        suggested.reasoning = "Oracle returned invalid response, needs human review";
    }

    json data = {
        {"prompt", prompt_text},
        {"suggested_action", std::string(to_string(suggested.action))},
        {"reasoning", suggested.reasoning},
    };
    if (suggested.response) data["suggested_response"] = *suggested.response;
    if (suggested.use_keys) data["suggested_keys"] = suggested.keys;

    registry_.set_pending(PendingDecision{
        .session_id = session_id,
        .prompt_text = prompt_text,
        .recent_output = std::move(output),
        .suggested = std::move(suggested),
        .created_at = std::chrono::system_clock::now(),
    });

    broadcast("pending_confirmation", session_id, std::move(data));
    return {};
}

DecisionLoop::Result DecisionLoop::confirm_decision(const std::string& session_id, bool approved,
                                                    std::optional<CoordinationDecision> override_decision) {
    auto* task = registry_.get(session_id);
    if (!task) {
        return std::unexpected(SessionError::unknown(session_id));
    }

    InFlightGuard guard(registry_, session_id);
    if (!guard) {
        return std::unexpected(SessionError{SessionError::Kind::InactiveSession,
                                            "a decision for session " + session_id + " is in flight"});
    }

    auto pending = registry_.take_pending(session_id);
    if (!pending) {
        return std::unexpected(SessionError{SessionError::Kind::UnknownSession,
                                            "no pending decision for session " + session_id});
    }

    if (!approved) {
        record(*task, DecisionEvent::Blocked, pending->prompt_text, DecisionKind::Escalate,
               "Human rejected the suggested decision");
        broadcast("confirmation_rejected", session_id, {{"prompt", pending->prompt_text}});
        return {};
    }

    auto decision = override_decision ? std::move(*override_decision) : pending->suggested;
    decision.reasoning = "Human-approved: " + decision.reasoning;

    if (decision.action == DecisionKind::Respond) {
        decay_auto_resolved(*task);
    }
    record(*task, DecisionEvent::Blocked, pending->prompt_text, decision.action, decision.reasoning,
           decision.recorded_response());
    broadcast("confirmation_approved", session_id, decision_json(decision));

    return execute_decision(session_id, *task, decision);
}

DecisionLoop::Result DecisionLoop::handle_turn_complete(const std::string& session_id, TaskContext& task,
                                                        const TurnCompleteEvent& event) {
    InFlightGuard guard(registry_, session_id);
    if (!guard) {
        log(std::format("Skipping turn-complete assessment for {} (in flight)", session_id));
        return {};
    }

    log(std::format("Turn complete for \"{}\", assessing whether the task is done", task.label));

    auto turn_output = sanitize::clean_for_display(event.response);
    if (turn_output.empty()) {
        turn_output = recent_output(session_id);
    }

    auto parsed = ask_oracle(prompts::turn_complete(task, turn_output));
    CoordinationDecision decision;
    if (parsed) {
        decision = std::move(*parsed);
    } else {
        log(std::format("Turn assessment for \"{}\" failed, defaulting to complete", task.label));
        decision.action = DecisionKind::Complete;
        decision.reasoning = "Oracle returned invalid response, defaulting to complete";
    }

    record(task, DecisionEvent::TurnComplete, "Agent finished a turn", decision.action,
           decision.reasoning, decision.recorded_response());
    broadcast("turn_assessment", session_id,
              {{"action", std::string(to_string(decision.action))}, {"reasoning", decision.reasoning}});

    return execute_decision(session_id, task, decision);
}

DecisionLoop::Result DecisionLoop::handle_idle_check(const std::string& session_id, TaskContext& task,
                                                     int idle_minutes) {
    InFlightGuard guard(registry_, session_id);
    if (!guard) return {};

    auto output = recent_output(session_id);
    auto decision = ask_oracle(prompts::idle_check(task, output, idle_minutes, task.idle_check_count,
                                                   policy_.max_idle_checks));
    if (!decision) {
        log(std::format("Idle check for \"{}\" returned an invalid response, escalating", task.label));
        broadcast("escalation", session_id,
                  {{"reason", "idle_check_invalid_response"}, {"idle_minutes", idle_minutes}});
        return {};
    }

    record(task, DecisionEvent::IdleWatchdog, std::format("Session idle for {} minutes", idle_minutes),
           decision->action, decision->reasoning, decision->recorded_response());
    broadcast("idle_check_decision", session_id, {
        {"action", std::string(to_string(decision->action))},
        {"idle_minutes", idle_minutes},
        {"idle_check_number", task.idle_check_count},
        {"reasoning", decision->reasoning},
    });

    return execute_decision(session_id, task, *decision);
}

DecisionLoop::Result DecisionLoop::execute_decision(const std::string& session_id, TaskContext& task,
                                                    const CoordinationDecision& decision) {
    switch (decision.action) {
        case DecisionKind::Respond:
            if (decision.use_keys) {
                return sessions_.send_keys(session_id, decision.keys);
            }
            if (decision.response) {
                return sessions_.send(session_id, *decision.response);
            }
            return {};

        case DecisionKind::Complete: {
            {
                auto lock = registry_.lock();
                task.status = TaskStatus::Completed;
            }

            std::string summary;
            if (auto raw = sessions_.get_output(session_id, RECENT_OUTPUT_LINES)) {
                summary = sanitize::extract_completion_summary(*raw);
            }
            broadcast("task_complete", session_id, {
                {"label", task.label},
                {"reasoning", decision.reasoning},
                {"summary", summary},
            });

            return sessions_.stop(session_id, SessionStatus::Completed);
        }

        case DecisionKind::Escalate:
            broadcast("escalation", session_id, {{"reasoning", decision.reasoning}});
            return {};

        case DecisionKind::Ignore:
        case DecisionKind::AutoResolved:
            return {};
    }
    return {};
}

std::expected<CoordinationDecision, OracleError> DecisionLoop::ask_oracle(const std::string& prompt) {
    auto raw = oracle_.complete(prompt);
    if (!raw) {
        log(std::format("Oracle call failed ({}): {}", to_string(raw.error().kind), raw.error().message));
        return std::unexpected(raw.error());
    }

    auto decision = prompts::parse_decision(*raw);
    if (!decision) {
        log(std::format("Oracle output rejected: {}", decision.error().message));
    }
    return decision;
}

std::string DecisionLoop::recent_output(const std::string& session_id) {
    auto raw = sessions_.get_output(session_id, RECENT_OUTPUT_LINES);
    if (!raw) return {};
    return sanitize::clean_for_display(*raw);
}

void DecisionLoop::record(TaskContext& task, DecisionEvent event, std::string prompt_text,
                          DecisionKind kind, std::string reasoning,
                          std::optional<std::string> response) {
    auto lock = registry_.lock();
    task.decisions.push_back(Decision{
        .timestamp = std::chrono::system_clock::now(),
        .event = event,
        .prompt_text = std::move(prompt_text),
        .kind = kind,
        .reasoning = std::move(reasoning),
        .response = std::move(response),
    });
}

void DecisionLoop::decay_auto_resolved(TaskContext& task) {
    auto lock = registry_.lock();
    if (task.auto_resolved_count > 0) --task.auto_resolved_count;
}

void DecisionLoop::broadcast(const std::string& type, const std::string& session_id, json data) {
    sink_.broadcast(SwarmEvent{
        .type = type,
        .session_id = session_id,
        .timestamp = epoch_ms(),
        .data = std::move(data),
    });
}

void DecisionLoop::log(const std::string& msg) {
    if (log_) log_(msg);
}
