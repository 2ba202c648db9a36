#include "task_context.hpp"

std::string_view to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Active: return "active";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Stopped: return "stopped";
        case TaskStatus::Error: return "error";
    }
    return "unknown";
}

std::string_view to_string(DecisionKind k) {
    switch (k) {
        case DecisionKind::AutoResolved: return "auto_resolved";
        case DecisionKind::Respond: return "respond";
        case DecisionKind::Escalate: return "escalate";
        case DecisionKind::Complete: return "complete";
        case DecisionKind::Ignore: return "ignore";
    }
    return "unknown";
}

std::string_view to_string(DecisionEvent e) {
    switch (e) {
        case DecisionEvent::Blocked: return "blocked";
        case DecisionEvent::TurnComplete: return "turn_complete";
        case DecisionEvent::IdleWatchdog: return "idle_watchdog";
    }
    return "unknown";
}

std::string_view to_string(Supervision s) {
    switch (s) {
        case Supervision::Autonomous: return "autonomous";
        case Supervision::Confirm: return "confirm";
        case Supervision::Notify: return "notify";
    }
    return "unknown";
}

std::optional<DecisionKind> parse_decision_kind(std::string_view s) {
    if (s == "respond") return DecisionKind::Respond;
    if (s == "escalate") return DecisionKind::Escalate;
    if (s == "complete") return DecisionKind::Complete;
    if (s == "ignore") return DecisionKind::Ignore;
    return std::nullopt;
}

std::optional<Supervision> parse_supervision(std::string_view s) {
    if (s == "autonomous") return Supervision::Autonomous;
    if (s == "confirm") return Supervision::Confirm;
    if (s == "notify") return Supervision::Notify;
    return std::nullopt;
}

std::optional<std::string> CoordinationDecision::recorded_response() const {
    if (action != DecisionKind::Respond) return std::nullopt;
    if (use_keys) {
        std::string joined = "keys:";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) joined += ',';
            joined += keys[i];
        }
        return joined;
    }
    return response;
}
