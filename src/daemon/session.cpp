#include "session.hpp"

std::string_view to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Starting: return "starting";
        case SessionStatus::Active: return "active";
        case SessionStatus::Blocked: return "blocked";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Stopped: return "stopped";
        case SessionStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<SessionStatus> parse_session_status(std::string_view s) {
    if (s == "starting") return SessionStatus::Starting;
    if (s == "active") return SessionStatus::Active;
    if (s == "blocked") return SessionStatus::Blocked;
    if (s == "completed") return SessionStatus::Completed;
    if (s == "stopped") return SessionStatus::Stopped;
    if (s == "failed") return SessionStatus::Failed;
    return std::nullopt;
}

std::string_view event_name(const SessionEvent& event) {
    if (std::holds_alternative<ReadyEvent>(event)) return "ready";
    if (std::holds_alternative<BlockedEvent>(event)) return "blocked";
    if (std::holds_alternative<TurnCompleteEvent>(event)) return "turn_complete";
    if (std::holds_alternative<ToolRunningEvent>(event)) return "tool_running";
    return "exit";
}
