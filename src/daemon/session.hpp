#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class SessionStatus { Starting, Active, Blocked, Completed, Stopped, Failed };

std::string_view to_string(SessionStatus status);
std::optional<SessionStatus> parse_session_status(std::string_view s);

// Terminal statuses never go back to running.
inline bool is_terminal(SessionStatus s) {
    return s == SessionStatus::Completed || s == SessionStatus::Stopped || s == SessionStatus::Failed;
}

struct SessionInfo {
    std::string id;
    std::string name;
    std::string agent_type;
    std::string workdir;
    int pid = -1;
    SessionStatus status = SessionStatus::Starting;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_output_at;
};

struct SpawnOptions {
    std::string name;
    std::string agent_type = "claude";
    std::string workdir;
    std::string initial_task;  // sent once the agent first shows its ready prompt
    std::map<std::string, std::string> env;
    std::vector<std::string> extra_args;
};

struct PromptInfo {
    std::string prompt;
};

// Session events, delivered in order per session.
struct ReadyEvent {};

struct BlockedEvent {
    PromptInfo prompt_info;
    bool auto_responded = false;
};

struct TurnCompleteEvent {
    std::string response;
};

struct ToolRunningEvent {
    std::string tool;
};

struct ExitEvent {
    int exit_code = 0;
    SessionStatus status = SessionStatus::Stopped;
};

using SessionEvent = std::variant<ReadyEvent, BlockedEvent, TurnCompleteEvent, ToolRunningEvent, ExitEvent>;

std::string_view event_name(const SessionEvent& event);

// Process operations the decision loop drives. Implemented by SessionManager.
class SessionControl {
public:
    virtual ~SessionControl() = default;

    virtual std::expected<void, SessionError> send(const std::string& id, const std::string& text) = 0;
    virtual std::expected<void, SessionError> send_keys(const std::string& id,
                                                        const std::vector<std::string>& keys) = 0;
    virtual std::expected<void, SessionError> stop(const std::string& id, SessionStatus final_status) = 0;
    virtual std::expected<std::string, SessionError> get_output(const std::string& id, size_t lines) = 0;
};
