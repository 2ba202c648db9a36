#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class TaskStatus { Active, Completed, Stopped, Error };

enum class DecisionKind { AutoResolved, Respond, Escalate, Complete, Ignore };

enum class DecisionEvent { Blocked, TurnComplete, IdleWatchdog };

enum class Supervision { Autonomous, Confirm, Notify };

std::string_view to_string(TaskStatus s);
std::string_view to_string(DecisionKind k);
std::string_view to_string(DecisionEvent e);
std::string_view to_string(Supervision s);

std::optional<DecisionKind> parse_decision_kind(std::string_view s);
std::optional<Supervision> parse_supervision(std::string_view s);

// One audit-trail entry. Never modified once appended.
struct Decision {
    std::chrono::system_clock::time_point timestamp;
    DecisionEvent event = DecisionEvent::Blocked;
    std::string prompt_text;
    DecisionKind kind = DecisionKind::Escalate;
    std::string reasoning;
    std::optional<std::string> response;  // "keys:a,b" for key responses
};

// What the oracle (or an operator) decided to do.
struct CoordinationDecision {
    DecisionKind action = DecisionKind::Escalate;
    std::optional<std::string> response;
    bool use_keys = false;
    std::vector<std::string> keys;
    std::string reasoning;

    // Payload as recorded in the audit trail.
    std::optional<std::string> recorded_response() const;
};

struct TaskSpec {
    std::string agent_type;
    std::string label;
    std::string original_task;
    std::string workdir;
};

struct TaskContext {
    std::string session_id;
    std::string agent_type;
    std::string label;
    std::string original_task;
    std::string workdir;

    TaskStatus status = TaskStatus::Active;
    std::vector<Decision> decisions;
    uint32_t auto_resolved_count = 0;

    std::chrono::system_clock::time_point registered_at;
    std::chrono::system_clock::time_point last_activity_at;
    uint32_t idle_check_count = 0;
};

// A suggestion computed in confirm mode, waiting for an operator.
struct PendingDecision {
    std::string session_id;
    std::string prompt_text;
    std::string recent_output;
    CoordinationDecision suggested;
    std::chrono::system_clock::time_point created_at;
};
