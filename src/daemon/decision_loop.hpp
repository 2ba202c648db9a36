#pragma once

#include "errors.hpp"
#include "event_sink.hpp"
#include "oracle/model_transport.hpp"
#include "session.hpp"
#include "task_registry.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

struct DecisionPolicy {
    uint32_t max_auto_responses = 10;
    uint32_t max_idle_checks = 3;
    Supervision supervision = Supervision::Autonomous;
};

// Arbitrates blocked, turn-complete and idle events for registered sessions.
//
// Every handler takes the session's context by reference and mutates it in
// place. Oracle failures never leave this class: they become an escalate (or,
// for turn completion, a complete) decision. Session I/O failures while
// executing a decision are returned to the caller.
class DecisionLoop {
public:
    using LogFn = std::function<void(const std::string&)>;
    using Result = std::expected<void, SessionError>;

    DecisionLoop(TaskRegistry& registry, SessionControl& sessions,
                 ModelTransport& oracle, EventSink& sink,
                 DecisionPolicy policy, LogFn log = {});

    Result handle_blocked(const std::string& session_id, TaskContext& task, const BlockedEvent& event);
    Result handle_turn_complete(const std::string& session_id, TaskContext& task,
                                const TurnCompleteEvent& event);
    Result handle_idle_check(const std::string& session_id, TaskContext& task, int idle_minutes);

    Result execute_decision(const std::string& session_id, TaskContext& task,
                            const CoordinationDecision& decision);

    // Resolve a confirm-mode suggestion. `override_decision` replaces the
    // suggestion when approving.
    Result confirm_decision(const std::string& session_id, bool approved,
                            std::optional<CoordinationDecision> override_decision = std::nullopt);

    void set_supervision(Supervision level) { supervision_.store(level); }
    Supervision supervision() const { return supervision_.load(); }
    const DecisionPolicy& policy() const { return policy_; }

private:
    Result decide_autonomously(const std::string& session_id, TaskContext& task,
                               const std::string& prompt_text);
    Result decide_for_confirmation(const std::string& session_id, TaskContext& task,
                                   const std::string& prompt_text);

    std::expected<CoordinationDecision, OracleError> ask_oracle(const std::string& prompt);
    std::string recent_output(const std::string& session_id);

    void record(TaskContext& task, DecisionEvent event, std::string prompt_text,
                DecisionKind kind, std::string reasoning,
                std::optional<std::string> response = std::nullopt);
    void decay_auto_resolved(TaskContext& task);
    void broadcast(const std::string& type, const std::string& session_id, nlohmann::json data);

    void log(const std::string& msg);

    TaskRegistry& registry_;
    SessionControl& sessions_;
    ModelTransport& oracle_;
    EventSink& sink_;
    DecisionPolicy policy_;
    std::atomic<Supervision> supervision_;
    LogFn log_;
};
