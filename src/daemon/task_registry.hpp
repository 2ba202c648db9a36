#pragma once

#include "task_context.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// In-memory map of session id -> TaskContext plus the cross-cutting state the
// decision loop needs: the in-flight set, pending confirmations and the
// throttling maps.
//
// Contexts live in place; get() hands out a pointer that stays valid until
// remove(). In-place mutation of a context happens only on the session's
// single decision path and is done while holding lock(), so snapshots taken
// from other threads are consistent.
class TaskRegistry {
public:
    using Clock = std::chrono::system_clock;

    TaskContext& register_task(const std::string& session_id, TaskSpec spec,
                               Clock::time_point now = Clock::now());
    TaskContext* get(const std::string& session_id);
    bool remove(const std::string& session_id);

    std::vector<TaskContext> all() const;
    std::optional<TaskContext> snapshot(const std::string& session_id) const;
    size_t size() const;

    // Held around in-place mutation of a context. Do not call other registry
    // methods while holding it.
    [[nodiscard]] std::unique_lock<std::mutex> lock() const { return std::unique_lock(mutex_); }

    // In-flight guard: at most one arbitration per session.
    bool try_begin_decision(const std::string& session_id);
    void end_decision(const std::string& session_id);
    bool is_in_flight(const std::string& session_id) const;

    void set_pending(PendingDecision pending);
    std::optional<PendingDecision> take_pending(const std::string& session_id);
    std::vector<PendingDecision> pending() const;

    // Stores `output` as the last seen output and returns the previous value.
    std::string swap_last_seen_output(const std::string& session_id, std::string output);

    // True at most once per `interval` per session.
    bool should_notify(const std::string& session_id, Clock::time_point now,
                       std::chrono::seconds interval);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TaskContext> tasks_;
    std::unordered_set<std::string> in_flight_;
    std::unordered_map<std::string, PendingDecision> pending_;
    std::unordered_map<std::string, std::string> last_seen_output_;
    std::unordered_map<std::string, Clock::time_point> last_notification_;
};

// Scoped membership in the in-flight set.
class InFlightGuard {
public:
    InFlightGuard(TaskRegistry& registry, std::string session_id)
        : registry_(registry), session_id_(std::move(session_id)),
          acquired_(registry_.try_begin_decision(session_id_)) {}

    ~InFlightGuard() {
        if (acquired_) registry_.end_decision(session_id_);
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    explicit operator bool() const { return acquired_; }

private:
    TaskRegistry& registry_;
    std::string session_id_;
    bool acquired_;
};
