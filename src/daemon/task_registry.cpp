#include "task_registry.hpp"

#include <algorithm>
#include <utility>

TaskContext& TaskRegistry::register_task(const std::string& session_id, TaskSpec spec,
                                         Clock::time_point now) {
    std::lock_guard lock(mutex_);
    auto& ctx = tasks_[session_id];
    ctx = TaskContext{
        .session_id = session_id,
        .agent_type = std::move(spec.agent_type),
        .label = std::move(spec.label),
        .original_task = std::move(spec.original_task),
        .workdir = std::move(spec.workdir),
        .status = TaskStatus::Active,
        .decisions = {},
        .auto_resolved_count = 0,
        .registered_at = now,
        .last_activity_at = now,
        .idle_check_count = 0,
    };
    return ctx;
}

TaskContext* TaskRegistry::get(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(session_id);
    return it != tasks_.end() ? &it->second : nullptr;
}

bool TaskRegistry::remove(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    pending_.erase(session_id);
    last_seen_output_.erase(session_id);
    last_notification_.erase(session_id);
    return tasks_.erase(session_id) > 0;
}

std::vector<TaskContext> TaskRegistry::all() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskContext> out;
    out.reserve(tasks_.size());
    for (auto& [id, ctx] : tasks_) out.push_back(ctx);
    std::ranges::sort(out, {}, &TaskContext::registered_at);
    return out;
}

std::optional<TaskContext> TaskRegistry::snapshot(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(session_id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

size_t TaskRegistry::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

bool TaskRegistry::try_begin_decision(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    return in_flight_.insert(session_id).second;
}

void TaskRegistry::end_decision(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    in_flight_.erase(session_id);
}

bool TaskRegistry::is_in_flight(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    return in_flight_.contains(session_id);
}

void TaskRegistry::set_pending(PendingDecision pending) {
    std::lock_guard lock(mutex_);
    auto id = pending.session_id;
    pending_.insert_or_assign(std::move(id), std::move(pending));
}

std::optional<PendingDecision> TaskRegistry::take_pending(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto node = pending_.extract(session_id);
    if (node.empty()) return std::nullopt;
    return std::move(node.mapped());
}

std::vector<PendingDecision> TaskRegistry::pending() const {
    std::lock_guard lock(mutex_);
    std::vector<PendingDecision> out;
    for (auto& [id, p] : pending_) out.push_back(p);
    std::ranges::sort(out, {}, &PendingDecision::created_at);
    return out;
}

std::string TaskRegistry::swap_last_seen_output(const std::string& session_id, std::string output) {
    std::lock_guard lock(mutex_);
    auto& slot = last_seen_output_[session_id];
    return std::exchange(slot, std::move(output));
}

bool TaskRegistry::should_notify(const std::string& session_id, Clock::time_point now,
                                 std::chrono::seconds interval) {
    std::lock_guard lock(mutex_);
    auto it = last_notification_.find(session_id);
    if (it != last_notification_.end() && now - it->second < interval) {
        return false;
    }
    last_notification_[session_id] = now;
    return true;
}
