#include "coordinator.hpp"

#include "oracle/prompts.hpp"
#include "text/sanitize.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>
#include <utility>

namespace {

constexpr size_t IDLE_OUTPUT_LINES = 20;
constexpr size_t TOOL_OUTPUT_LINES = 50;
constexpr size_t DEFAULT_OUTPUT_LINES = 50;

nlohmann::json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json error_response(const SessionError& err) {
    return {{"status", "error"}, {"message", err.message}, {"kind", to_string(err.kind)}};
}

std::string excerpt(const std::string& text, size_t max_bytes) {
    return std::string(utf8::tail(text, max_bytes));
}

nlohmann::json decision_to_json(const CoordinationDecision& d) {
    nlohmann::json j = {
        {"action", to_string(d.action)},
        {"reasoning", d.reasoning},
        {"useKeys", d.use_keys},
    };
    if (d.response) j["response"] = *d.response;
    if (d.use_keys) j["keys"] = d.keys;
    return j;
}

} // namespace

nlohmann::json session_to_json(const SessionInfo& info) {
    return {
        {"id", info.id},
        {"name", info.name},
        {"agent_type", info.agent_type},
        {"workdir", info.workdir},
        {"pid", info.pid},
        {"status", to_string(info.status)},
        {"created_at", epoch_ms(info.created_at)},
        {"last_output_at", epoch_ms(info.last_output_at)},
    };
}

nlohmann::json task_to_json(const TaskContext& task, bool with_decisions) {
    nlohmann::json j = {
        {"session_id", task.session_id},
        {"label", task.label},
        {"agent_type", task.agent_type},
        {"original_task", task.original_task},
        {"workdir", task.workdir},
        {"status", to_string(task.status)},
        {"auto_resolved_count", task.auto_resolved_count},
        {"idle_check_count", task.idle_check_count},
        {"decision_count", task.decisions.size()},
        {"registered_at", epoch_ms(task.registered_at)},
        {"last_activity_at", epoch_ms(task.last_activity_at)},
    };
    if (with_decisions) {
        j["decisions"] = nlohmann::json::array();
        for (auto& d : task.decisions) {
            nlohmann::json entry = {
                {"timestamp", epoch_ms(d.timestamp)},
                {"event", to_string(d.event)},
                {"prompt_text", d.prompt_text},
                {"decision", to_string(d.kind)},
                {"reasoning", d.reasoning},
            };
            if (d.response) entry["response"] = *d.response;
            j["decisions"].push_back(std::move(entry));
        }
    }
    return j;
}

void Coordinator::QueuedSink::broadcast(SwarmEvent event) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(event));
    }
    if (notify_) notify_();
}

std::deque<SwarmEvent> Coordinator::QueuedSink::take() {
    std::lock_guard lock(mutex_);
    return std::exchange(queue_, {});
}

Coordinator::Coordinator(Config config, bool verbose,
                         SessionManager& sessions, ModelTransport& oracle,
                         IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      sessions_(sessions), ipc_(ipc),
      notify_(std::move(notify)),
      sink_(notify_),
      decisions_(registry_, sessions_, oracle, sink_,
                 DecisionPolicy{
                     .max_auto_responses = config_.coordinator.max_auto_responses,
                     .max_idle_checks = config_.coordinator.max_idle_checks,
                     .supervision = parse_supervision(config_.coordinator.supervision)
                                        .value_or(Supervision::Autonomous),
                 },
                 [this](const std::string& msg) { log(msg); }),
      last_scan_(std::chrono::system_clock::now()) {
    if (!parse_supervision(config_.coordinator.supervision)) {
        std::println(stderr, "config: unknown supervision level '{}', using autonomous",
                     config_.coordinator.supervision);
    }
}

Coordinator::~Coordinator() = default;

nlohmann::json Coordinator::handle_command(const std::string& cmd_str,
                                           const nlohmann::json& cmd) {
    try {
        if (cmd_str == "spawn") return handle_spawn(cmd);
        if (cmd_str == "send") return handle_send(cmd);
        if (cmd_str == "keys") return handle_keys(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "output") return handle_output(cmd);
        if (cmd_str == "list") return handle_list(cmd);
        if (cmd_str == "tasks") return handle_tasks(cmd);
        if (cmd_str == "task") return handle_task(cmd);
        if (cmd_str == "pending") return handle_pending(cmd);
        if (cmd_str == "confirm") return handle_confirm(cmd);
        if (cmd_str == "supervision") return handle_supervision(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "subscribe") return {{"status", "ok"}, {"subscribed", true}};
    } catch (const nlohmann::json::exception& e) {
        return error_response(std::format("invalid arguments for {}: {}", cmd_str, e.what()));
    }
    return error_response("unknown command");
}

nlohmann::json Coordinator::handle_spawn(const nlohmann::json& cmd) {
    SpawnOptions opts;
    opts.agent_type = cmd.value("agent_type", opts.agent_type);
    opts.name = cmd.value("name", "");
    opts.workdir = cmd.value("workdir", "");
    opts.initial_task = cmd.value("task", "");
    if (cmd.contains("env")) opts.env = cmd["env"].get<std::map<std::string, std::string>>();
    if (cmd.contains("args")) opts.extra_args = cmd["args"].get<std::vector<std::string>>();

    auto info = sessions_.spawn(opts);
    if (!info) {
        log("Spawn failed: " + info.error().message);
        return error_response(info.error());
    }

    // Registered before the loop delivers any event for this session.
    registry_.register_task(info->id, TaskSpec{
        .agent_type = info->agent_type,
        .label = info->name,
        .original_task = opts.initial_task,
        .workdir = info->workdir,
    });

    log(std::format("Spawned {} session {} ({})", info->agent_type, info->id, info->name));
    broadcast("spawned", info->id, session_to_json(*info));
    return {{"status", "ok"}, {"session", session_to_json(*info)}};
}

nlohmann::json Coordinator::handle_send(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    auto text = cmd.at("text").get<std::string>();
    if (auto res = sessions_.send(id, text); !res) return error_response(res.error());
    return {{"status", "ok"}};
}

nlohmann::json Coordinator::handle_keys(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    auto keys = cmd.at("keys").get<std::vector<std::string>>();
    if (auto res = sessions_.send_keys(id, keys); !res) return error_response(res.error());
    return {{"status", "ok"}};
}

nlohmann::json Coordinator::handle_stop(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    if (auto res = sessions_.stop(id, SessionStatus::Stopped); !res) return error_response(res.error());

    if (auto* task = registry_.get(id)) {
        auto lock = registry_.lock();
        if (task->status == TaskStatus::Active) task->status = TaskStatus::Stopped;
    }
    log("Stopping session " + id);
    return {{"status", "ok"}};
}

nlohmann::json Coordinator::handle_output(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    size_t lines = cmd.value("lines", DEFAULT_OUTPUT_LINES);
    auto output = sessions_.get_output(id, lines);
    if (!output) return error_response(output.error());

    std::string text = cmd.value("raw", false) ? *output : sanitize::clean_for_display(*output);
    return {{"status", "ok"}, {"output", text}};
}

nlohmann::json Coordinator::handle_list(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"sessions", nlohmann::json::array()}};
    for (auto& info : sessions_.list()) {
        resp["sessions"].push_back(session_to_json(info));
    }
    return resp;
}

nlohmann::json Coordinator::handle_tasks(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"tasks", nlohmann::json::array()}};
    for (auto& task : registry_.all()) {
        resp["tasks"].push_back(task_to_json(task, false));
    }
    return resp;
}

nlohmann::json Coordinator::handle_task(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    auto task = registry_.snapshot(id);
    if (!task) return error_response("no task registered for session " + id);
    return {{"status", "ok"}, {"task", task_to_json(*task, true)}};
}

nlohmann::json Coordinator::handle_pending(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"pending", nlohmann::json::array()}};
    for (auto& p : registry_.pending()) {
        resp["pending"].push_back({
            {"session_id", p.session_id},
            {"prompt_text", p.prompt_text},
            {"recent_output", p.recent_output},
            {"suggested", decision_to_json(p.suggested)},
            {"created_at", epoch_ms(p.created_at)},
        });
    }
    return resp;
}

nlohmann::json Coordinator::handle_confirm(const nlohmann::json& cmd) {
    auto id = cmd.at("session_id").get<std::string>();
    bool approved = cmd.value("approved", true);

    std::optional<CoordinationDecision> override_decision;
    if (cmd.contains("decision")) {
        auto parsed = prompts::parse_decision(cmd["decision"].dump());
        if (!parsed) return error_response("invalid decision override: " + parsed.error().message);
        override_decision = std::move(*parsed);
    }

    if (auto res = decisions_.confirm_decision(id, approved, std::move(override_decision)); !res) {
        return error_response(res.error());
    }
    return {{"status", "ok"}};
}

nlohmann::json Coordinator::handle_supervision(const nlohmann::json& cmd) {
    if (cmd.contains("level")) {
        auto level_str = cmd["level"].get<std::string>();
        auto level = parse_supervision(level_str);
        if (!level) return error_response("unknown supervision level: " + level_str);

        decisions_.set_supervision(*level);
        log(std::format("Supervision set to {}", level_str));
        broadcast("supervision_changed", "*", {{"level", level_str}});
    }
    return {{"status", "ok"}, {"level", to_string(decisions_.supervision())}};
}

nlohmann::json Coordinator::handle_status(const nlohmann::json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"sessions", sessions_.list().size()},
        {"tasks", registry_.size()},
        {"pending", registry_.pending().size()},
        {"workers", workers_.size()},
        {"supervision", to_string(decisions_.supervision())},
        {"subscribers", subscribers_.size()},
    };
}

void Coordinator::on_session_event(const std::string& id, const SessionEvent& event) {
    auto* task = registry_.get(id);
    if (!task) {
        log(std::format("Ignoring {} event for unregistered session {}", event_name(event), id));
        return;
    }

    if (auto it = workers_.find(id); it != workers_.end()) {
        auto* blocked = std::get_if<BlockedEvent>(&event);
        bool deferrable = std::holds_alternative<ExitEvent>(event) ||
                          std::holds_alternative<ToolRunningEvent>(event) ||
                          (blocked && blocked->auto_responded);
        if (deferrable) {
            it->second->deferred.push_back(event);
        } else {
            log(std::format("Dropping {} event for {} ({} in flight)",
                            event_name(event), id, it->second->what));
        }
        return;
    }

    auto now = std::chrono::system_clock::now();
    {
        auto lock = registry_.lock();
        task->last_activity_at = now;
        task->idle_check_count = 0;
    }

    if (std::holds_alternative<ReadyEvent>(event)) {
        broadcast("ready", id);
    } else if (auto* blocked = std::get_if<BlockedEvent>(&event)) {
        if (blocked->auto_responded) {
            if (auto res = decisions_.handle_blocked(id, *task, *blocked); !res) {
                log("Auto-response bookkeeping failed: " + res.error().message);
            }
        } else {
            dispatch(id, "blocked decision", [this, id, task, ev = *blocked] {
                return decisions_.handle_blocked(id, *task, ev);
            });
        }
    } else if (auto* turn = std::get_if<TurnCompleteEvent>(&event)) {
        broadcast("turn_complete", id, {{"response", excerpt(turn->response, 2000)}});
        dispatch(id, "turn assessment", [this, id, task, ev = *turn] {
            return decisions_.handle_turn_complete(id, *task, ev);
        });
    } else if (auto* tool = std::get_if<ToolRunningEvent>(&event)) {
        nlohmann::json data = {{"tool", tool->tool}};
        if (registry_.should_notify(id, now, std::chrono::seconds(config_.coordinator.tool_notify_seconds))) {
            data["notify"] = true;
            if (auto output = sessions_.get_output(id, TOOL_OUTPUT_LINES)) {
                auto url = sanitize::extract_dev_server_url(*output);
                if (!url.empty()) data["dev_server_url"] = url;
            }
        }
        broadcast("tool_running", id, std::move(data));
    } else if (auto* exit = std::get_if<ExitEvent>(&event)) {
        std::string task_status;
        {
            auto lock = registry_.lock();
            if (task->status == TaskStatus::Active) {
                task->status = exit->status == SessionStatus::Failed ? TaskStatus::Error
                                                                     : TaskStatus::Stopped;
            }
            task_status = to_string(task->status);
        }
        log(std::format("Session {} exited with code {} ({})", id, exit->exit_code, task_status));
        broadcast("stopped", id, {
            {"exit_code", exit->exit_code},
            {"session_status", to_string(exit->status)},
            {"task_status", task_status},
        });
        registry_.remove(id);
    }

    flush_broadcasts();
}

void Coordinator::dispatch(const std::string& id, std::string what,
                           std::function<DecisionLoop::Result()> job) {
    auto worker = std::make_unique<Worker>();
    worker->what = std::move(what);
    auto* raw = worker.get();
    workers_.emplace(id, std::move(worker));

    raw->thread = std::jthread([this, raw, job = std::move(job)](std::stop_token) {
        raw->result = job();
        raw->done.store(true, std::memory_order_release);
        notify_();
    });
}

void Coordinator::on_worker_complete() {
    std::vector<std::pair<std::string, std::vector<SessionEvent>>> replay;

    for (auto it = workers_.begin(); it != workers_.end();) {
        auto& worker = *it->second;
        if (!worker.done.load(std::memory_order_acquire)) {
            ++it;
            continue;
        }

        if (worker.thread.joinable()) worker.thread.join();
        if (!worker.result) {
            log(std::format("{} for {} failed: {}", worker.what, it->first, worker.result.error().message));
        }
        replay.emplace_back(it->first, std::move(worker.deferred));
        it = workers_.erase(it);
    }

    for (auto& [id, events] : replay) {
        for (auto& event : events) {
            on_session_event(id, event);
        }
    }

    flush_broadcasts();
}

void Coordinator::tick(std::chrono::system_clock::time_point now) {
    if (now - last_scan_ >= std::chrono::seconds(config_.coordinator.scan_interval_seconds)) {
        last_scan_ = now;
        scan_idle(now);
    }
    flush_broadcasts();
}

void Coordinator::scan_idle(std::chrono::system_clock::time_point now) {
    auto threshold = std::chrono::seconds(config_.coordinator.idle_threshold_seconds);
    auto max_checks = config_.coordinator.max_idle_checks;

    for (auto& snap : registry_.all()) {
        const auto& id = snap.session_id;
        if (snap.status != TaskStatus::Active) continue;
        if (workers_.contains(id) || registry_.is_in_flight(id)) continue;

        auto idle = now - snap.last_activity_at;
        if (idle < threshold) continue;

        auto* task = registry_.get(id);
        if (!task) continue;

        if (auto output = sessions_.get_output(id, IDLE_OUTPUT_LINES)) {
            if (registry_.swap_last_seen_output(id, *output) != *output) {
                auto lock = registry_.lock();
                task->last_activity_at = now;
                task->idle_check_count = 0;
                continue;
            }
        }

        uint32_t check;
        {
            auto lock = registry_.lock();
            check = ++task->idle_check_count;
        }
        int idle_minutes = static_cast<int>(std::lround(
            std::chrono::duration<double>(idle).count() / 60.0));

        if (check > max_checks) {
            auto reasoning = std::format("Force-escalated after {} idle checks with no activity", max_checks);
            {
                auto lock = registry_.lock();
                task->decisions.push_back(Decision{
                    .timestamp = now,
                    .event = DecisionEvent::IdleWatchdog,
                    .prompt_text = std::format("Idle for {} minutes", idle_minutes),
                    .kind = DecisionKind::Escalate,
                    .reasoning = reasoning,
                });
            }
            log(std::format("\"{}\" idle for {}m, {}", task->label, idle_minutes, reasoning));
            broadcast("escalation", id, {
                {"reason", "idle_watchdog_max_checks"},
                {"idle_minutes", idle_minutes},
                {"idle_check_count", check},
                {"reasoning", reasoning},
            });
            continue;
        }

        log(std::format("\"{}\" idle for {}m, running idle check {}/{}",
                        task->label, idle_minutes, check, max_checks));
        dispatch(id, "idle check", [this, id, task, idle_minutes] {
            return decisions_.handle_idle_check(id, *task, idle_minutes);
        });
    }
}

void Coordinator::flush_broadcasts() {
    auto events = sink_.take();
    for (auto& event : events) {
        log(std::format("event {} {}", event.type, event.session_id));
        auto j = event.to_json();
        std::vector<int> dropped;
        for (int fd : subscribers_) {
            if (!ipc_.send_response(fd, j)) dropped.push_back(fd);
        }
        for (int fd : dropped) {
            log(std::format("Dropping subscriber {}", fd));
            remove_subscriber(fd);
        }
    }
}

void Coordinator::add_subscriber(int fd) {
    if (std::ranges::find(subscribers_, fd) == subscribers_.end()) {
        subscribers_.push_back(fd);
    }
}

void Coordinator::remove_subscriber(int fd) {
    std::erase(subscribers_, fd);
}

void Coordinator::shutdown() {
    if (!workers_.empty()) {
        log(std::format("Waiting for {} decision worker(s) to finish...", workers_.size()));
    }
    for (auto& [id, worker] : workers_) {
        if (worker->thread.joinable()) worker->thread.join();
    }
    on_worker_complete();
}

void Coordinator::broadcast(const std::string& type, const std::string& session_id, nlohmann::json data) {
    sink_.broadcast(SwarmEvent{
        .type = type,
        .session_id = session_id,
        .timestamp = epoch_ms(),
        .data = std::move(data),
    });
}

void Coordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-herder] {}", msg);
    }
}
