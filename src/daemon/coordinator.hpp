#pragma once

#include "config.hpp"
#include "decision_loop.hpp"
#include "event_sink.hpp"
#include "oracle/model_transport.hpp"
#include "platform/ipc_server.hpp"
#include "session.hpp"
#include "session_manager.hpp"
#include "task_registry.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// Routes session events into the decision loop, runs the idle watchdog and
// answers client commands. Everything here runs on the event loop thread
// except the decision workers, which report back through `notify`.
class Coordinator {
public:
    using NotifyCallback = std::function<void()>;

    Coordinator(Config config, bool verbose,
                SessionManager& sessions, ModelTransport& oracle,
                IpcServer& ipc, NotifyCallback notify);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void on_session_event(const std::string& id, const SessionEvent& event);

    // Join finished workers and replay the events they held back.
    void on_worker_complete();

    void tick(std::chrono::system_clock::time_point now);
    void scan_idle(std::chrono::system_clock::time_point now);

    // Send queued broadcasts to subscribers.
    void flush_broadcasts();

    void add_subscriber(int fd);
    void remove_subscriber(int fd);

    bool worker_running(const std::string& id) const { return workers_.contains(id); }

    TaskRegistry& registry() { return registry_; }
    DecisionLoop& decisions() { return decisions_; }

    void shutdown();

private:
    class QueuedSink : public EventSink {
    public:
        explicit QueuedSink(NotifyCallback notify) : notify_(std::move(notify)) {}

        void broadcast(SwarmEvent event) override;
        std::deque<SwarmEvent> take();

    private:
        std::mutex mutex_;
        std::deque<SwarmEvent> queue_;
        NotifyCallback notify_;
    };

    struct Worker {
        std::string what;
        std::jthread thread;
        std::atomic<bool> done{false};
        DecisionLoop::Result result;
        std::vector<SessionEvent> deferred;
    };

    nlohmann::json handle_spawn(const nlohmann::json& cmd);
    nlohmann::json handle_send(const nlohmann::json& cmd);
    nlohmann::json handle_keys(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_output(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_tasks(const nlohmann::json& cmd);
    nlohmann::json handle_task(const nlohmann::json& cmd);
    nlohmann::json handle_pending(const nlohmann::json& cmd);
    nlohmann::json handle_confirm(const nlohmann::json& cmd);
    nlohmann::json handle_supervision(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    void dispatch(const std::string& id, std::string what, std::function<DecisionLoop::Result()> job);
    void broadcast(const std::string& type, const std::string& session_id, nlohmann::json data = nlohmann::json::object());

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    SessionManager& sessions_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    TaskRegistry registry_;
    QueuedSink sink_;
    DecisionLoop decisions_;

    std::vector<int> subscribers_;
    std::chrono::system_clock::time_point last_scan_;

    // Declared last: workers reference the members above.
    std::unordered_map<std::string, std::unique_ptr<Worker>> workers_;
};

nlohmann::json session_to_json(const SessionInfo& info);
nlohmann::json task_to_json(const TaskContext& task, bool with_decisions);
