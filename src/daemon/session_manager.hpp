#pragma once

#include "classifier/output_classifier.hpp"
#include "config.hpp"
#include "output_log.hpp"
#include "platform/terminal_process.hpp"
#include "session.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Owns one terminal process per session, buffers its output and turns the
// settled screen into session events.
//
// Threading: on_readable/reap/tick/spawn run on the event loop thread;
// send/send_keys/stop/get_output may also be called from decision workers.
// All state is guarded by one mutex; events are delivered after it is released.
// Terminal writes never block: input the child has not taken yet is kept per
// session and retried from on_readable and tick.
class SessionManager : public SessionControl {
public:
    using Clock = std::chrono::steady_clock;
    using EventCallback = std::function<void(const std::string& id, const SessionEvent& event)>;
    // Start (true) or stop (false) polling a terminal fd.
    using WatchCallback = std::function<void(int fd, bool watch)>;

    SessionManager(Config config, ProcessLauncher& launcher,
                   EventCallback on_event, WatchCallback watch);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    std::expected<SessionInfo, SessionError> spawn(const SpawnOptions& options);

    std::expected<void, SessionError> send(const std::string& id, const std::string& text) override;
    std::expected<void, SessionError> send_keys(const std::string& id,
                                                const std::vector<std::string>& keys) override;
    std::expected<void, SessionError> stop(const std::string& id, SessionStatus final_status) override;
    std::expected<std::string, SessionError> get_output(const std::string& id, size_t lines) override;

    std::expected<void, SessionError> stop(const std::string& id) {
        return stop(id, SessionStatus::Stopped);
    }

    // Live sessions (tombstones excluded).
    std::vector<SessionInfo> list() const;
    std::optional<SessionInfo> info(const std::string& id) const;

    // Returns false if `fd` belongs to no session.
    bool on_readable(int fd);
    void reap();
    void tick(Clock::time_point now);

    // Stop every running session (daemon shutdown).
    void stop_all();

private:
    struct Session {
        SessionInfo info;
        std::unique_ptr<TerminalProcess> process;
        std::unique_ptr<OutputClassifier> classifier;
        std::string pending_task;
        size_t scan_from = 0;       // absolute log line where classification starts
        bool seen_ready = false;
        bool awaiting_turn = false; // instruction sent, waiting to return to ready
        bool dirty = false;         // output since last classification
        bool watching = false;
        bool stopping = false;
        std::string last_prompt;
        std::string last_tool;
        std::string input_backlog;  // written, not yet taken by the terminal
        Clock::time_point last_output;
        std::optional<Clock::time_point> kill_deadline;
        std::optional<Clock::time_point> tombstone_since;
    };

    using PendingEvents = std::vector<std::pair<std::string, SessionEvent>>;

    // Unsent input beyond this fails the write instead of queueing.
    static constexpr size_t MAX_INPUT_BACKLOG = 1024 * 1024;

    // Requires mutex_ held.
    std::expected<Session*, SessionError> find_active(const std::string& id);
    std::expected<void, std::string> write_locked(Session& s, std::string_view data);
    bool flush_input_locked(Session& s);
    std::expected<void, std::string> begin_turn_locked(Session& s, const std::string& text);
    void drain_locked(Session& s);
    void classify_locked(Session& s, PendingEvents& events);
    void finish_locked(Session& s, int exit_code, PendingEvents& events);
    void unwatch_locked(Session& s);

    void deliver(PendingEvents& events);
    std::string generate_id() const;

    Config config_;
    ProcessLauncher& launcher_;
    EventCallback on_event_;
    WatchCallback watch_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, OutputLog> buffers_;
    std::unordered_map<std::string, size_t> markers_;
};

// Terminal byte sequence for a named key ("enter", "up", "ctrl+c", ...).
// Unknown names are returned literally.
std::string terminal_key_sequence(std::string_view key);
