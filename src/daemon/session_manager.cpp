#include "session_manager.hpp"

#include "classifier/rule_classifier.hpp"
#include "platform/platform_paths.hpp"
#include "text/sanitize.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <print>
#include <random>
#include <unordered_map>

namespace fs = std::filesystem;

std::string terminal_key_sequence(std::string_view key) {
    static const std::unordered_map<std::string, std::string> named = {
        {"enter", "\r"},      {"return", "\r"},     {"escape", "\x1b"},
        {"esc", "\x1b"},      {"tab", "\t"},        {"space", " "},
        {"backspace", "\x7f"}, {"delete", "\x1b[3~"}, {"up", "\x1b[A"},
        {"down", "\x1b[B"},   {"right", "\x1b[C"},  {"left", "\x1b[D"},
        {"home", "\x1b[H"},   {"end", "\x1b[F"},    {"pageup", "\x1b[5~"},
        {"pagedown", "\x1b[6~"},
    };

    std::string lower(key);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (auto it = named.find(lower); it != named.end()) {
        return it->second;
    }
    if (lower.size() == 6 && lower.starts_with("ctrl+")) {
        char c = lower[5];
        if (c >= 'a' && c <= 'z') return std::string(1, static_cast<char>(c - 'a' + 1));
    }
    return std::string(key);
}

SessionManager::SessionManager(Config config, ProcessLauncher& launcher,
                               EventCallback on_event, WatchCallback watch)
    : config_(std::move(config)), launcher_(launcher),
      on_event_(std::move(on_event)), watch_(std::move(watch)) {}

SessionManager::~SessionManager() = default;

std::expected<SessionInfo, SessionError> SessionManager::spawn(const SpawnOptions& options) {
    auto profile_it = config_.agents.find(options.agent_type);
    if (profile_it == config_.agents.end()) {
        return std::unexpected(SessionError::spawn("unknown agent type: " + options.agent_type));
    }
    const auto& profile = profile_it->second;

    std::error_code ec;
    std::string workdir = options.workdir.empty() ? fs::current_path(ec).string() : options.workdir;
    if (!fs::is_directory(workdir, ec)) {
        return std::unexpected(SessionError::spawn("working directory does not exist: " + workdir));
    }

    auto program = platform::find_executable(profile.command);
    if (program.empty()) {
        return std::unexpected(SessionError::spawn("executable not found: " + profile.command));
    }

    LaunchSpec spec{
        .program = program,
        .args = profile.args,
        .workdir = workdir,
        .env = options.env,
        .cols = config_.sessions.cols,
        .rows = config_.sessions.rows,
    };
    spec.args.insert(spec.args.end(), options.extra_args.begin(), options.extra_args.end());

    auto process = launcher_.launch(spec);
    if (!process) {
        return std::unexpected(SessionError::spawn(process.error()));
    }

    auto now = std::chrono::system_clock::now();
    Session s;
    s.info = SessionInfo{
        .id = generate_id(),
        .name = options.name.empty() ? options.agent_type : options.name,
        .agent_type = options.agent_type,
        .workdir = workdir,
        .pid = (*process)->pid(),
        .status = SessionStatus::Starting,
        .created_at = now,
        .last_output_at = now,
    };
    s.process = std::move(*process);
    s.classifier = std::make_unique<RuleClassifier>(profile);
    s.pending_task = options.initial_task;
    s.last_output = Clock::now();
    s.watching = true;

    int fd = s.process->fd();
    SessionInfo info = s.info;
    {
        std::lock_guard lock(mutex_);
        buffers_.emplace(info.id, OutputLog(config_.sessions.max_log_lines));
        sessions_.emplace(info.id, std::move(s));
    }

    if (watch_) watch_(fd, true);
    return info;
}

std::expected<SessionManager::Session*, SessionError> SessionManager::find_active(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::unexpected(SessionError::unknown(id));
    }
    auto& s = it->second;
    if (!s.process || s.stopping || is_terminal(s.info.status)) {
        return std::unexpected(SessionError::inactive(id));
    }
    return &s;
}

std::expected<void, SessionError> SessionManager::send(const std::string& id, const std::string& text) {
    std::lock_guard lock(mutex_);
    auto s = find_active(id);
    if (!s) return std::unexpected(s.error());

    if (auto sent = begin_turn_locked(**s, text); !sent) {
        return std::unexpected(SessionError::io(id, sent.error()));
    }
    return {};
}

std::expected<void, SessionError> SessionManager::send_keys(const std::string& id,
                                                            const std::vector<std::string>& keys) {
    std::lock_guard lock(mutex_);
    auto s = find_active(id);
    if (!s) return std::unexpected(s.error());

    auto& session = **s;
    for (auto& key : keys) {
        if (auto sent = write_locked(session, terminal_key_sequence(key)); !sent) {
            return std::unexpected(SessionError::io(id, sent.error()));
        }
    }

    session.scan_from = buffers_[id].marker();
    session.last_prompt.clear();
    if (session.info.status == SessionStatus::Blocked) {
        session.info.status = SessionStatus::Active;
    }
    return {};
}

std::expected<void, SessionError> SessionManager::stop(const std::string& id, SessionStatus final_status) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::unexpected(SessionError::unknown(id));
    }

    auto& s = it->second;
    if (s.stopping || !s.process || is_terminal(s.info.status)) {
        return {};
    }

    s.stopping = true;
    s.info.status = final_status;
    s.process->terminate();
    s.kill_deadline = Clock::now() + std::chrono::milliseconds(config_.sessions.kill_grace_ms);
    unwatch_locked(s);

    buffers_.erase(id);
    markers_.erase(id);
    return {};
}

std::expected<std::string, SessionError> SessionManager::get_output(const std::string& id, size_t lines) {
    std::lock_guard lock(mutex_);
    auto s = find_active(id);
    if (!s) return std::unexpected(s.error());

    auto it = buffers_.find(id);
    if (it == buffers_.end()) return std::string{};
    return it->second.tail(lines);
}

std::vector<SessionInfo> SessionManager::list() const {
    std::lock_guard lock(mutex_);
    std::vector<SessionInfo> out;
    for (auto& [id, s] : sessions_) {
        if (s.process && !s.stopping) out.push_back(s.info);
    }
    std::ranges::sort(out, {}, &SessionInfo::created_at);
    return out;
}

std::optional<SessionInfo> SessionManager::info(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.info;
}

bool SessionManager::on_readable(int fd) {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(sessions_, [fd](const auto& entry) {
        return entry.second.watching && entry.second.process && entry.second.process->fd() == fd;
    });
    if (it == sessions_.end()) return false;

    auto& s = it->second;
    drain_locked(s);
    if (!flush_input_locked(s)) {
        // Terminal gone; reap() reports the exit.
        s.input_backlog.clear();
    }
    return true;
}

void SessionManager::reap() {
    PendingEvents events;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, s] : sessions_) {
            if (!s.process) continue;
            if (auto code = s.process->try_reap()) {
                drain_locked(s);
                finish_locked(s, *code, events);
            }
        }
    }
    deliver(events);
}

void SessionManager::tick(Clock::time_point now) {
    PendingEvents events;
    {
        std::lock_guard lock(mutex_);
        auto settle = std::chrono::milliseconds(config_.sessions.settle_ms);
        auto tombstone_ttl = std::chrono::seconds(config_.sessions.tombstone_seconds);

        for (auto it = sessions_.begin(); it != sessions_.end();) {
            auto& s = it->second;

            if (s.tombstone_since && now - *s.tombstone_since >= tombstone_ttl) {
                it = sessions_.erase(it);
                continue;
            }

            if (s.process && s.stopping && s.kill_deadline && now >= *s.kill_deadline) {
                std::println(stderr, "pty: {} ignored SIGTERM, killing", s.info.id);
                s.process->kill();
                s.kill_deadline.reset();
            }

            if (s.process && !s.stopping && !flush_input_locked(s)) {
                std::println(stderr, "pty: {} closed with {} bytes of input unsent",
                             s.info.id, s.input_backlog.size());
                s.input_backlog.clear();
            }

            if (s.process && !s.stopping && s.dirty && now - s.last_output >= settle) {
                s.dirty = false;
                classify_locked(s, events);
            }
            ++it;
        }
    }
    deliver(events);
}

void SessionManager::stop_all() {
    std::lock_guard lock(mutex_);
    for (auto& [id, s] : sessions_) {
        if (!s.process || s.stopping) continue;
        s.stopping = true;
        s.info.status = SessionStatus::Stopped;
        s.process->terminate();
        s.kill_deadline = Clock::now() + std::chrono::milliseconds(config_.sessions.kill_grace_ms);
        unwatch_locked(s);
    }
    buffers_.clear();
    markers_.clear();
}

std::expected<void, std::string> SessionManager::write_locked(Session& s, std::string_view data) {
    if (!flush_input_locked(s)) return std::unexpected(std::string("terminal closed"));

    if (s.input_backlog.empty()) {
        ssize_t n = s.process->write(data);
        if (n < 0) return std::unexpected(std::string("terminal closed"));
        data.remove_prefix(static_cast<size_t>(n));
        if (data.empty()) return {};
    }

    if (s.input_backlog.size() + data.size() > MAX_INPUT_BACKLOG) {
        return std::unexpected(std::format("terminal not reading input ({} bytes pending)",
                                           s.input_backlog.size()));
    }
    s.input_backlog.append(data);
    return {};
}

// Returns false if the terminal is gone.
bool SessionManager::flush_input_locked(Session& s) {
    if (s.input_backlog.empty()) return true;
    ssize_t n = s.process->write(s.input_backlog);
    if (n < 0) return false;
    s.input_backlog.erase(0, static_cast<size_t>(n));
    return true;
}

std::expected<void, std::string> SessionManager::begin_turn_locked(Session& s, const std::string& text) {
    if (s.input_backlog.size() + text.size() + 1 > MAX_INPUT_BACKLOG) {
        return std::unexpected(std::format("terminal not reading input ({} bytes pending)",
                                           s.input_backlog.size()));
    }
    if (auto w = write_locked(s, text); !w) return w;
    if (auto w = write_locked(s, "\r"); !w) return w;

    // Nothing can be appended while we hold the lock, so the marker is exactly
    // where the echo of this instruction will start.
    auto& log = buffers_[s.info.id];
    markers_[s.info.id] = log.marker();
    s.scan_from = log.marker();
    s.awaiting_turn = true;
    s.last_prompt.clear();
    s.info.status = SessionStatus::Active;
    return {};
}

void SessionManager::drain_locked(Session& s) {
    auto log_it = buffers_.find(s.info.id);
    if (log_it == buffers_.end() || !s.watching) return;

    char buf[8192];
    // Bounded so one chatty session cannot starve the event loop; epoll is
    // level-triggered and will report the fd again.
    for (int i = 0; i < 16; ++i) {
        ssize_t n = s.process->read(buf, sizeof(buf));
        if (n > 0) {
            log_it->second.append(std::string_view(buf, static_cast<size_t>(n)));
            s.dirty = true;
            s.last_output = Clock::now();
            s.info.last_output_at = std::chrono::system_clock::now();
            continue;
        }
        if (n == 0) {
            // Hung up. The exit itself is reported by reap().
            unwatch_locked(s);
        }
        break;
    }
}

void SessionManager::classify_locked(Session& s, PendingEvents& events) {
    auto& id = s.info.id;
    auto log_it = buffers_.find(id);
    if (log_it == buffers_.end()) return;
    auto& log = log_it->second;

    auto screen = sanitize::strip_control_sequences(log.since(s.scan_from));
    auto c = s.classifier->classify(screen);

    switch (c.kind) {
        case Classification::Kind::Blocked: {
            if (c.prompt == s.last_prompt) break;

            if (c.auto_respond) {
                std::expected<void, std::string> sent;
                if (!c.keys.empty()) {
                    for (auto& key : c.keys) {
                        if (sent) sent = write_locked(s, terminal_key_sequence(key));
                    }
                } else {
                    sent = write_locked(s, c.response);
                    if (sent) sent = write_locked(s, "\r");
                }
                if (!sent) {
                    std::println(stderr, "pty: auto-response to {} failed: {}", id, sent.error());
                    break;
                }
                s.scan_from = log.marker();
                s.last_prompt.clear();
                events.emplace_back(id, BlockedEvent{.prompt_info = {c.prompt}, .auto_responded = true});
            } else {
                s.last_prompt = c.prompt;
                s.info.status = SessionStatus::Blocked;
                events.emplace_back(id, BlockedEvent{.prompt_info = {c.prompt}, .auto_responded = false});
            }
            break;
        }

        case Classification::Kind::Ready:
        case Classification::Kind::TurnComplete: {
            s.last_prompt.clear();
            if (s.info.status == SessionStatus::Starting || s.info.status == SessionStatus::Blocked) {
                s.info.status = SessionStatus::Active;
            }

            if (!s.seen_ready) {
                s.seen_ready = true;
                events.emplace_back(id, ReadyEvent{});
                if (!s.pending_task.empty()) {
                    auto task = std::exchange(s.pending_task, {});
                    if (auto sent = begin_turn_locked(s, task); !sent) {
                        std::println(stderr, "pty: could not send initial task to {}: {}", id, sent.error());
                    }
                }
            } else if (s.awaiting_turn) {
                s.awaiting_turn = false;
                auto response = sanitize::capture_since_marker(id, buffers_, markers_);
                s.scan_from = log.marker();
                events.emplace_back(id, TurnCompleteEvent{std::move(response)});
            }
            break;
        }

        case Classification::Kind::ToolRunning:
            if (c.prompt != s.last_tool) {
                s.last_tool = c.prompt;
                events.emplace_back(id, ToolRunningEvent{c.prompt});
            }
            break;

        case Classification::Kind::None:
            break;
    }
}

void SessionManager::finish_locked(Session& s, int exit_code, PendingEvents& events) {
    unwatch_locked(s);
    if (!s.stopping) {
        s.info.status = exit_code == 0 ? SessionStatus::Completed : SessionStatus::Failed;
    }
    events.emplace_back(s.info.id, ExitEvent{.exit_code = exit_code, .status = s.info.status});

    s.process.reset();
    s.kill_deadline.reset();
    s.tombstone_since = Clock::now();
    buffers_.erase(s.info.id);
    markers_.erase(s.info.id);
}

void SessionManager::unwatch_locked(Session& s) {
    if (!s.watching || !s.process) return;
    s.watching = false;
    if (watch_) watch_(s.process->fd(), false);
}

void SessionManager::deliver(PendingEvents& events) {
    if (!on_event_) return;
    for (auto& [id, event] : events) {
        on_event_(id, event);
    }
}

std::string SessionManager::generate_id() const {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("pty-{}-{:08x}", ms, dist(rng));
}
