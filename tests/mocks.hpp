#pragma once

#include "event_sink.hpp"
#include "oracle/model_transport.hpp"
#include "platform/terminal_process.hpp"
#include "session.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Records every process operation the decision loop performs.
class MockSessionControl : public SessionControl {
public:
    std::expected<void, SessionError> send(const std::string& id, const std::string& text) override {
        std::lock_guard lock(mutex);
        if (fail_writes) return std::unexpected(SessionError::inactive(id));
        sent.push_back(text);
        return {};
    }

    std::expected<void, SessionError> send_keys(const std::string& id,
                                                const std::vector<std::string>& keys) override {
        std::lock_guard lock(mutex);
        if (fail_writes) return std::unexpected(SessionError::inactive(id));
        keys_sent.push_back(keys);
        return {};
    }

    std::expected<void, SessionError> stop(const std::string& id, SessionStatus final_status) override {
        std::lock_guard lock(mutex);
        stops.emplace_back(id, final_status);
        return {};
    }

    std::expected<std::string, SessionError> get_output(const std::string& id, size_t /*lines*/) override {
        std::lock_guard lock(mutex);
        if (unknown) return std::unexpected(SessionError::unknown(id));
        return output;
    }

    std::mutex mutex;
    std::vector<std::string> sent;
    std::vector<std::vector<std::string>> keys_sent;
    std::vector<std::pair<std::string, SessionStatus>> stops;
    std::string output;
    bool fail_writes = false;
    bool unknown = false;
};

// Answers with queued replies; an empty queue answers `fallback`.
class MockOracle : public ModelTransport {
public:
    std::expected<std::string, OracleError> complete(const std::string& prompt) override {
        std::function<void()> hook;
        std::expected<std::string, OracleError> result = fallback;
        {
            std::lock_guard lock(mutex);
            ++calls;
            prompts.push_back(prompt);
            if (!replies.empty()) {
                result = std::move(replies.front());
                replies.pop_front();
            }
            hook = during_call;
        }
        if (hook) hook();
        return result;
    }

    void reply(std::string text) { replies.emplace_back(std::move(text)); }
    void fail(OracleError::Kind kind) {
        replies.emplace_back(std::unexpected(OracleError{kind, "mock failure"}));
    }

    std::mutex mutex;
    int calls = 0;
    std::vector<std::string> prompts;
    std::deque<std::expected<std::string, OracleError>> replies;
    std::expected<std::string, OracleError> fallback =
        std::unexpected(OracleError{OracleError::Kind::Transport, "no reply queued"});
    // Runs inside complete(), after the call is counted.
    std::function<void()> during_call;
};

class RecordingSink : public EventSink {
public:
    void broadcast(SwarmEvent event) override {
        std::lock_guard lock(mutex);
        events.push_back(std::move(event));
    }

    size_t count(const std::string& type) {
        std::lock_guard lock(mutex);
        return static_cast<size_t>(std::ranges::count(events, type, &SwarmEvent::type));
    }

    // Last event of `type`; default-constructed if none.
    SwarmEvent last(const std::string& type) {
        std::lock_guard lock(mutex);
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) return *it;
        }
        return {};
    }

    std::mutex mutex;
    std::vector<SwarmEvent> events;
};

// Scripted terminal: output is fed by the test, writes are recorded.
class MockTerminalProcess : public TerminalProcess {
public:
    explicit MockTerminalProcess(int fd, pid_t pid = 4242) : fd_(fd), pid_(pid) {}

    int fd() const override { return fd_; }
    pid_t pid() const override { return pid_; }

    ssize_t read(char* buf, size_t len) override {
        if (pending.empty()) return eof ? 0 : -1;
        size_t n = std::min(len, pending.size());
        std::copy_n(pending.begin(), n, buf);
        pending.erase(0, n);
        return static_cast<ssize_t>(n);
    }

    ssize_t write(std::string_view data) override {
        if (fail_writes) return -1;
        size_t n = std::min(data.size(), accept);
        written += data.substr(0, n);
        accept -= n;
        return static_cast<ssize_t>(n);
    }

    void terminate() override { ++terminates; }
    void kill() override { ++kills; }

    std::optional<int> try_reap() override {
        if (!exit_code) return std::nullopt;
        auto code = exit_code;
        exit_code.reset();
        reaped = true;
        return code;
    }

    std::string pending;
    std::string written;
    size_t accept = SIZE_MAX;  // bytes the child will still take in
    bool eof = false;
    bool fail_writes = false;
    bool reaped = false;
    int terminates = 0;
    int kills = 0;
    std::optional<int> exit_code;

private:
    int fd_;
    pid_t pid_;
};

// Hands out MockTerminalProcess instances and keeps a handle to each.
class MockLauncher : public ProcessLauncher {
public:
    std::expected<std::unique_ptr<TerminalProcess>, std::string> launch(const LaunchSpec& spec) override {
        specs.push_back(spec);
        if (fail) return std::unexpected(std::string("exec failed"));
        auto proc = std::make_unique<MockTerminalProcess>(next_fd++);
        processes.push_back(proc.get());
        return proc;
    }

    std::vector<LaunchSpec> specs;
    std::vector<MockTerminalProcess*> processes;
    bool fail = false;
    int next_fd = 100;
};
