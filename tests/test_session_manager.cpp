#include <catch2/catch_test_macros.hpp>

#include "mocks.hpp"
#include "session_manager.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

Config make_config() {
    Config cfg;
    cfg.sessions.settle_ms = 0;
    cfg.sessions.kill_grace_ms = 1000;
    cfg.sessions.tombstone_seconds = 60;
    cfg.sessions.cols = 132;
    cfg.sessions.rows = 43;
    cfg.agents["mock"] = AgentProfile{
        .command = "/bin/sh",
        .args = {"-i"},
        .ready = "^ready>$",
        .tool_running = "^Running: (.+)$",
        .blocked = {
            {.pattern = R"(Trust folder\?)", .keys = {"enter"}},
            {.pattern = R"(Overwrite\?)", .response = "y"},
            {.pattern = R"(Proceed\?)"},
        },
    };
    cfg.agents["ghost"] = AgentProfile{.command = "ah-test-no-such-binary"};
    return cfg;
}

struct Fixture {
    Fixture()
        : mgr(make_config(), launcher,
              [this](const std::string& id, const SessionEvent& ev) { events.emplace_back(id, ev); },
              [this](int fd, bool watch) { watches.emplace_back(fd, watch); }) {}

    SessionInfo spawn(std::string task = {}) {
        auto info = mgr.spawn(SpawnOptions{
            .name = "worker",
            .agent_type = "mock",
            .workdir = "/tmp",
            .initial_task = std::move(task),
        });
        REQUIRE(info.has_value());
        return *info;
    }

    MockTerminalProcess& proc(size_t i = 0) { return *launcher.processes.at(i); }

    // Deliver output and let it settle.
    void feed(const std::string& text, size_t i = 0) {
        proc(i).pending += text;
        REQUIRE(mgr.on_readable(proc(i).fd()));
        mgr.tick(SessionManager::Clock::now());
    }

    template <typename T>
    std::vector<T> events_of() const {
        std::vector<T> out;
        for (auto& [id, ev] : events) {
            if (auto* e = std::get_if<T>(&ev)) out.push_back(*e);
        }
        return out;
    }

    MockLauncher launcher;
    std::vector<std::pair<std::string, SessionEvent>> events;
    std::vector<std::pair<int, bool>> watches;
    SessionManager mgr;
};

} // namespace

TEST_CASE("terminal_key_sequence", "[session_manager]") {
    REQUIRE(terminal_key_sequence("enter") == "\r");
    REQUIRE(terminal_key_sequence("Enter") == "\r");
    REQUIRE(terminal_key_sequence("escape") == "\x1b");
    REQUIRE(terminal_key_sequence("down") == "\x1b[B");
    REQUIRE(terminal_key_sequence("ctrl+c") == "\x03");
    REQUIRE(terminal_key_sequence("y") == "y");
    REQUIRE(terminal_key_sequence("ctrl+1") == "ctrl+1");
    // Non-ASCII names pass through untouched
    REQUIRE(terminal_key_sequence("\xc3\x89nter") == "\xc3\x89nter");
    REQUIRE(terminal_key_sequence("\xff") == "\xff");
}

TEST_CASE("SessionManager spawn", "[session_manager]") {
    Fixture f;

    SECTION("UnknownAgentType") {
        auto r = f.mgr.spawn(SpawnOptions{.agent_type = "nope", .workdir = "/tmp"});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == SessionError::Kind::Spawn);
        REQUIRE(f.launcher.specs.empty());
    }

    SECTION("MissingWorkdir") {
        auto r = f.mgr.spawn(SpawnOptions{.agent_type = "mock", .workdir = "/nonexistent/ah-test"});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == SessionError::Kind::Spawn);
    }

    SECTION("MissingExecutable") {
        auto r = f.mgr.spawn(SpawnOptions{.agent_type = "ghost", .workdir = "/tmp"});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().message.find("ah-test-no-such-binary") != std::string::npos);
    }

    SECTION("LaunchFailure") {
        f.launcher.fail = true;
        auto r = f.mgr.spawn(SpawnOptions{.agent_type = "mock", .workdir = "/tmp"});
        REQUIRE_FALSE(r);
        REQUIRE(r.error().message == "exec failed");
        REQUIRE(f.mgr.list().empty());
    }

    SECTION("LaunchSpecFromProfileAndOptions") {
        auto r = f.mgr.spawn(SpawnOptions{
            .agent_type = "mock",
            .workdir = "/tmp",
            .env = {{"FOO", "bar"}},
            .extra_args = {"--fast"},
        });
        REQUIRE(r.has_value());

        auto& spec = f.launcher.specs.at(0);
        REQUIRE(spec.program == "/bin/sh");
        REQUIRE(spec.args == std::vector<std::string>{"-i", "--fast"});
        REQUIRE(spec.workdir == "/tmp");
        REQUIRE(spec.env.at("FOO") == "bar");
        REQUIRE(spec.cols == 132);
        REQUIRE(spec.rows == 43);
    }

    SECTION("SessionInfo") {
        auto info = f.spawn();
        REQUIRE(info.id.starts_with("pty-"));
        REQUIRE(info.name == "worker");
        REQUIRE(info.agent_type == "mock");
        REQUIRE(info.pid == 4242);
        REQUIRE(info.status == SessionStatus::Starting);
        REQUIRE(f.watches == std::vector<std::pair<int, bool>>{{100, true}});

        REQUIRE(f.mgr.list().size() == 1);
        REQUIRE(f.mgr.info(info.id)->name == "worker");
    }

    SECTION("IdsAreUnique") {
        auto a = f.spawn();
        auto b = f.spawn();
        REQUIRE(a.id != b.id);
        REQUIRE(f.mgr.list().size() == 2);
    }
}

TEST_CASE("SessionManager classification", "[session_manager]") {
    Fixture f;

    SECTION("FirstReadySendsInitialTask") {
        auto info = f.spawn("fix the bug");
        f.feed("Welcome\nready>");

        REQUIRE(f.events_of<ReadyEvent>().size() == 1);
        REQUIRE(f.proc().written == "fix the bug\r");
        REQUIRE(f.mgr.info(info.id)->status == SessionStatus::Active);
    }

    SECTION("ReturnToReadyCompletesTurn") {
        f.spawn("fix the bug");
        f.feed("Welcome\nready>");
        f.feed("fix the bug\nPatched src/auth.ts\n");
        REQUIRE(f.events_of<TurnCompleteEvent>().empty());

        f.feed("ready>");
        auto turns = f.events_of<TurnCompleteEvent>();
        REQUIRE(turns.size() == 1);
        REQUIRE(turns[0].response.find("Patched src/auth.ts") != std::string::npos);
        REQUIRE(f.events_of<ReadyEvent>().size() == 1);
    }

    SECTION("SendStartsNewTurn") {
        auto info = f.spawn();
        f.feed("ready>");
        REQUIRE(f.mgr.send(info.id, "run the tests"));
        REQUIRE(f.proc().written == "run the tests\r");

        f.feed("run the tests\n12 passed\nready>");
        auto turns = f.events_of<TurnCompleteEvent>();
        REQUIRE(turns.size() == 1);
        REQUIRE(turns[0].response.find("12 passed") != std::string::npos);
    }

    SECTION("BlockedPromptReportedOnce") {
        auto info = f.spawn();
        f.feed("Edit config.json\nProceed?\n1. Yes\n2. No\n");
        f.feed("\n");

        auto blocked = f.events_of<BlockedEvent>();
        REQUIRE(blocked.size() == 1);
        REQUIRE_FALSE(blocked[0].auto_responded);
        REQUIRE(blocked[0].prompt_info.prompt == "Proceed?\n1. Yes\n2. No");
        REQUIRE(f.mgr.info(info.id)->status == SessionStatus::Blocked);
        REQUIRE(f.proc().written.empty());
    }

    SECTION("AnsweringUnblocks") {
        auto info = f.spawn();
        f.feed("Proceed?\n");
        REQUIRE(f.mgr.send_keys(info.id, {"down", "enter"}));
        REQUIRE(f.proc().written == "\x1b[B\r");
        REQUIRE(f.mgr.info(info.id)->status == SessionStatus::Active);

        // The same prompt drawn again after the answer is a new prompt
        f.feed("Proceed?\n");
        REQUIRE(f.events_of<BlockedEvent>().size() == 2);
    }

    SECTION("AutoRespondWithKeys") {
        f.spawn();
        f.feed("Trust folder?\n");

        auto blocked = f.events_of<BlockedEvent>();
        REQUIRE(blocked.size() == 1);
        REQUIRE(blocked[0].auto_responded);
        REQUIRE(f.proc().written == "\r");
    }

    SECTION("AutoRespondWithText") {
        f.spawn();
        f.feed("Overwrite? (y/n)\n");
        REQUIRE(f.proc().written == "y\r");
        REQUIRE(f.events_of<BlockedEvent>().at(0).auto_responded);
    }

    SECTION("ToolRunningReportedOncePerTool") {
        f.spawn();
        f.feed("Running: npm run dev\n");
        f.feed("compiled\n");
        f.feed("Running: npm test\n");

        auto tools = f.events_of<ToolRunningEvent>();
        REQUIRE(tools.size() == 2);
        REQUIRE(tools[0].tool == "npm run dev");
        REQUIRE(tools[1].tool == "npm test");
    }

    SECTION("NoClassificationBeforeSettle") {
        Config cfg = make_config();
        cfg.sessions.settle_ms = 60'000;
        std::vector<SessionEvent> seen;
        SessionManager mgr(cfg, f.launcher, [&](const std::string&, const SessionEvent& ev) { seen.push_back(ev); }, {});
        auto info = mgr.spawn(SpawnOptions{.agent_type = "mock", .workdir = "/tmp"});
        REQUIRE(info);

        auto& proc = *f.launcher.processes.back();
        proc.pending = "ready>";
        REQUIRE(mgr.on_readable(proc.fd()));
        mgr.tick(SessionManager::Clock::now());
        REQUIRE(seen.empty());

        mgr.tick(SessionManager::Clock::now() + 61s);
        REQUIRE(seen.size() == 1);
    }
}

TEST_CASE("SessionManager control errors", "[session_manager]") {
    Fixture f;
    auto info = f.spawn();

    SECTION("UnknownSession") {
        REQUIRE(f.mgr.send("missing", "hi").error().kind == SessionError::Kind::UnknownSession);
        REQUIRE(f.mgr.send_keys("missing", {"enter"}).error().kind == SessionError::Kind::UnknownSession);
        REQUIRE(f.mgr.stop("missing").error().kind == SessionError::Kind::UnknownSession);
        REQUIRE(f.mgr.get_output("missing", 10).error().kind == SessionError::Kind::UnknownSession);
    }

    SECTION("WriteFailureIsIoError") {
        f.proc().fail_writes = true;
        REQUIRE(f.mgr.send(info.id, "hi").error().kind == SessionError::Kind::Io);
        REQUIRE(f.mgr.send_keys(info.id, {"enter"}).error().kind == SessionError::Kind::Io);
    }

    SECTION("InputWaitsWhileTerminalIsFull") {
        f.proc().accept = 4;
        REQUIRE(f.mgr.send(info.id, "run the tests").has_value());
        REQUIRE(f.mgr.send_keys(info.id, {"enter"}).has_value());
        REQUIRE(f.proc().written == "run ");

        // Still full: nothing moves, nothing fails
        f.mgr.tick(SessionManager::Clock::now());
        REQUIRE(f.proc().written == "run ");

        f.proc().accept = SIZE_MAX;
        f.mgr.tick(SessionManager::Clock::now());
        REQUIRE(f.proc().written == "run the tests\r\r");
    }

    SECTION("BacklogFlushedWhenOutputArrives") {
        f.proc().accept = 0;
        REQUIRE(f.mgr.send(info.id, "hello").has_value());
        REQUIRE(f.proc().written.empty());

        f.proc().accept = SIZE_MAX;
        f.proc().pending = "hello\n";
        REQUIRE(f.mgr.on_readable(f.proc().fd()));
        REQUIRE(f.proc().written == "hello\r");
    }

    SECTION("OversizedBacklogIsIoError") {
        f.proc().accept = 0;
        auto r = f.mgr.send(info.id, std::string(2 * 1024 * 1024, 'x'));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == SessionError::Kind::Io);
        REQUIRE(f.proc().written.empty());

        // Nothing half-queued; a normal instruction still goes through
        f.proc().accept = SIZE_MAX;
        REQUIRE(f.mgr.send(info.id, "ok").has_value());
        REQUIRE(f.proc().written == "ok\r");
    }

    SECTION("GetOutputTail") {
        f.feed("one\ntwo\nthree\n");
        REQUIRE(f.mgr.get_output(info.id, 2).value() == "two\nthree");
    }

    SECTION("UnreadableFdIsNotOurs") {
        REQUIRE_FALSE(f.mgr.on_readable(999));
    }
}

TEST_CASE("SessionManager stop and exit", "[session_manager]") {
    Fixture f;
    auto info = f.spawn();

    SECTION("StopTerminatesOnce") {
        REQUIRE(f.mgr.stop(info.id));
        REQUIRE(f.mgr.stop(info.id));
        REQUIRE(f.proc().terminates == 1);
        REQUIRE(f.mgr.info(info.id)->status == SessionStatus::Stopped);
        REQUIRE(f.watches.back() == std::pair<int, bool>{100, false});
        REQUIRE(f.mgr.list().empty());

        REQUIRE(f.mgr.send(info.id, "hi").error().kind == SessionError::Kind::InactiveSession);
        REQUIRE(f.mgr.get_output(info.id, 5).error().kind == SessionError::Kind::InactiveSession);
    }

    SECTION("StopKeepsRequestedStatus") {
        REQUIRE(f.mgr.stop(info.id, SessionStatus::Completed));
        f.proc().exit_code = 143;
        f.mgr.reap();

        auto exits = f.events_of<ExitEvent>();
        REQUIRE(exits.size() == 1);
        REQUIRE(exits[0].exit_code == 143);
        REQUIRE(exits[0].status == SessionStatus::Completed);
    }

    SECTION("StubbornProcessKilledAfterGrace") {
        REQUIRE(f.mgr.stop(info.id));
        f.mgr.tick(SessionManager::Clock::now());
        REQUIRE(f.proc().kills == 0);
        f.mgr.tick(SessionManager::Clock::now() + 2s);
        REQUIRE(f.proc().kills == 1);
    }

    SECTION("CleanExitCompletes") {
        f.proc().exit_code = 0;
        f.mgr.reap();

        auto exits = f.events_of<ExitEvent>();
        REQUIRE(exits.size() == 1);
        REQUIRE(exits[0].status == SessionStatus::Completed);
        REQUIRE(f.mgr.info(info.id)->status == SessionStatus::Completed);
        REQUIRE(f.mgr.list().empty());
    }

    SECTION("FailedExit") {
        f.proc().exit_code = 1;
        f.mgr.reap();
        REQUIRE(f.events_of<ExitEvent>().at(0).status == SessionStatus::Failed);
        REQUIRE(f.mgr.send(info.id, "hi").error().kind == SessionError::Kind::InactiveSession);
    }

    SECTION("ExitReportedOnce") {
        f.proc().exit_code = 0;
        f.mgr.reap();
        f.mgr.reap();
        REQUIRE(f.events_of<ExitEvent>().size() == 1);
    }

    SECTION("TombstoneExpires") {
        f.proc().exit_code = 0;
        f.mgr.reap();
        REQUIRE(f.mgr.info(info.id).has_value());
        f.mgr.tick(SessionManager::Clock::now() + 61s);
        REQUIRE_FALSE(f.mgr.info(info.id).has_value());
    }

    SECTION("StopAll") {
        auto second = f.spawn();
        f.mgr.stop_all();
        REQUIRE(f.proc(0).terminates == 1);
        REQUIRE(f.proc(1).terminates == 1);
        REQUIRE(f.mgr.list().empty());
    }
}
