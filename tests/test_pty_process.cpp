#include <catch2/catch_test_macros.hpp>

#include "platform/linux/pty_process.hpp"

#include <chrono>
#include <csignal>
#include <optional>
#include <poll.h>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Read until `needle` shows up, the child hangs up, or the deadline passes.
std::string read_until(TerminalProcess& proc, const std::string& needle,
                       std::chrono::milliseconds timeout = 3000ms) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[1024];

    while (std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{.fd = proc.fd(), .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, 50) <= 0) continue;

        ssize_t n = proc.read(buf, sizeof(buf));
        if (n == 0) break;
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            if (!needle.empty() && out.find(needle) != std::string::npos) break;
        }
    }
    return out;
}

std::optional<int> wait_exit(TerminalProcess& proc, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto code = proc.try_reap()) return code;
        std::this_thread::sleep_for(10ms);
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("PtyProcess", "[pty]") {
    PtyLauncher launcher;

    SECTION("CatRoundTrip") {
        auto proc = launcher.launch(LaunchSpec{.program = "/bin/cat"});
        REQUIRE(proc.has_value());
        auto& p = **proc;
        REQUIRE(p.fd() >= 0);
        REQUIRE(p.pid() > 0);

        REQUIRE(p.write("hello pty\r") == 10);
        auto out = read_until(p, "hello pty");
        REQUIRE(out.find("hello pty") != std::string::npos);

        REQUIRE_FALSE(p.try_reap().has_value());
        p.terminate();
        auto code = wait_exit(p);
        REQUIRE(code.has_value());
        REQUIRE(*code == 128 + SIGTERM);
    }

    SECTION("ExitCodeAndHangup") {
        auto proc = launcher.launch(LaunchSpec{.program = "/bin/sh", .args = {"-c", "echo bye; exit 3"}});
        REQUIRE(proc.has_value());
        auto& p = **proc;

        auto out = read_until(p, "");
        REQUIRE(out.find("bye") != std::string::npos);
        REQUIRE(wait_exit(p) == 3);
        // Reaping is idempotent
        REQUIRE(p.try_reap() == 3);
    }

    SECTION("EnvironmentAndWorkdir") {
        auto proc = launcher.launch(LaunchSpec{
            .program = "/bin/sh",
            .args = {"-c", "echo \"$AH_TEST_VAR:$TERM:$(pwd)\""},
            .workdir = "/tmp",
            .env = {{"AH_TEST_VAR", "marker42"}},
        });
        REQUIRE(proc.has_value());

        auto out = read_until(**proc, "");
        REQUIRE(out.find("marker42:xterm-256color:/tmp") != std::string::npos);
    }

    SECTION("WindowSize") {
        auto proc = launcher.launch(LaunchSpec{
            .program = "/bin/sh",
            .args = {"-c", "stty size"},
            .cols = 123,
            .rows = 45,
        });
        REQUIRE(proc.has_value());
        REQUIRE(read_until(**proc, "").find("45 123") != std::string::npos);
    }

    SECTION("WriteToChildNotReadingReturnsPromptly") {
        auto proc = launcher.launch(LaunchSpec{
            .program = "/bin/sh",
            .args = {"-c", "stty raw -echo; echo ready; sleep 30"},
        });
        REQUIRE(proc.has_value());
        auto& p = **proc;
        REQUIRE(read_until(p, "ready").find("ready") != std::string::npos);

        // Larger than the kernel's tty buffering.
        std::string big(4 * 1024 * 1024, 'x');
        auto start = std::chrono::steady_clock::now();
        ssize_t n = p.write(big);
        ssize_t again = p.write(big);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(n >= 0);
        REQUIRE(static_cast<size_t>(n) < big.size());
        REQUIRE(again >= 0);
        REQUIRE(elapsed < 2s);

        p.kill();
        REQUIRE(wait_exit(p) == 128 + SIGKILL);
    }

    SECTION("MissingProgramExits127") {
        auto proc = launcher.launch(LaunchSpec{.program = "/nonexistent/ah-test-binary"});
        REQUIRE(proc.has_value());
        REQUIRE(wait_exit(**proc) == 127);
    }
}
