#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ah_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.oracle.api_format == "anthropic");
        REQUIRE(cfg.oracle.api_key_env == "ANTHROPIC_API_KEY");
        REQUIRE(cfg.oracle.timeout_seconds == 60);
        REQUIRE(cfg.sessions.max_log_lines == 1000);
        REQUIRE(cfg.sessions.settle_ms == 400);
        REQUIRE(cfg.coordinator.supervision == "autonomous");
        REQUIRE(cfg.coordinator.max_auto_responses == 10);
        REQUIRE(cfg.coordinator.idle_threshold_seconds == 180);
        REQUIRE(cfg.coordinator.max_idle_checks == 3);
        REQUIRE(cfg.coordinator.scan_interval_seconds == 60);
        REQUIRE(cfg.agents.size() == 5);
        REQUIRE(cfg.agents.contains("claude"));
        REQUIRE(cfg.agents.contains("shell"));
    }

    SECTION("BuiltInProfilesHaveCommands") {
        for (auto& [name, profile] : default_agent_profiles()) {
            INFO(name);
            REQUIRE_FALSE(profile.command.empty());
            REQUIRE_FALSE(profile.ready.empty());
            REQUIRE_FALSE(profile.blocked.empty());
        }
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "oracle": {
                "api_format": "openai",
                "url": "http://10.0.0.1:11434",
                "model": "qwen2.5-coder",
                "api_key_env": "LOCAL_KEY",
                "max_tokens": 512,
                "timeout_seconds": 15
            },
            "sessions": { "max_log_lines": 200, "settle_ms": 250, "cols": 120, "rows": 40 },
            "coordinator": {
                "supervision": "confirm",
                "max_auto_responses": 4,
                "idle_threshold_seconds": 30,
                "max_idle_checks": 1,
                "scan_interval_seconds": 5
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.oracle.api_format == "openai");
        REQUIRE(cfg.oracle.url == "http://10.0.0.1:11434");
        REQUIRE(cfg.oracle.model == "qwen2.5-coder");
        REQUIRE(cfg.oracle.api_key_env == "LOCAL_KEY");
        REQUIRE(cfg.oracle.max_tokens == 512);
        REQUIRE(cfg.oracle.timeout_seconds == 15);
        REQUIRE(cfg.sessions.max_log_lines == 200);
        REQUIRE(cfg.sessions.settle_ms == 250);
        REQUIRE(cfg.sessions.cols == 120);
        REQUIRE(cfg.sessions.rows == 40);
        REQUIRE(cfg.coordinator.supervision == "confirm");
        REQUIRE(cfg.coordinator.max_auto_responses == 4);
        REQUIRE(cfg.coordinator.idle_threshold_seconds == 30);
        REQUIRE(cfg.coordinator.max_idle_checks == 1);
        REQUIRE(cfg.coordinator.scan_interval_seconds == 5);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "oracle": { "model": "claude-sonnet-4-5" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.oracle.model == "claude-sonnet-4-5");
        // Other fields retain defaults
        REQUIRE(cfg.oracle.api_format == "anthropic");
        REQUIRE(cfg.oracle.url == "https://api.anthropic.com");
        REQUIRE(cfg.sessions.max_log_lines == 1000);
        REQUIRE(cfg.coordinator.max_idle_checks == 3);
    }

    SECTION("AgentProfilesMergeOverDefaults") {
        TmpFile f(R"({
            "agents": {
                "claude": { "command": "/opt/bin/claude" },
                "mybot": {
                    "command": "mybot",
                    "args": ["--tui"],
                    "ready": "^ready>",
                    "blocked": [
                        { "pattern": "Continue\\?", "response": "y" },
                        { "pattern": "Select an option", "keys": ["down", "enter"] },
                        { "response": "ignored without a pattern" }
                    ]
                }
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.agents.size() == 6);

        auto& claude = cfg.agents["claude"];
        REQUIRE(claude.command == "/opt/bin/claude");
        REQUIRE(claude.ready == default_agent_profiles()["claude"].ready);
        REQUIRE_FALSE(claude.blocked.empty());

        auto& bot = cfg.agents["mybot"];
        REQUIRE(bot.args == std::vector<std::string>{"--tui"});
        REQUIRE(bot.ready == "^ready>");
        REQUIRE(bot.blocked.size() == 2);
        REQUIRE(bot.blocked[0].response == "y");
        REQUIRE(bot.blocked[0].auto_respond());
        REQUIRE(bot.blocked[1].keys == std::vector<std::string>{"down", "enter"});
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.oracle.api_format == "anthropic");
        REQUIRE(cfg.coordinator.max_auto_responses == 10);
    }

    SECTION("LoadWrongTypeFallsBack") {
        TmpFile f(R"({ "coordinator": { "max_idle_checks": "three" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.coordinator.max_idle_checks == 3);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ah_test_nonexistent_config_file.json");
        REQUIRE(cfg.oracle.api_format == "anthropic");
        REQUIRE(cfg.sessions.settle_ms == 400);
    }
}
