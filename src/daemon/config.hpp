#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// How an agent CLI is launched and how its screen is read.
// Patterns are ECMAScript regexes matched case-insensitively per line.
struct AgentProfile {
    struct BlockedRule {
        std::string pattern;
        std::string response;           // auto-response text, sent followed by Enter
        std::vector<std::string> keys;  // auto-response key sequence

        bool auto_respond() const { return !response.empty() || !keys.empty(); }
    };

    std::string command;
    std::vector<std::string> args;
    std::string ready;
    std::string turn_complete;
    std::string tool_running;  // first capture group names the tool
    std::vector<BlockedRule> blocked;
};

// Built-in profiles: claude, codex, gemini, aider, shell.
std::map<std::string, AgentProfile> default_agent_profiles();

struct Config {
    struct Oracle {
        std::string api_format = "anthropic"; // "anthropic" or "openai"
        std::string url = "https://api.anthropic.com";
        std::string model = "claude-3-5-haiku-latest";
        std::string api_key_env = "ANTHROPIC_API_KEY";
        uint32_t max_tokens = 1024;
        uint32_t timeout_seconds = 60;
    } oracle;

    struct Sessions {
        size_t max_log_lines = 1000;
        uint32_t settle_ms = 400;
        uint32_t kill_grace_ms = 5000;
        uint32_t tombstone_seconds = 300;
        uint16_t cols = 200;
        uint16_t rows = 50;
    } sessions;

    struct Coordinator {
        std::string supervision = "autonomous"; // "autonomous", "confirm" or "notify"
        uint32_t max_auto_responses = 10;
        uint32_t idle_threshold_seconds = 180;
        uint32_t max_idle_checks = 3;
        uint32_t scan_interval_seconds = 60;
        uint32_t tool_notify_seconds = 30;
    } coordinator;

    std::map<std::string, AgentProfile> agents = default_agent_profiles();

    static Config load(const std::string& path);
    static Config load_default();
};
