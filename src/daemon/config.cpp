#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::map<std::string, AgentProfile> default_agent_profiles() {
    std::map<std::string, AgentProfile> profiles;

    profiles["claude"] = AgentProfile{
        .command = "claude",
        .args = {},
        .ready = R"(^\s*(?:>|❯)\s*(?:Try ".*")?$)",
        .turn_complete = "",
        .tool_running = R"(^\s*(?:⏺\s*)?Bash\((.+)\))",
        .blocked = {
            {.pattern = R"(Do you trust the files in this folder\?)", .response = "", .keys = {"enter"}},
            {.pattern = R"(Press Enter to continue)", .response = "", .keys = {"enter"}},
            {.pattern = R"(Do you want to (?:proceed|make this edit|create|overwrite|run))", .response = "", .keys = {}},
        },
    };

    profiles["codex"] = AgentProfile{
        .command = "codex",
        .args = {},
        .ready = R"((?:⏎ send|^\s*›\s*$))",
        .turn_complete = "",
        .tool_running = "",
        .blocked = {
            {.pattern = R"(Do you trust the contents of this directory\?)", .response = "", .keys = {"enter"}},
            {.pattern = R"((?:Allow command\?|Would you like to run the following command\?))", .response = "", .keys = {}},
            {.pattern = R"(Would you like to make the following edits\?)", .response = "", .keys = {}},
        },
    };

    profiles["gemini"] = AgentProfile{
        .command = "gemini",
        .args = {},
        .ready = R"(Type your message)",
        .turn_complete = "",
        .tool_running = "",
        .blocked = {
            {.pattern = R"(Do you trust this folder\?)", .response = "", .keys = {"enter"}},
            {.pattern = R"((?:Allow execution|Apply this change)\?)", .response = "", .keys = {}},
        },
    };

    profiles["aider"] = AgentProfile{
        .command = "aider",
        .args = {"--no-pretty"},
        .ready = R"(^\s*(?:[\w-]+\s*)?>\s*$)",
        .turn_complete = "",
        .tool_running = "",
        .blocked = {
            {.pattern = R"(Open documentation url for more info\?)", .response = "n", .keys = {}},
            {.pattern = R"(\(Y\)es/\(N\)o)", .response = "", .keys = {}},
        },
    };

    profiles["shell"] = AgentProfile{
        .command = "bash",
        .args = {"--noprofile", "--norc", "-i"},
        .ready = R"([$#]\s*$)",
        .turn_complete = "",
        .tool_running = "",
        .blocked = {
            {.pattern = R"((?:\[y/N\]|\[Y/n\]|\(yes/no(?:/\[fingerprint\])?\)\?))", .response = "", .keys = {}},
            {.pattern = R"(password[^:]*:\s*$)", .response = "", .keys = {}},
        },
    };

    return profiles;
}

namespace {

void load_profile(const json& j, AgentProfile& p) {
    if (j.contains("command")) p.command = j["command"].get<std::string>();
    if (j.contains("args")) p.args = j["args"].get<std::vector<std::string>>();
    if (j.contains("ready")) p.ready = j["ready"].get<std::string>();
    if (j.contains("turn_complete")) p.turn_complete = j["turn_complete"].get<std::string>();
    if (j.contains("tool_running")) p.tool_running = j["tool_running"].get<std::string>();

    if (j.contains("blocked")) {
        p.blocked.clear();
        for (auto& r : j["blocked"]) {
            AgentProfile::BlockedRule rule;
            rule.pattern = r.value("pattern", "");
            rule.response = r.value("response", "");
            if (r.contains("keys")) rule.keys = r["keys"].get<std::vector<std::string>>();
            if (!rule.pattern.empty()) p.blocked.push_back(std::move(rule));
        }
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("oracle")) {
            auto& o = j["oracle"];
            if (o.contains("api_format")) cfg.oracle.api_format = o["api_format"].get<std::string>();
            if (o.contains("url")) cfg.oracle.url = o["url"].get<std::string>();
            if (o.contains("model")) cfg.oracle.model = o["model"].get<std::string>();
            if (o.contains("api_key_env")) cfg.oracle.api_key_env = o["api_key_env"].get<std::string>();
            if (o.contains("max_tokens")) cfg.oracle.max_tokens = o["max_tokens"].get<uint32_t>();
            if (o.contains("timeout_seconds")) cfg.oracle.timeout_seconds = o["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("sessions")) {
            auto& s = j["sessions"];
            if (s.contains("max_log_lines")) cfg.sessions.max_log_lines = s["max_log_lines"].get<size_t>();
            if (s.contains("settle_ms")) cfg.sessions.settle_ms = s["settle_ms"].get<uint32_t>();
            if (s.contains("kill_grace_ms")) cfg.sessions.kill_grace_ms = s["kill_grace_ms"].get<uint32_t>();
            if (s.contains("tombstone_seconds")) cfg.sessions.tombstone_seconds = s["tombstone_seconds"].get<uint32_t>();
            if (s.contains("cols")) cfg.sessions.cols = s["cols"].get<uint16_t>();
            if (s.contains("rows")) cfg.sessions.rows = s["rows"].get<uint16_t>();
        }

        if (j.contains("coordinator")) {
            auto& c = j["coordinator"];
            if (c.contains("supervision")) cfg.coordinator.supervision = c["supervision"].get<std::string>();
            if (c.contains("max_auto_responses")) cfg.coordinator.max_auto_responses = c["max_auto_responses"].get<uint32_t>();
            if (c.contains("idle_threshold_seconds")) cfg.coordinator.idle_threshold_seconds = c["idle_threshold_seconds"].get<uint32_t>();
            if (c.contains("max_idle_checks")) cfg.coordinator.max_idle_checks = c["max_idle_checks"].get<uint32_t>();
            if (c.contains("scan_interval_seconds")) cfg.coordinator.scan_interval_seconds = c["scan_interval_seconds"].get<uint32_t>();
            if (c.contains("tool_notify_seconds")) cfg.coordinator.tool_notify_seconds = c["tool_notify_seconds"].get<uint32_t>();
        }

        if (j.contains("agents")) {
            // Entries override fields of the built-in profile of the same name.
            for (auto& [name, profile] : j["agents"].items()) {
                load_profile(profile, cfg.agents[name]);
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
