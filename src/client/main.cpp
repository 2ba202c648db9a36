#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <system_error>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  spawn <agent> [--name N] [--workdir DIR] [--task TEXT]");
    std::println(stderr, "        [--env KEY=VALUE]... [--arg ARG]...   Start an agent session");
    std::println(stderr, "  send <id> <text>                            Send a line of input");
    std::println(stderr, "  keys <id> <key>...                          Send keys (enter, up, ctrl+c, ...)");
    std::println(stderr, "  stop <id>                                   Stop a session");
    std::println(stderr, "  output <id> [--lines N] [--raw]             Show recent output");
    std::println(stderr, "  list                                        List sessions");
    std::println(stderr, "  tasks                                       List supervised tasks");
    std::println(stderr, "  task <id>                                   Show a task and its decisions");
    std::println(stderr, "  pending                                     Show decisions awaiting confirmation");
    std::println(stderr, "  confirm <id> [--reject] [--decision JSON]   Resolve a pending decision");
    std::println(stderr, "  supervision [autonomous|confirm|notify]     Show or set supervision level");
    std::println(stderr, "  status                                      Show daemon status");
    std::println(stderr, "  watch                                       Stream daemon events");
    std::println(stderr, "Global options:");
    std::println(stderr, "  --socket PATH                               Daemon control socket");
}

static std::string format_time(int64_t ms) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
    return std::format("{:%F %T}", std::chrono::floor<std::chrono::seconds>(tp));
}

static void print_session(const json& s) {
    std::println("{}  {:<8} {:<10} pid {:<7} {}  {}",
                 s.value("id", ""), s.value("agent_type", ""), s.value("status", ""),
                 s.value("pid", -1), s.value("name", ""), s.value("workdir", ""));
}

static void print_task(const json& t) {
    std::println("{}  {:<10} auto {:>2}  idle checks {}  decisions {:>3}  {}",
                 t.value("session_id", ""), t.value("status", ""),
                 t.value("auto_resolved_count", 0), t.value("idle_check_count", 0),
                 t.value("decision_count", 0), t.value("label", ""));
}

static void print_event(const json& e) {
    std::println("{} {:<22} {} {}", format_time(e.value("timestamp", int64_t{0})),
                 e.value("type", ""), e.value("session_id", ""),
                 e.contains("data") ? e["data"].dump() : "{}");
}

// Positional argument `index` of the subcommand, or empty.
static std::string positional(const std::vector<std::string>& args, size_t index) {
    return index < args.size() ? args[index] : std::string{};
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    }

    // Split options from positional arguments
    std::vector<std::string> args;
    std::string name, workdir, task, decision;
    std::string sock_path = platform::ipc_endpoint();
    json env = json::object();
    std::vector<std::string> extra_args;
    int lines = 50;
    bool raw = false;
    bool reject = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--name" && i + 1 < argc) {
            name = argv[++i];
        } else if (arg == "--workdir" && i + 1 < argc) {
            workdir = argv[++i];
        } else if (arg == "--task" && i + 1 < argc) {
            task = argv[++i];
        } else if (arg == "--env" && i + 1 < argc) {
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos) {
                std::println(stderr, "--env expects KEY=VALUE, got '{}'", kv);
                return 1;
            }
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--arg" && i + 1 < argc) {
            extra_args.push_back(argv[++i]);
        } else if (arg == "--lines" && i + 1 < argc) {
            lines = std::atoi(argv[++i]);
        } else if (arg == "--raw") {
            raw = true;
        } else if (arg == "--reject") {
            reject = true;
        } else if (arg == "--decision" && i + 1 < argc) {
            decision = argv[++i];
        } else if (arg == "--socket" && i + 1 < argc) {
            sock_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    auto id = positional(args, 0);
    auto needs_id = [&]() {
        if (!id.empty()) return true;
        std::println(stderr, "{} requires a session id", command);
        return false;
    };

    // Build command JSON
    json cmd;
    if (command == "spawn") {
        if (args.empty()) {
            std::println(stderr, "spawn requires an agent type");
            return 1;
        }
        // The daemon runs from /, so relative paths are resolved here.
        std::error_code ec;
        auto dir = workdir.empty() ? std::filesystem::current_path(ec)
                                   : std::filesystem::absolute(workdir, ec);
        if (ec) {
            std::println(stderr, "Cannot resolve working directory: {}", ec.message());
            return 1;
        }
        cmd = {{"cmd", "spawn"}, {"agent_type", args[0]}, {"workdir", dir.lexically_normal().string()}};
        if (!name.empty()) cmd["name"] = name;
        if (!task.empty()) cmd["task"] = task;
        if (!env.empty()) cmd["env"] = env;
        if (!extra_args.empty()) cmd["args"] = extra_args;
    } else if (command == "send") {
        if (!needs_id()) return 1;
        std::string text;
        for (size_t i = 1; i < args.size(); i++) {
            if (i > 1) text += ' ';
            text += args[i];
        }
        cmd = {{"cmd", "send"}, {"session_id", id}, {"text", text}};
    } else if (command == "keys") {
        if (!needs_id()) return 1;
        cmd = {{"cmd", "keys"}, {"session_id", id},
               {"keys", std::vector<std::string>(args.begin() + 1, args.end())}};
    } else if (command == "stop" || command == "task") {
        if (!needs_id()) return 1;
        cmd = {{"cmd", command}, {"session_id", id}};
    } else if (command == "output") {
        if (!needs_id()) return 1;
        cmd = {{"cmd", "output"}, {"session_id", id}, {"lines", lines}, {"raw", raw}};
    } else if (command == "confirm") {
        if (!needs_id()) return 1;
        cmd = {{"cmd", "confirm"}, {"session_id", id}, {"approved", !reject}};
        if (!decision.empty()) {
            try {
                cmd["decision"] = json::parse(decision);
            } catch (const json::exception& e) {
                std::println(stderr, "--decision is not valid JSON: {}", e.what());
                return 1;
            }
        }
    } else if (command == "supervision") {
        cmd = {{"cmd", "supervision"}};
        if (!id.empty()) cmd["level"] = id;
    } else if (command == "list" || command == "tasks" || command == "pending" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is agent-herder running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "watch") {
        json event;
        while (client.recv(event, -1)) {
            print_event(event);
        }
        std::println(stderr, "Daemon closed the connection");
        return 0;
    }

    if (command == "spawn") {
        std::println("{}", response["session"].value("id", ""));
    } else if (command == "output") {
        std::println("{}", response.value("output", ""));
    } else if (command == "list") {
        for (auto& s : response["sessions"]) print_session(s);
    } else if (command == "tasks") {
        for (auto& t : response["tasks"]) print_task(t);
    } else if (command == "task") {
        auto& t = response["task"];
        print_task(t);
        std::println("  Task: {}", t.value("original_task", ""));
        for (auto& d : t["decisions"]) {
            std::println("  [{}] {:<13} {:<13} {}", format_time(d.value("timestamp", int64_t{0})),
                         d.value("event", ""), d.value("decision", ""), d.value("reasoning", ""));
            if (d.contains("response")) {
                std::println("      -> {}", d["response"].get<std::string>());
            }
        }
    } else if (command == "pending") {
        for (auto& p : response["pending"]) {
            auto& s = p["suggested"];
            std::println("{}  suggests {}: {}", p.value("session_id", ""),
                         s.value("action", ""), s.value("reasoning", ""));
            std::println("  Prompt: {}", p.value("prompt_text", ""));
        }
    } else if (command == "supervision") {
        std::println("Supervision: {}", response.value("level", ""));
    } else if (command == "status") {
        std::println("Sessions: {}", response.value("sessions", 0));
        std::println("Tasks: {}", response.value("tasks", 0));
        std::println("Pending confirmations: {}", response.value("pending", 0));
        std::println("Decisions in flight: {}", response.value("workers", 0));
        std::println("Supervision: {}", response.value("supervision", ""));
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
