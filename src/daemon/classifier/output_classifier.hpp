#pragma once

#include <string>
#include <vector>

struct Classification {
    enum class Kind { None, Ready, Blocked, TurnComplete, ToolRunning };

    Kind kind = Kind::None;
    std::string prompt;  // Blocked: the prompt lines; ToolRunning: the tool

    // Set when a deterministic rule already knows the answer to the prompt.
    bool auto_respond = false;
    std::string response;
    std::vector<std::string> keys;
};

// Reads a session's screen (control sequences already stripped) and reports
// what state the agent is in. Implementations must be safe to call from the
// event loop thread only; they hold no per-session state.
class OutputClassifier {
public:
    virtual ~OutputClassifier() = default;
    virtual Classification classify(const std::string& screen) const = 0;
};
