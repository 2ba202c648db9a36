#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// Broadcast to observers. session_id is "*" for daemon-wide events.
struct SwarmEvent {
    std::string type;
    std::string session_id;
    int64_t timestamp = 0;  // ms since epoch
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json to_json() const {
        return {{"type", type}, {"session_id", session_id}, {"timestamp", timestamp}, {"data", data}};
    }
};

inline int64_t epoch_ms(std::chrono::system_clock::time_point t = std::chrono::system_clock::now()) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// Fire-and-forget; implementations must not block the caller.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void broadcast(SwarmEvent event) = 0;
};
