#pragma once

#include <string>
#include <string_view>

// Failures of session lifecycle operations. Returned to the immediate caller.
struct SessionError {
    enum class Kind { Spawn, UnknownSession, InactiveSession, Io };

    Kind kind;
    std::string message;

    static SessionError spawn(std::string msg) { return {Kind::Spawn, std::move(msg)}; }
    static SessionError unknown(const std::string& id) {
        return {Kind::UnknownSession, "session " + id + " not found"};
    }
    static SessionError inactive(const std::string& id) {
        return {Kind::InactiveSession, "session " + id + " is not running"};
    }
    static SessionError io(const std::string& id, const std::string& detail) {
        return {Kind::Io, "write to session " + id + " failed: " + detail};
    }
};

// Failures of the decision oracle. Converted inside the decision loop, never thrown.
struct OracleError {
    enum class Kind { Parse, Timeout, Transport };

    Kind kind;
    std::string message;
};

inline std::string_view to_string(SessionError::Kind kind) {
    switch (kind) {
        case SessionError::Kind::Spawn: return "spawn";
        case SessionError::Kind::UnknownSession: return "unknown_session";
        case SessionError::Kind::InactiveSession: return "inactive_session";
        case SessionError::Kind::Io: return "io";
    }
    return "unknown";
}

inline std::string_view to_string(OracleError::Kind kind) {
    switch (kind) {
        case OracleError::Kind::Parse: return "parse";
        case OracleError::Kind::Timeout: return "timeout";
        case OracleError::Kind::Transport: return "transport";
    }
    return "unknown";
}
