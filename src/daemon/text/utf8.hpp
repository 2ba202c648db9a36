#pragma once

#include <cstddef>
#include <string_view>

// Byte-budget cuts that never split a multi-byte UTF-8 sequence.
namespace utf8 {

inline bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// At most `max_bytes` from the front of `s`, ending on a character boundary.
inline std::string_view head(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t end = max_bytes;
    // A sequence is at most 4 bytes; stop looking after that so stray
    // continuation bytes in invalid input don't eat the whole cut.
    for (size_t i = 0; i < 4 && end > 0 && is_continuation(s[end]); ++i) --end;
    return s.substr(0, end);
}

// At most `max_bytes` from the back of `s`, starting on a character boundary.
inline std::string_view tail(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t start = s.size() - max_bytes;
    for (size_t i = 0; i < 4 && start < s.size() && is_continuation(s[start]); ++i) ++start;
    return s.substr(start);
}

} // namespace utf8
