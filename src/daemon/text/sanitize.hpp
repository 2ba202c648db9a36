#pragma once

#include "output_log.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

// Pure transforms turning raw terminal byte streams into classifiable text.
namespace sanitize {

// std::regex recurses per matched character; no line longer than this is
// handed to a pattern.
constexpr size_t MAX_MATCH_LINE = 2048;

// Completion summaries are looked for in this much of the end of the output.
constexpr size_t MAX_SUMMARY_SCREEN = 64 * 1024;

// Remove cursor movement, positioning, erase and OSC sequences. Cursor-forward
// movement becomes a space since TUIs move the cursor instead of padding.
// Runs of 3+ spaces collapse to one; the result is trimmed.
std::string strip_control_sequences(std::string_view raw);

// strip_control_sequences, then drop TUI decoration, spinner/status lines and
// punctuation-only lines. Consecutive blank lines collapse to one.
std::string clean_for_display(std::string_view raw);

// PR URLs, "created pull request #N", commit hashes and diff stats found in
// the output, deduplicated, one per line.
std::string extract_completion_summary(std::string_view raw);

// First local dev-server URL (localhost / 127.0.0.1 / 0.0.0.0 with a port), or empty.
std::string extract_dev_server_url(std::string_view raw);

// Cleaned output accumulated since the session's turn marker. Consumes the
// marker, so each turn is captured at most once.
std::string capture_since_marker(const std::string& session_id,
                                 const std::unordered_map<std::string, OutputLog>& buffers,
                                 std::unordered_map<std::string, size_t>& markers);

} // namespace sanitize
