#pragma once

#include "text/utf8.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

// Bounded line log of terminal output.
// Lines are addressed by absolute index (lines pruned from the front keep
// counting), so a marker taken before pruning stays meaningful afterwards.
// The log is bounded in lines, in bytes per line and in total bytes.
class OutputLog {
public:
    static constexpr size_t DEFAULT_MAX_LINE_BYTES = 4096;
    static constexpr size_t DEFAULT_MAX_BYTES = 512 * 1024;

    explicit OutputLog(size_t max_lines = 1000,
                       size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES,
                       size_t max_bytes = DEFAULT_MAX_BYTES)
        : max_lines_(max_lines),
          max_line_bytes_(max_line_bytes > 0 ? max_line_bytes : 1),
          max_bytes_(max_bytes) {}

    // Append a raw chunk. A chunk without a trailing newline leaves the last
    // line open; the next chunk continues it.
    // A line over the byte limit keeps only its last '\r' redraw; if that is
    // still too long it is broken into several lines.
    void append(std::string_view chunk) {
        while (!chunk.empty()) {
            auto nl = chunk.find('\n');
            auto piece = chunk.substr(0, nl);

            if (open_line_ && !lines_.empty()) {
                lines_.back().append(piece);
            } else {
                lines_.emplace_back(piece);
            }
            bytes_ += piece.size();
            fold_last_line();

            if (nl == std::string_view::npos) {
                open_line_ = true;
                break;
            }
            open_line_ = false;
            chunk.remove_prefix(nl + 1);
            if (chunk.empty()) {
                // Trailing newline: next output starts a fresh line.
                break;
            }
        }
        prune();
    }

    // Absolute index at which the next instruction's output starts.
    // An open line (typically the prompt being typed on) is included.
    size_t marker() const {
        size_t end = end_index();
        return (open_line_ && end > 0) ? end - 1 : end;
    }

    size_t end_index() const { return dropped_ + lines_.size(); }
    size_t dropped() const { return dropped_; }
    size_t size() const { return lines_.size(); }
    size_t bytes() const { return bytes_; }
    bool empty() const { return lines_.empty(); }

    // Lines from absolute index `from` to the end, joined with '\n'.
    std::string since(size_t from) const {
        size_t start = from > dropped_ ? from - dropped_ : 0;
        return join(start);
    }

    // Last `n` lines joined with '\n'.
    std::string tail(size_t n) const {
        size_t start = lines_.size() > n ? lines_.size() - n : 0;
        return join(start);
    }

    void clear() {
        dropped_ += lines_.size();
        lines_.clear();
        bytes_ = 0;
        open_line_ = false;
    }

private:
    void fold_last_line() {
        auto& line = lines_.back();
        if (line.size() <= max_line_bytes_) return;

        // Progress bars and spinners redraw with '\r'; only the last
        // redraw is still on screen.
        auto end = line.find_last_not_of('\r');
        if (end != std::string::npos) {
            auto cr = line.rfind('\r', end);
            if (cr != std::string::npos && cr > 0) {
                bytes_ -= cr;
                line.erase(0, cr);
            }
        }
        if (line.size() <= max_line_bytes_) return;

        std::string full = std::move(line);
        lines_.pop_back();
        bytes_ -= full.size();

        std::string_view rest(full);
        while (rest.size() > max_line_bytes_) {
            auto head = utf8::head(rest, max_line_bytes_);
            if (head.empty()) head = rest.substr(0, max_line_bytes_);
            lines_.emplace_back(head);
            bytes_ += head.size();
            rest.remove_prefix(head.size());
        }
        lines_.emplace_back(rest);
        bytes_ += rest.size();
    }

    void prune() {
        while (lines_.size() > max_lines_ || (bytes_ > max_bytes_ && lines_.size() > 1)) {
            bytes_ -= lines_.front().size();
            lines_.pop_front();
            ++dropped_;
        }
    }

    std::string join(size_t start) const {
        std::string out;
        for (size_t i = start; i < lines_.size(); ++i) {
            if (i > start) out += '\n';
            out += lines_[i];
        }
        return out;
    }

    std::deque<std::string> lines_;
    size_t max_lines_;
    size_t max_line_bytes_;
    size_t max_bytes_;
    size_t bytes_ = 0;
    size_t dropped_ = 0;
    bool open_line_ = false;
};
