#include "classifier/rule_classifier.hpp"
#include "text/sanitize.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <print>

namespace {

constexpr size_t BLOCKED_WINDOW = 12;
constexpr size_t READY_WINDOW = 3;
constexpr size_t PROMPT_CONTEXT = 4;

std::optional<std::regex> compile(const std::string& pattern) {
    if (pattern.empty()) return std::nullopt;
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        std::println(stderr, "classifier: invalid pattern '{}': {}", pattern, e.what());
        return std::nullopt;
    }
}

std::vector<std::string> screen_lines(const std::string& screen) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= screen.size()) {
        auto nl = screen.find('\n', start);
        auto line = screen.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        std::erase(line, '\r');

        auto first = line.find_first_not_of(" \t");
        if (first != std::string::npos) {
            auto last = line.find_last_not_of(" \t");
            auto trimmed = std::string_view(line).substr(first, last - first + 1);
            // Prompts start at the left; the head of an overlong line is enough.
            lines.emplace_back(utf8::head(trimmed, sanitize::MAX_MATCH_LINE));
        }

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

} // namespace

RuleClassifier::RuleClassifier(const AgentProfile& profile)
    : ready_(compile(profile.ready)),
      turn_complete_(compile(profile.turn_complete)),
      tool_running_(compile(profile.tool_running)) {
    for (auto& rule : profile.blocked) {
        if (auto re = compile(rule.pattern)) {
            blocked_.push_back({std::move(*re), rule});
        }
    }
}

Classification RuleClassifier::classify(const std::string& screen) const {
    auto lines = screen_lines(screen);
    if (lines.empty()) return {};

    size_t window_start = lines.size() > BLOCKED_WINDOW ? lines.size() - BLOCKED_WINDOW : 0;

    // Bottom-most prompt wins; it is the one the agent is waiting on.
    for (size_t i = lines.size(); i-- > window_start;) {
        for (auto& r : blocked_) {
            if (!std::regex_search(lines[i], r.re)) continue;

            Classification c{.kind = Classification::Kind::Blocked};
            size_t end = std::min(lines.size(), i + PROMPT_CONTEXT);
            for (size_t j = i; j < end; ++j) {
                if (j > i) c.prompt += '\n';
                c.prompt += lines[j];
            }
            c.auto_respond = r.rule.auto_respond();
            c.response = r.rule.response;
            c.keys = r.rule.keys;
            return c;
        }
    }

    if (turn_complete_) {
        for (size_t i = window_start; i < lines.size(); ++i) {
            if (std::regex_search(lines[i], *turn_complete_)) {
                return {.kind = Classification::Kind::TurnComplete};
            }
        }
    }

    if (ready_) {
        size_t ready_start = lines.size() > READY_WINDOW ? lines.size() - READY_WINDOW : 0;
        for (size_t i = ready_start; i < lines.size(); ++i) {
            if (std::regex_search(lines[i], *ready_)) {
                return {.kind = Classification::Kind::Ready};
            }
        }
    }

    if (tool_running_) {
        for (size_t i = lines.size(); i-- > window_start;) {
            std::smatch m;
            if (std::regex_search(lines[i], m, *tool_running_)) {
                Classification c{.kind = Classification::Kind::ToolRunning};
                c.prompt = m.size() > 1 && m[1].matched ? m[1].str() : m.str();
                return c;
            }
        }
    }

    return {};
}
