#include "text/sanitize.hpp"
#include "text/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>
#include <vector>

namespace sanitize {

namespace {

// Box drawing, spinner frames, arrows and bullets drawn by agent TUIs.
constexpr std::string_view DECORATIVE_GLYPHS =
    "│╭╰╮╯─═╌║╔╗╚╝╠╣╦╩╬┌┐└┘├┤┬┴┼●○❮❯▶◀⠋⠙⠹⠸⠼⠴⠦⠧⠇⠏⣾⣽⣻⢿⡿⣟⣯⣷✽✻✶✳✢⏺"
    "←→↑↓⬆⬇◆▪▫■□▲△▼▽◈⟨⟩⌘⏎⏏⌫⌦⇧⇪⌥·⎿✔◼ ";

size_t utf8_len(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

const std::unordered_set<std::string_view>& glyph_set() {
    static const std::unordered_set<std::string_view> set = [] {
        std::unordered_set<std::string_view> s;
        for (size_t i = 0; i < DECORATIVE_GLYPHS.size();) {
            size_t len = std::min(utf8_len(static_cast<unsigned char>(DECORATIVE_GLYPHS[i])),
                                  DECORATIVE_GLYPHS.size() - i);
            s.insert(DECORATIVE_GLYPHS.substr(i, len));
            i += len;
        }
        return s;
    }();
    return set;
}

std::string replace_glyphs(std::string_view line) {
    const auto& glyphs = glyph_set();
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size();) {
        size_t len = std::min(utf8_len(static_cast<unsigned char>(line[i])), line.size() - i);
        auto ch = line.substr(i, len);
        if (len > 1 && glyphs.contains(ch)) {
            out += ' ';
        } else {
            out.append(ch);
        }
        i += len;
    }
    return out;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

std::string collapse_spaces(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        out += c;
    }
    return out;
}

std::string remove_control_chars(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        bool control = (u <= 0x08) || u == 0x0b || u == 0x0c ||
                       (u >= 0x0e && u <= 0x1f) || u == 0x7f;
        if (!control) out += c;
    }
    return out;
}

bool has_alnum(std::string_view s) {
    return std::ranges::any_of(s, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto nl = s.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(start));
            break;
        }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

bool is_param_digit(char c) {
    return (c >= '0' && c <= '9') || c == ';';
}

// "[38;5\n;208m": an SGR sequence broken by a line wrap. Drop the line break.
std::string rejoin_split_sgr(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '[') {
            out += s[i++];
            continue;
        }
        size_t j = i + 1;
        while (j < s.size() && is_param_digit(s[j])) ++j;
        size_t brk = j;
        if (j < s.size() && s[j] == '\r') ++j;
        if (j < s.size() && s[j] == '\n') {
            size_t k = j + 1;
            while (k < s.size() && is_param_digit(s[k])) ++k;
            if (k < s.size() && s[k] == 'm') {
                out.append(s.substr(i, brk - i));
                out.append(s.substr(j + 1, k - j));
                i = k + 1;
                continue;
            }
        }
        out.append(s.substr(i, brk - i));
        i = brk;
    }
    return out;
}

// Replacement for one CSI sequence: cursor movement and positioning leave a
// space, everything else (colours, erase, modes) disappears.
std::string_view csi_replacement(std::string_view params, std::string_view intermediates, char final_byte) {
    if (!intermediates.empty()) return "";
    auto semi = params.find(';');
    bool digits_only = params.find_first_not_of("0123456789") == std::string_view::npos;
    switch (final_byte) {
    case 'A': case 'B': case 'C': case 'D':
    case 'E': case 'F': case 'G': case 'd':
        return digits_only ? " " : "";
    case 'H': case 'f':
        if (semi == std::string_view::npos) return digits_only ? " " : "";
        if (params.find(';', semi + 1) != std::string_view::npos) return "";
        if (semi + 1 == params.size()) return "";
        return params.find_first_not_of("0123456789;") == std::string_view::npos ? " " : "";
    default:
        return "";
    }
}

// Single pass over escape sequences. Unterminated sequences lose only their
// introducer; the payload stays as text.
std::string strip_escapes(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '\x1b' || i + 1 >= s.size()) {
            out += s[i++];
            continue;
        }

        char kind = s[i + 1];
        if (kind == '[') {
            size_t j = i + 2;
            size_t params = j;
            while (j < s.size() && s[j] >= 0x30 && s[j] <= 0x3f) ++j;
            size_t inter = j;
            while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x2f) ++j;
            if (j < s.size() && s[j] >= 0x40 && s[j] <= 0x7e) {
                out.append(csi_replacement(s.substr(params, inter - params),
                                           s.substr(inter, j - inter), s[j]));
                i = j + 1;
            } else {
                i += 2;
            }
        } else if (kind == ']') {
            // OSC runs to BEL or ST (ESC \).
            auto stop = s.find_first_of("\x07\x1b", i + 2);
            if (stop != std::string_view::npos && s[stop] == '\x07') {
                i = stop + 1;
            } else if (stop != std::string_view::npos && stop + 1 < s.size() && s[stop + 1] == '\\') {
                i = stop + 2;
            } else {
                i += 2;
            }
        } else if (kind >= 0x40 && kind <= 0x5f) {
            i += 2;
        } else {
            out += s[i++];
        }
    }
    return out;
}

// Leftover "[0m" fragments whose ESC was lost in a chunk split.
std::string remove_orphan_sgr(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '[') {
            size_t j = i + 1;
            while (j < s.size() && is_param_digit(s[j])) ++j;
            if (j < s.size() && s[j] == 'm') {
                i = j + 1;
                continue;
            }
            out.append(s.substr(i, j - i));
            i = j;
            continue;
        }
        out += s[i++];
    }
    return out;
}

std::string squeeze_space_runs(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != ' ') {
            out += s[i++];
            continue;
        }
        size_t j = s.find_first_not_of(' ', i);
        if (j == std::string_view::npos) j = s.size();
        out.append(j - i >= 3 ? 1 : j - i, ' ');
        i = j;
    }
    return out;
}

// Lines that are only a CLI loading/thinking status.
const std::regex& loading_line_re() {
    static const std::regex re(
        R"(^\s*(?:thinking|Forging|Shenaniganing|Inferring|Cooking|Brewing|Loading|Scheming|)"
        R"(Pondering|Conjuring|Manifesting|Reflecting|Synthesizing|Vibing|Summoning|Compiling|)"
        R"(processing|Elucidating|Cogitat\w+|Bak\w+)(?:…|\.{3})?(?:\s*\(.*\))?\s*$)",
        std::regex::icase);
    return re;
}

// Spinner status-bar metadata: timers, token counters, shortcut hints.
const std::regex& status_line_re() {
    static const std::regex re(
        R"(^\s*(?:\d+[smh]\s+\d+s?\s*·|(?:↓)?\s*[0-9.]+k?\s*tokens|·\s*↓|esc\s+to\s+interrupt|)"
        R"([Uu]pdate available|ate available|Run:\s+brew|brew\s+upgrade|)"
        R"(\d+\s+files?\s+\+\d+\s+-\d+|ctrl\+\w|\+\d+\s+lines|Wrote\s+\d+\s+lines\s+to|)"
        R"(\?\s+for\s+shortcuts|Cooked for|Baked for|Cogitated for))",
        std::regex::icase);
    return re;
}

bool is_noise(const std::string& line) {
    if (line.size() > MAX_MATCH_LINE) return false;
    return std::regex_search(line, loading_line_re()) ||
           std::regex_search(line, status_line_re());
}

// Matches are collected line by line, each line clipped to MAX_MATCH_LINE.
void collect(const std::vector<std::string>& lines, const std::regex& re,
             std::vector<std::string>& out) {
    for (const auto& full : lines) {
        std::string line(utf8::head(full, MAX_MATCH_LINE));
        for (auto it = std::sregex_iterator(line.begin(), line.end(), re);
             it != std::sregex_iterator(); ++it) {
            auto m = trim(it->str());
            if (!m.empty() && std::ranges::find(out, m) == out.end()) {
                out.push_back(std::move(m));
            }
        }
    }
}

} // namespace

std::string strip_control_sequences(std::string_view raw) {
    auto s = strip_escapes(rejoin_split_sgr(raw));
    s = remove_control_chars(s);
    s = remove_orphan_sgr(s);
    return trim(squeeze_space_runs(s));
}

std::string clean_for_display(std::string_view raw) {
    auto stripped = strip_control_sequences(raw);

    std::vector<std::string> kept;
    bool pending_blank = false;

    for (const auto& line : split_lines(stripped)) {
        auto base = trim(line);
        if (base.empty()) {
            if (!kept.empty()) pending_blank = true;
            continue;
        }
        if (is_noise(base)) continue;

        auto cleaned = trim(collapse_spaces(replace_glyphs(base)));
        if (cleaned.empty() || is_noise(cleaned)) continue;
        if (!has_alnum(cleaned)) continue;

        if (pending_blank) {
            kept.emplace_back();
            pending_blank = false;
        }
        kept.push_back(std::move(cleaned));
    }

    std::string out;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) out += '\n';
        out += kept[i];
    }
    return out;
}

std::string extract_completion_summary(std::string_view raw) {
    static const std::regex pr_url_re(
        R"(https?://github\.com/[A-Za-z0-9_.-]+/[A-Za-z0-9_.-]+/pull/[0-9]+)");
    static const std::regex pr_created_re(
        R"((?:Created|Opened)\s+pull\s+request\s+#[0-9]+[^\n]*)", std::regex::icase);
    static const std::regex commit_re(
        R"((?:committed|commit)\s+[a-f0-9]{7,40})", std::regex::icase);
    static const std::regex diff_stat_re(
        R"([0-9]+\s+files?\s+changed.*?(?:insertion|deletion)[^\n]*)", std::regex::icase);

    auto screen = split_lines(strip_control_sequences(utf8::tail(raw, MAX_SUMMARY_SCREEN)));
    std::vector<std::string> lines;

    collect(screen, pr_url_re, lines);
    if (lines.empty()) {
        collect(screen, pr_created_re, lines);
    }
    collect(screen, commit_re, lines);
    collect(screen, diff_stat_re, lines);

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string extract_dev_server_url(std::string_view raw) {
    static const std::regex url_re(
        R"(https?://(?:localhost|127\.0\.0\.1|0\.0\.0\.0|\[::1\]):[0-9]{2,5}[^\s'"]*)");
    for (const auto& full : split_lines(strip_control_sequences(raw))) {
        std::string line(utf8::head(full, MAX_MATCH_LINE));
        std::smatch m;
        if (std::regex_search(line, m, url_re)) {
            return m.str();
        }
    }
    return {};
}

std::string capture_since_marker(const std::string& session_id,
                                 const std::unordered_map<std::string, OutputLog>& buffers,
                                 std::unordered_map<std::string, size_t>& markers) {
    auto buf = buffers.find(session_id);
    auto marker = markers.find(session_id);
    if (buf == buffers.end() || marker == markers.end()) return {};

    auto text = buf->second.since(marker->second);
    markers.erase(marker);
    return clean_for_display(text);
}

} // namespace sanitize
