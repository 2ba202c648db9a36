#include <catch2/catch_test_macros.hpp>

#include "text/sanitize.hpp"

#include <string>

using namespace sanitize;

TEST_CASE("strip_control_sequences", "[sanitize]") {

    SECTION("RemovesColours") {
        REQUIRE(strip_control_sequences("\x1b[1;31mred\x1b[0m text") == "red text");
    }

    SECTION("CursorForwardBecomesSpace") {
        REQUIRE(strip_control_sequences("hello\x1b[5Cworld") == "hello world");
    }

    SECTION("RemovesPositioningAndErase") {
        REQUIRE(strip_control_sequences("\x1b[2J\x1b[1;1Hready\x1b[K") == "ready");
    }

    SECTION("RemovesOscTitle") {
        REQUIRE(strip_control_sequences("\x1b]0;claude\x07> prompt") == "> prompt");
        REQUIRE(strip_control_sequences("\x1b]8;;http://x\x1b\\link") == "link");
    }

    SECTION("RejoinsSgrSplitAcrossLines") {
        REQUIRE(strip_control_sequences("\x1b[38;5\n;208mtext") == "text");
    }

    SECTION("CollapsesLongSpaceRuns") {
        REQUIRE(strip_control_sequences("a      b  c") == "a b  c");
    }

    SECTION("DropsBareControlCharacters") {
        REQUIRE(strip_control_sequences("be\x07ll\x08") == "bell");
    }

    SECTION("PlainTextUnchanged") {
        REQUIRE(strip_control_sequences("just text\nsecond line") == "just text\nsecond line");
    }

    SECTION("UnterminatedOscKeepsPayload") {
        REQUIRE(strip_control_sequences("\x1b]0;title") == "0;title");
    }

    SECTION("HugeOscTitle") {
        auto raw = "\x1b]0;title" + std::string(100'000, 'y') + "\x07 done";
        REQUIRE(strip_control_sequences(raw) == "done");
    }

    SECTION("HugeLineOfCursorMoves") {
        std::string raw;
        for (int i = 0; i < 50'000; ++i) raw += "\x1b[1C\x1b[32mx\x1b[0m";
        auto out = strip_control_sequences(raw);
        REQUIRE(out.size() == 2 * 50'000 - 1);
        REQUIRE(out.starts_with("x x x"));
        REQUIRE(out.find('\x1b') == std::string::npos);
    }
}

TEST_CASE("clean_for_display", "[sanitize]") {

    SECTION("DropsBoxDrawing") {
        REQUIRE(clean_for_display("╭──────╮\n│ hello │\n╰──────╯") == "hello");
    }

    SECTION("DropsSpinnerAndStatusLines") {
        auto out = clean_for_display(
            "✻ Cogitating… (3s · esc to interrupt)\n"
            "Fixed the failing test.\n"
            "  ? for shortcuts\n"
            "12.3k tokens");
        REQUIRE(out == "Fixed the failing test.");
    }

    SECTION("DropsPunctuationOnlyLines") {
        REQUIRE(clean_for_display("----\nok\n...") == "ok");
    }

    SECTION("CollapsesBlankRuns") {
        REQUIRE(clean_for_display("first\n\n\n\nsecond") == "first\n\nsecond");
    }

    SECTION("NoLeadingBlankLine") {
        REQUIRE(clean_for_display("\n\n───\n\nbody") == "body");
    }

    SECTION("HugeStatusLine") {
        auto out = clean_for_display("Thinking (" + std::string(300'000, 'x') + ")\nall done");
        REQUIRE(out.ends_with("\nall done"));
    }

    SECTION("HugeOscSequence") {
        auto raw = "\x1b]8;;" + std::string(200'000, 'u') + "\x1b\\Fixed the test.";
        REQUIRE(clean_for_display(raw) == "Fixed the test.");
    }

    SECTION("KeepsPromptQuestion") {
        auto out = clean_for_display("\x1b[1mDo you want to proceed?\x1b[0m\n❯ 1. Yes\n  2. No");
        REQUIRE(out == "Do you want to proceed?\n1. Yes\n2. No");
    }
}

TEST_CASE("extract_completion_summary", "[sanitize]") {

    SECTION("CollectsPrCommitAndDiffStat") {
        auto out = extract_completion_summary(
            "Opened https://github.com/acme/app/pull/42 for review\n"
            "committed 1a2b3c4d on main\n"
            " 3 files changed, 10 insertions(+), 2 deletions(-)\n"
            "see https://github.com/acme/app/pull/42");
        REQUIRE(out ==
                "https://github.com/acme/app/pull/42\n"
                "committed 1a2b3c4d\n"
                "3 files changed, 10 insertions(+), 2 deletions(-)");
    }

    SECTION("FallsBackToCreatedPullRequest") {
        REQUIRE(extract_completion_summary("Created pull request #17 on main") ==
                "Created pull request #17 on main");
    }

    SECTION("EmptyWhenNothingFound") {
        REQUIRE(extract_completion_summary("all done, nothing to report").empty());
    }

    SECTION("HugeLinesAreClipped") {
        auto raw = "3 files changed, " + std::string(300'000, 'a') + " insertions\n"
                   "committed abcdef1 on main";
        REQUIRE(extract_completion_summary(raw) == "committed abcdef1");
    }

    SECTION("LooksOnlyAtTheEndOfLongOutput") {
        std::string raw = "commit 1111111\n";
        for (int i = 0; i < 20'000; ++i) raw += "compiling module\n";
        raw += "commit 2222222";
        REQUIRE(raw.size() > MAX_SUMMARY_SCREEN);
        REQUIRE(extract_completion_summary(raw) == "commit 2222222");
    }

    SECTION("StableWhenReapplied") {
        auto once = extract_completion_summary(
            "\x1b[32mcommit deadbeef1\x1b[0m\n"
            "https://github.com/acme/app/pull/7\n"
            "1 file changed, 4 insertions(+)");
        REQUIRE(once == "https://github.com/acme/app/pull/7\ncommit deadbeef1\n1 file changed, 4 insertions(+)");
        REQUIRE(extract_completion_summary(once) == once);
    }
}

TEST_CASE("extract_dev_server_url", "[sanitize]") {

    SECTION("FindsLocalUrl") {
        REQUIRE(extract_dev_server_url("  VITE ready\n  Local:   http://localhost:5173/\n") ==
                "http://localhost:5173/");
        REQUIRE(extract_dev_server_url("listening on http://127.0.0.1:8000") ==
                "http://127.0.0.1:8000");
    }

    SECTION("HugeLineBeforeUrl") {
        auto raw = std::string(150'000, '=') + "\nLocal: http://localhost:3000/";
        REQUIRE(extract_dev_server_url(raw) == "http://localhost:3000/");
    }

    SECTION("IgnoresRemoteUrls") {
        REQUIRE(extract_dev_server_url("docs at https://example.com:8443/guide").empty());
    }
}

TEST_CASE("capture_since_marker", "[sanitize]") {
    std::unordered_map<std::string, OutputLog> buffers;
    std::unordered_map<std::string, size_t> markers;

    auto& log = buffers["s1"];
    log.append("banner\n> ");
    markers["s1"] = log.marker();
    log.append("add a test\n\x1b[32mAdded test_foo.\x1b[0m\n> ");

    SECTION("ReturnsCleanedTurnOutput") {
        REQUIRE(capture_since_marker("s1", buffers, markers) == "> add a test\nAdded test_foo.");
    }

    SECTION("ConsumesMarker") {
        REQUIRE_FALSE(capture_since_marker("s1", buffers, markers).empty());
        REQUIRE(markers.empty());
        REQUIRE(capture_since_marker("s1", buffers, markers).empty());
    }

    SECTION("UnknownSessionIsEmpty") {
        REQUIRE(capture_since_marker("nope", buffers, markers).empty());
    }
}
