#include <catch2/catch_test_macros.hpp>

#include "output_log.hpp"

TEST_CASE("OutputLog", "[output_log]") {

    SECTION("StartsEmpty") {
        OutputLog log;
        REQUIRE(log.empty());
        REQUIRE(log.marker() == 0);
        REQUIRE(log.tail(10).empty());
    }

    SECTION("SplitsChunksIntoLines") {
        OutputLog log;
        log.append("one\ntwo\nthree\n");
        REQUIRE(log.size() == 3);
        REQUIRE(log.tail(2) == "two\nthree");
        REQUIRE(log.marker() == 3);
    }

    SECTION("OpenLineContinuesAcrossChunks") {
        OutputLog log;
        log.append("hel");
        log.append("lo\nwor");
        log.append("ld");
        REQUIRE(log.size() == 2);
        REQUIRE(log.tail(5) == "hello\nworld");
    }

    SECTION("MarkerIncludesOpenPromptLine") {
        OutputLog log;
        log.append("banner\n> ");
        auto mark = log.marker();
        REQUIRE(mark == 1);

        log.append("fix the tests\nworking...\n");
        REQUIRE(log.since(mark) == "> fix the tests\nworking...");
    }

    SECTION("PrunesToMaxLinesKeepingAbsoluteIndices") {
        OutputLog log(3);
        log.append("a\nb\n");
        auto mark = log.marker();
        REQUIRE(mark == 2);

        log.append("c\nd\ne\nf\n");
        REQUIRE(log.size() == 3);
        REQUIRE(log.dropped() == 3);
        REQUIRE(log.end_index() == 6);
        REQUIRE(log.tail(10) == "d\ne\nf");
        // Marker before the pruned region: everything still retained
        REQUIRE(log.since(mark) == "d\ne\nf");
        REQUIRE(log.since(5) == "f");
    }

    SECTION("CarriageReturnRedrawsStayBounded") {
        OutputLog log(100);
        for (int i = 0; i < 20'000; ++i) {
            log.append("\r 45% [=====>     ] 1.2MB/s eta 0:01");
        }
        REQUIRE(log.size() == 1);
        REQUIRE(log.bytes() <= OutputLog::DEFAULT_MAX_LINE_BYTES);
        auto line = log.tail(1);
        REQUIRE(line.size() <= OutputLog::DEFAULT_MAX_LINE_BYTES);
        REQUIRE(line.ends_with("eta 0:01"));
    }

    SECTION("OverlongLineIsBroken") {
        OutputLog log(100, 16);
        log.append(std::string(40, 'x') + "\nend\n");
        REQUIRE(log.size() == 4);
        REQUIRE(log.tail(4) == std::string(16, 'x') + "\n" + std::string(16, 'x') + "\n" +
                               std::string(8, 'x') + "\nend");
        REQUIRE(log.marker() == 4);
    }

    SECTION("BreakKeepsCharactersWhole") {
        OutputLog log(100, 5);
        log.append("abééé");
        REQUIRE(log.tail(2) == "abé\néé");
    }

    SECTION("TotalBytesBounded") {
        OutputLog log(1000, 100, 1000);
        for (int i = 0; i < 50; ++i) log.append(std::string(99, 'y') + "\n");
        REQUIRE(log.bytes() <= 1000);
        REQUIRE(log.size() == 10);
        REQUIRE(log.dropped() == 40);
        REQUIRE(log.end_index() == 50);
    }

    SECTION("HugeChunkWithoutNewline") {
        OutputLog log;
        log.append(std::string(2 * 1024 * 1024, 'z'));
        REQUIRE(log.bytes() <= OutputLog::DEFAULT_MAX_BYTES);
        REQUIRE(log.tail(1).size() == OutputLog::DEFAULT_MAX_LINE_BYTES);
    }

    SECTION("ClearKeepsCounting") {
        OutputLog log;
        log.append("x\ny\n");
        log.clear();
        REQUIRE(log.empty());
        REQUIRE(log.end_index() == 2);
        log.append("z\n");
        REQUIRE(log.since(2) == "z");
    }
}
