#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "bitbrush/api/bitbrush.hpp"

#include <algorithm>
#include <bit>
#include <functional>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace bitbrush;

TEST_CASE("PatternEngine - Construction", "[engine][config]") {
    SECTION("Valid widths") {
        int width = GENERATE(8, 16, 24, 32, 48, 56, 64);
        PatternEngine engine(width);
        REQUIRE(engine.Width() == width);
        REQUIRE(engine.DefaultStep() == 3);
    }

    SECTION("Mask covers exactly the width") {
        REQUIRE(PatternEngine(8).Mask() == 0xFFu);
        REQUIRE(PatternEngine(16).Mask() == 0xFFFFu);
        REQUIRE(PatternEngine(64).Mask() == ~Pattern{ 0 });
    }

    SECTION("Rejected widths") {
        int width = GENERATE(0, -8, 7, 9, 12, 63, 72, 128);
        REQUIRE_THROWS_AS(PatternEngine(width), InvalidConfiguration);
    }

    SECTION("Non-positive default step only fails ToggleSparse()") {
        int step = GENERATE(0, -2);
        EngineConfig config{ .width = 8, .default_step = step };
        PatternEngine engine(config);
        REQUIRE(engine.DefaultStep() == step);
        REQUIRE(engine.Mirror(1) == 128);
        REQUIRE(engine.SweepOnes().Size() == 8);
        REQUIRE(engine.ToggleSparse(3).ToVector() == std::vector<Pattern>{ 1, 9, 73 });
        REQUIRE_THROWS_AS(engine.ToggleSparse(), InvalidArgument);
    }

    SECTION("Errors share a common base") {
        REQUIRE_THROWS_AS(PatternEngine(7), Error);
    }
}

TEST_CASE("PatternEngine - Width 8 scenario", "[engine][scenario]") {
    PatternEngine engine(8);

    REQUIRE(engine.SweepOnes().ToVector() == std::vector<Pattern>{ 1, 2, 4, 8, 16, 32, 64, 128 });
    REQUIRE(engine.Visualize(5) == "00000101");
    REQUIRE(engine.Mirror(1) == 128);
    REQUIRE(engine.CountOnes(255) == 8);
    REQUIRE(engine.ToggleSparse(3).ToVector() == std::vector<Pattern>{ 1, 9, 73 });
    REQUIRE(engine.ToggleSparse().ToVector() == std::vector<Pattern>{ 1, 9, 73 });
}

TEST_CASE("PatternEngine - SweepOnes", "[engine][sweep]") {
    int width = GENERATE(8, 16, 32, 64);
    PatternEngine engine(width);
    auto values = engine.SweepOnes().ToVector();

    REQUIRE(values.size() == static_cast<std::size_t>(width));
    REQUIRE(std::is_sorted(values.begin(), values.end()));
    REQUIRE(std::adjacent_find(values.begin(), values.end()) == values.end());

    std::set<Pattern> expected;
    for (int i = 0; i < width; ++i)
        expected.insert(Pattern{ 1 } << i);
    REQUIRE(std::set<Pattern>(values.begin(), values.end()) == expected);

    for (Pattern v : values)
        REQUIRE(engine.CountOnes(v) == 1);
}

TEST_CASE("PatternEngine - SweepZeros complements SweepOnes", "[engine][sweep]") {
    int width = GENERATE(8, 24, 64);
    PatternEngine engine(width);
    auto ones = engine.SweepOnes().ToVector();
    auto zeros = engine.SweepZeros().ToVector();

    REQUIRE(zeros.size() == ones.size());
    for (std::size_t i = 0; i < ones.size(); ++i) {
        REQUIRE(zeros[i] == (engine.Mask() ^ ones[i]));
        REQUIRE(engine.CountOnes(zeros[i]) == width - 1);
    }
}

TEST_CASE("PatternEngine - ToggleSparse", "[engine][toggle]") {
    SECTION("Final value sets every multiple of step") {
        int width = GENERATE(8, 32, 64);
        int step = GENERATE(1, 2, 3, 5, 8, 13, 64, 100);
        PatternEngine engine(width);

        auto values = engine.ToggleSparse(step).ToVector();
        REQUIRE(values.size() == static_cast<std::size_t>((width + step - 1) / step));

        Pattern last = values.back();
        for (int i = 0; i < width; ++i) {
            bool set = (last >> i) & 1u;
            REQUIRE(set == (i % step == 0));
        }
    }

    SECTION("Each element adds exactly one bit") {
        PatternEngine engine(32);
        Pattern previous = 0;
        for (Pattern value : engine.ToggleSparse(4)) {
            REQUIRE((value & previous) == previous);
            REQUIRE(std::popcount(value ^ previous) == 1);
            previous = value;
        }
    }

    SECTION("Non-positive step is rejected at the call") {
        PatternEngine engine(8);
        REQUIRE_THROWS_AS(engine.ToggleSparse(0), InvalidArgument);
        REQUIRE_THROWS_AS(engine.ToggleSparse(-3), InvalidArgument);
        REQUIRE_THROWS_AS(engine.Generate(SequenceKind::ToggleSparse, 0), InvalidArgument);
    }
}

TEST_CASE("PatternEngine - ScanPatterns", "[engine][scan]") {
    int width = GENERATE(8, 16, 32, 64);
    PatternEngine engine(width);
    auto scan = engine.ScanPatterns().ToVector();
    auto rings = engine.ScanRings().ToVector();

    REQUIRE(scan.size() == static_cast<std::size_t>(width / 2 + 1));
    REQUIRE(rings.size() == scan.size());

    SECTION("Starts at the center bit") {
        REQUIRE(scan.front() == (Pattern{ 1 } << (width / 2)));
    }

    SECTION("Grows symmetrically until every bit is set") {
        REQUIRE(scan.back() == engine.Mask());
        for (std::size_t i = 1; i < scan.size(); ++i)
            REQUIRE((scan[i] & scan[i - 1]) == scan[i - 1]);
    }

    SECTION("Rings fold into the cumulative scan") {
        Pattern acc = 0;
        for (std::size_t i = 0; i < rings.size(); ++i) {
            acc |= rings[i];
            REQUIRE(acc == scan[i]);
            REQUIRE(engine.CountOnes(rings[i]) <= 2);
        }
    }
}

TEST_CASE("PatternEngine - Mirror", "[engine][mirror]") {
    SECTION("Single bit edges") {
        int width = GENERATE(8, 16, 40, 64);
        PatternEngine engine(width);
        Pattern top = Pattern{ 1 } << (width - 1);
        REQUIRE(engine.Mirror(1) == top);
        REQUIRE(engine.Mirror(top) == 1);
        REQUIRE(engine.Mirror(0) == 0);
        REQUIRE(engine.Mirror(engine.Mask()) == engine.Mask());
    }

    SECTION("Involution over the whole 16 bit space") {
        PatternEngine engine(16);
        for (Pattern v = 0; v <= engine.Mask(); ++v)
            REQUIRE(engine.Mirror(engine.Mirror(v)) == v);
    }

    SECTION("Mirrors each sweep position onto its opposite") {
        PatternEngine engine(32);
        auto ones = engine.SweepOnes().ToVector();
        for (std::size_t i = 0; i < ones.size(); ++i)
            REQUIRE(engine.Mirror(ones[i]) == ones[ones.size() - 1 - i]);
    }

    SECTION("Multi-byte value") {
        PatternEngine engine(16);
        REQUIRE(engine.Mirror(0x0001) == 0x8000);
        REQUIRE(engine.Mirror(0x00F0) == 0x0F00);
        REQUIRE(engine.Mirror(0x1234) == 0x2C48);
    }

    SECTION("Out of range input is masked") {
        PatternEngine engine(8);
        REQUIRE(engine.Mirror(0x101) == 0x80);
    }

    SECTION("MirrorAll matches Mirror") {
        PatternEngine engine(24);
        std::vector<Pattern> values{ 0, 1, 0x123456, 0xFFFFFF, 0x800000 };
        auto mirrored = engine.MirrorAll(values);
        REQUIRE(mirrored.size() == values.size());
        for (std::size_t i = 0; i < values.size(); ++i)
            REQUIRE(mirrored[i] == engine.Mirror(values[i]));
    }
}

TEST_CASE("PatternEngine - Visualize and CountOnes", "[engine][inspect]") {
    SECTION("Length always equals width and parses back") {
        int width = GENERATE(8, 16, 64);
        PatternEngine engine(width);
        for (Pattern v : { Pattern{ 0 }, Pattern{ 1 }, Pattern{ 0xA5 }, engine.Mask(), engine.Mask() >> 1 }) {
            std::string text = engine.Visualize(v);
            REQUIRE(text.size() == static_cast<std::size_t>(width));
            REQUIRE(text.find_first_not_of("01") == std::string::npos);
            REQUIRE(std::stoull(text, nullptr, 2) == v);
            REQUIRE(engine.Parse(text) == v);
            REQUIRE(engine.CountOnes(v) == std::count(text.begin(), text.end(), '1'));
        }
    }

    SECTION("Bits above the width are ignored") {
        PatternEngine engine(8);
        REQUIRE(engine.CountOnes(0xFF00) == 0);
        REQUIRE(engine.CountOnes(0x1FF) == 8);
        REQUIRE(engine.Visualize(0x105) == "00000101");
    }
}

TEST_CASE("PatternEngine - Parse", "[engine][parse]") {
    PatternEngine engine(8);

    REQUIRE(engine.Parse("101") == 5);
    REQUIRE(engine.Parse("11111111") == 255);
    REQUIRE_THROWS_AS(engine.Parse(""), InvalidArgument);
    REQUIRE_THROWS_AS(engine.Parse("111111111"), InvalidArgument);
    REQUIRE_THROWS_AS(engine.Parse("10201"), InvalidArgument);
}

TEST_CASE("PatternEngine - Generate dispatches by kind", "[engine][kind]") {
    PatternEngine engine(16);

    REQUIRE(engine.Generate(SequenceKind::SweepOnes, 1).ToVector() == engine.SweepOnes().ToVector());
    REQUIRE(engine.Generate(SequenceKind::SweepZeros, 1).ToVector() == engine.SweepZeros().ToVector());
    REQUIRE(engine.Generate(SequenceKind::ToggleSparse, 5).ToVector() == engine.ToggleSparse(5).ToVector());
    REQUIRE(engine.Generate(SequenceKind::Scan, 1).ToVector() == engine.ScanPatterns().ToVector());
    REQUIRE(engine.Generate(SequenceKind::ScanRings, 1).ToVector() == engine.ScanRings().ToVector());
}

TEST_CASE("SequenceKind - Names round trip", "[kind]") {
    for (SequenceKind kind : AllSequenceKinds())
        REQUIRE(ParseSequenceKind(ToString(kind)) == kind);

    REQUIRE(ParseSequenceKind("scan") == SequenceKind::Scan);
    REQUIRE_FALSE(ParseSequenceKind("spiral").has_value());
}

TEST_CASE("PatternEngine - Logger receives construction and rejection messages", "[engine][logger]") {
    std::vector<std::string> debug_lines;
    std::vector<std::string> warn_lines;
    Logger log{};
    log.debug = [&](const std::string& m) { debug_lines.push_back(m); };
    log.warn = [&](const std::string& m) { warn_lines.push_back(m); };

    PatternEngine engine(EngineConfig{ .width = 16, .default_step = 2 }, log);
    REQUIRE_FALSE(debug_lines.empty());
    REQUIRE(debug_lines.front().find("width=16") != std::string::npos);

    REQUIRE_THROWS_AS(engine.ToggleSparse(0), InvalidArgument);
    REQUIRE(warn_lines.size() == 1);
}

TEST_CASE("PatternEngine - Engines built on separate threads keep their own logger", "[engine][logger]") {
    std::vector<std::string> first_lines;
    std::vector<std::string> second_lines;

    auto build = [](int width, std::vector<std::string>& lines) {
        Logger log{};
        log.debug = [&lines](const std::string& m) { lines.push_back(m); };
        for (int i = 0; i < 200; ++i) {
            PatternEngine engine(EngineConfig{ .width = width }, log);
            engine.MirrorAll({ 1, 2, 3 });
        }
    };

    {
        std::jthread first(build, 8, std::ref(first_lines));
        std::jthread second(build, 64, std::ref(second_lines));
    }

    REQUIRE(first_lines.size() >= 200);
    REQUIRE(second_lines.size() >= 200);
    for (const auto& line : first_lines)
        REQUIRE(line.find("width=64") == std::string::npos);
    for (const auto& line : second_lines)
        REQUIRE(line.find("width=8 ") == std::string::npos);
}
