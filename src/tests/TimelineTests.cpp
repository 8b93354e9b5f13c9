// SPDX-License-Identifier: Apache-2.0
#include <generation/Timeline.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace narrator;

namespace
{

auto segment(int index, double duration, DurationSource source = DurationSource::Exact) -> AudioSegment
{
    return AudioSegment {
        .id = std::format("p{}", index),
        .chapterId = "ch",
        .index = index,
        .text = {},
        .audio = {},
        .duration = duration,
        .durationSource = source,
    };
}

} // namespace

TEST_CASE("computeTimeline orders segments and accumulates start times", "[timeline]")
{
    auto segments = std::vector { segment(2, 0.5), segment(0, 1.25), segment(1, 2.0) };

    auto const total = computeTimeline(segments);
    CHECK(total == Catch::Approx(3.75));
    REQUIRE(segments.size() == 3);
    CHECK(segments[0].index == 0);
    CHECK(segments[0].startTime == 0.0);
    CHECK(segments[1].startTime == Catch::Approx(1.25));
    CHECK(segments[2].startTime == Catch::Approx(3.25));
}

TEST_CASE("computeTimeline of an empty chapter is zero", "[timeline]")
{
    auto segments = std::vector<AudioSegment> {};
    CHECK(computeTimeline(segments) == 0.0);
}

TEST_CASE("hasEstimatedDurations detects estimated entries", "[timeline]")
{
    auto exact = std::vector { segment(0, 1.0), segment(1, 1.0) };
    CHECK(!hasEstimatedDurations(exact));

    exact.push_back(segment(2, 1.0, DurationSource::Estimated));
    CHECK(hasEstimatedDurations(exact));
}

TEST_CASE("buildMediaOverlay maps text fragments to audio clips", "[timeline]")
{
    auto segments = std::vector { segment(0, 1.5), segment(1, 2.25) };
    computeTimeline(segments);

    auto const smil = buildMediaOverlay("chapter1.xhtml", "audio/ch1.mp3", segments);
    CHECK(smil.find("epub:textref=\"chapter1.xhtml\"") != std::string::npos);
    CHECK(smil.find("<par id=\"par1\">") != std::string::npos);
    CHECK(smil.find("<text src=\"chapter1.xhtml#p0\"/>") != std::string::npos);
    CHECK(smil.find("clipBegin=\"00:00:00.000\" clipEnd=\"00:00:01.500\"") != std::string::npos);
    CHECK(smil.find("clipBegin=\"00:00:01.500\" clipEnd=\"00:00:03.750\"") != std::string::npos);
}

TEST_CASE("buildMediaOverlay escapes attribute values", "[timeline]")
{
    auto segments = std::vector { segment(0, 1.0) };
    segments[0].id = "a&b";

    auto const smil = buildMediaOverlay("ch\"1\".xhtml", "a.wav", segments);
    CHECK(smil.find("ch&quot;1&quot;.xhtml#a&amp;b") != std::string::npos);
}
