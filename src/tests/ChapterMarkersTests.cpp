// SPDX-License-Identifier: Apache-2.0
#include <audio/ChapterMarkers.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace narrator;

namespace
{

auto chapter(std::string title, std::optional<double> duration = std::nullopt) -> AudioChapter
{
    return AudioChapter { .id = title, .title = title, .audio = AudioBuffer {}, .duration = duration };
}

} // namespace

TEST_CASE("chapterMarkersFor lays chapters out back to back", "[markers]")
{
    auto const chapters = std::vector { chapter("One"), chapter("Two"), chapter("Three") };
    auto const durations = std::vector<std::optional<double>> { 1.5, 2.25, 0.5 };

    auto const markers = chapterMarkersFor(chapters, durations, 4.25);
    REQUIRE(markers.size() == 3);
    CHECK(markers[0].startMs == 0);
    CHECK(markers[0].endMs == 1500);
    CHECK(markers[1].startMs == 1500);
    CHECK(markers[1].endMs == 3750);
    CHECK(markers[2].startMs == 3750);
    CHECK(markers[2].endMs == 4250);
    CHECK(markers[2].title == "Three");
}

TEST_CASE("chapterMarkersFor falls back to chapter then average duration", "[markers]")
{
    auto const chapters = std::vector { chapter("A", 2.0), chapter("B") };
    auto const durations = std::vector<std::optional<double>> { std::nullopt, std::nullopt };

    auto const markers = chapterMarkersFor(chapters, durations, 5.0);
    REQUIRE(markers.size() == 2);
    CHECK(markers[0].endMs == 2000);
    CHECK(markers[1].startMs == 2000);
    CHECK(markers[1].endMs == 4500);
}

TEST_CASE("formatTimestamp renders hours, minutes, seconds and milliseconds", "[markers]")
{
    CHECK(formatTimestamp(0.0) == "00:00:00.000");
    CHECK(formatTimestamp(3.75) == "00:00:03.750");
    CHECK(formatTimestamp(3661.5) == "01:01:01.500");
    CHECK(formatTimestamp(-2.0) == "00:00:00.000");
}

TEST_CASE("createFfmetadata emits one CHAPTER block per marker", "[markers]")
{
    auto const markers = std::vector<ChapterMarker> {
        { .title = "Intro", .startMs = 0, .endMs = 1500 },
        { .title = "Act=1", .startMs = 1500, .endMs = 3000 },
    };

    auto const metadata = createFfmetadata(markers, "My Book", "Jane Doe");
    CHECK(metadata.starts_with(";FFMETADATA1\n"));
    CHECK(metadata.find("title=My Book\n") != std::string::npos);
    CHECK(metadata.find("artist=Jane Doe\n") != std::string::npos);
    CHECK(metadata.find("[CHAPTER]\nTIMEBASE=1/1000\nSTART=0\nEND=1500\ntitle=Intro\n") != std::string::npos);
    CHECK(metadata.find("START=1500\nEND=3000\ntitle=Act\\=1\n") != std::string::npos);
}

TEST_CASE("createChapterList numbers chapters from one", "[markers]")
{
    auto const markers = std::vector<ChapterMarker> {
        { .title = "Intro", .startMs = 0, .endMs = 1500 },
        { .title = "Middle", .startMs = 61500, .endMs = 70000 },
    };

    CHECK(createChapterList(markers)
          == "CHAPTER01=00:00:00.000\nCHAPTER01NAME=Intro\n"
             "CHAPTER02=00:01:01.500\nCHAPTER02NAME=Middle");
}
