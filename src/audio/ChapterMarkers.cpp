// SPDX-License-Identifier: Apache-2.0
#include "ChapterMarkers.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace narrator
{

namespace
{

    /// @brief Escapes characters with special meaning in FFMETADATA values.
    auto escapeMetadata(std::string_view value) -> std::string
    {
        auto out = std::string {};
        out.reserve(value.size());
        for (auto const c: value)
        {
            if (c == '=' || c == ';' || c == '#' || c == '\\' || c == '\n')
                out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

} // namespace

auto chapterMarkersFor(std::span<const AudioChapter> chapters,
                       std::span<const std::optional<double>> durations,
                       double totalDuration) -> std::vector<ChapterMarker>
{
    auto markers = std::vector<ChapterMarker> {};
    markers.reserve(chapters.size());

    auto const fallback = chapters.empty() ? 0.0 : totalDuration / static_cast<double>(chapters.size());
    auto currentTime = 0.0;

    for (auto i = std::size_t { 0 }; i < chapters.size(); ++i)
    {
        auto duration = fallback;
        if (i < durations.size() && durations[i])
            duration = *durations[i];
        else if (chapters[i].duration && *chapters[i].duration > 0.0)
            duration = *chapters[i].duration;

        markers.push_back(ChapterMarker {
            .title = chapters[i].title,
            .startMs = static_cast<std::int64_t>(std::floor(currentTime * 1000.0)),
            .endMs = static_cast<std::int64_t>(std::floor((currentTime + duration) * 1000.0)),
        });

        currentTime += duration;
    }

    return markers;
}

auto createFfmetadata(std::span<const ChapterMarker> markers, std::string_view title, std::string_view artist)
    -> std::string
{
    auto metadata = std::string { ";FFMETADATA1\n" };
    if (!title.empty())
        metadata += std::format("title={}\n", escapeMetadata(title));
    if (!artist.empty())
        metadata += std::format("artist={}\n", escapeMetadata(artist));

    for (auto const& marker: markers)
    {
        metadata += "\n[CHAPTER]\nTIMEBASE=1/1000\n";
        metadata += std::format("START={}\nEND={}\ntitle={}\n", marker.startMs, marker.endMs, escapeMetadata(marker.title));
    }

    return metadata;
}

auto formatTimestamp(double seconds) -> std::string
{
    auto const totalMs = static_cast<std::int64_t>(std::floor(std::max(seconds, 0.0) * 1000.0));
    auto const hours = totalMs / 3'600'000;
    auto const minutes = (totalMs / 60'000) % 60;
    auto const secs = (totalMs / 1000) % 60;
    auto const ms = totalMs % 1000;
    return std::format("{:02}:{:02}:{:02}.{:03}", hours, minutes, secs, ms);
}

auto createChapterList(std::span<const ChapterMarker> markers) -> std::string
{
    auto lines = std::string {};
    for (auto i = std::size_t { 0 }; i < markers.size(); ++i)
    {
        if (!lines.empty())
            lines += '\n';
        lines += std::format("CHAPTER{:02}={}\n", i + 1, formatTimestamp(static_cast<double>(markers[i].startMs) / 1000.0));
        lines += std::format("CHAPTER{:02}NAME={}", i + 1, markers[i].title);
    }
    return lines;
}

} // namespace narrator
