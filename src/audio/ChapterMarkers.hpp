// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioPayload.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace narrator
{

/// @brief A chapter's position in the assembled timeline, in milliseconds.
struct ChapterMarker
{
    std::string title;
    std::int64_t startMs = 0;
    std::int64_t endMs = 0;
};

/// @brief Lays chapters out back to back.
///
/// `durations[i]` (seconds) is used for chapter i when present; otherwise the chapter's own
/// duration, and failing that `totalDuration / chapters.size()`.
[[nodiscard]] auto chapterMarkersFor(std::span<const AudioChapter> chapters,
                                     std::span<const std::optional<double>> durations,
                                     double totalDuration) -> std::vector<ChapterMarker>;

/// @brief Renders an ffmpeg FFMETADATA1 document carrying the chapter table.
[[nodiscard]] auto createFfmetadata(std::span<const ChapterMarker> markers,
                                    std::string_view title = {},
                                    std::string_view artist = {}) -> std::string;

/// @brief Formats seconds as HH:MM:SS.mmm.
[[nodiscard]] auto formatTimestamp(double seconds) -> std::string;

/// @brief Renders the CHAPTERnn=/CHAPTERnnNAME= list understood by simple chapter readers.
[[nodiscard]] auto createChapterList(std::span<const ChapterMarker> markers) -> std::string;

} // namespace narrator
