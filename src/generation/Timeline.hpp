// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Sorts segments by index and assigns cumulative start times.
/// @return The chapter's total duration in seconds.
auto computeTimeline(std::vector<AudioSegment>& segments) -> double;

/// @brief Returns true if any duration in the timeline is an estimate.
[[nodiscard]] auto hasEstimatedDurations(std::span<const AudioSegment> segments) -> bool;

/// @brief Renders an EPUB3 media overlay mapping each segment's text element to its audio clip.
///
/// Clip times are HH:MM:SS.mmm clock values. Text references are `<chapterHref>#<segment id>`; segments must already carry start times.
[[nodiscard]] auto buildMediaOverlay(std::string_view chapterHref,
                                     std::string_view audioHref,
                                     std::span<const AudioSegment> segments) -> std::string;

} // namespace narrator
