// SPDX-License-Identifier: Apache-2.0
#include "Timeline.hpp"

#include <audio/ChapterMarkers.hpp>

#include <algorithm>
#include <format>

namespace narrator
{

namespace
{

    auto escapeXml(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());
        for (auto const ch: text)
        {
            switch (ch)
            {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                case '\'': out += "&apos;"; break;
                default: out += ch; break;
            }
        }
        return out;
    }

} // namespace

auto computeTimeline(std::vector<AudioSegment>& segments) -> double
{
    std::ranges::stable_sort(segments, {}, &AudioSegment::index);

    auto cumulative = 0.0;
    for (auto& segment: segments)
    {
        segment.startTime = cumulative;
        cumulative += segment.duration;
    }
    return cumulative;
}

auto hasEstimatedDurations(std::span<const AudioSegment> segments) -> bool
{
    return std::ranges::any_of(
        segments, [](const AudioSegment& segment) { return segment.durationSource == DurationSource::Estimated; });
}

auto buildMediaOverlay(std::string_view chapterHref, std::string_view audioHref, std::span<const AudioSegment> segments)
    -> std::string
{
    auto const textRef = escapeXml(chapterHref);
    auto const audioRef = escapeXml(audioHref);

    auto out = std::string {};
    out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<smil xmlns=\"http://www.w3.org/ns/SMIL\" xmlns:epub=\"http://www.idpf.org/2007/ops\" version=\"3.0\">\n";
    out += "  <body>\n";
    out += std::format("    <seq id=\"seq1\" epub:textref=\"{}\" epub:type=\"bodymatter chapter\">\n", textRef);

    auto number = 0;
    for (auto const& segment: segments)
    {
        out += std::format("      <par id=\"par{}\">\n", ++number);
        out += std::format("        <text src=\"{}#{}\"/>\n", textRef, escapeXml(segment.id));
        out += std::format("        <audio src=\"{}\" clipBegin=\"{}\" clipEnd=\"{}\"/>\n",
                           audioRef,
                           formatTimestamp(segment.startTime),
                           formatTimestamp(segment.startTime + segment.duration));
        out += "      </par>\n";
    }

    out += "    </seq>\n";
    out += "  </body>\n";
    out += "</smil>\n";
    return out;
}

} // namespace narrator
