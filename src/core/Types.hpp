// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Owned binary payload.
using Bytes = std::vector<std::uint8_t>;

/// @brief Container format an encoded audio blob is stored in.
enum class ContainerFormat : std::uint8_t
{
    Wav,
    Mp3,
    Mp4,
    Unknown,
};

/// @brief Output formats offered for assembled audio.
enum class OutputFormat : std::uint8_t
{
    Wav, ///< Uncompressed PCM container.
    Mp3, ///< Lossy-compressed single-track container.
    M4b, ///< Lossy-compressed chaptered container.
};

[[nodiscard]] constexpr auto containerName(ContainerFormat format) -> std::string_view
{
    switch (format)
    {
        case ContainerFormat::Wav: return "audio/wav";
        case ContainerFormat::Mp3: return "audio/mpeg";
        case ContainerFormat::Mp4: return "audio/mp4";
        case ContainerFormat::Unknown: return "application/octet-stream";
    }
    return "application/octet-stream";
}

/// @brief File extension (without dot) used when a blob is written to disk.
[[nodiscard]] constexpr auto containerExtension(ContainerFormat format) -> std::string_view
{
    switch (format)
    {
        case ContainerFormat::Wav: return "wav";
        case ContainerFormat::Mp3: return "mp3";
        case ContainerFormat::Mp4: return "m4a";
        case ContainerFormat::Unknown: return "bin";
    }
    return "bin";
}

[[nodiscard]] constexpr auto outputFormatName(OutputFormat format) -> std::string_view
{
    switch (format)
    {
        case OutputFormat::Wav: return "wav";
        case OutputFormat::Mp3: return "mp3";
        case OutputFormat::M4b: return "m4b";
    }
    return "wav";
}

/// @brief Parses an output format name; unknown names yield std::nullopt.
[[nodiscard]] constexpr auto outputFormatFromString(std::string_view name) -> std::optional<OutputFormat>
{
    if (name == "wav")
        return OutputFormat::Wav;
    if (name == "mp3")
        return OutputFormat::Mp3;
    if (name == "m4b")
        return OutputFormat::M4b;
    return std::nullopt;
}

/// @brief Returns the container an output format is written in.
[[nodiscard]] constexpr auto containerFor(OutputFormat format) -> ContainerFormat
{
    switch (format)
    {
        case OutputFormat::Wav: return ContainerFormat::Wav;
        case OutputFormat::Mp3: return ContainerFormat::Mp3;
        case OutputFormat::M4b: return ContainerFormat::Mp4;
    }
    return ContainerFormat::Unknown;
}

/// @brief Returns true for formats that carry embedded chapter markers.
[[nodiscard]] constexpr auto supportsChapters(OutputFormat format) -> bool
{
    return format == OutputFormat::M4b;
}

/// @brief Guesses the container of a blob from its leading magic bytes.
[[nodiscard]] inline auto sniffContainer(std::span<const std::uint8_t> bytes) -> ContainerFormat
{
    auto const startsWith = [&](std::size_t offset, std::string_view magic) {
        if (bytes.size() < offset + magic.size())
            return false;
        for (auto i = std::size_t { 0 }; i < magic.size(); ++i)
            if (bytes[offset + i] != static_cast<std::uint8_t>(magic[i]))
                return false;
        return true;
    };

    if (startsWith(0, "RIFF") && startsWith(8, "WAVE"))
        return ContainerFormat::Wav;
    if (startsWith(4, "ftyp"))
        return ContainerFormat::Mp4;
    if (startsWith(0, "ID3"))
        return ContainerFormat::Mp3;
    if (bytes.size() >= 2 && bytes[0] == 0xFF && (bytes[1] & 0xE0) == 0xE0)
        return ContainerFormat::Mp3;
    return ContainerFormat::Unknown;
}

/// @brief A binary audio blob tagged with its container format.
struct EncodedAudio
{
    Bytes bytes;
    ContainerFormat container = ContainerFormat::Unknown;

    /// @brief Tags raw bytes by sniffing their container.
    [[nodiscard]] static auto detect(Bytes data) -> EncodedAudio
    {
        auto const container = sniffContainer(data);
        return EncodedAudio { .bytes = std::move(data), .container = container };
    }
};

/// @brief A sentence-sized unit of chapter text, as produced by the segmenter.
struct TextSegment
{
    int index = 0;
    std::string text;
    std::string id;
};

/// @brief How a duration value was obtained.
enum class DurationSource : std::uint8_t
{
    Exact,     ///< Computed from container header fields.
    Estimated, ///< Header unreadable; assumed 16-bit mono at the conventional rate.
};

/// @brief Synthesized audio for one text segment.
struct AudioSegment
{
    std::string id;
    std::string chapterId;
    int index = 0;
    std::string text;
    EncodedAudio audio;
    double duration = 0.0;
    DurationSource durationSource = DurationSource::Exact;

    /// Offset from chapter start; only valid after computeTimeline().
    double startTime = 0.0;
};

/// @brief Progress callback delivered at batch or step granularity.
using ProgressCallback = std::function<void(int current, int total, std::string_view message)>;

} // namespace narrator
