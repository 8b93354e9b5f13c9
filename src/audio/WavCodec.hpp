// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <span>

namespace narrator::wav
{

/// @brief Size of the canonical PCM header produced by writeHeader().
constexpr auto CanonicalHeaderSize = std::size_t { 44 };

/// @brief `fmt ` chunk format tags.
constexpr auto FormatPcm = std::uint16_t { 1 };
constexpr auto FormatIeeeFloat = std::uint16_t { 3 };
constexpr auto FormatExtensible = std::uint16_t { 0xFFFE };

/// @brief Rate assumed by the fallback duration estimate.
constexpr auto EstimateSampleRate = 24000u;

/// @brief Header fields of a RIFF/WAVE container.
struct WavHeader
{
    std::uint16_t audioFormat = FormatPcm; ///< Resolved format tag (extensible subformat unwrapped).
    unsigned channelCount = 0;
    unsigned sampleRate = 0;
    unsigned bitDepth = 0;
    std::size_t dataOffset = 0; ///< Offset of the first payload byte.
    std::size_t dataLength = 0;      ///< Payload length as declared by the `data` chunk.
    std::size_t availableLength = 0; ///< Payload bytes actually present in the blob.

    [[nodiscard]] auto blockAlign() const -> unsigned { return channelCount * (bitDepth / 8); }

    /// @brief True when the four format fields match (offsets and lengths are ignored).
    [[nodiscard]] auto sameFormat(const WavHeader& other) const -> bool
    {
        return audioFormat == other.audioFormat && channelCount == other.channelCount
               && sampleRate == other.sampleRate && bitDepth == other.bitDepth;
    }
};

/// @brief Duration result, distinguishing exact measurements from estimates.
struct DurationMeasurement
{
    double seconds = 0.0;
    DurationSource source = DurationSource::Exact;

    [[nodiscard]] auto isExact() const -> bool { return source == DurationSource::Exact; }
};

/// @brief Parses the header of a RIFF/WAVE blob.
///
/// Walks chunk by chunk using each chunk's declared size, so `LIST`, `fact` or other
/// chunks may appear before `fmt ` or between `fmt ` and `data`.
/// @return The header, or FormatError if the magic is absent or no `fmt `/`data` chunk exists.
[[nodiscard]] auto parseHeader(std::span<const std::uint8_t> bytes) -> Result<WavHeader>;

/// @brief Produces a canonical 44-byte header.
[[nodiscard]] auto writeHeader(unsigned sampleRate,
                               unsigned channelCount,
                               unsigned bitDepth,
                               std::size_t dataLength,
                               std::uint16_t audioFormat = FormatPcm) -> Bytes;

/// @brief Computes the exact playing time from header fields.
///
/// Uses the payload present in the blob, so a truncated or streamed blob with an oversized
/// declared length reports what can actually be played.
[[nodiscard]] auto duration(const WavHeader& header) -> Result<double>;

/// @brief Measures the duration of a blob.
///
/// Falls back to an estimate (16-bit mono at EstimateSampleRate after a 44-byte header)
/// only when the header cannot be parsed; the result is tagged as Estimated then.
[[nodiscard]] auto measureDuration(std::span<const std::uint8_t> bytes) -> DurationMeasurement;

/// @brief Encodes a planar buffer as interleaved PCM16 WAV.
[[nodiscard]] auto encode(const AudioBuffer& buffer) -> Bytes;

/// @brief Returns a zero payload of the given duration, aligned to whole frames of `format`.
[[nodiscard]] auto silencePayload(const WavHeader& format, double seconds) -> Bytes;

} // namespace narrator::wav
