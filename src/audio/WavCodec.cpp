// SPDX-License-Identifier: Apache-2.0
#include "WavCodec.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <string_view>

namespace narrator::wav
{

namespace
{

    auto readU16(std::span<const std::uint8_t> bytes, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
    }

    auto readU32(std::span<const std::uint8_t> bytes, std::size_t offset) -> std::uint32_t
    {
        return static_cast<std::uint32_t>(bytes[offset]) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
               | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
               | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
    }

    auto tagEquals(std::span<const std::uint8_t> bytes, std::size_t offset, std::string_view tag) -> bool
    {
        return bytes.size() >= offset + 4 && std::equal(tag.begin(), tag.end(), bytes.begin() + offset);
    }

    void appendTag(Bytes& out, std::string_view tag)
    {
        out.insert(out.end(), tag.begin(), tag.end());
    }

    void appendU16(Bytes& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    }

    void appendU32(Bytes& out, std::uint32_t value)
    {
        for (auto shift = 0; shift < 32; shift += 8)
            out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }

    constexpr auto RiffHeaderSize = std::size_t { 12 };
    constexpr auto ChunkHeaderSize = std::size_t { 8 };
    constexpr auto MinFmtChunkSize = std::size_t { 16 };

} // namespace

auto parseHeader(std::span<const std::uint8_t> bytes) -> Result<WavHeader>
{
    if (!tagEquals(bytes, 0, "RIFF") || !tagEquals(bytes, 8, "WAVE"))
        return makeError(ErrorCode::FormatError,
                         std::format("Not a RIFF/WAVE container ({} bytes)", bytes.size()));

    auto header = WavHeader {};
    auto fmtFound = false;
    auto offset = RiffHeaderSize;

    while (offset + ChunkHeaderSize <= bytes.size())
    {
        auto const chunkSize = static_cast<std::size_t>(readU32(bytes, offset + 4));
        auto const body = offset + ChunkHeaderSize;

        if (tagEquals(bytes, offset, "fmt "))
        {
            if (chunkSize < MinFmtChunkSize || body + MinFmtChunkSize > bytes.size())
                return makeError(ErrorCode::FormatError,
                                 std::format("Truncated fmt chunk ({} bytes declared)", chunkSize));

            header.audioFormat = readU16(bytes, body);
            header.channelCount = readU16(bytes, body + 2);
            header.sampleRate = readU32(bytes, body + 4);
            header.bitDepth = readU16(bytes, body + 14);

            // WAVE_FORMAT_EXTENSIBLE carries the real tag in the first two bytes of the subformat GUID.
            if (header.audioFormat == FormatExtensible && chunkSize >= 26 && body + 26 <= bytes.size())
                header.audioFormat = readU16(bytes, body + 24);

            fmtFound = true;
        }
        else if (tagEquals(bytes, offset, "data"))
        {
            if (!fmtFound)
                return makeError(ErrorCode::FormatError, "data chunk precedes fmt chunk");

            header.dataOffset = body;
            header.dataLength = chunkSize;
            header.availableLength = std::min(chunkSize, bytes.size() - body);
            if (header.availableLength != chunkSize)
                log::debug("WAV data chunk truncated: declared {} bytes, {} present", chunkSize, header.availableLength);
            return header;
        }

        // Chunks are word aligned.
        offset = body + chunkSize + (chunkSize & 1);
    }

    return makeError(ErrorCode::FormatError,
                     fmtFound ? "No data chunk found" : "No fmt chunk found");
}

auto writeHeader(unsigned sampleRate,
                 unsigned channelCount,
                 unsigned bitDepth,
                 std::size_t dataLength,
                 std::uint16_t audioFormat) -> Bytes
{
    auto const blockAlign = channelCount * (bitDepth / 8);

    auto out = Bytes {};
    out.reserve(CanonicalHeaderSize);
    appendTag(out, "RIFF");
    appendU32(out, static_cast<std::uint32_t>(36 + dataLength));
    appendTag(out, "WAVE");
    appendTag(out, "fmt ");
    appendU32(out, 16);
    appendU16(out, audioFormat);
    appendU16(out, static_cast<std::uint16_t>(channelCount));
    appendU32(out, sampleRate);
    appendU32(out, sampleRate * blockAlign);
    appendU16(out, static_cast<std::uint16_t>(blockAlign));
    appendU16(out, static_cast<std::uint16_t>(bitDepth));
    appendTag(out, "data");
    appendU32(out, static_cast<std::uint32_t>(dataLength));
    return out;
}

auto duration(const WavHeader& header) -> Result<double>
{
    auto const bytesPerSecond =
        static_cast<double>(header.sampleRate) * header.channelCount * (header.bitDepth / 8);
    if (bytesPerSecond <= 0.0)
        return makeError(ErrorCode::FormatError,
                         std::format("Invalid WAV format fields (rate {}, channels {}, bits {})",
                                     header.sampleRate,
                                     header.channelCount,
                                     header.bitDepth));

    return static_cast<double>(header.availableLength) / bytesPerSecond;
}

auto measureDuration(std::span<const std::uint8_t> bytes) -> DurationMeasurement
{
    auto header = parseHeader(bytes);
    if (header)
    {
        auto seconds = duration(*header);
        if (seconds)
            return DurationMeasurement { .seconds = *seconds, .source = DurationSource::Exact };
    }

    auto const payload = bytes.size() > CanonicalHeaderSize ? bytes.size() - CanonicalHeaderSize : 0;
    auto const estimate = static_cast<double>(payload) / (EstimateSampleRate * 2.0);
    log::debug("WAV header unreadable, estimating duration as {:.3f}s", estimate);
    return DurationMeasurement { .seconds = estimate, .source = DurationSource::Estimated };
}

auto encode(const AudioBuffer& buffer) -> Bytes
{
    constexpr auto bitDepth = 16u;
    auto const channelCount = buffer.channelCount();
    auto const frames = buffer.frameCount();
    auto const dataLength = frames * channelCount * (bitDepth / 8);

    auto out = writeHeader(buffer.sampleRate, channelCount, bitDepth, dataLength);
    out.reserve(out.size() + dataLength);

    for (auto frame = std::size_t { 0 }; frame < frames; ++frame)
    {
        for (auto const& channel: buffer.channels)
        {
            auto const s = std::clamp(channel[frame], -1.0f, 1.0f);
            auto const value = static_cast<std::int16_t>(s < 0 ? s * 0x8000 : s * 0x7FFF);
            appendU16(out, static_cast<std::uint16_t>(value));
        }
    }

    return out;
}

auto silencePayload(const WavHeader& format, double seconds) -> Bytes
{
    auto const frames = static_cast<std::size_t>(std::llround(std::max(seconds, 0.0) * format.sampleRate));
    auto const fill = (format.audioFormat == FormatPcm && format.bitDepth == 8) ? std::uint8_t { 0x80 }
                                                                                 : std::uint8_t { 0 };
    return Bytes(frames * format.blockAlign(), fill);
}

} // namespace narrator::wav
