// SPDX-License-Identifier: Apache-2.0
#include "Resampler.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace narrator
{

auto upmix(AudioBuffer buffer, unsigned channelCount) -> AudioBuffer
{
    if (buffer.channels.empty())
    {
        buffer.channels.assign(channelCount, std::vector<float> {});
        return buffer;
    }

    while (buffer.channelCount() < channelCount)
        buffer.channels.push_back(buffer.channels.back());

    return buffer;
}

auto resample(AudioBuffer buffer, unsigned sampleRate) -> AudioBuffer
{
    if (buffer.sampleRate == sampleRate || buffer.sampleRate == 0 || sampleRate == 0)
    {
        buffer.sampleRate = sampleRate == 0 ? buffer.sampleRate : sampleRate;
        return buffer;
    }

    auto const sourceFrames = buffer.frameCount();
    auto const ratio = static_cast<double>(buffer.sampleRate) / sampleRate;
    auto const targetFrames =
        static_cast<std::size_t>(std::llround(static_cast<double>(sourceFrames) * sampleRate / buffer.sampleRate));

    auto result = AudioBuffer { .sampleRate = sampleRate, .channels = {} };
    result.channels.reserve(buffer.channels.size());

    for (auto const& input: buffer.channels)
    {
        auto output = std::vector<float>(targetFrames, 0.0f);
        if (!input.empty())
        {
            auto const last = input.size() - 1;
            for (auto i = std::size_t { 0 }; i < targetFrames; ++i)
            {
                auto const position = static_cast<double>(i) * ratio;
                auto const i0 = std::min(static_cast<std::size_t>(position), last);
                auto const i1 = std::min(i0 + 1, last);
                auto const fraction = static_cast<float>(position - static_cast<double>(i0));
                output[i] = input[i0] + (input[i1] - input[i0]) * fraction;
            }
        }
        result.channels.push_back(std::move(output));
    }

    return result;
}

auto normalize(std::vector<AudioBuffer>& buffers) -> Result<NormalizedFormat>
{
    if (buffers.empty())
        return makeError(ErrorCode::InvalidArgument, "No audio buffers to normalize");

    auto format = NormalizedFormat { .sampleRate = 0, .channelCount = 0 };
    for (auto const& buffer: buffers)
    {
        format.sampleRate = std::max(format.sampleRate, buffer.sampleRate);
        format.channelCount = std::max(format.channelCount, buffer.channelCount());
    }

    if (format.sampleRate == 0)
        return makeError(ErrorCode::InvalidArgument, "No audio buffer has a sample rate");

    for (auto i = std::size_t { 0 }; i < buffers.size(); ++i)
    {
        auto& buffer = buffers[i];
        if (buffer.channelCount() == format.channelCount && buffer.sampleRate == format.sampleRate)
            continue;

        log::debug("Normalizing buffer {}: {} Hz/{} ch -> {} Hz/{} ch",
                   i,
                   buffer.sampleRate,
                   buffer.channelCount(),
                   format.sampleRate,
                   format.channelCount);
        buffer = resample(upmix(std::move(buffer), format.channelCount), format.sampleRate);
    }

    return format;
}

auto concatenate(std::span<const AudioBuffer> buffers) -> Result<AudioBuffer>
{
    if (buffers.empty())
        return makeError(ErrorCode::InvalidArgument, "No audio buffers to concatenate");

    auto const sampleRate = buffers.front().sampleRate;
    auto const channelCount = buffers.front().channelCount();

    auto totalFrames = std::size_t { 0 };
    for (auto i = std::size_t { 0 }; i < buffers.size(); ++i)
    {
        if (buffers[i].sampleRate != sampleRate || buffers[i].channelCount() != channelCount)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Buffer {} has format {} Hz/{} ch, expected {} Hz/{} ch",
                                         i,
                                         buffers[i].sampleRate,
                                         buffers[i].channelCount(),
                                         sampleRate,
                                         channelCount));
        totalFrames += buffers[i].frameCount();
    }

    auto output = AudioBuffer {
        .sampleRate = sampleRate,
        .channels = std::vector<std::vector<float>>(channelCount, std::vector<float>(totalFrames, 0.0f)),
    };

    auto offset = std::size_t { 0 };
    for (auto const& buffer: buffers)
    {
        for (auto channel = 0u; channel < channelCount; ++channel)
            std::copy(buffer.channels[channel].begin(),
                      buffer.channels[channel].end(),
                      output.channels[channel].begin() + static_cast<std::ptrdiff_t>(offset));
        offset += buffer.frameCount();
    }

    return output;
}

} // namespace narrator
