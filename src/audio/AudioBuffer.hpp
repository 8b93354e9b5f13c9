// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace narrator
{

/// @brief Decoded audio held as planar float32 samples in [-1, 1].
struct AudioBuffer
{
    unsigned sampleRate = 0;
    std::vector<std::vector<float>> channels;

    [[nodiscard]] auto channelCount() const -> unsigned { return static_cast<unsigned>(channels.size()); }

    [[nodiscard]] auto frameCount() const -> std::size_t { return channels.empty() ? 0 : channels.front().size(); }

    [[nodiscard]] auto duration() const -> double
    {
        return sampleRate == 0 ? 0.0 : static_cast<double>(frameCount()) / sampleRate;
    }

    /// @brief Creates a zero-filled buffer of the given length.
    [[nodiscard]] static auto silence(unsigned sampleRate, unsigned channelCount, double seconds) -> AudioBuffer
    {
        auto const frames = static_cast<std::size_t>(std::llround(seconds * sampleRate));
        return AudioBuffer {
            .sampleRate = sampleRate,
            .channels = std::vector<std::vector<float>>(channelCount, std::vector<float>(frames, 0.0f)),
        };
    }
};

} // namespace narrator
