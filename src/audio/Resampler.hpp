// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

#include <span>
#include <vector>

namespace narrator
{

/// @brief Common format every buffer is brought to by normalize().
struct NormalizedFormat
{
    unsigned sampleRate = 0;
    unsigned channelCount = 0;
};

/// @brief Widens a buffer to `channelCount` channels by duplicating its highest-indexed channel.
///
/// Buffers that already have at least `channelCount` channels are returned unchanged.
[[nodiscard]] auto upmix(AudioBuffer buffer, unsigned channelCount) -> AudioBuffer;

/// @brief Resamples a buffer to `sampleRate` using linear interpolation.
///
/// Not band-limited; intended for speech whose content sits well below either Nyquist rate.
/// The result holds round(frames * target / source) frames.
[[nodiscard]] auto resample(AudioBuffer buffer, unsigned sampleRate) -> AudioBuffer;

/// @brief Brings every buffer to the maximum channel count and the highest sample rate in the set.
/// @return The common format, or InvalidArgument for an empty set or when no buffer has a sample rate.
[[nodiscard]] auto normalize(std::vector<AudioBuffer>& buffers) -> Result<NormalizedFormat>;

/// @brief Concatenates buffers that already share one format, preserving their order.
/// @return The joined buffer, or InvalidArgument if the formats differ.
[[nodiscard]] auto concatenate(std::span<const AudioBuffer> buffers) -> Result<AudioBuffer>;

} // namespace narrator
