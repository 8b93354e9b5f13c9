// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string>
#include <variant>

namespace narrator
{

/// @brief Audio handed to the assembler: either still encoded, or already decoded.
using AudioPayload = std::variant<EncodedAudio, AudioBuffer>;

/// @brief One entry of an ordered assembly input; order is playback order.
struct AudioChapter
{
    std::string id;
    std::string title;
    AudioPayload audio;
    std::optional<double> duration;
};

/// @brief Returns the encoded blob of a payload, or nullptr for decoded buffers.
[[nodiscard]] inline auto encodedAudio(const AudioPayload& payload) -> const EncodedAudio*
{
    return std::get_if<EncodedAudio>(&payload);
}

/// @brief Returns true if the payload is an encoded blob in the given container.
[[nodiscard]] inline auto isEncodedAs(const AudioPayload& payload, ContainerFormat container) -> bool
{
    auto const* encoded = encodedAudio(payload);
    return encoded && encoded->container == container;
}

/// @brief Resolves a payload to an encoded blob; decoded buffers are written as PCM16 WAV.
[[nodiscard]] auto toEncoded(const AudioPayload& payload) -> EncodedAudio;

} // namespace narrator
