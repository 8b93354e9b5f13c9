// SPDX-License-Identifier: Apache-2.0
#include "AudioPayload.hpp"

#include <audio/WavCodec.hpp>

namespace narrator
{

auto toEncoded(const AudioPayload& payload) -> EncodedAudio
{
    if (auto const* encoded = encodedAudio(payload))
        return *encoded;
    return EncodedAudio { .bytes = wav::encode(std::get<AudioBuffer>(payload)), .container = ContainerFormat::Wav };
}

} // namespace narrator
