// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string_view>

namespace narrator
{

/// @brief Voice tuning passed with every synthesis request. Unset fields use the model's defaults.
struct VoiceParams
{
    std::optional<int> speakerId;
    std::optional<float> lengthScale;
    std::optional<float> noiseScale;
    std::optional<float> noiseWScale;
};

/// @brief Opaque text-to-speech capability.
///
/// Implementations may be slow and may fail transiently. The scheduler calls synthesize()
/// from up to `parallelism` worker threads at once.
class SynthesisBackend
{
  public:
    virtual ~SynthesisBackend() = default;

    /// @brief Synthesizes one segment of text.
    /// @return Audio in a known container, or a SynthesisError.
    [[nodiscard]] virtual auto synthesize(std::string_view text, const VoiceParams& params)
        -> Result<EncodedAudio> = 0;
};

} // namespace narrator
