// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/AudioPayload.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>

namespace narrator
{

/// @brief A decoding context that is open for the duration of one assembly.
///
/// Sessions are released by destruction; holders keep them in a std::unique_ptr so every
/// exit path of a multi-step operation frees the underlying context.
class DecodeSession
{
  public:
    virtual ~DecodeSession() = default;

    /// @brief Decodes one encoded blob into planar float samples.
    /// @return The decoded buffer or a DecodeError.
    [[nodiscard]] virtual auto decode(const EncodedAudio& audio) -> Result<AudioBuffer> = 0;
};

/// @brief Factory for decoding contexts.
class DecodeBackend
{
  public:
    virtual ~DecodeBackend() = default;

    /// @brief Opens a decoding context.
    /// @return The session, or an error if no context can be constructed in this environment.
    [[nodiscard]] virtual auto open() -> Result<std::unique_ptr<DecodeSession>> = 0;
};

/// @brief Decode backend built on miniaudio's decoders (WAV, MP3, FLAC).
class MiniaudioDecodeBackend: public DecodeBackend
{
  public:
    [[nodiscard]] auto open() -> Result<std::unique_ptr<DecodeSession>> override;
};

/// @brief Resolves a payload to a decoded buffer, decoding through `session` when needed.
[[nodiscard]] auto toBuffer(const AudioPayload& payload, DecodeSession& session) -> Result<AudioBuffer>;

} // namespace narrator
