// SPDX-License-Identifier: Apache-2.0
#include "AudioDecoder.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <array>
#include <format>

namespace narrator
{

namespace
{

    constexpr auto ReadChunkFrames = ma_uint64 { 4096 };

    /// @brief Owns an initialized ma_decoder.
    struct DecoderGuard
    {
        ma_decoder decoder {};
        bool initialized = false;

        ~DecoderGuard()
        {
            if (initialized)
                ma_decoder_uninit(&decoder);
        }
    };

    class MiniaudioDecodeSession: public DecodeSession
    {
      public:
        MiniaudioDecodeSession() = default;

        ~MiniaudioDecodeSession() override
        {
            if (_initialized)
            {
                ma_context_uninit(&_context);
                log::trace("Decode context released");
            }
        }

        MiniaudioDecodeSession(const MiniaudioDecodeSession&) = delete;
        MiniaudioDecodeSession& operator=(const MiniaudioDecodeSession&) = delete;

        auto initialize() -> VoidResult
        {
            auto const result = ma_context_init(nullptr, 0, nullptr, &_context);
            if (result != MA_SUCCESS)
                return makeError(ErrorCode::DecodeError,
                                 std::format("Failed to create audio context: {}", ma_result_description(result)));
            _initialized = true;
            return {};
        }

        auto decode(const EncodedAudio& audio) -> Result<AudioBuffer> override
        {
            if (audio.bytes.empty())
                return makeError(ErrorCode::DecodeError, "Cannot decode empty audio blob");

            auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
            config.allocationCallbacks = _context.allocationCallbacks;

            auto guard = DecoderGuard {};
            auto const initResult =
                ma_decoder_init_memory(audio.bytes.data(), audio.bytes.size(), &config, &guard.decoder);
            if (initResult != MA_SUCCESS)
                return makeError(ErrorCode::DecodeError,
                                 std::format("Unsupported or corrupt {} blob ({} bytes): {}",
                                             containerName(audio.container),
                                             audio.bytes.size(),
                                             ma_result_description(initResult)));
            guard.initialized = true;

            auto const channelCount = guard.decoder.outputChannels;
            auto buffer = AudioBuffer {
                .sampleRate = guard.decoder.outputSampleRate,
                .channels = std::vector<std::vector<float>>(channelCount),
            };

            auto interleaved = std::vector<float>(ReadChunkFrames * channelCount);
            while (true)
            {
                auto framesRead = ma_uint64 { 0 };
                auto const readResult =
                    ma_decoder_read_pcm_frames(&guard.decoder, interleaved.data(), ReadChunkFrames, &framesRead);

                for (auto frame = ma_uint64 { 0 }; frame < framesRead; ++frame)
                    for (auto channel = 0u; channel < channelCount; ++channel)
                        buffer.channels[channel].push_back(interleaved[frame * channelCount + channel]);

                if (readResult == MA_AT_END || framesRead < ReadChunkFrames)
                    break;
                if (readResult != MA_SUCCESS)
                    return makeError(ErrorCode::DecodeError,
                                     std::format("Decoding failed after {} frames: {}",
                                                 buffer.frameCount(),
                                                 ma_result_description(readResult)));
            }

            if (buffer.frameCount() == 0)
                return makeError(ErrorCode::DecodeError, "Decoded audio contains no frames");

            return buffer;
        }

      private:
        ma_context _context {};
        bool _initialized = false;
    };

} // namespace

auto MiniaudioDecodeBackend::open() -> Result<std::unique_ptr<DecodeSession>>
{
    auto session = std::make_unique<MiniaudioDecodeSession>();
    auto result = session->initialize();
    if (!result)
        return std::unexpected(result.error());
    return session;
}

auto toBuffer(const AudioPayload& payload, DecodeSession& session) -> Result<AudioBuffer>
{
    if (auto const* buffer = std::get_if<AudioBuffer>(&payload))
        return *buffer;
    return session.decode(std::get<EncodedAudio>(payload));
}

} // namespace narrator
