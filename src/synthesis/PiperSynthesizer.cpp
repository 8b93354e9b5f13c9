// SPDX-License-Identifier: Apache-2.0
#include "PiperSynthesizer.hpp"

#include <audio/AudioBuffer.hpp>
#include <audio/WavCodec.hpp>
#include <core/Log.hpp>

#include <format>
#include <mutex>
#include <string>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace narrator
{

namespace
{

    /// @brief Used when a chunk does not report its rate.
    constexpr auto PiperDefaultSampleRate = 22050u;

} // namespace

struct PiperSynthesizer::Impl
{
    PiperSynthesizerConfig config;
    piper_synthesizer* synth = nullptr;

    // A piper synthesizer streams one utterance at a time.
    std::mutex mutex;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }
};

PiperSynthesizer::PiperSynthesizer(): _impl(std::make_unique<Impl>())
{
}

PiperSynthesizer::~PiperSynthesizer() = default;

auto PiperSynthesizer::initialize(const PiperSynthesizerConfig& config) -> VoidResult
{
    _impl->config = config;

    auto const configPath = config.modelPath + ".json";

    auto const& espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("Piper synthesizer initialized (model: {}, espeak: {})", config.modelPath, espeakData);
    return {};
}

auto PiperSynthesizer::synthesize(std::string_view text, const VoiceParams& params) -> Result<EncodedAudio>
{
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper synthesizer is not initialized");

    auto const input = std::string(text);
    auto lock = std::lock_guard(_impl->mutex);

    auto opts = piper_default_synthesize_options(_impl->synth);
    if (params.speakerId)
        opts.speaker_id = *params.speakerId;
    if (params.lengthScale)
        opts.length_scale = *params.lengthScale;
    if (params.noiseScale)
        opts.noise_scale = *params.noiseScale;
    if (params.noiseWScale)
        opts.noise_w_scale = *params.noiseWScale;

    auto const startResult = piper_synthesize_start(_impl->synth, input.c_str(), &opts);
    if (startResult != 0)
        return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

    auto samples = std::vector<float> {};
    auto sampleRate = PiperDefaultSampleRate;
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        auto const rc = piper_synthesize_next(_impl->synth, &chunk);
        if (rc == 1) // PIPER_DONE
            break;
        if (rc < 0) // PIPER_ERR_GENERIC
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));

        if (chunk.sample_rate > 0)
            sampleRate = static_cast<unsigned>(chunk.sample_rate);
        samples.insert(samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    log::trace("Piper produced {} samples at {} Hz for {} characters", samples.size(), sampleRate, text.size());

    auto buffer = AudioBuffer { .sampleRate = sampleRate, .channels = {} };
    buffer.channels.push_back(std::move(samples));
    return EncodedAudio { .bytes = wav::encode(buffer), .container = ContainerFormat::Wav };
}

} // namespace narrator
