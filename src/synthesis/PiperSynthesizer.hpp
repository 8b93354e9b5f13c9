// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <synthesis/SynthesisBackend.hpp>

#include <memory>
#include <string>

namespace narrator
{

/// @brief Configuration for the piper voice.
struct PiperSynthesizerConfig
{
    /// @brief Path to the piper voice model (.onnx file); its config is expected at `<model>.json`.
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech using the piper library (linked at build time).
///
/// Output is PCM16 mono WAV at the voice's native sample rate.
class PiperSynthesizer: public SynthesisBackend
{
  public:
    PiperSynthesizer();
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    /// @brief Loads the voice model.
    [[nodiscard]] auto initialize(const PiperSynthesizerConfig& config) -> VoidResult;

    [[nodiscard]] auto synthesize(std::string_view text, const VoiceParams& params)
        -> Result<EncodedAudio> override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
