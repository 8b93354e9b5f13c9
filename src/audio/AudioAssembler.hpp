// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioDecoder.hpp>
#include <audio/AudioPayload.hpp>
#include <audio/ChapterMarkers.hpp>
#include <audio/Transcoder.hpp>
#include <audio/WavCodec.hpp>
#include <core/Error.hpp>
#include <core/LazyHandle.hpp>
#include <core/Types.hpp>

#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Coarse phase reported by assembly progress.
enum class AssemblyStage : std::uint8_t
{
    Loading,
    Decoding,
    Concatenating,
    Encoding,
    Complete,
};

[[nodiscard]] constexpr auto assemblyStageName(AssemblyStage stage) -> std::string_view
{
    switch (stage)
    {
        case AssemblyStage::Loading: return "loading";
        case AssemblyStage::Decoding: return "decoding";
        case AssemblyStage::Concatenating: return "concatenating";
        case AssemblyStage::Encoding: return "encoding";
        case AssemblyStage::Complete: return "complete";
    }
    return "unknown";
}

struct AssemblyProgress
{
    int current = 0;
    int total = 0;
    AssemblyStage stage = AssemblyStage::Loading;
    std::string message;
};

using AssemblyProgressCallback = std::function<void(const AssemblyProgress&)>;

struct AssemblyOptions
{
    OutputFormat format = OutputFormat::Wav;
    unsigned bitrateKbps = 192;
    std::string title;
    std::string author;

    /// Observed between decode, normalize and encode steps.
    std::stop_token stopToken;
};

/// @brief Final output of an assembly; the caller owns the only reference.
struct AssembledAudio
{
    EncodedAudio audio;
    double duration = 0.0;
    std::vector<ChapterMarker> chapters;

    /// Name of the strategy that produced the output.
    std::string strategy;
};

/// @brief Verifies that every chapter is a PCM WAV blob sharing one format.
/// @return The common header (of the first chapter), or a FormatError naming the offending
///         chapter index and its expected vs. actual fields.
[[nodiscard]] auto probeSplice(std::span<const AudioChapter> chapters) -> Result<wav::WavHeader>;

/// @brief Joins identically formatted WAV chapters without decoding samples.
///
/// Writes one canonical header carrying the summed data length, followed by each input's
/// `data` payload in order.
[[nodiscard]] auto spliceWav(std::span<const AudioChapter> chapters) -> Result<Bytes>;

/// @brief Joins an ordered set of audio chapters into one artifact.
///
/// Strategies are evaluated top-down; the first applicable one whose run succeeds wins:
///  - single-chapter-identity: one WAV chapter requested as WAV is returned unchanged.
///  - raw-splice: all chapters are WAV with identical format and WAV is requested.
///  - decode-normalize-encode: a decode context is available.
///  - transcoder-concat: no decode context; the transcoder demuxes and joins the inputs.
///  - salvage-splice: no decode context and WAV requested; mismatched inputs become silence.
class AudioAssembler
{
  public:
    AudioAssembler(std::shared_ptr<DecodeBackend> decoder, std::shared_ptr<LazyHandle<Transcoder>> transcoder);

    AudioAssembler(const AudioAssembler&) = delete;
    AudioAssembler& operator=(const AudioAssembler&) = delete;

    /// @brief Assembles chapters in their given order.
    /// @return The assembled audio, or AssemblyError for empty input, EncodeError when the
    ///         final encode fails, Cancelled when the stop token fires.
    [[nodiscard]] auto assemble(std::vector<AudioChapter> chapters,
                                const AssemblyOptions& options,
                                const AssemblyProgressCallback& onProgress = {}) -> Result<AssembledAudio>;

    /// @brief Whole-book export entry point.
    [[nodiscard]] auto exportBook(std::vector<AudioChapter> chapters,
                                  OutputFormat format,
                                  unsigned bitrateKbps,
                                  std::string bookTitle,
                                  std::string bookAuthor,
                                  const AssemblyProgressCallback& onProgress = {}) -> Result<EncodedAudio>;

    /// @brief Names of the strategies in evaluation order.
    [[nodiscard]] auto strategyNames() const -> std::vector<std::string_view>;

  private:
    struct Context;

    struct Strategy
    {
        std::string_view name;
        std::function<bool(Context&)> isApplicable;
        std::function<Result<AssembledAudio>(Context&)> run;
    };

    [[nodiscard]] auto runIdentity(Context& context) -> Result<AssembledAudio>;
    [[nodiscard]] auto runSplice(Context& context) -> Result<AssembledAudio>;
    [[nodiscard]] auto runDecode(Context& context) -> Result<AssembledAudio>;
    [[nodiscard]] auto runTranscoderConcat(Context& context) -> Result<AssembledAudio>;
    [[nodiscard]] auto runSalvage(Context& context) -> Result<AssembledAudio>;

    [[nodiscard]] auto transcode(const std::function<Result<Bytes>(Transcoder&)>& call) -> Result<Bytes>;

    std::shared_ptr<DecodeBackend> _decoder;
    std::shared_ptr<LazyHandle<Transcoder>> _transcoder;
    std::vector<Strategy> _strategies;
};

} // namespace narrator
