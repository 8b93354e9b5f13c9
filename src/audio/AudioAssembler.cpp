// SPDX-License-Identifier: Apache-2.0
#include "AudioAssembler.hpp"

#include <audio/Resampler.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <optional>

namespace narrator
{

namespace
{

    constexpr auto SubstituteSilenceSeconds = 1.0;

    auto cancelledError() -> std::unexpected<Error>
    {
        return makeError(ErrorCode::Cancelled, "Audio assembly cancelled");
    }

    auto describe(const wav::WavHeader& header) -> std::string
    {
        return std::format("{} Hz/{} ch/{}-bit/format {}",
                           header.sampleRate,
                           header.channelCount,
                           header.bitDepth,
                           header.audioFormat);
    }

    /// @brief Best known duration of a chapter without decoding it.
    auto chapterDuration(const AudioChapter& chapter) -> std::optional<double>
    {
        if (chapter.duration && *chapter.duration > 0.0)
            return chapter.duration;
        if (auto const* buffer = std::get_if<AudioBuffer>(&chapter.audio))
            return buffer->duration();
        if (isEncodedAs(chapter.audio, ContainerFormat::Wav))
        {
            auto const measured = wav::measureDuration(encodedAudio(chapter.audio)->bytes);
            if (measured.isExact())
                return measured.seconds;
        }
        return std::nullopt;
    }

    auto knownDurations(std::span<const AudioChapter> chapters) -> std::vector<std::optional<double>>
    {
        auto durations = std::vector<std::optional<double>> {};
        durations.reserve(chapters.size());
        for (auto const& chapter: chapters)
            durations.push_back(chapterDuration(chapter));
        return durations;
    }

    auto sumOf(std::span<const std::optional<double>> durations) -> double
    {
        auto total = 0.0;
        for (auto const& duration: durations)
            total += duration.value_or(0.0);
        return total;
    }

    auto payloadOf(const AudioChapter& chapter, const wav::WavHeader& header) -> std::span<const std::uint8_t>
    {
        return std::span(encodedAudio(chapter.audio)->bytes).subspan(header.dataOffset, header.availableLength);
    }

} // namespace

struct AudioAssembler::Context
{
    std::vector<AudioChapter> chapters;
    const AssemblyOptions& options;
    const AssemblyProgressCallback& onProgress;
    DecodeBackend& decoder;

    std::optional<Result<wav::WavHeader>> spliceProbe;
    bool decodeProbed = false;
    std::unique_ptr<DecodeSession> session;

    void report(int current, int total, AssemblyStage stage, std::string message) const
    {
        if (onProgress)
            onProgress(AssemblyProgress { .current = current, .total = total, .stage = stage, .message = std::move(message) });
    }

    [[nodiscard]] auto cancelled() const -> bool { return options.stopToken.stop_requested(); }

    [[nodiscard]] auto chapterCount() const -> int { return static_cast<int>(chapters.size()); }

    auto spliceFormat() -> const Result<wav::WavHeader>&
    {
        if (!spliceProbe)
            spliceProbe = probeSplice(chapters);
        return *spliceProbe;
    }

    /// @brief Opens the decode context on first use; nullptr if the environment has none.
    auto decodeSession() -> DecodeSession*
    {
        if (!decodeProbed)
        {
            decodeProbed = true;
            auto opened = decoder.open();
            if (opened)
                session = std::move(*opened);
            else
                log::warning("Audio decode backend unavailable: {}", opened.error().message);
        }
        return session.get();
    }
};

auto probeSplice(std::span<const AudioChapter> chapters) -> Result<wav::WavHeader>
{
    if (chapters.empty())
        return makeError(ErrorCode::FormatError, "No chapters to splice");

    auto reference = std::optional<wav::WavHeader> {};
    for (auto i = std::size_t { 0 }; i < chapters.size(); ++i)
    {
        if (!isEncodedAs(chapters[i].audio, ContainerFormat::Wav))
            return makeError(ErrorCode::FormatError,
                             std::format("Chapter {} ({}) is not a WAV blob", i, chapters[i].id));

        auto header = wav::parseHeader(encodedAudio(chapters[i].audio)->bytes);
        if (!header)
            return makeError(ErrorCode::FormatError,
                             std::format("Chapter {} ({}): {}", i, chapters[i].id, header.error().message));

        if (header->audioFormat != wav::FormatPcm && header->audioFormat != wav::FormatIeeeFloat)
            return makeError(ErrorCode::FormatError,
                             std::format("Chapter {} ({}) uses unsupported WAV format tag {}",
                                         i,
                                         chapters[i].id,
                                         header->audioFormat));

        if (!reference)
            reference = *header;
        else if (!reference->sameFormat(*header))
            return makeError(ErrorCode::FormatError,
                             std::format("Chapter {} ({}) format mismatch: expected {} (chapter 0), got {}",
                                         i,
                                         chapters[i].id,
                                         describe(*reference),
                                         describe(*header)));
    }

    return *reference;
}

auto spliceWav(std::span<const AudioChapter> chapters) -> Result<Bytes>
{
    auto format = probeSplice(chapters);
    if (!format)
        return std::unexpected(format.error());

    auto headers = std::vector<wav::WavHeader> {};
    auto dataLength = std::size_t { 0 };
    for (auto const& chapter: chapters)
    {
        // probeSplice() has already parsed every chapter successfully.
        headers.push_back(*wav::parseHeader(encodedAudio(chapter.audio)->bytes));
        dataLength += headers.back().availableLength;
    }

    auto output = wav::writeHeader(
        format->sampleRate, format->channelCount, format->bitDepth, dataLength, format->audioFormat);
    output.reserve(output.size() + dataLength);

    for (auto i = std::size_t { 0 }; i < chapters.size(); ++i)
    {
        auto const payload = payloadOf(chapters[i], headers[i]);
        output.insert(output.end(), payload.begin(), payload.end());
    }

    return output;
}

AudioAssembler::AudioAssembler(std::shared_ptr<DecodeBackend> decoder,
                               std::shared_ptr<LazyHandle<Transcoder>> transcoder):
    _decoder(std::move(decoder)), _transcoder(std::move(transcoder))
{
    auto const wantsWav = [](Context& c) {
        return c.options.format == OutputFormat::Wav;
    };

    _strategies = {
        Strategy {
            .name = "single-chapter-identity",
            .isApplicable =
                [wantsWav](Context& c) {
                    return wantsWav(c) && c.chapters.size() == 1
                           && isEncodedAs(c.chapters.front().audio, ContainerFormat::Wav);
                },
            .run = [this](Context& c) { return runIdentity(c); },
        },
        Strategy {
            .name = "raw-splice",
            .isApplicable =
                [wantsWav](Context& c) {
                    return wantsWav(c) && c.chapters.size() > 1 && c.spliceFormat().has_value();
                },
            .run = [this](Context& c) { return runSplice(c); },
        },
        Strategy {
            .name = "decode-normalize-encode",
            .isApplicable = [](Context& c) { return c.decodeSession() != nullptr; },
            .run = [this](Context& c) { return runDecode(c); },
        },
        Strategy {
            .name = "transcoder-concat",
            .isApplicable = [](Context& c) { return c.decodeSession() == nullptr; },
            .run = [this](Context& c) { return runTranscoderConcat(c); },
        },
        Strategy {
            .name = "salvage-splice",
            .isApplicable =
                [wantsWav](Context& c) {
                    return wantsWav(c) && c.decodeSession() == nullptr
                           && std::ranges::any_of(c.chapters, [](const AudioChapter& chapter) {
                                  return isEncodedAs(chapter.audio, ContainerFormat::Wav)
                                         && wav::parseHeader(encodedAudio(chapter.audio)->bytes).has_value();
                              });
                },
            .run = [this](Context& c) { return runSalvage(c); },
        },
    };
}

auto AudioAssembler::strategyNames() const -> std::vector<std::string_view>
{
    auto names = std::vector<std::string_view> {};
    for (auto const& strategy: _strategies)
        names.push_back(strategy.name);
    return names;
}

auto AudioAssembler::assemble(std::vector<AudioChapter> chapters,
                              const AssemblyOptions& options,
                              const AssemblyProgressCallback& onProgress) -> Result<AssembledAudio>
{
    if (chapters.empty())
        return makeError(ErrorCode::AssemblyError, "No chapters to assemble");
    if (options.stopToken.stop_requested())
        return cancelledError();

    auto context = Context {
        .chapters = std::move(chapters),
        .options = options,
        .onProgress = onProgress,
        .decoder = *_decoder,
        .spliceProbe = std::nullopt,
        .decodeProbed = false,
        .session = nullptr,
    };

    auto lastError = Error { ErrorCode::AssemblyError, "No assembly strategy applies to the given chapters" };

    for (auto const& strategy: _strategies)
    {
        if (!strategy.isApplicable(context))
            continue;

        log::debug("Assembling {} chapter(s) as {} via {}",
                   context.chapters.size(),
                   outputFormatName(options.format),
                   strategy.name);

        auto result = strategy.run(context);
        if (result)
        {
            result->strategy = std::string(strategy.name);
            return result;
        }

        if (isCancellation(result.error()))
            return result;

        log::warning("Assembly strategy {} failed: {}", strategy.name, result.error().message);
        lastError = std::move(result.error());
    }

    return std::unexpected(std::move(lastError));
}

auto AudioAssembler::exportBook(std::vector<AudioChapter> chapters,
                                OutputFormat format,
                                unsigned bitrateKbps,
                                std::string bookTitle,
                                std::string bookAuthor,
                                const AssemblyProgressCallback& onProgress) -> Result<EncodedAudio>
{
    auto const options = AssemblyOptions {
        .format = format,
        .bitrateKbps = bitrateKbps,
        .title = std::move(bookTitle),
        .author = std::move(bookAuthor),
        .stopToken = {},
    };

    auto assembled = assemble(std::move(chapters), options, onProgress);
    if (!assembled)
        return std::unexpected(assembled.error());

    log::info("Exported {} ({:.1f}s, {} bytes, {} chapter markers)",
              outputFormatName(format),
              assembled->duration,
              assembled->audio.bytes.size(),
              assembled->chapters.size());
    return std::move(assembled->audio);
}

auto AudioAssembler::runIdentity(Context& context) -> Result<AssembledAudio>
{
    auto& chapter = context.chapters.front();
    auto const durations = knownDurations(context.chapters);
    auto markers = chapterMarkersFor(context.chapters, durations, sumOf(durations));

    auto output = AssembledAudio {
        .audio = std::move(std::get<EncodedAudio>(chapter.audio)),
        .duration = sumOf(durations),
        .chapters = std::move(markers),
        .strategy = {},
    };

    context.report(1, 1, AssemblyStage::Complete, "Single chapter passed through");
    return output;
}

auto AudioAssembler::runSplice(Context& context) -> Result<AssembledAudio>
{
    context.report(0, context.chapterCount(), AssemblyStage::Concatenating, "Splicing WAV chapters...");

    auto bytes = spliceWav(context.chapters);
    if (!bytes)
        return std::unexpected(bytes.error());

    auto header = wav::parseHeader(*bytes);
    if (!header)
        return std::unexpected(header.error());
    auto total = wav::duration(*header);
    if (!total)
        return std::unexpected(total.error());

    auto const durations = knownDurations(context.chapters);
    auto output = AssembledAudio {
        .audio = EncodedAudio { .bytes = std::move(*bytes), .container = ContainerFormat::Wav },
        .duration = *total,
        .chapters = chapterMarkersFor(context.chapters, durations, *total),
        .strategy = {},
    };

    context.report(context.chapterCount(), context.chapterCount(), AssemblyStage::Complete, "Audio spliced");
    return output;
}

auto AudioAssembler::runDecode(Context& context) -> Result<AssembledAudio>
{
    auto& session = *context.decodeSession();
    auto const total = context.chapterCount();

    context.report(0, total, AssemblyStage::Loading, "Loading audio chapters...");

    auto decoded = std::vector<std::optional<AudioBuffer>>(context.chapters.size());
    for (auto i = std::size_t { 0 }; i < context.chapters.size(); ++i)
    {
        if (context.cancelled())
            return cancelledError();

        auto const& chapter = context.chapters[i];
        context.report(static_cast<int>(i) + 1,
                       total,
                       AssemblyStage::Decoding,
                       std::format("Decoding chapter {}/{}: {}", i + 1, total, chapter.title));

        auto buffer = toBuffer(chapter.audio, session);
        if (buffer)
            decoded[i] = std::move(*buffer);
        else
            log::warning("Chapter {} ({}) could not be decoded, substituting {:.0f}s of silence: {}",
                         i,
                         chapter.id,
                         SubstituteSilenceSeconds,
                         buffer.error().message);
    }

    auto silenceRate = wav::EstimateSampleRate;
    for (auto const& buffer: decoded)
    {
        if (buffer && buffer->sampleRate > 0)
        {
            silenceRate = buffer->sampleRate;
            break;
        }
    }

    auto buffers = std::vector<AudioBuffer> {};
    auto durations = std::vector<std::optional<double>> {};
    buffers.reserve(decoded.size());
    durations.reserve(decoded.size());
    for (auto& buffer: decoded)
    {
        buffers.push_back(buffer ? std::move(*buffer) : AudioBuffer::silence(silenceRate, 1, SubstituteSilenceSeconds));
        durations.emplace_back(buffers.back().duration());
    }

    if (context.cancelled())
        return cancelledError();

    context.report(0, 1, AssemblyStage::Concatenating, "Concatenating audio chapters...");

    auto normalized = normalize(buffers);
    if (!normalized)
        return makeError(ErrorCode::AssemblyError, normalized.error().message);

    auto joined = concatenate(buffers);
    if (!joined)
        return makeError(ErrorCode::AssemblyError, joined.error().message);
    buffers.clear();

    if (context.cancelled())
        return cancelledError();

    auto const totalDuration = joined->duration();
    auto markers = chapterMarkersFor(context.chapters, durations, totalDuration);
    auto const format = context.options.format;

    context.report(0, 1, AssemblyStage::Encoding, std::format("Encoding to {}...", outputFormatName(format)));

    auto wavBytes = wav::encode(*joined);
    joined->channels.clear();

    auto output = AssembledAudio {
        .audio = EncodedAudio { .bytes = {}, .container = containerFor(format) },
        .duration = totalDuration,
        .chapters = markers,
        .strategy = {},
    };

    if (format == OutputFormat::Wav)
    {
        output.audio.bytes = std::move(wavBytes);
    }
    else
    {
        auto const request = TranscodeRequest {
            .format = format,
            .bitrateKbps = context.options.bitrateKbps,
            .title = context.options.title,
            .artist = context.options.author,
            .chapters = supportsChapters(format) ? std::move(markers) : std::vector<ChapterMarker> {},
        };

        auto encoded = transcode([&](Transcoder& transcoder) { return transcoder.encode(wavBytes, request); });
        if (!encoded)
            return makeError(ErrorCode::EncodeError,
                             std::format("Encoding to {} failed: {}", outputFormatName(format), encoded.error().message));
        output.audio.bytes = std::move(*encoded);
    }

    context.report(1, 1, AssemblyStage::Complete, "Audio assembled");
    return output;
}

auto AudioAssembler::runTranscoderConcat(Context& context) -> Result<AssembledAudio>
{
    auto const format = context.options.format;
    auto const durations = knownDurations(context.chapters);
    auto const totalDuration = sumOf(durations);
    auto markers = chapterMarkersFor(context.chapters, durations, totalDuration);

    context.report(0, context.chapterCount(), AssemblyStage::Loading, "Handing chapters to the transcoder...");

    auto inputs = std::vector<EncodedAudio> {};
    inputs.reserve(context.chapters.size());
    for (auto const& chapter: context.chapters)
        inputs.push_back(toEncoded(chapter.audio));

    if (context.cancelled())
        return cancelledError();

    context.report(0, 1, AssemblyStage::Encoding, std::format("Encoding to {}...", outputFormatName(format)));

    auto const request = TranscodeRequest {
        .format = format,
        .bitrateKbps = context.options.bitrateKbps,
        .title = context.options.title,
        .artist = context.options.author,
        .chapters = supportsChapters(format) ? markers : std::vector<ChapterMarker> {},
    };

    auto encoded = transcode([&](Transcoder& transcoder) { return transcoder.concat(inputs, request); });
    if (!encoded)
        return makeError(ErrorCode::EncodeError,
                         std::format("Transcoder concat to {} failed: {}", outputFormatName(format), encoded.error().message));

    context.report(1, 1, AssemblyStage::Complete, "Audio assembled");
    return AssembledAudio {
        .audio = EncodedAudio { .bytes = std::move(*encoded), .container = containerFor(format) },
        .duration = totalDuration,
        .chapters = std::move(markers),
        .strategy = {},
    };
}

auto AudioAssembler::runSalvage(Context& context) -> Result<AssembledAudio>
{
    auto reference = std::optional<wav::WavHeader> {};
    auto headers = std::vector<std::optional<wav::WavHeader>> {};
    for (auto const& chapter: context.chapters)
    {
        auto header = isEncodedAs(chapter.audio, ContainerFormat::Wav)
                          ? wav::parseHeader(encodedAudio(chapter.audio)->bytes)
                          : Result<wav::WavHeader> { makeError(ErrorCode::FormatError, "not a WAV blob") };
        headers.push_back(header ? std::optional(*header) : std::nullopt);
        if (header && !reference)
            reference = *header;
    }

    if (!reference || reference->blockAlign() == 0)
        return makeError(ErrorCode::AssemblyError, "No usable PCM chapter to salvage");

    context.report(0, context.chapterCount(), AssemblyStage::Concatenating, "Salvaging PCM chapters...");

    auto payload = Bytes {};
    auto durations = std::vector<std::optional<double>> {};
    for (auto i = std::size_t { 0 }; i < context.chapters.size(); ++i)
    {
        if (context.cancelled())
            return cancelledError();

        auto const& chapter = context.chapters[i];
        if (headers[i] && headers[i]->sameFormat(*reference))
        {
            auto const data = payloadOf(chapter, *headers[i]);
            payload.insert(payload.end(), data.begin(), data.end());
            durations.emplace_back(wav::duration(*headers[i]).value_or(0.0));
            continue;
        }

        auto const seconds = chapterDuration(chapter).value_or(SubstituteSilenceSeconds);
        log::warning("Chapter {} ({}) does not match {}, substituting {:.2f}s of silence",
                     i,
                     chapter.id,
                     describe(*reference),
                     seconds);
        auto const silence = wav::silencePayload(*reference, seconds);
        payload.insert(payload.end(), silence.begin(), silence.end());
        durations.emplace_back(seconds);
    }

    auto bytes = wav::writeHeader(
        reference->sampleRate, reference->channelCount, reference->bitDepth, payload.size(), reference->audioFormat);
    bytes.insert(bytes.end(), payload.begin(), payload.end());

    auto const totalDuration = sumOf(durations);
    context.report(context.chapterCount(), context.chapterCount(), AssemblyStage::Complete, "Audio salvaged");
    return AssembledAudio {
        .audio = EncodedAudio { .bytes = std::move(bytes), .container = ContainerFormat::Wav },
        .duration = totalDuration,
        .chapters = chapterMarkersFor(context.chapters, durations, totalDuration),
        .strategy = {},
    };
}

auto AudioAssembler::transcode(const std::function<Result<Bytes>(Transcoder&)>& call) -> Result<Bytes>
{
    auto instance = _transcoder->acquire();
    if (!instance)
        return std::unexpected(instance.error());

    auto result = call(**instance);
    if (!result)
    {
        log::warning("Transcoder call failed, discarding instance: {}", result.error().message);
        _transcoder->invalidate(*instance);
    }
    return result;
}

} // namespace narrator
