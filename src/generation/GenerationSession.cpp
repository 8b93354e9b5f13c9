// SPDX-License-Identifier: Apache-2.0
#include "GenerationSession.hpp"

#include <audio/WavCodec.hpp>
#include <core/Log.hpp>
#include <generation/SegmentBatcher.hpp>
#include <generation/SegmentScheduler.hpp>
#include <generation/Timeline.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>

namespace narrator
{

namespace
{

    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
    }

    /// @brief Clears the running flag when a generation call returns.
    struct RunningFlag
    {
        std::atomic<bool>& flag;
        ~RunningFlag() { flag = false; }
    };

} // namespace

struct GenerationSession::Impl
{
    std::shared_ptr<LazyHandle<SynthesisBackend>> synthesizer;
    std::shared_ptr<SegmentStore> store;
    std::shared_ptr<AudioAssembler> assembler;
    GenerationSessionConfig config;
    GenerationCallbacks callbacks;

    std::atomic<int> parallelism = 1;
    std::atomic<bool> running = false;

    mutable std::mutex mutex;
    std::stop_source stopSource;
    std::map<std::string, std::stop_source, std::less<>> chapterStops;
    std::map<std::string, PriorityChannel, std::less<>> priorities;
    std::map<std::string, ChapterStatus, std::less<>> statuses;

    void setStatus(const std::string& chapterId, ChapterStatus status)
    {
        auto lock = std::lock_guard(mutex);
        statuses.insert_or_assign(chapterId, status);
    }

    auto priorityFor(const std::string& chapterId) -> PriorityChannel&
    {
        auto lock = std::lock_guard(mutex);
        return priorities[chapterId];
    }

    void progress(const std::string& chapterId, int current, int total, std::string_view message) const
    {
        if (callbacks.onChapterProgress)
            callbacks.onChapterProgress(chapterId, current, total, message);
    }

    auto finish(ChapterOutcome outcome) -> ChapterOutcome
    {
        {
            auto lock = std::lock_guard(mutex);
            chapterStops.erase(outcome.chapterId);
            if (auto const it = priorities.find(outcome.chapterId); it != priorities.end())
                it->second.clear();
            statuses.insert_or_assign(outcome.chapterId, outcome.status);
        }

        if (outcome.status == ChapterStatus::Error)
            log::error("Chapter {}: {}", outcome.chapterId, outcome.message);
        else
            log::info("Chapter {} {}: {}", outcome.chapterId, chapterStatusName(outcome.status), outcome.message);

        if (callbacks.onChapterFinished)
            callbacks.onChapterFinished(outcome);
        return outcome;
    }

    auto synthesizeSegment(const TextSegment& segment, const std::string& chapterId, std::stop_token stopToken)
        -> Result<std::optional<AudioSegment>>
    {
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Generation cancelled");

        if (isBlank(segment.text))
            return std::optional<AudioSegment> {};

        auto backend = synthesizer->acquire();
        if (!backend)
            return std::unexpected(backend.error());

        auto audio = (*backend)->synthesize(segment.text, config.voice);
        if (!audio)
            return makeError(ErrorCode::SynthesisError,
                             std::format("Segment {} ({}): {}", segment.index, segment.id, audio.error().message));

        if (audio->container == ContainerFormat::Unknown)
            audio->container = sniffContainer(audio->bytes);

        auto measured = wav::DurationMeasurement { .seconds = 0.0, .source = DurationSource::Estimated };
        if (audio->container == ContainerFormat::Wav)
            measured = wav::measureDuration(audio->bytes);
        else
            log::warning("Segment {} is {}, its duration is unknown", segment.index, containerName(audio->container));

        return AudioSegment {
            .id = segment.id,
            .chapterId = chapterId,
            .index = segment.index,
            .text = segment.text,
            .audio = std::move(*audio),
            .duration = measured.seconds,
            .durationSource = measured.source,
            .startTime = 0.0,
        };
    }

    auto runChapter(const ChapterInput& chapter, const std::set<int>* only, std::stop_token globalToken)
        -> ChapterOutcome
    {
        auto outcome = ChapterOutcome { .chapterId = chapter.id };

        if (std::ranges::all_of(chapter.segments, [](const TextSegment& s) { return isBlank(s.text); }))
        {
            outcome.status = ChapterStatus::Error;
            outcome.message = "Chapter content is empty";
            return finish(std::move(outcome));
        }

        auto chapterStop = std::stop_source {};
        {
            auto lock = std::lock_guard(mutex);
            chapterStops.insert_or_assign(chapter.id, chapterStop);
            statuses.insert_or_assign(chapter.id, ChapterStatus::Processing);
        }

        auto runStop = std::stop_source {};
        auto const onGlobalStop = std::stop_callback(globalToken, [&runStop] { runStop.request_stop(); });
        auto const onChapterStop =
            std::stop_callback(chapterStop.get_token(), [&runStop] { runStop.request_stop(); });
        auto const stopToken = runStop.get_token();

        auto const total = static_cast<int>(chapter.segments.size());
        progress(chapter.id, 0, total, "Initializing generation...");

        auto segments = std::vector<AudioSegment> {};
        if (only && store)
        {
            auto stored = store->getSegments(config.scopeId, chapter.id);
            if (!stored)
                log::warning("Cannot load stored segments of chapter {}: {}", chapter.id, stored.error().message);
            else
            {
                // Stored segments beyond the chapter's current segmentation are stale.
                auto current = std::set<int> {};
                for (auto const& segment: chapter.segments)
                    current.insert(segment.index);
                for (auto& segment: *stored)
                    if (current.contains(segment.index) && !only->contains(segment.index))
                        segments.push_back(std::move(segment));
            }
            log::debug("Regenerating {} segment(s) of chapter {}, {} carried over",
                       only->size(),
                       chapter.id,
                       segments.size());
        }

        auto produced = std::vector<AudioSegment> {};
        auto batcher = SegmentBatcher(store, config.scopeId, chapter.id, config.persistBatchSize, callbacks.onSegmentReady);

        auto scheduler = SegmentScheduler(SchedulerHooks {
            .parallelism = [this] { return parallelism.load(); },
            .process = [this, &chapter, only](const TextSegment& segment,
                                              std::stop_token token) -> Result<std::optional<AudioSegment>> {
                if (only && !only->contains(segment.index))
                    return std::optional<AudioSegment> {};
                return synthesizeSegment(segment, chapter.id, token);
            },
            .onResult = [&](AudioSegment segment) -> VoidResult {
                produced.push_back(segment);
                batcher.addSegment(std::move(segment));
                return {};
            },
            .onProgress =
                [&](int completed, int count) {
                    progress(chapter.id, completed, count, std::format("Generating segment {}/{}", completed, count));
                },
        });

        auto const report = scheduler.run(chapter.segments, priorityFor(chapter.id), stopToken);

        if (auto flushed = batcher.flush(); !flushed)
            log::warning("Final segment batch of chapter {} not persisted: {}", chapter.id, flushed.error().message);

        outcome.failedIndices = report.failed;
        if (report.cancelled || stopToken.stop_requested())
        {
            outcome.status = ChapterStatus::Cancelled;
            outcome.message = std::format("Cancelled after {} of {} segments", report.processed.size(), total);
            return finish(std::move(outcome));
        }

        segments.insert(segments.end(), std::make_move_iterator(produced.begin()), std::make_move_iterator(produced.end()));
        produced.clear();
        auto const timelineDuration = computeTimeline(segments);
        if (hasEstimatedDurations(segments))
            log::warning("Timeline of chapter {} contains estimated durations", chapter.id);

        if (segments.empty())
        {
            outcome.status = ChapterStatus::Error;
            outcome.message = std::format("No segment could be synthesized ({} failed)", report.failed.size());
            return finish(std::move(outcome));
        }

        if (store)
        {
            if (auto saved = store->putSegments(config.scopeId, chapter.id, segments); !saved)
            {
                outcome.status = ChapterStatus::Error;
                outcome.message = std::format("Failed to save segments: {}", saved.error().message);
                return finish(std::move(outcome));
            }
        }

        auto audioChapters = std::vector<AudioChapter> {};
        audioChapters.reserve(segments.size());
        for (auto const& segment: segments)
            audioChapters.push_back(AudioChapter {
                .id = segment.id,
                .title = std::format("Segment {}", segment.index),
                .audio = segment.audio,
                .duration = segment.duration > 0.0 ? std::optional(segment.duration) : std::nullopt,
            });

        auto const options = AssemblyOptions {
            .format = OutputFormat::Wav,
            .bitrateKbps = 192,
            .title = chapter.title,
            .author = {},
            .stopToken = stopToken,
        };
        auto assembled = assembler->assemble(std::move(audioChapters), options, [&](const AssemblyProgress& step) {
            progress(chapter.id, step.current, step.total, step.message);
        });
        if (!assembled)
        {
            outcome.status = isCancellation(assembled.error()) ? ChapterStatus::Cancelled : ChapterStatus::Error;
            outcome.message = std::format("Assembly failed: {}", assembled.error().message);
            return finish(std::move(outcome));
        }

        log::debug("Chapter {} assembled via {} ({:.2f}s, timeline {:.2f}s)",
                   chapter.id,
                   assembled->strategy,
                   assembled->duration,
                   timelineDuration);

        if (store)
        {
            auto const metadata = ChapterAudioMetadata {
                .title = chapter.title,
                .duration = assembled->duration,
                .segmentCount = static_cast<int>(segments.size()),
                .strategy = assembled->strategy,
            };
            if (auto saved = store->putAssembledAudio(config.scopeId, chapter.id, assembled->audio, metadata); !saved)
            {
                outcome.status = ChapterStatus::Error;
                outcome.message = std::format("Failed to save chapter audio: {}", saved.error().message);
                return finish(std::move(outcome));
            }
        }

        outcome.duration = assembled->duration;
        if (report.failed.empty())
        {
            outcome.status = ChapterStatus::Done;
            outcome.message = std::format("{} segments, {:.1f}s", segments.size(), outcome.duration);
        }
        else
        {
            outcome.status = ChapterStatus::Partial;
            outcome.message = std::format("{} of {} segments failed", report.failed.size(), total);
        }
        return finish(std::move(outcome));
    }

    auto runChapters(std::span<const ChapterInput> chapters,
                     std::optional<int> startIndex,
                     const std::set<int>* only) -> Result<std::vector<ChapterOutcome>>
    {
        if (running.exchange(true))
            return makeError(ErrorCode::InvalidArgument, "Generation already running");
        auto const runningFlag = RunningFlag { running };

        auto globalToken = std::stop_token {};
        {
            auto lock = std::lock_guard(mutex);
            stopSource = std::stop_source {};
            globalToken = stopSource.get_token();
            priorities.clear();
            for (auto const& chapter: chapters)
                statuses.insert_or_assign(chapter.id, ChapterStatus::Pending);
        }

        if (startIndex && !chapters.empty())
            priorityFor(chapters.front().id).request(*startIndex);

        log::info("Generating {} chapter(s) with parallelism {}", chapters.size(), parallelism.load());

        auto outcomes = std::vector<ChapterOutcome> {};
        for (auto const& chapter: chapters)
        {
            if (globalToken.stop_requested())
            {
                log::info("Generation cancelled, skipping remaining chapters");
                break;
            }
            outcomes.push_back(runChapter(chapter, only, globalToken));
        }
        return outcomes;
    }
};

GenerationSession::GenerationSession(std::shared_ptr<LazyHandle<SynthesisBackend>> synthesizer,
                                     std::shared_ptr<SegmentStore> store,
                                     std::shared_ptr<AudioAssembler> assembler,
                                     GenerationSessionConfig config,
                                     GenerationCallbacks callbacks):
    _impl(std::make_unique<Impl>())
{
    _impl->synthesizer = std::move(synthesizer);
    _impl->store = std::move(store);
    _impl->assembler = std::move(assembler);
    _impl->config = std::move(config);
    _impl->callbacks = std::move(callbacks);
    _impl->parallelism = std::max(1, _impl->config.parallelism);
}

GenerationSession::~GenerationSession() = default;

auto GenerationSession::generateChapters(std::span<const ChapterInput> chapters) -> Result<std::vector<ChapterOutcome>>
{
    return _impl->runChapters(chapters, std::nullopt, nullptr);
}

auto GenerationSession::generateChapterFromSegment(const ChapterInput& chapter, int startIndex) -> Result<ChapterOutcome>
{
    auto outcomes = _impl->runChapters(std::span(&chapter, 1), startIndex, nullptr);
    if (!outcomes)
        return std::unexpected(outcomes.error());
    if (outcomes->empty())
        return makeError(ErrorCode::Cancelled, "Generation cancelled");
    return std::move(outcomes->front());
}

auto GenerationSession::regenerateChapter(const ChapterInput& chapter, std::span<const int> indices)
    -> Result<ChapterOutcome>
{
    if (indices.empty())
        return makeError(ErrorCode::InvalidArgument, "No segments selected for regeneration");

    auto const only = std::set<int>(indices.begin(), indices.end());
    auto outcomes = _impl->runChapters(std::span(&chapter, 1), std::nullopt, &only);
    if (!outcomes)
        return std::unexpected(outcomes.error());
    if (outcomes->empty())
        return makeError(ErrorCode::Cancelled, "Generation cancelled");
    return std::move(outcomes->front());
}

auto GenerationSession::setGenerationPriority(std::string_view chapterId, int segmentIndex) -> bool
{
    if (!_impl->running)
        return false;

    _impl->priorityFor(std::string(chapterId)).request(segmentIndex);
    log::info("Set generation priority for chapter {} to segment {}", chapterId, segmentIndex);
    return true;
}

void GenerationSession::setParallelism(int parallelism)
{
    _impl->parallelism = std::max(1, parallelism);
}

auto GenerationSession::parallelism() const -> int
{
    return _impl->parallelism;
}

void GenerationSession::cancel()
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->stopSource.request_stop();
}

void GenerationSession::cancelChapter(std::string_view chapterId)
{
    auto lock = std::lock_guard(_impl->mutex);
    if (auto const it = _impl->chapterStops.find(chapterId); it != _impl->chapterStops.end())
        it->second.request_stop();
}

auto GenerationSession::isRunning() const -> bool
{
    return _impl->running;
}

auto GenerationSession::chapterStatus(std::string_view chapterId) const -> ChapterStatus
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->statuses.find(chapterId);
    return it == _impl->statuses.end() ? ChapterStatus::Pending : it->second;
}

auto GenerationSession::exportAudio(std::span<const std::string> chapterIds,
                                    OutputFormat format,
                                    unsigned bitrateKbps,
                                    std::string bookTitle,
                                    std::string bookAuthor,
                                    const AssemblyProgressCallback& onProgress) -> Result<EncodedAudio>
{
    if (!_impl->store)
        return makeError(ErrorCode::InvalidArgument, "Export requires a segment store");

    auto chapters = std::vector<AudioChapter> {};
    for (auto const& chapterId: chapterIds)
    {
        auto stored = _impl->store->getAssembledAudio(_impl->config.scopeId, chapterId);
        if (!stored)
            return std::unexpected(stored.error());
        if (!*stored)
            return makeError(ErrorCode::InvalidArgument, std::format("Chapter {} has no generated audio", chapterId));

        auto& audio = **stored;
        chapters.push_back(AudioChapter {
            .id = chapterId,
            .title = audio.metadata.title.empty() ? chapterId : audio.metadata.title,
            .audio = std::move(audio.audio),
            .duration = audio.metadata.duration > 0.0 ? std::optional(audio.metadata.duration) : std::nullopt,
        });
    }

    return _impl->assembler->exportBook(
        std::move(chapters), format, bitrateKbps, std::move(bookTitle), std::move(bookAuthor), onProgress);
}

} // namespace narrator
