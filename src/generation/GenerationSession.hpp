// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioAssembler.hpp>
#include <core/Error.hpp>
#include <core/LazyHandle.hpp>
#include <core/Types.hpp>
#include <storage/SegmentStore.hpp>
#include <synthesis/SynthesisBackend.hpp>

#include <functional>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Generation state of one chapter.
enum class ChapterStatus : std::uint8_t
{
    Pending,
    Processing,
    Done,      ///< Every segment synthesized and the chapter audio assembled.
    Partial,   ///< Chapter audio assembled, but some segments failed.
    Error,     ///< Nothing usable was produced.
    Cancelled, ///< Stopped by a global or per-chapter cancel.
};

[[nodiscard]] constexpr auto chapterStatusName(ChapterStatus status) -> std::string_view
{
    switch (status)
    {
        case ChapterStatus::Pending: return "pending";
        case ChapterStatus::Processing: return "processing";
        case ChapterStatus::Done: return "done";
        case ChapterStatus::Partial: return "partial";
        case ChapterStatus::Error: return "error";
        case ChapterStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief A chapter as handed over by the segmenter.
struct ChapterInput
{
    std::string id;
    std::string title;
    std::vector<TextSegment> segments;
};

struct ChapterOutcome
{
    std::string chapterId;
    ChapterStatus status = ChapterStatus::Pending;
    std::set<int> failedIndices;
    std::string message;

    /// Length of the assembled chapter audio in seconds.
    double duration = 0.0;
};

struct GenerationSessionConfig
{
    /// Store namespace, typically the book id.
    std::string scopeId = "default";
    VoiceParams voice;
    int parallelism = 1;
    std::size_t persistBatchSize = 10;
};

struct GenerationCallbacks
{
    std::function<void(std::string_view chapterId, int current, int total, std::string_view message)> onChapterProgress;
    std::function<void(const AudioSegment&)> onSegmentReady;
    std::function<void(const ChapterOutcome&)> onChapterFinished;
};

/// @brief Drives generation of whole chapters: scheduling, persistence, timing and assembly.
///
/// Chapters are generated one after another. All public members may be called from any
/// thread; generate*() calls block until their chapters are finished and only one of them
/// may run at a time.
class GenerationSession
{
  public:
    GenerationSession(std::shared_ptr<LazyHandle<SynthesisBackend>> synthesizer,
                      std::shared_ptr<SegmentStore> store,
                      std::shared_ptr<AudioAssembler> assembler,
                      GenerationSessionConfig config,
                      GenerationCallbacks callbacks = {});
    ~GenerationSession();

    GenerationSession(const GenerationSession&) = delete;
    GenerationSession& operator=(const GenerationSession&) = delete;

    /// @brief Generates the given chapters in order.
    /// @return One outcome per started chapter, or InvalidArgument if a generation is already running.
    [[nodiscard]] auto generateChapters(std::span<const ChapterInput> chapters) -> Result<std::vector<ChapterOutcome>>;

    /// @brief Generates one chapter, starting at the given segment index.
    [[nodiscard]] auto generateChapterFromSegment(const ChapterInput& chapter, int startIndex) -> Result<ChapterOutcome>;

    /// @brief Synthesizes only the given segment indices again; the other segments are taken from the store.
    [[nodiscard]] auto regenerateChapter(const ChapterInput& chapter, std::span<const int> indices)
        -> Result<ChapterOutcome>;

    /// @brief Asks the running generation to synthesize the given segment next.
    ///
    /// A request for a chapter still queued in the run is served when that chapter starts.
    /// Requests left over when a chapter finishes, or when the run ends, are discarded.
    /// @return false if no generation is running.
    auto setGenerationPriority(std::string_view chapterId, int segmentIndex) -> bool;

    /// @brief Changes the fan-out; takes effect with the next batch.
    void setParallelism(int parallelism);
    [[nodiscard]] auto parallelism() const -> int;

    /// @brief Stops the whole run; chapters not yet started are skipped.
    void cancel();

    /// @brief Stops only the given chapter if it is in progress.
    void cancelChapter(std::string_view chapterId);

    [[nodiscard]] auto isRunning() const -> bool;

    [[nodiscard]] auto chapterStatus(std::string_view chapterId) const -> ChapterStatus;

    /// @brief Joins the stored audio of the given chapters into one book file.
    [[nodiscard]] auto exportAudio(std::span<const std::string> chapterIds,
                                   OutputFormat format,
                                   unsigned bitrateKbps,
                                   std::string bookTitle,
                                   std::string bookAuthor,
                                   const AssemblyProgressCallback& onProgress = {}) -> Result<EncodedAudio>;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
