// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioAssembler.hpp>
#include <audio/AudioDecoder.hpp>
#include <audio/Transcoder.hpp>
#include <core/LazyHandle.hpp>
#include <core/Log.hpp>
#include <generation/GenerationSession.hpp>
#include <generation/Timeline.hpp>
#include <narrator/Book.hpp>
#include <storage/FileSegmentStore.hpp>
#include <synthesis/PiperSynthesizer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <span>
#include <thread>

namespace narrator
{

namespace
{
    constexpr auto ExitInterrupted = 130;

    // Set from the SIGINT handler; polled by SignalWatcher.
    std::atomic<bool> gInterrupted = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};        // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigintHandler(int /*sig*/)
    {
        gInterrupted = true;
    }

    /// @brief Turns SIGINT into a global generation cancel while alive.
    class SignalWatcher
    {
      public:
        explicit SignalWatcher(GenerationSession& session)
        {
            gInterrupted = false;
            struct sigaction sa {};
            sa.sa_handler = sigintHandler;
            sa.sa_flags = SA_RESTART;
            sigemptyset(&sa.sa_mask);
            sigaction(SIGINT, &sa, &gPrevSigint);

            _thread = std::jthread([&session](const std::stop_token& stopToken) {
                while (!stopToken.stop_requested())
                {
                    if (gInterrupted.exchange(false))
                    {
                        log::warning("Interrupted, cancelling generation...");
                        session.cancel();
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            });
        }

        ~SignalWatcher()
        {
            _thread.request_stop();
            _thread.join();
            sigaction(SIGINT, &gPrevSigint, nullptr);
        }

        SignalWatcher(const SignalWatcher&) = delete;
        SignalWatcher& operator=(const SignalWatcher&) = delete;

      private:
        std::jthread _thread;
    };

    auto writeOutput(const std::string& path, std::span<const std::uint8_t> data) -> VoidResult
    {
        auto const dir = std::filesystem::path(path).parent_path();
        if (!dir.empty())
        {
            auto ec = std::error_code {};
            std::filesystem::create_directories(dir, ec);
            if (ec)
                return makeError(ErrorCode::IoError,
                                 std::format("Failed to create output directory '{}': {}", dir.string(), ec.message()));
        }

        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", path));
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Short write to {}", path));
        return {};
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::shared_ptr<LazyHandle<SynthesisBackend>> synthesizer;
    std::shared_ptr<SegmentStore> store;
    std::shared_ptr<AudioAssembler> assembler;

    auto exportBook(GenerationSession& session, const Book& book, std::span<const std::string> chapterIds,
                    const RunOptions& options) -> VoidResult
    {
        auto const format = config.exportSettings.format;
        auto const outputPath = options.outputPath.empty()
                                    ? std::format("{}.{}", storagePathComponent(book.id), outputFormatName(format))
                                    : options.outputPath;

        log::info("Exporting {} chapter(s) of \"{}\" as {}", chapterIds.size(), book.title, outputFormatName(format));
        auto audio = session.exportAudio(chapterIds,
                                         format,
                                         config.exportSettings.bitrate,
                                         book.title,
                                         book.author,
                                         [](const AssemblyProgress& progress) {
                                             log::info("[{}] {}", assemblyStageName(progress.stage), progress.message);
                                         });
        if (!audio)
            return std::unexpected(audio.error());

        if (auto written = writeOutput(outputPath, audio->bytes); !written)
            return written;

        log::info("Wrote {} ({} bytes)", outputPath, audio->bytes.size());
        return {};
    }

    /// @brief Writes `<chapter>.<ext>` and `<chapter>.smil` for every chapter into `directory`.
    auto writeOverlays(const Book& book, std::span<const std::string> chapterIds, const std::string& directory)
        -> VoidResult
    {
        for (auto const& chapterId: chapterIds)
        {
            auto audio = store->getAssembledAudio(book.id, chapterId);
            if (!audio)
                return std::unexpected(audio.error());
            if (!*audio)
                return makeError(ErrorCode::InvalidArgument, std::format("Chapter {} has no generated audio", chapterId));

            auto segments = store->getSegments(book.id, chapterId);
            if (!segments)
                return std::unexpected(segments.error());

            auto const name = storagePathComponent(chapterId);
            auto const audioFile = std::format("{}.{}", name, containerExtension((*audio)->audio.container));
            if (auto written = writeOutput((std::filesystem::path(directory) / audioFile).string(), (*audio)->audio.bytes);
                !written)
                return written;

            auto const smil = buildMediaOverlay(std::format("{}.xhtml", name), audioFile, *segments);
            auto const document = std::span(reinterpret_cast<const std::uint8_t*>(smil.data()), smil.size());
            if (auto written = writeOutput((std::filesystem::path(directory) / (name + ".smil")).string(), document);
                !written)
                return written;
        }

        log::info("Wrote media overlays of {} chapter(s) to {}", chapterIds.size(), directory);
        return {};
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;

    auto const storeDir = storageDirectory(config);
    auto ec = std::error_code {};
    std::filesystem::create_directories(storeDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create store directory '{}': {}", storeDir, ec.message()));
    _impl->store = std::make_shared<FileSegmentStore>(storeDir);

    auto const synthesisConfig = PiperSynthesizerConfig {
        .modelPath = config.synthesis.modelPath,
        .espeakDataPath = config.synthesis.espeakDataPath,
    };
    _impl->synthesizer = std::make_shared<LazyHandle<SynthesisBackend>>(
        [synthesisConfig]() -> Result<std::shared_ptr<SynthesisBackend>> {
            if (synthesisConfig.modelPath.empty())
                return makeError(ErrorCode::ConfigError, "No voice model configured (synthesis.modelPath)");
            auto piper = std::make_shared<PiperSynthesizer>();
            if (auto initialized = piper->initialize(synthesisConfig); !initialized)
                return std::unexpected(initialized.error());
            return piper;
        });

    auto const transcoderConfig = FfmpegTranscoderConfig {
        .executable = config.exportSettings.transcoderPath,
        .scratchRoot = std::filesystem::temp_directory_path(ec),
    };
    auto transcoder = std::make_shared<LazyHandle<Transcoder>>([transcoderConfig]() -> Result<std::shared_ptr<Transcoder>> {
        return std::make_shared<FfmpegTranscoder>(transcoderConfig);
    });

    _impl->assembler = std::make_shared<AudioAssembler>(std::make_shared<MiniaudioDecodeBackend>(), std::move(transcoder));

    log::debug("Store at {}, transcoder {}", storeDir, config.exportSettings.transcoderPath);
    return {};
}

auto App::run(const RunOptions& options) -> int
{
    auto book = loadBookFromFile(options.bookPath);
    if (!book)
    {
        log::error("Failed to load book: {}", book.error());
        return 1;
    }

    log::info("Loaded \"{}\" with {} chapter(s)", book->title, book->chapters.size());

    auto const& config = _impl->config;
    auto session = GenerationSession(
        _impl->synthesizer,
        _impl->store,
        _impl->assembler,
        GenerationSessionConfig {
            .scopeId = book->id,
            .voice = voiceParams(config.synthesis),
            .parallelism = config.generation.parallelism,
            .persistBatchSize = static_cast<std::size_t>(config.generation.persistBatchSize),
        },
        GenerationCallbacks {
            .onChapterProgress =
                [](std::string_view chapterId, int current, int total, std::string_view message) {
                    log::info("{} [{}/{}] {}", chapterId, current, total, message);
                },
            .onSegmentReady =
                [](const AudioSegment& segment) {
                    log::debug("Segment {} of {} ready ({:.2f}s)", segment.index, segment.chapterId, segment.duration);
                },
            .onChapterFinished = {},
        });

    auto const watcher = SignalWatcher(session);

    auto exportIds = book->chapterIds();
    if (!options.exportOnly)
    {
        auto outcomes = session.generateChapters(book->chapters);
        if (!outcomes)
        {
            log::error("Generation failed: {}", outcomes.error());
            return 1;
        }

        exportIds.clear();
        auto cancelled = false;
        for (auto const& outcome: *outcomes)
        {
            if (outcome.status == ChapterStatus::Done || outcome.status == ChapterStatus::Partial)
                exportIds.push_back(outcome.chapterId);
            cancelled = cancelled || outcome.status == ChapterStatus::Cancelled;
        }

        if (cancelled || outcomes->size() < book->chapters.size())
        {
            log::warning("Generation interrupted; {} chapter(s) finished", exportIds.size());
            return ExitInterrupted;
        }
    }

    if (exportIds.empty())
    {
        log::error("No chapter audio to export");
        return 1;
    }

    if (auto exported = _impl->exportBook(session, *book, exportIds, options); !exported)
    {
        log::error("Export failed: {}", exported.error());
        return 1;
    }

    if (!options.overlayDirectory.empty())
    {
        if (auto written = _impl->writeOverlays(*book, exportIds, options.overlayDirectory); !written)
        {
            log::error("Writing media overlays failed: {}", written.error());
            return 1;
        }
    }
    return 0;
}

} // namespace narrator
