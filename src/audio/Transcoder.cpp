// SPDX-License-Identifier: Apache-2.0
#include "Transcoder.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

#include <sys/wait.h>

#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace narrator
{

namespace
{

    constexpr auto LogTailBytes = std::size_t { 512 };

    /// @brief Private working directory removed on every exit path.
    class ScratchDirectory
    {
      public:
        ~ScratchDirectory()
        {
            if (_path.empty())
                return;
            auto ec = std::error_code {};
            std::filesystem::remove_all(_path, ec);
            if (ec)
                log::warning("Failed to remove transcoder scratch directory {}: {}", _path.string(), ec.message());
        }

        auto create(const std::filesystem::path& root) -> VoidResult
        {
            static auto counter = std::atomic<unsigned> { 0 };
            auto const name = std::format("narrator-{}-{}", ::getpid(), counter.fetch_add(1));
            auto ec = std::error_code {};
            auto path = root / name;
            std::filesystem::create_directories(path, ec);
            if (ec)
                return makeError(ErrorCode::IoError,
                                 std::format("Cannot create scratch directory {}: {}", path.string(), ec.message()));
            _path = std::move(path);
            return {};
        }

        [[nodiscard]] auto file(std::string_view name) const -> std::string { return (_path / name).string(); }

      private:
        std::filesystem::path _path;
    };

    auto writeFile(const std::string& path, std::span<const std::uint8_t> data) -> VoidResult
    {
        auto file = std::ofstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", path));
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Short write to {}", path));
        return {};
    }

    auto readFile(const std::string& path) -> Result<Bytes>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::TranscoderError, std::format("Transcoder produced no output at {}", path));
        return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    auto logTail(const std::string& path) -> std::string
    {
        auto file = std::ifstream(path, std::ios::binary);
        auto text = std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (text.size() > LogTailBytes)
            text.erase(0, text.size() - LogTailBytes);
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
            text.pop_back();
        return text;
    }

    /// @brief Runs the executable to completion with stdout/stderr captured into `logPath`.
    auto runProcess(const std::string& executable, const std::vector<std::string>& args, const std::string& logPath)
        -> VoidResult
    {
        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_addopen(
            &actions, STDOUT_FILENO, logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

        auto argStorage = std::vector<std::string> {};
        argStorage.reserve(args.size() + 1);
        argStorage.push_back(executable);
        argStorage.insert(argStorage.end(), args.begin(), args.end());

        auto argv = std::vector<char*> {};
        for (auto& arg: argStorage)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        pid_t pid;
        auto const status = posix_spawnp(&pid, executable.c_str(), &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        if (status != 0)
            return makeError(ErrorCode::TranscoderError,
                             std::format("Failed to spawn '{}': {}", executable, strerror(status)));

        int exitStatus = 0;
        if (waitpid(pid, &exitStatus, 0) < 0)
            return makeError(ErrorCode::TranscoderError,
                             std::format("Failed to wait for '{}': {}", executable, strerror(errno)));

        if (WIFSIGNALED(exitStatus))
            return makeError(ErrorCode::TranscoderError,
                             std::format("{} aborted by signal {}: {}",
                                         executable,
                                         WTERMSIG(exitStatus),
                                         logTail(logPath)));

        if (!WIFEXITED(exitStatus) || WEXITSTATUS(exitStatus) != 0)
            return makeError(ErrorCode::TranscoderError,
                             std::format("{} exited with status {}: {}",
                                         executable,
                                         WIFEXITED(exitStatus) ? WEXITSTATUS(exitStatus) : -1,
                                         logTail(logPath)));

        return {};
    }

    auto outputContainerArguments(const TranscodeRequest& request) -> std::vector<std::string>
    {
        auto const bitrate = std::format("{}k", request.bitrateKbps);
        switch (request.format)
        {
            case OutputFormat::Wav: return { "-c:a", "pcm_s16le", "-f", "wav" };
            case OutputFormat::Mp3: return { "-c:a", "libmp3lame", "-b:a", bitrate, "-f", "mp3" };
            case OutputFormat::M4b: return { "-c:a", "aac", "-b:a", bitrate, "-f", "ipod" };
        }
        return {};
    }

    auto wantsMetadataFile(const TranscodeRequest& request) -> bool
    {
        return supportsChapters(request.format) && !request.chapters.empty();
    }

} // namespace

auto scratchFileName(std::string_view stem, ContainerFormat container) -> std::string
{
    return std::format("{}.{}", stem, containerExtension(container));
}

FfmpegTranscoder::FfmpegTranscoder(FfmpegTranscoderConfig config): _config(std::move(config))
{
}

auto FfmpegTranscoder::buildArguments(std::span<const std::string> inputs,
                                      const std::string& metadata,
                                      const std::string& output,
                                      const TranscodeRequest& request) -> std::vector<std::string>
{
    auto args = std::vector<std::string> { "-hide_banner", "-nostdin", "-y" };

    for (auto const& input: inputs)
    {
        args.emplace_back("-i");
        args.push_back(input);
    }

    if (!metadata.empty())
    {
        args.emplace_back("-i");
        args.push_back(metadata);
        args.emplace_back("-map_metadata");
        args.push_back(std::to_string(inputs.size()));
    }

    if (inputs.size() > 1)
    {
        auto filter = std::string {};
        for (auto i = std::size_t { 0 }; i < inputs.size(); ++i)
            filter += std::format("[{}:a]", i);
        filter += std::format("concat=n={}:v=0:a=1[out]", inputs.size());

        args.emplace_back("-filter_complex");
        args.push_back(std::move(filter));
        args.emplace_back("-map");
        args.emplace_back("[out]");
    }
    else
    {
        args.emplace_back("-map");
        args.emplace_back("0:a");
    }

    for (auto& arg: outputContainerArguments(request))
        args.push_back(std::move(arg));

    if (!request.title.empty())
    {
        args.emplace_back("-metadata");
        args.push_back(std::format("title={}", request.title));
    }
    if (!request.artist.empty())
    {
        args.emplace_back("-metadata");
        args.push_back(std::format("artist={}", request.artist));
    }

    args.push_back(output);
    return args;
}

auto FfmpegTranscoder::encode(std::span<const std::uint8_t> wav, const TranscodeRequest& request) -> Result<Bytes>
{
    auto const input = EncodedAudio { .bytes = Bytes(wav.begin(), wav.end()), .container = ContainerFormat::Wav };
    return concat(std::span<const EncodedAudio>(&input, 1), request);
}

auto FfmpegTranscoder::concat(std::span<const EncodedAudio> inputs, const TranscodeRequest& request) -> Result<Bytes>
{
    if (inputs.empty())
        return makeError(ErrorCode::InvalidArgument, "Transcoder called without inputs");

    auto scratch = ScratchDirectory {};
    if (auto created = scratch.create(_config.scratchRoot); !created)
        return std::unexpected(created.error());

    auto inputFiles = std::vector<std::string> {};
    inputFiles.reserve(inputs.size());
    for (auto i = std::size_t { 0 }; i < inputs.size(); ++i)
    {
        auto path = scratch.file(scratchFileName(std::format("input{}", i), inputs[i].container));
        if (auto written = writeFile(path, inputs[i].bytes); !written)
            return std::unexpected(written.error());
        inputFiles.push_back(std::move(path));
    }

    auto metadataFile = std::string {};
    if (wantsMetadataFile(request))
    {
        metadataFile = scratch.file("metadata.txt");
        auto const text = createFfmetadata(request.chapters, request.title, request.artist);
        auto const bytes = std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
        if (auto written = writeFile(metadataFile, bytes); !written)
            return std::unexpected(written.error());
    }

    auto const outputFile = scratch.file(scratchFileName("output", containerFor(request.format)));
    auto const args = buildArguments(inputFiles, metadataFile, outputFile, request);

    log::debug("Running {} with {} input(s) -> {}", _config.executable, inputs.size(), outputFormatName(request.format));

    if (auto ran = runProcess(_config.executable, args, scratch.file("transcoder.log")); !ran)
        return std::unexpected(ran.error());

    return readFile(outputFile);
}

} // namespace narrator
