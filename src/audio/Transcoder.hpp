// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/ChapterMarkers.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace narrator
{

/// @brief Parameters of one transcoder invocation.
struct TranscodeRequest
{
    OutputFormat format = OutputFormat::Mp3;
    unsigned bitrateKbps = 192;
    std::string title;
    std::string artist;

    /// Embedded only when the output format supports chapters.
    std::vector<ChapterMarker> chapters;
};

/// @brief External encoder/demuxer used for compressed and chaptered outputs.
///
/// Any failed call leaves the instance in an unknown state; callers discard it and
/// construct a new one for subsequent work.
class Transcoder
{
  public:
    virtual ~Transcoder() = default;

    /// @brief Encodes an uncompressed WAV blob into the requested format.
    [[nodiscard]] virtual auto encode(std::span<const std::uint8_t> wav, const TranscodeRequest& request)
        -> Result<Bytes> = 0;

    /// @brief Demuxes, joins (in the given order) and encodes heterogeneous inputs.
    [[nodiscard]] virtual auto concat(std::span<const EncodedAudio> inputs, const TranscodeRequest& request)
        -> Result<Bytes> = 0;
};

/// @brief Configuration for the ffmpeg-backed transcoder.
struct FfmpegTranscoderConfig
{
    /// @brief Executable name or path, resolved through PATH.
    std::string executable = "ffmpeg";

    /// @brief Directory under which per-call scratch directories are created.
    std::filesystem::path scratchRoot = std::filesystem::temp_directory_path();
};

/// @brief Transcoder that runs the ffmpeg executable as a child process.
class FfmpegTranscoder: public Transcoder
{
  public:
    explicit FfmpegTranscoder(FfmpegTranscoderConfig config = {});

    [[nodiscard]] auto encode(std::span<const std::uint8_t> wav, const TranscodeRequest& request)
        -> Result<Bytes> override;
    [[nodiscard]] auto concat(std::span<const EncodedAudio> inputs, const TranscodeRequest& request)
        -> Result<Bytes> override;

    /// @brief Builds the argument list (without the executable) that joins `inputs` into `output`.
    ///
    /// A single input is encoded directly; several inputs are joined by the concat filter.
    /// `metadata` names an FFMETADATA file and is only mapped when non-empty.
    [[nodiscard]] static auto buildArguments(std::span<const std::string> inputs,
                                             const std::string& metadata,
                                             const std::string& output,
                                             const TranscodeRequest& request) -> std::vector<std::string>;

  private:
    FfmpegTranscoderConfig _config;
};

/// @brief Filename used for an encoded blob of the given container inside a scratch directory.
[[nodiscard]] auto scratchFileName(std::string_view stem, ContainerFormat container) -> std::string;

} // namespace narrator
