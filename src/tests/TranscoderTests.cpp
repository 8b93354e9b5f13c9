// SPDX-License-Identifier: Apache-2.0
#include <audio/Transcoder.hpp>
#include <audio/WavCodec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace narrator;

TEST_CASE("scratchFileName uses the container extension", "[transcoder]")
{
    CHECK(scratchFileName("input0", ContainerFormat::Wav) == "input0.wav");
    CHECK(scratchFileName("input1", ContainerFormat::Mp3) == "input1.mp3");
    CHECK(scratchFileName("output", ContainerFormat::Mp4) == "output.m4a");
    CHECK(scratchFileName("blob", ContainerFormat::Unknown) == "blob.bin");
}

TEST_CASE("buildArguments encodes a single input directly", "[transcoder]")
{
    auto const inputs = std::vector<std::string> { "in.wav" };
    auto const request = TranscodeRequest {
        .format = OutputFormat::Mp3,
        .bitrateKbps = 128,
        .title = "Book",
        .artist = {},
        .chapters = {},
    };

    auto const args = FfmpegTranscoder::buildArguments(inputs, {}, "out.mp3", request);
    auto const expected = std::vector<std::string> {
        "-hide_banner", "-nostdin", "-y",   "-i",        "in.wav",     "-map",   "0:a",    "-c:a",
        "libmp3lame",   "-b:a",     "128k", "-f",        "mp3",        "-metadata", "title=Book", "out.mp3",
    };
    CHECK(args == expected);
}

TEST_CASE("buildArguments joins several inputs with the concat filter", "[transcoder]")
{
    auto const inputs = std::vector<std::string> { "a.wav", "b.mp3", "c.wav" };
    auto const request = TranscodeRequest {
        .format = OutputFormat::M4b,
        .bitrateKbps = 64,
        .title = {},
        .artist = "Narrator",
        .chapters = { ChapterMarker { .title = "One", .startMs = 0, .endMs = 1000 } },
    };

    auto const args = FfmpegTranscoder::buildArguments(inputs, "meta.txt", "out.m4a", request);

    auto const contains = [&](const std::vector<std::string>& run) {
        return std::ranges::search(args, run).size() == run.size();
    };
    CHECK(contains({ "-i", "meta.txt", "-map_metadata", "3" }));
    CHECK(contains({ "-filter_complex", "[0:a][1:a][2:a]concat=n=3:v=0:a=1[out]", "-map", "[out]" }));
    CHECK(contains({ "-c:a", "aac", "-b:a", "64k", "-f", "ipod" }));
    CHECK(contains({ "-metadata", "artist=Narrator" }));
    CHECK(args.back() == "out.m4a");
}

#ifndef _WIN32
TEST_CASE("FfmpegTranscoder reports a missing executable", "[transcoder]")
{
    auto transcoder = FfmpegTranscoder(FfmpegTranscoderConfig {
        .executable = "narrator-no-such-transcoder",
        .scratchRoot = std::filesystem::temp_directory_path(),
    });

    auto const wavBytes = wav::encode(AudioBuffer::silence(8000, 1, 0.1));
    auto result = transcoder.encode(wavBytes, TranscodeRequest {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TranscoderError);
}

TEST_CASE("FfmpegTranscoder reports a non-zero exit status", "[transcoder]")
{
    auto transcoder = FfmpegTranscoder(FfmpegTranscoderConfig {
        .executable = "false",
        .scratchRoot = std::filesystem::temp_directory_path(),
    });

    auto const wavBytes = wav::encode(AudioBuffer::silence(8000, 1, 0.1));
    auto result = transcoder.encode(wavBytes, TranscodeRequest {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TranscoderError);
    CHECK(result.error().message.find("exited with status 1") != std::string::npos);
}

TEST_CASE("FfmpegTranscoder reads back the output file", "[transcoder]")
{
    // Stands in for ffmpeg: copies the single input (argument 5) to the output (last argument).
    auto const script = std::filesystem::temp_directory_path() / "narrator_test_transcoder.sh";
    {
        auto file = std::ofstream(script);
        file << "#!/bin/sh\neval last=\\${$#}\ncp \"$5\" \"$last\"\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    auto transcoder = FfmpegTranscoder(FfmpegTranscoderConfig {
        .executable = script.string(),
        .scratchRoot = std::filesystem::temp_directory_path(),
    });

    auto const wavBytes = wav::encode(AudioBuffer::silence(8000, 1, 0.25));
    auto result = transcoder.encode(wavBytes, TranscodeRequest { .format = OutputFormat::Wav });
    REQUIRE(result.has_value());
    CHECK(*result == wavBytes);

    std::filesystem::remove(script);
}

TEST_CASE("FfmpegTranscoder rejects an empty input list", "[transcoder]")
{
    auto transcoder = FfmpegTranscoder();
    auto result = transcoder.concat({}, TranscodeRequest {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}
#endif
