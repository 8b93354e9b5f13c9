// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioAssembler.hpp>

#include "TestDoubles.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace narrator;
using namespace narrator::test;

namespace
{

struct AssemblerFixture
{
    std::shared_ptr<FakeDecodeBackend> decoder;
    std::shared_ptr<FakeTranscoder> transcoder = std::make_shared<FakeTranscoder>();
    std::shared_ptr<LazyHandle<Transcoder>> handle;
    AudioAssembler assembler;

    explicit AssemblerFixture(bool decodeAvailable = true):
        decoder(std::make_shared<FakeDecodeBackend>(decodeAvailable)),
        handle(std::make_shared<LazyHandle<Transcoder>>(
            [t = transcoder]() -> Result<std::shared_ptr<Transcoder>> { return t; })),
        assembler(decoder, handle)
    {
    }
};

auto wavOptions() -> AssemblyOptions
{
    return AssemblyOptions { .format = OutputFormat::Wav, .bitrateKbps = 192, .title = {}, .author = {}, .stopToken = {} };
}

} // namespace

TEST_CASE("AudioAssembler evaluates strategies in a fixed order", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto const names = fixture.assembler.strategyNames();
    auto const expected = std::vector<std::string_view> {
        "single-chapter-identity", "raw-splice", "decode-normalize-encode", "transcoder-concat", "salvage-splice",
    };
    CHECK(names == expected);
}

TEST_CASE("AudioAssembler rejects empty input", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto result = fixture.assembler.assemble({}, wavOptions());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::AssemblyError);
}

TEST_CASE("AudioAssembler passes a single WAV chapter through unchanged", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto chapter = wavChapter("only", 22050, 1, 0.5);
    auto const original = std::get<EncodedAudio>(chapter.audio).bytes;

    auto result = fixture.assembler.assemble({ std::move(chapter) }, wavOptions());
    REQUIRE(result.has_value());
    CHECK(result->strategy == "single-chapter-identity");
    CHECK(result->audio.bytes == original);
    CHECK(result->duration == Catch::Approx(0.5));
    REQUIRE(result->chapters.size() == 1);
    CHECK(result->chapters[0].endMs == 500);
    CHECK(fixture.decoder->openCount == 0);
}

TEST_CASE("AudioAssembler splices identically formatted WAV chapters", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto chapters = std::vector { wavChapter("a", 24000, 1, 1.0), wavChapter("b", 24000, 1, 2.0) };

    auto result = fixture.assembler.assemble(std::move(chapters), wavOptions());
    REQUIRE(result.has_value());
    CHECK(result->strategy == "raw-splice");
    CHECK(result->audio.container == ContainerFormat::Wav);
    CHECK(result->audio.bytes.size() == 44 + 48000 + 96000);
    CHECK(result->duration == Catch::Approx(3.0));

    auto header = wav::parseHeader(result->audio.bytes);
    REQUIRE(header.has_value());
    CHECK(header->dataLength == 144000);

    REQUIRE(result->chapters.size() == 2);
    CHECK(result->chapters[0].startMs == 0);
    CHECK(result->chapters[0].endMs == 1000);
    CHECK(result->chapters[1].startMs == 1000);
    CHECK(result->chapters[1].endMs == 3000);
    CHECK(fixture.decoder->openCount == 0);
}

TEST_CASE("probeSplice names the first mismatching chapter", "[assembler]")
{
    auto const chapters = std::vector { wavChapter("a", 24000, 1, 0.1), wavChapter("b", 44100, 2, 0.1) };
    auto result = probeSplice(chapters);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::FormatError);
    CHECK(result.error().message.starts_with("Chapter 1 (b) format mismatch"));
    CHECK(result.error().message.find("24000 Hz/1 ch") != std::string::npos);
    CHECK(result.error().message.find("44100 Hz/2 ch") != std::string::npos);
}

TEST_CASE("AudioAssembler decodes and normalizes mismatched chapters", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto chapters = std::vector { wavChapter("a", 22050, 1, 1.0), wavChapter("b", 44100, 2, 1.0) };

    auto events = std::vector<AssemblyProgress> {};
    auto result = fixture.assembler.assemble(
        std::move(chapters), wavOptions(), [&](const AssemblyProgress& progress) { events.push_back(progress); });
    REQUIRE(result.has_value());
    CHECK(result->strategy == "decode-normalize-encode");
    CHECK(result->duration == Catch::Approx(2.0));

    auto header = wav::parseHeader(result->audio.bytes);
    REQUIRE(header.has_value());
    CHECK(header->sampleRate == 44100);
    CHECK(header->channelCount == 2);
    CHECK(result->audio.bytes.size() == 44 + 88200 * 4);

    REQUIRE(result->chapters.size() == 2);
    CHECK(result->chapters[1].startMs == 1000);
    CHECK(result->chapters[1].endMs == 2000);

    REQUIRE(!events.empty());
    CHECK(events.front().stage == AssemblyStage::Loading);
    CHECK(events.back().stage == AssemblyStage::Complete);
    CHECK(std::ranges::any_of(events, [](const AssemblyProgress& p) {
        return p.stage == AssemblyStage::Decoding && p.message == "Decoding chapter 2/2: Chapter b";
    }));
}

TEST_CASE("AudioAssembler substitutes silence for undecodable chapters", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto chapters = std::vector {
        wavChapter("a", 16000, 1, 1.0),
        AudioChapter {
            .id = "broken",
            .title = "Broken",
            .audio = EncodedAudio { .bytes = Bytes(100, 0x42), .container = ContainerFormat::Unknown },
            .duration = std::nullopt,
        },
    };

    auto result = fixture.assembler.assemble(std::move(chapters), wavOptions());
    REQUIRE(result.has_value());
    CHECK(result->strategy == "decode-normalize-encode");
    CHECK(result->duration == Catch::Approx(2.0));
    REQUIRE(result->chapters.size() == 2);
    CHECK(result->chapters[1].endMs == 2000);
}

TEST_CASE("AudioAssembler encodes compressed formats through the transcoder", "[assembler]")
{
    auto fixture = AssemblerFixture();

    SECTION("mp3 carries no chapter table")
    {
        auto options = wavOptions();
        options.format = OutputFormat::Mp3;
        options.title = "Book";
        auto result = fixture.assembler.assemble(
            { wavChapter("a", 24000, 1, 1.0), wavChapter("b", 24000, 1, 1.0) }, options);
        REQUIRE(result.has_value());
        CHECK(result->strategy == "decode-normalize-encode");
        CHECK(result->audio.container == ContainerFormat::Mp3);
        CHECK(result->audio.bytes == fixture.transcoder->output);
        CHECK(fixture.transcoder->encodeCalls == 1);
        CHECK(fixture.transcoder->lastRequest.chapters.empty());
        CHECK(fixture.transcoder->lastRequest.title == "Book");
    }

    SECTION("m4b embeds chapter markers")
    {
        auto options = wavOptions();
        options.format = OutputFormat::M4b;
        options.author = "Someone";
        auto result = fixture.assembler.assemble(
            { wavChapter("a", 24000, 1, 1.0), wavChapter("b", 24000, 1, 1.0) }, options);
        REQUIRE(result.has_value());
        CHECK(result->audio.container == ContainerFormat::Mp4);
        REQUIRE(fixture.transcoder->lastRequest.chapters.size() == 2);
        CHECK(fixture.transcoder->lastRequest.chapters[1].startMs == 1000);
        CHECK(fixture.transcoder->lastRequest.artist == "Someone");
    }
}

TEST_CASE("AudioAssembler discards the transcoder after a failed call", "[assembler]")
{
    auto fixture = AssemblerFixture();
    fixture.transcoder->fail = true;

    auto options = wavOptions();
    options.format = OutputFormat::Mp3;
    auto result = fixture.assembler.assemble({ wavChapter("a", 24000, 1, 0.5) }, options);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::EncodeError);
    CHECK(result.error().message.starts_with("Encoding to mp3 failed"));
    CHECK(!fixture.handle->isConstructed());
    CHECK(fixture.handle->generation() == 1);

    fixture.transcoder->fail = false;
    auto retried = fixture.assembler.assemble({ wavChapter("a", 24000, 1, 0.5) }, options);
    REQUIRE(retried.has_value());
    CHECK(fixture.handle->generation() == 2);
}

TEST_CASE("AudioAssembler hands inputs to the transcoder without a decode context", "[assembler]")
{
    auto fixture = AssemblerFixture(false);
    auto options = wavOptions();
    options.format = OutputFormat::Mp3;

    auto result = fixture.assembler.assemble(
        { wavChapter("a", 22050, 1, 1.0), wavChapter("b", 44100, 2, 0.5) }, options);
    REQUIRE(result.has_value());
    CHECK(result->strategy == "transcoder-concat");
    CHECK(fixture.transcoder->concatCalls == 1);
    CHECK(fixture.transcoder->lastInputCount == 2);
    CHECK(result->duration == Catch::Approx(1.5));
}

TEST_CASE("AudioAssembler salvages WAV chapters when nothing else works", "[assembler]")
{
    auto fixture = AssemblerFixture(false);
    fixture.transcoder->fail = true;

    auto result = fixture.assembler.assemble(
        { wavChapter("a", 22050, 1, 1.0), wavChapter("b", 44100, 2, 1.0) }, wavOptions());
    REQUIRE(result.has_value());
    CHECK(result->strategy == "salvage-splice");
    CHECK(!fixture.handle->isConstructed());

    auto header = wav::parseHeader(result->audio.bytes);
    REQUIRE(header.has_value());
    CHECK(header->sampleRate == 22050);
    CHECK(header->channelCount == 1);
    CHECK(result->audio.bytes.size() == 44 + 2 * 22050 * 2);
    CHECK(result->duration == Catch::Approx(2.0));
}

TEST_CASE("AudioAssembler observes a stop request", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto source = std::stop_source {};
    source.request_stop();

    auto options = wavOptions();
    options.stopToken = source.get_token();
    auto result = fixture.assembler.assemble({ wavChapter("a", 24000, 1, 0.5) }, options);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
}

TEST_CASE("exportBook returns the encoded artifact", "[assembler]")
{
    auto fixture = AssemblerFixture();
    auto result = fixture.assembler.exportBook(
        { wavChapter("a", 24000, 1, 1.0), wavChapter("b", 24000, 1, 1.0) }, OutputFormat::Wav, 192, "Book", "Author");
    REQUIRE(result.has_value());
    CHECK(result->container == ContainerFormat::Wav);
    CHECK(result->bytes.size() == 44 + 2 * 48000);
}
