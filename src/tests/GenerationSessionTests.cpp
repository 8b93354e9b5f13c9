// SPDX-License-Identifier: Apache-2.0
#include <generation/GenerationSession.hpp>

#include "TestDoubles.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace narrator;
using namespace narrator::test;

namespace
{

auto makeChapter(std::string id, std::vector<std::string> texts) -> ChapterInput
{
    auto chapter = ChapterInput { .id = id, .title = "Title of " + id, .segments = {} };
    for (auto i = 0; i < static_cast<int>(texts.size()); ++i)
        chapter.segments.push_back(
            TextSegment { .index = i, .text = std::move(texts[i]), .id = std::format("{}-s{}", id, i) });
    return chapter;
}

struct SessionFixture
{
    std::shared_ptr<FakeSynthesizer> synthesizer = std::make_shared<FakeSynthesizer>();
    std::shared_ptr<LazyHandle<SynthesisBackend>> handle = std::make_shared<LazyHandle<SynthesisBackend>>(
        [s = synthesizer]() -> Result<std::shared_ptr<SynthesisBackend>> { return s; });
    std::shared_ptr<FlakySegmentStore> store = std::make_shared<FlakySegmentStore>();
    std::shared_ptr<FakeTranscoder> transcoder = std::make_shared<FakeTranscoder>();
    std::shared_ptr<AudioAssembler> assembler = std::make_shared<AudioAssembler>(
        std::make_shared<FakeDecodeBackend>(),
        std::make_shared<LazyHandle<Transcoder>>([t = transcoder]() -> Result<std::shared_ptr<Transcoder>> { return t; }));
    GenerationCallbacks callbacks;
    std::unique_ptr<GenerationSession> session;

    void start(int parallelism = 1, std::size_t persistBatchSize = 10)
    {
        session = std::make_unique<GenerationSession>(handle,
                                                      store,
                                                      assembler,
                                                      GenerationSessionConfig {
                                                          .scopeId = "book",
                                                          .voice = {},
                                                          .parallelism = parallelism,
                                                          .persistBatchSize = persistBatchSize,
                                                      },
                                                      callbacks);
    }
};

} // namespace

TEST_CASE("GenerationSession generates and assembles chapters in order", "[session]")
{
    auto fixture = SessionFixture {};
    auto ready = 0;
    auto finished = std::vector<std::string> {};
    fixture.callbacks.onSegmentReady = [&](const AudioSegment&) { ++ready; };
    fixture.callbacks.onChapterFinished = [&](const ChapterOutcome& outcome) { finished.push_back(outcome.chapterId); };
    fixture.start();

    auto const chapters = std::vector {
        makeChapter("ch1", { "One.", "Two words.", "Now three words." }),
        makeChapter("ch2", { "Single." }),
    };

    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    REQUIRE(outcomes->size() == 2);
    CHECK((*outcomes)[0].status == ChapterStatus::Done);
    CHECK((*outcomes)[0].duration == Catch::Approx(0.6));
    CHECK((*outcomes)[1].status == ChapterStatus::Done);
    CHECK(ready == 4);
    CHECK(finished == std::vector<std::string> { "ch1", "ch2" });
    CHECK(fixture.session->chapterStatus("ch1") == ChapterStatus::Done);
    CHECK(!fixture.session->isRunning());

    auto segments = fixture.store->getSegments("book", "ch1");
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 3);
    CHECK((*segments)[1].startTime == Catch::Approx(0.1));
    CHECK((*segments)[2].startTime == Catch::Approx(0.3));
    CHECK((*segments)[2].durationSource == DurationSource::Exact);

    auto audio = fixture.store->getAssembledAudio("book", "ch1");
    REQUIRE(audio.has_value());
    REQUIRE(audio->has_value());
    CHECK((*audio)->metadata.strategy == "raw-splice");
    CHECK((*audio)->metadata.segmentCount == 3);
    CHECK((*audio)->metadata.title == "Title of ch1");
    CHECK((*audio)->audio.bytes.size() == 44 + 9600 * 2);

    auto single = fixture.store->getAssembledAudio("book", "ch2");
    REQUIRE(single.has_value());
    REQUIRE(single->has_value());
    CHECK((*single)->metadata.strategy == "single-chapter-identity");
}

TEST_CASE("GenerationSession reports partial chapters", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start(2);

    auto const chapters = std::vector { makeChapter("ch1", { "Fine.", "FAIL here.", "Also fine." }) };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    REQUIRE(outcomes->size() == 1);

    auto const& outcome = outcomes->front();
    CHECK(outcome.status == ChapterStatus::Partial);
    CHECK(outcome.failedIndices == std::set<int> { 1 });
    CHECK(outcome.message == "1 of 3 segments failed");
    CHECK(outcome.duration == Catch::Approx(0.3));

    auto segments = fixture.store->getSegments("book", "ch1");
    REQUIRE(segments.has_value());
    CHECK(segments->size() == 2);
}

TEST_CASE("GenerationSession marks a chapter without audio as failed", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    SECTION("every segment fails")
    {
        auto const chapters = std::vector { makeChapter("ch1", { "FAIL.", "FAIL again." }) };
        auto outcomes = fixture.session->generateChapters(chapters);
        REQUIRE(outcomes.has_value());
        CHECK(outcomes->front().status == ChapterStatus::Error);
        CHECK(outcomes->front().failedIndices.size() == 2);
        CHECK(fixture.session->chapterStatus("ch1") == ChapterStatus::Error);
    }

    SECTION("chapter text is blank")
    {
        auto const chapters = std::vector { makeChapter("ch1", { "  ", "\n" }) };
        auto outcomes = fixture.session->generateChapters(chapters);
        REQUIRE(outcomes.has_value());
        CHECK(outcomes->front().status == ChapterStatus::Error);
        CHECK(outcomes->front().message == "Chapter content is empty");
        CHECK(fixture.synthesizer->calls() == 0);
    }
}

TEST_CASE("GenerationSession skips blank segments", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto const chapters = std::vector { makeChapter("ch1", { "First.", "   ", "Third." }) };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    CHECK(outcomes->front().status == ChapterStatus::Done);
    CHECK(fixture.synthesizer->calls() == 2);

    auto segments = fixture.store->getSegments("book", "ch1");
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 2);
    CHECK((*segments)[1].index == 2);
}

TEST_CASE("GenerationSession starts at the requested segment", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto const chapter = makeChapter("ch1", { "s0", "s1", "s2", "s3", "s4" });
    auto outcome = fixture.session->generateChapterFromSegment(chapter, 3);
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == ChapterStatus::Done);
    CHECK(fixture.synthesizer->texts == std::vector<std::string> { "s3", "s4", "s0", "s1", "s2" });
}

TEST_CASE("GenerationSession honours a priority request while running", "[session]")
{
    auto fixture = SessionFixture {};
    auto accepted = false;
    fixture.callbacks.onSegmentReady = [&](const AudioSegment& segment) {
        if (segment.index == 0)
            accepted = fixture.session->setGenerationPriority("ch1", 4);
    };
    fixture.start();

    CHECK(!fixture.session->setGenerationPriority("ch1", 2));

    auto const chapters = std::vector { makeChapter("ch1", { "s0", "s1", "s2", "s3", "s4" }) };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    CHECK(accepted);
    CHECK(fixture.synthesizer->texts == std::vector<std::string> { "s0", "s4", "s1", "s2", "s3" });
}

TEST_CASE("GenerationSession keeps a priority request for a queued chapter", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.callbacks.onSegmentReady = [&](const AudioSegment& segment) {
        if (segment.chapterId == "ch1" && segment.index == 0)
            fixture.session->setGenerationPriority("ch2", 2);
    };
    fixture.start();

    auto const chapters = std::vector {
        makeChapter("ch1", { "a", "b" }),
        makeChapter("ch2", { "c", "d", "e" }),
    };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    CHECK(fixture.synthesizer->texts == std::vector<std::string> { "a", "b", "e", "c", "d" });

    fixture.synthesizer->texts.clear();
    auto again = fixture.session->generateChapters(std::span(&chapters[1], 1));
    REQUIRE(again.has_value());
    CHECK(fixture.synthesizer->texts == std::vector<std::string> { "c", "d", "e" });
}

TEST_CASE("GenerationSession regenerates selected segments only", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto chapter = makeChapter("ch1", { "Alpha.", "Beta.", "Gamma." });
    auto first = fixture.session->generateChapters(std::span(&chapter, 1));
    REQUIRE(first.has_value());
    REQUIRE(fixture.synthesizer->calls() == 3);

    chapter.segments[1].text = "Beta, now longer.";
    auto const indices = std::vector { 1 };
    auto outcome = fixture.session->regenerateChapter(chapter, indices);
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == ChapterStatus::Done);
    CHECK(fixture.synthesizer->calls() == 4);
    CHECK(fixture.synthesizer->texts.back() == "Beta, now longer.");
    CHECK(outcome->duration == Catch::Approx(0.5));

    auto segments = fixture.store->getSegments("book", "ch1");
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 3);
    CHECK((*segments)[1].text == "Beta, now longer.");
    CHECK((*segments)[2].startTime == Catch::Approx(0.4));
}

TEST_CASE("GenerationSession drops stored segments the chapter no longer has", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto chapter = makeChapter("ch1", { "Alpha.", "Beta.", "Gamma.", "Delta.", "Epsilon." });
    auto first = fixture.session->generateChapters(std::span(&chapter, 1));
    REQUIRE(first.has_value());

    chapter.segments.resize(3);
    auto const indices = std::vector { 0 };
    auto outcome = fixture.session->regenerateChapter(chapter, indices);
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == ChapterStatus::Done);
    CHECK(outcome->duration == Catch::Approx(0.3));

    auto audio = fixture.store->getAssembledAudio("book", "ch1");
    REQUIRE(audio.has_value());
    REQUIRE(audio->has_value());
    CHECK((*audio)->metadata.segmentCount == 3);
    CHECK((*audio)->audio.bytes.size() == 44 + 3 * 3200);
}

TEST_CASE("GenerationSession rejects an empty regeneration", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto const chapter = makeChapter("ch1", { "Alpha." });
    auto outcome = fixture.session->regenerateChapter(chapter, {});
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("GenerationSession cancel stops the run and skips later chapters", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.callbacks.onSegmentReady = [&](const AudioSegment&) { fixture.session->cancel(); };
    fixture.start();

    auto const chapters = std::vector {
        makeChapter("ch1", { "a", "b", "c", "d" }),
        makeChapter("ch2", { "e", "f" }),
    };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    REQUIRE(outcomes->size() == 1);
    CHECK(outcomes->front().status == ChapterStatus::Cancelled);
    CHECK(fixture.session->chapterStatus("ch1") == ChapterStatus::Cancelled);
    CHECK(fixture.session->chapterStatus("ch2") == ChapterStatus::Pending);
    CHECK(fixture.synthesizer->calls() == 1);

    auto audio = fixture.store->getAssembledAudio("book", "ch1");
    REQUIRE(audio.has_value());
    CHECK(!audio->has_value());
}

TEST_CASE("GenerationSession cancelChapter stops only that chapter", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.callbacks.onSegmentReady = [&](const AudioSegment& segment) {
        if (segment.chapterId == "ch1")
            fixture.session->cancelChapter("ch1");
    };
    fixture.start();

    auto const chapters = std::vector {
        makeChapter("ch1", { "a", "b", "c" }),
        makeChapter("ch2", { "d", "e" }),
    };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    REQUIRE(outcomes->size() == 2);
    CHECK((*outcomes)[0].status == ChapterStatus::Cancelled);
    CHECK((*outcomes)[1].status == ChapterStatus::Done);
}

TEST_CASE("GenerationSession allows one generation at a time", "[session]")
{
    auto fixture = SessionFixture {};
    auto nested = std::optional<Error> {};
    auto runningInside = false;
    fixture.callbacks.onSegmentReady = [&](const AudioSegment&) {
        runningInside = fixture.session->isRunning();
        auto const other = std::vector { makeChapter("other", { "x" }) };
        auto result = fixture.session->generateChapters(other);
        if (!result)
            nested = result.error();
    };
    fixture.start();

    auto const chapters = std::vector { makeChapter("ch1", { "a" }) };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    CHECK(runningInside);
    REQUIRE(nested.has_value());
    CHECK(nested->code == ErrorCode::InvalidArgument);
    CHECK(!fixture.session->isRunning());
}

TEST_CASE("GenerationSession bounds concurrency by the parallelism setting", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.synthesizer->delay = std::chrono::milliseconds(20);
    fixture.start(3);

    CHECK(fixture.session->parallelism() == 3);
    fixture.session->setParallelism(0);
    CHECK(fixture.session->parallelism() == 1);
    fixture.session->setParallelism(3);

    auto const chapters = std::vector { makeChapter("ch1", { "a", "b", "c", "d", "e", "f" }) };
    auto outcomes = fixture.session->generateChapters(chapters);
    REQUIRE(outcomes.has_value());
    CHECK(outcomes->front().status == ChapterStatus::Done);
    CHECK(fixture.synthesizer->maxConcurrent <= 3);
}

TEST_CASE("GenerationSession persists segments in batches", "[session]")
{
    auto fixture = SessionFixture {};

    SECTION("batches plus the final snapshot")
    {
        fixture.start(1, 2);
        auto const chapters = std::vector { makeChapter("ch1", { "a", "b", "c", "d", "e" }) };
        auto outcomes = fixture.session->generateChapters(chapters);
        REQUIRE(outcomes.has_value());
        // Two full batches, the remainder, then the whole chapter.
        CHECK(fixture.store->attempts == 4);
    }

    SECTION("a failed batch is repaired by the snapshot")
    {
        fixture.store->failNextPuts = 1;
        fixture.start(1, 1);
        auto const chapters = std::vector { makeChapter("ch1", { "a", "b" }) };
        auto outcomes = fixture.session->generateChapters(chapters);
        REQUIRE(outcomes.has_value());
        CHECK(outcomes->front().status == ChapterStatus::Done);

        auto segments = fixture.store->getSegments("book", "ch1");
        REQUIRE(segments.has_value());
        CHECK(segments->size() == 2);
    }

    SECTION("a failed snapshot fails the chapter")
    {
        fixture.store->failNextPuts = 100;
        fixture.start();
        auto const chapters = std::vector { makeChapter("ch1", { "a", "b" }) };
        auto outcomes = fixture.session->generateChapters(chapters);
        REQUIRE(outcomes.has_value());
        CHECK(outcomes->front().status == ChapterStatus::Error);
        CHECK(outcomes->front().message.starts_with("Failed to save segments"));
    }
}

TEST_CASE("GenerationSession exports stored chapters as one book", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.start();

    auto const chapters = std::vector {
        makeChapter("ch1", { "One.", "Two words." }),
        makeChapter("ch2", { "Three." }),
    };
    REQUIRE(fixture.session->generateChapters(chapters).has_value());

    SECTION("wav")
    {
        auto const ids = std::vector<std::string> { "ch1", "ch2" };
        auto book = fixture.session->exportAudio(ids, OutputFormat::Wav, 192, "Book", "Author");
        REQUIRE(book.has_value());
        CHECK(book->container == ContainerFormat::Wav);
        CHECK(book->bytes.size() == 44 + (4800 + 1600) * 2);
    }

    SECTION("m4b goes through the transcoder")
    {
        auto const ids = std::vector<std::string> { "ch1", "ch2" };
        auto book = fixture.session->exportAudio(ids, OutputFormat::M4b, 64, "Book", "Author");
        REQUIRE(book.has_value());
        CHECK(book->container == ContainerFormat::Mp4);
        REQUIRE(fixture.transcoder->lastRequest.chapters.size() == 2);
        CHECK(fixture.transcoder->lastRequest.chapters[0].title == "Title of ch1");
        CHECK(fixture.transcoder->lastRequest.chapters[1].startMs == 300);
    }

    SECTION("missing chapter")
    {
        auto const ids = std::vector<std::string> { "ch1", "nope" };
        auto book = fixture.session->exportAudio(ids, OutputFormat::Wav, 192, "Book", "Author");
        REQUIRE(!book.has_value());
        CHECK(book.error().code == ErrorCode::InvalidArgument);
    }
}
