// SPDX-License-Identifier: Apache-2.0
#include "FileSegmentStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <map>

namespace narrator
{

namespace fs = std::filesystem;

namespace
{

    constexpr auto SegmentManifest = std::string_view { "segments.json" };
    constexpr auto AudioManifest = std::string_view { "audio.json" };

    auto segmentFileName(int index, ContainerFormat container) -> std::string
    {
        return std::format("segment-{:05}.{}", index, containerExtension(container));
    }

    auto readBytes(const fs::path& path) -> Result<Bytes>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));
        return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    /// @brief Writes to a sibling temporary file and renames it over the target.
    auto writeAtomically(const fs::path& path, std::span<const std::uint8_t> data) -> VoidResult
    {
        auto temporary = path;
        temporary += ".tmp";
        {
            auto file = std::ofstream(temporary, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
                return makeError(ErrorCode::PersistenceError, std::format("Cannot write {}", temporary.string()));
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!file)
                return makeError(ErrorCode::PersistenceError, std::format("Short write to {}", temporary.string()));
        }

        auto ec = std::error_code {};
        fs::rename(temporary, path, ec);
        if (ec)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Cannot replace {}: {}", path.string(), ec.message()));
        return {};
    }

    auto writeJson(const fs::path& path, const nlohmann::json& document) -> VoidResult
    {
        auto const text = document.dump(2);
        return writeAtomically(path, std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    }

    auto readJson(const fs::path& path) -> Result<nlohmann::json>
    {
        auto bytes = readBytes(path);
        if (!bytes)
            return std::unexpected(bytes.error());
        auto const text = std::string_view(reinterpret_cast<const char*>(bytes->data()), bytes->size());
        return json::parse(text, ErrorCode::PersistenceError);
    }

    auto durationSourceName(DurationSource source) -> std::string_view
    {
        return source == DurationSource::Exact ? "exact" : "estimated";
    }

    auto manifestEntry(const AudioSegment& segment, const std::string& fileName) -> nlohmann::json
    {
        return nlohmann::json {
            { "id", segment.id },
            { "chapterId", segment.chapterId },
            { "index", segment.index },
            { "text", segment.text },
            { "file", fileName },
            { "duration", segment.duration },
            { "durationSource", durationSourceName(segment.durationSource) },
            { "startTime", segment.startTime },
        };
    }

    auto isFile(const fs::path& path) -> bool
    {
        auto ec = std::error_code {};
        return fs::is_regular_file(path, ec);
    }

    /// @brief Reads the entry list of a segment manifest; a missing manifest yields an empty list.
    auto readManifestEntries(const fs::path& manifestPath) -> Result<nlohmann::json>
    {
        if (!isFile(manifestPath))
            return nlohmann::json::array();

        auto manifest = readJson(manifestPath);
        if (!manifest)
            return std::unexpected(manifest.error());
        if (!manifest->is_object() || !manifest->contains("segments") || !(*manifest)["segments"].is_array())
            return makeError(ErrorCode::PersistenceError, std::format("Malformed manifest {}", manifestPath.string()));
        return std::move((*manifest)["segments"]);
    }

    auto ensureDirectory(const fs::path& directory) -> VoidResult
    {
        auto ec = std::error_code {};
        fs::create_directories(directory, ec);
        if (ec)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Failed to create directory '{}': {}", directory.string(), ec.message()));
        return {};
    }

} // namespace

auto storagePathComponent(std::string_view id) -> std::string
{
    auto component = std::string {};
    component.reserve(id.size());
    for (auto const ch: id)
    {
        auto const safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
                          || ch == '-' || ch == '_' || ch == '.';
        component.push_back(safe ? ch : '_');
    }
    if (component.empty() || component == "." || component == "..")
        component.insert(0, "_");
    return component;
}

FileSegmentStore::FileSegmentStore(fs::path root): _root(std::move(root))
{
}

auto FileSegmentStore::chapterDirectory(std::string_view scopeId, std::string_view chapterId) const -> fs::path
{
    return _root / storagePathComponent(scopeId) / storagePathComponent(chapterId);
}

auto FileSegmentStore::readSegments(const fs::path& directory) -> Result<std::vector<AudioSegment>>
{
    auto const manifestPath = directory / SegmentManifest;
    auto entries = readManifestEntries(manifestPath);
    if (!entries)
        return std::unexpected(entries.error());

    auto segments = std::vector<AudioSegment> {};
    for (auto const& entry: *entries)
    {
        auto file = json::getString(entry, "file");
        if (!file)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Malformed manifest {}: {}", manifestPath.string(), file.error().message));

        auto bytes = readBytes(directory / *file);
        if (!bytes)
            return makeError(ErrorCode::PersistenceError, bytes.error().message);

        segments.push_back(AudioSegment {
            .id = json::getStringOr(entry, "id", ""),
            .chapterId = json::getStringOr(entry, "chapterId", ""),
            .index = json::getIntOr(entry, "index", 0),
            .text = json::getStringOr(entry, "text", ""),
            .audio = EncodedAudio::detect(std::move(*bytes)),
            .duration = json::getDoubleOr(entry, "duration", 0.0),
            .durationSource = json::getStringOr(entry, "durationSource", "exact") == "estimated"
                                  ? DurationSource::Estimated
                                  : DurationSource::Exact,
            .startTime = json::getDoubleOr(entry, "startTime", 0.0),
        });
    }

    std::ranges::sort(segments, {}, &AudioSegment::index);
    return segments;
}

auto FileSegmentStore::putSegments(std::string_view scopeId,
                                   std::string_view chapterId,
                                   std::span<const AudioSegment> segments) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto const directory = chapterDirectory(scopeId, chapterId);
    if (auto created = ensureDirectory(directory); !created)
        return created;

    auto existing = readManifestEntries(directory / SegmentManifest);
    if (!existing)
        return std::unexpected(existing.error());

    auto byIndex = std::map<int, nlohmann::json> {};
    for (auto& entry: *existing)
        byIndex[json::getIntOr(entry, "index", 0)] = std::move(entry);

    for (auto const& segment: segments)
    {
        auto const fileName = segmentFileName(segment.index, segment.audio.container);
        if (auto written = writeAtomically(directory / fileName, segment.audio.bytes); !written)
            return written;
        byIndex[segment.index] = manifestEntry(segment, fileName);
    }

    auto entries = nlohmann::json::array();
    for (auto& [index, entry]: byIndex)
        entries.push_back(std::move(entry));

    log::trace("Persisting {} segment(s) to {} ({} total)", segments.size(), directory.string(), entries.size());
    return writeJson(directory / SegmentManifest, nlohmann::json { { "segments", std::move(entries) } });
}

auto FileSegmentStore::getSegments(std::string_view scopeId, std::string_view chapterId)
    -> Result<std::vector<AudioSegment>>
{
    auto lock = std::lock_guard(_mutex);
    return readSegments(chapterDirectory(scopeId, chapterId));
}

auto FileSegmentStore::putAssembledAudio(std::string_view scopeId,
                                         std::string_view chapterId,
                                         const EncodedAudio& audio,
                                         const ChapterAudioMetadata& metadata) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto const directory = chapterDirectory(scopeId, chapterId);
    if (auto created = ensureDirectory(directory); !created)
        return created;

    auto const fileName = std::format("chapter.{}", containerExtension(audio.container));
    if (auto written = writeAtomically(directory / fileName, audio.bytes); !written)
        return written;

    return writeJson(directory / AudioManifest,
                     nlohmann::json {
                         { "file", fileName },
                         { "mimeType", containerName(audio.container) },
                         { "title", metadata.title },
                         { "duration", metadata.duration },
                         { "segmentCount", metadata.segmentCount },
                         { "strategy", metadata.strategy },
                     });
}

auto FileSegmentStore::getAssembledAudio(std::string_view scopeId, std::string_view chapterId)
    -> Result<std::optional<StoredChapterAudio>>
{
    auto lock = std::lock_guard(_mutex);
    auto const directory = chapterDirectory(scopeId, chapterId);
    auto const manifestPath = directory / AudioManifest;
    if (!isFile(manifestPath))
        return std::optional<StoredChapterAudio> {};

    auto manifest = readJson(manifestPath);
    if (!manifest)
        return std::unexpected(manifest.error());

    auto file = json::getString(*manifest, "file");
    if (!file)
        return makeError(ErrorCode::PersistenceError,
                         std::format("Malformed manifest {}: {}", manifestPath.string(), file.error().message));

    auto bytes = readBytes(directory / *file);
    if (!bytes)
        return makeError(ErrorCode::PersistenceError, bytes.error().message);

    return std::optional(StoredChapterAudio {
        .audio = EncodedAudio::detect(std::move(*bytes)),
        .metadata =
            ChapterAudioMetadata {
                .title = json::getStringOr(*manifest, "title", ""),
                .duration = json::getDoubleOr(*manifest, "duration", 0.0),
                .segmentCount = json::getIntOr(*manifest, "segmentCount", 0),
                .strategy = json::getStringOr(*manifest, "strategy", ""),
            },
    });
}

} // namespace narrator
