// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <storage/SegmentStore.hpp>

#include <filesystem>
#include <mutex>

namespace narrator
{

/// @brief Directory-backed store.
///
/// Layout: `<root>/<scope>/<chapter>/segments.json` with one `segment-NNNNN.<ext>` blob per
/// segment, plus `audio.json` and `chapter.<ext>` for the assembled chapter audio. Manifests
/// are replaced atomically via rename, so a reader never observes a half-written manifest.
class FileSegmentStore: public SegmentStore
{
  public:
    explicit FileSegmentStore(std::filesystem::path root);

    [[nodiscard]] auto putSegments(std::string_view scopeId,
                                   std::string_view chapterId,
                                   std::span<const AudioSegment> segments) -> VoidResult override;

    [[nodiscard]] auto getSegments(std::string_view scopeId, std::string_view chapterId)
        -> Result<std::vector<AudioSegment>> override;

    [[nodiscard]] auto putAssembledAudio(std::string_view scopeId,
                                         std::string_view chapterId,
                                         const EncodedAudio& audio,
                                         const ChapterAudioMetadata& metadata) -> VoidResult override;

    [[nodiscard]] auto getAssembledAudio(std::string_view scopeId, std::string_view chapterId)
        -> Result<std::optional<StoredChapterAudio>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return _root; }

  private:
    [[nodiscard]] auto chapterDirectory(std::string_view scopeId, std::string_view chapterId) const
        -> std::filesystem::path;

    [[nodiscard]] auto readSegments(const std::filesystem::path& directory) -> Result<std::vector<AudioSegment>>;

    std::filesystem::path _root;
    std::mutex _mutex;
};

/// @brief Maps an identifier onto a single safe path component.
[[nodiscard]] auto storagePathComponent(std::string_view id) -> std::string;

} // namespace narrator
