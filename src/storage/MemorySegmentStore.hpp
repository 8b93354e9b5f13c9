// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <storage/SegmentStore.hpp>

#include <map>
#include <mutex>
#include <utility>

namespace narrator
{

/// @brief Process-local store, used for dry runs and tests.
class MemorySegmentStore: public SegmentStore
{
  public:
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

    /// @brief Number of putSegments() calls so far.
    [[nodiscard]] auto putCount() const -> int;

  private:
    using Key = std::pair<std::string, std::string>;

    mutable std::mutex _mutex;
    std::map<Key, std::map<int, AudioSegment>> _segments;
    std::map<Key, StoredChapterAudio> _audio;
    int _putCount = 0;
};

} // namespace narrator
