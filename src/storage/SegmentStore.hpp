// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace narrator
{

/// @brief Descriptive data stored alongside a chapter's assembled audio.
struct ChapterAudioMetadata
{
    std::string title;
    double duration = 0.0;
    int segmentCount = 0;

    /// Name of the assembly strategy that produced the audio.
    std::string strategy;
};

/// @brief Assembled chapter audio as read back from a store.
struct StoredChapterAudio
{
    EncodedAudio audio;
    ChapterAudioMetadata metadata;
};

/// @brief Keyed persistence for generated segments and assembled chapter audio.
///
/// Every write is an upsert keyed by (scope, chapter, segment index), so repeating a write
/// is harmless.
class SegmentStore
{
  public:
    virtual ~SegmentStore() = default;

    [[nodiscard]] virtual auto putSegments(std::string_view scopeId,
                                           std::string_view chapterId,
                                           std::span<const AudioSegment> segments) -> VoidResult = 0;

    /// @brief Returns the stored segments of a chapter sorted by index; empty if none.
    [[nodiscard]] virtual auto getSegments(std::string_view scopeId, std::string_view chapterId)
        -> Result<std::vector<AudioSegment>> = 0;

    [[nodiscard]] virtual auto putAssembledAudio(std::string_view scopeId,
                                                 std::string_view chapterId,
                                                 const EncodedAudio& audio,
                                                 const ChapterAudioMetadata& metadata) -> VoidResult = 0;

    /// @brief Returns the chapter's assembled audio, or std::nullopt if none was stored.
    [[nodiscard]] virtual auto getAssembledAudio(std::string_view scopeId, std::string_view chapterId)
        -> Result<std::optional<StoredChapterAudio>> = 0;
};

} // namespace narrator
