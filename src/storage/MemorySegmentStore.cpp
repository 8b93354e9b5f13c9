// SPDX-License-Identifier: Apache-2.0
#include "MemorySegmentStore.hpp"

namespace narrator
{

auto MemorySegmentStore::putSegments(std::string_view scopeId,
                                     std::string_view chapterId,
                                     std::span<const AudioSegment> segments) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    auto& chapter = _segments[Key { scopeId, chapterId }];
    for (auto const& segment: segments)
        chapter.insert_or_assign(segment.index, segment);
    ++_putCount;
    return {};
}

auto MemorySegmentStore::getSegments(std::string_view scopeId, std::string_view chapterId)
    -> Result<std::vector<AudioSegment>>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<AudioSegment> {};
    auto const it = _segments.find(Key { scopeId, chapterId });
    if (it == _segments.end())
        return result;

    result.reserve(it->second.size());
    for (auto const& [index, segment]: it->second)
        result.push_back(segment);
    return result;
}

auto MemorySegmentStore::putAssembledAudio(std::string_view scopeId,
                                           std::string_view chapterId,
                                           const EncodedAudio& audio,
                                           const ChapterAudioMetadata& metadata) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    _audio.insert_or_assign(Key { scopeId, chapterId }, StoredChapterAudio { .audio = audio, .metadata = metadata });
    return {};
}

auto MemorySegmentStore::getAssembledAudio(std::string_view scopeId, std::string_view chapterId)
    -> Result<std::optional<StoredChapterAudio>>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _audio.find(Key { scopeId, chapterId });
    if (it == _audio.end())
        return std::optional<StoredChapterAudio> {};
    return std::optional(it->second);
}

auto MemorySegmentStore::putCount() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _putCount;
}

} // namespace narrator
