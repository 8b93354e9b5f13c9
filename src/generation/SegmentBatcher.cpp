// SPDX-License-Identifier: Apache-2.0
#include "SegmentBatcher.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace narrator
{

SegmentBatcher::SegmentBatcher(std::shared_ptr<SegmentStore> store,
                               std::string scopeId,
                               std::string chapterId,
                               std::size_t batchSize,
                               ReadyCallback onSegmentReady):
    _store(std::move(store)),
    _scopeId(std::move(scopeId)),
    _chapterId(std::move(chapterId)),
    _batchSize(std::max<std::size_t>(1, batchSize)),
    _onSegmentReady(std::move(onSegmentReady))
{
}

void SegmentBatcher::addSegment(AudioSegment segment)
{
    _buffer.push_back(segment);

    if (_buffer.size() >= _batchSize)
    {
        // Masked here; the chapter snapshot save persists the dropped batch again.
        if (auto flushed = flush(); !flushed)
            log::warning("Continuing after failed segment batch: {}", flushed.error().message);
    }

    if (_onSegmentReady)
        _onSegmentReady(segment);
}

auto SegmentBatcher::flush() -> VoidResult
{
    if (_buffer.empty())
        return {};

    auto batch = std::vector<AudioSegment> {};
    batch.swap(_buffer);

    if (!_store)
        return {};

    auto stored = _store->putSegments(_scopeId, _chapterId, batch);
    if (!stored)
    {
        log::error("Failed to persist {} segment(s) of chapter {}: {}", batch.size(), _chapterId, stored.error().message);
        return makeError(ErrorCode::PersistenceError,
                         std::format("Failed to persist segments of chapter {}: {}", _chapterId, stored.error().message));
    }

    log::debug("Persisted {} segment(s) of chapter {}", batch.size(), _chapterId);
    return {};
}

} // namespace narrator
