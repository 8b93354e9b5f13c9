// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <storage/SegmentStore.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace narrator
{

/// @brief Buffers generated segments and persists them in bounded batches.
///
/// Each segment is reported as ready when it is added, before it is durably stored. A failed
/// intermediate flush is logged and its buffer dropped; the caller's final snapshot save of the
/// whole chapter re-persists every segment, which is safe because the store upserts.
/// Not thread-safe: only the scheduler thread calls into it.
class SegmentBatcher
{
  public:
    using ReadyCallback = std::function<void(const AudioSegment&)>;

    static constexpr auto DefaultBatchSize = std::size_t { 10 };

    /// @param store Destination; may be null, in which case flushes only clear the buffer.
    SegmentBatcher(std::shared_ptr<SegmentStore> store,
                   std::string scopeId,
                   std::string chapterId,
                   std::size_t batchSize = DefaultBatchSize,
                   ReadyCallback onSegmentReady = {});

    void addSegment(AudioSegment segment);

    /// @brief Persists buffered segments.
    /// @return PersistenceError if the store rejected the batch; the buffer is cleared either way.
    [[nodiscard]] auto flush() -> VoidResult;

    [[nodiscard]] auto pendingCount() const -> std::size_t { return _buffer.size(); }

    [[nodiscard]] auto batchSize() const -> std::size_t { return _batchSize; }

  private:
    std::shared_ptr<SegmentStore> _store;
    std::string _scopeId;
    std::string _chapterId;
    std::size_t _batchSize;
    ReadyCallback _onSegmentReady;
    std::vector<AudioSegment> _buffer;
};

} // namespace narrator
