// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <stop_token>

namespace narrator
{

/// @brief One-shot "generate this index next" request for a running chapter.
///
/// Holds at most one pending index: a new request replaces an unconsumed one.
class PriorityChannel
{
  public:
    void request(int index);

    /// @brief Removes and returns the pending index, if any.
    [[nodiscard]] auto take() -> std::optional<int>;

    [[nodiscard]] auto pending() const -> std::optional<int>;

    void clear();

  private:
    mutable std::mutex _mutex;
    std::optional<int> _pending;
};

/// @brief Outcome of one scheduler run over a chapter's segments.
///
/// `processed` and `failed` hold TextSegment::index values, which are unique within a chapter.
struct RunReport
{
    int total = 0;
    std::set<int> processed;
    std::set<int> failed;
    bool cancelled = false;

    /// @brief Every index has been attempted exactly once.
    [[nodiscard]] auto complete() const -> bool
    {
        return static_cast<int>(processed.size() + failed.size()) == total;
    }
};

/// @brief Callbacks driving a scheduler run.
struct SchedulerHooks
{
    /// Current fan-out; read again before every batch. Values below 1 count as 1.
    std::function<int()> parallelism;

    /// Synthesizes one segment. Runs on a worker thread, up to parallelism at a time.
    /// A value of std::nullopt means "nothing to do" and counts as processed.
    std::function<Result<std::optional<AudioSegment>>(const TextSegment&, std::stop_token)> process;

    /// Receives each produced segment on the scheduler thread. A failure marks the index failed.
    std::function<VoidResult(AudioSegment)> onResult;

    /// Called after every batch with (processed + failed, total).
    std::function<void(int completed, int total)> onProgress;
};

/// @brief Batch-by-batch driver that submits a chapter's segments for synthesis.
///
/// Walks a circular cursor over the positions of `segments`, so indices need not be dense.
/// Each batch holds up to `parallelism` segments, starting with a pending priority request
/// (by segment index) if it is still eligible. Items of a batch run
/// concurrently; the run waits for all of them before forming the next batch. Failed items
/// are never retried within the run. Stop requests are honored between batches.
class SegmentScheduler
{
  public:
    explicit SegmentScheduler(SchedulerHooks hooks);

    /// @brief Runs until every index is processed or failed, or the stop token fires.
    [[nodiscard]] auto run(std::span<const TextSegment> segments,
                           PriorityChannel& priority,
                           std::stop_token stopToken) -> RunReport;

  private:
    SchedulerHooks _hooks;
};

} // namespace narrator
