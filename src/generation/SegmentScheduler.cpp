// SPDX-License-Identifier: Apache-2.0
#include "SegmentScheduler.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <map>
#include <system_error>
#include <utility>
#include <vector>

namespace narrator
{

void PriorityChannel::request(int index)
{
    auto lock = std::lock_guard(_mutex);
    _pending = index;
}

auto PriorityChannel::take() -> std::optional<int>
{
    auto lock = std::lock_guard(_mutex);
    return std::exchange(_pending, std::nullopt);
}

auto PriorityChannel::pending() const -> std::optional<int>
{
    auto lock = std::lock_guard(_mutex);
    return _pending;
}

void PriorityChannel::clear()
{
    auto lock = std::lock_guard(_mutex);
    _pending.reset();
}

SegmentScheduler::SegmentScheduler(SchedulerHooks hooks): _hooks(std::move(hooks))
{
}

auto SegmentScheduler::run(std::span<const TextSegment> segments, PriorityChannel& priority, std::stop_token stopToken)
    -> RunReport
{
    auto report = RunReport { .total = static_cast<int>(segments.size()) };
    auto const total = report.total;
    if (total == 0)
        return report;

    // The cursor walks positions in `segments`; reports and priority requests use segment indices.
    auto positionOf = std::map<int, int> {};
    for (auto position = 0; position < total; ++position)
        positionOf.emplace(segments[position].index, position);

    auto done = std::vector<bool>(segments.size(), false);
    auto attempted = 0;
    auto const settle = [&](int position, std::set<int>& outcome) {
        outcome.insert(segments[position].index);
        done[position] = true;
        ++attempted;
    };

    auto cursor = 0;

    while (attempted < total)
    {
        if (stopToken.stop_requested())
        {
            report.cancelled = true;
            break;
        }

        auto const parallelism = std::max(1, _hooks.parallelism ? _hooks.parallelism() : 1);
        auto batch = std::vector<int> {};
        auto const inBatch = [&](int position) {
            return std::ranges::find(batch, position) != batch.end();
        };

        while (static_cast<int>(batch.size()) < parallelism && attempted + static_cast<int>(batch.size()) < total)
        {
            if (auto const requested = priority.take())
            {
                auto const it = positionOf.find(*requested);
                if (it != positionOf.end() && !done[it->second] && !inBatch(it->second))
                {
                    log::debug("Priority request moves generation to segment {}", *requested);
                    batch.push_back(it->second);
                    cursor = (it->second + 1) % total;
                }
                else
                    log::debug("Dropping priority request for segment {} (done or unknown)", *requested);
                continue;
            }

            auto found = false;
            for (auto checked = 0; checked < total; ++checked)
            {
                auto const candidate = cursor;
                cursor = (cursor + 1) % total;
                if (!done[candidate] && !inBatch(candidate))
                {
                    batch.push_back(candidate);
                    found = true;
                    break;
                }
            }
            if (!found)
                break;
        }

        if (batch.empty())
            break;

        auto pending = std::vector<std::pair<int, std::future<Result<std::optional<AudioSegment>>>>> {};
        for (auto const position: batch)
        {
            try
            {
                pending.emplace_back(position,
                                     std::async(std::launch::async,
                                                [this, segment = &segments[position], stopToken] {
                                                    return _hooks.process(*segment, stopToken);
                                                }));
            }
            catch (const std::system_error& e)
            {
                log::error("Cannot start synthesis of segment {}: {}", segments[position].index, e.what());
                settle(position, report.failed);
            }
        }

        auto sawCancellation = false;
        for (auto& [position, future]: pending)
        {
            auto const index = segments[position].index;
            auto result = Result<std::optional<AudioSegment>> {};
            try
            {
                result = future.get();
            }
            catch (const std::exception& e)
            {
                result = makeError(ErrorCode::SynthesisError, e.what());
            }

            if (!result)
            {
                if (isCancellation(result.error()))
                {
                    sawCancellation = true;
                    continue;
                }
                log::warning("Segment {} failed: {}", index, result.error().message);
                settle(position, report.failed);
                continue;
            }

            if (!*result)
            {
                settle(position, report.processed);
                continue;
            }

            auto handled = _hooks.onResult ? _hooks.onResult(std::move(**result)) : VoidResult {};
            if (!handled)
            {
                log::warning("Segment {} could not be handled: {}", index, handled.error().message);
                settle(position, report.failed);
                continue;
            }
            settle(position, report.processed);
        }

        if (_hooks.onProgress)
            _hooks.onProgress(attempted, total);

        if (sawCancellation)
        {
            report.cancelled = true;
            break;
        }
    }

    if (!report.failed.empty())
        log::warning("Generation finished with {} failed segment(s) of {}", report.failed.size(), total);

    return report;
}

} // namespace narrator
