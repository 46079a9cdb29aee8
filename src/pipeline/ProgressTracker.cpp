// SPDX-License-Identifier: Apache-2.0
#include "ProgressTracker.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace scribe
{

ProgressTracker::ProgressTracker(ProgressSink sink): _sink(std::move(sink))
{
}

void ProgressTracker::checkpoint(std::string_view stageName, int percent)
{
    auto lock = std::lock_guard(_mutex);
    publish(std::string(stageName), percent);
}

void ProgressTracker::beginDispatch(std::size_t totalChunks)
{
    auto lock = std::lock_guard(_mutex);
    _total = totalChunks;
    _completed = 0;
    publish(std::format("{} (0/{})", stage::Transcribing, _total), checkpoint::Segmented);
}

void ProgressTracker::chunkCompleted()
{
    auto lock = std::lock_guard(_mutex);
    _completed = std::min(_completed + 1, _total);
    publish(std::format("{} ({}/{})", stage::Transcribing, _completed, _total),
            dispatchPercent(_completed, _total));
}

auto ProgressTracker::percent() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _percent;
}

auto ProgressTracker::stageName() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _stage;
}

auto ProgressTracker::completedChunks() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _completed;
}

auto ProgressTracker::dispatchPercent(std::size_t completed, std::size_t total) -> int
{
    if (total == 0)
        return checkpoint::Segmented;

    auto const span = checkpoint::Finalizing - checkpoint::Segmented;
    auto const done = std::min(completed, total);
    return checkpoint::Segmented + static_cast<int>((static_cast<std::size_t>(span) * done) / total);
}

// Called with _mutex held, so sink invocations are serialized and observe increasing values.
void ProgressTracker::publish(std::string stageName, int percent)
{
    _percent = std::clamp(std::max(_percent, percent), 0, checkpoint::ActiveCeiling);
    _stage = std::move(stageName);

    log::trace("Progress: {} ({}%)", _stage, _percent);

    if (_sink)
        _sink(_stage, _percent);
}

} // namespace scribe
