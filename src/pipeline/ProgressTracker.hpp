// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace scribe
{

/// @brief Receives (stage, percent) updates from a running pipeline.
using ProgressSink = std::function<void(std::string_view stage, int percent)>;

/// @brief Human-readable stage names reported to callers.
namespace stage
{
    inline constexpr auto Queued = std::string_view { "Queued" };
    inline constexpr auto Starting = std::string_view { "Starting" };
    inline constexpr auto Normalizing = std::string_view { "Normalizing audio" };
    inline constexpr auto Segmenting = std::string_view { "Segmenting audio" };
    inline constexpr auto Transcribing = std::string_view { "Transcribing" };
    inline constexpr auto Finalizing = std::string_view { "Finalizing" };
    inline constexpr auto Completed = std::string_view { "Completed" };
    inline constexpr auto Failed = std::string_view { "Failed" };
} // namespace stage

/// @brief Fixed percentage checkpoints of the pipeline.
namespace checkpoint
{
    inline constexpr auto Starting = 5;
    inline constexpr auto Normalized = 10;
    inline constexpr auto Segmented = 20;
    inline constexpr auto Finalizing = 95;
    inline constexpr auto Complete = 100;

    /// @brief Highest value reported while a job is still active.
    inline constexpr auto ActiveCeiling = 99;
} // namespace checkpoint

/// @brief Maps pipeline events onto a single monotonic (stage, percent) pair.
///
/// During dispatch the percentage is interpolated linearly between checkpoint::Segmented
/// and checkpoint::Finalizing by completed/total chunks. The reported percentage never
/// decreases and never reaches 100; only the job's terminal transition reports 100.
/// All members are safe to call from concurrent workers.
class ProgressTracker
{
  public:
    explicit ProgressTracker(ProgressSink sink);

    /// @brief Reports a fixed checkpoint. Values below the current percentage only update the stage.
    void checkpoint(std::string_view stageName, int percent);

    /// @brief Starts the dispatch phase for @p totalChunks chunks.
    void beginDispatch(std::size_t totalChunks);

    /// @brief Records one finished chunk and reports the interpolated percentage.
    void chunkCompleted();

    [[nodiscard]] auto percent() const -> int;
    [[nodiscard]] auto stageName() const -> std::string;
    [[nodiscard]] auto completedChunks() const -> std::size_t;

    /// @brief Percentage for @p completed out of @p total chunks.
    [[nodiscard]] static auto dispatchPercent(std::size_t completed, std::size_t total) -> int;

  private:
    void publish(std::string stageName, int percent);

    ProgressSink _sink;
    mutable std::mutex _mutex;
    std::string _stage;
    int _percent = 0;
    std::size_t _completed = 0;
    std::size_t _total = 0;
};

} // namespace scribe
