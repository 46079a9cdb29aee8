// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace scribe
{

/// @brief Opaque job identifier (RFC 4122 version 4 UUID text).
using JobId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

/// @brief Lifecycle state of a transcription job.
enum class JobStatus : std::uint8_t
{
    Queued,
    Processing,
    Completed,
    Failed,
};

/// @brief Converts a JobStatus to its wire name ("queued", "processing", ...).
[[nodiscard]] constexpr auto jobStatusName(JobStatus status) -> std::string_view
{
    switch (status)
    {
        case JobStatus::Queued: return "queued";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Returns true for the terminal states Completed and Failed.
[[nodiscard]] constexpr auto isTerminal(JobStatus status) -> bool
{
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

/// @brief Immutable point-in-time copy of a job record.
struct JobSnapshot
{
    JobId id;
    JobStatus status = JobStatus::Queued;
    int progress = 0;
    std::string stage;
    Timestamp submittedAt {};
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> completedAt;

    // Completed only
    std::optional<std::string> transcription;
    std::optional<std::string> outputFile;
    std::optional<std::string> downloadUrl;

    // Failed only
    std::optional<Error> error;

    [[nodiscard]] auto terminal() const -> bool { return isTerminal(status); }
};

/// @brief Formats a timestamp as ISO-8601 UTC with millisecond precision.
[[nodiscard]] auto formatTimestamp(Timestamp timestamp) -> std::string;

/// @brief Serializes a snapshot to the status document returned to polling clients.
/// Optional fields are omitted when absent.
[[nodiscard]] auto toJson(const JobSnapshot& snapshot) -> nlohmann::json;

/// @brief Generates a new random job identifier.
[[nodiscard]] auto generateJobId() -> JobId;

/// @brief Mutable job record guarded by its own mutex.
///
/// Enforces the state machine queued -> processing -> completed | failed. Every transition
/// is applied atomically with respect to snapshot(), so readers never see torn fields.
/// Progress is monotonic and stays below 100 until a terminal state is reached.
class JobRecord
{
  public:
    explicit JobRecord(JobId id);

    JobRecord(const JobRecord&) = delete;
    JobRecord& operator=(const JobRecord&) = delete;

    /// @brief queued -> processing. Returns false if the record is not queued.
    auto markProcessing() -> bool;

    /// @brief Updates stage and progress of a processing job. Lower percentages are ignored.
    /// Returns false if the record is not processing.
    auto updateProgress(std::string_view stageName, int percent) -> bool;

    /// @brief processing -> completed. Returns false if the record is not processing.
    auto markCompleted(std::string transcription, std::string outputFile, std::string downloadUrl) -> bool;

    /// @brief processing -> failed. Returns false if the record is not processing.
    auto markFailed(Error error) -> bool;

    [[nodiscard]] auto snapshot() const -> JobSnapshot;

    /// @brief Blocks until the record is terminal or @p timeout elapses.
    /// @return The latest snapshot (terminal unless the timeout expired).
    [[nodiscard]] auto waitUntilTerminal(std::chrono::milliseconds timeout) const -> JobSnapshot;

  private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _terminalReached;
    JobSnapshot _state;
};

} // namespace scribe
