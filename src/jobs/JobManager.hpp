// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <jobs/Job.hpp>
#include <pipeline/TranscriptionPipeline.hpp>
#include <process/CommandRunner.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scribe
{

/// @brief Job-level behaviour around the pipeline.
struct JobManagerConfig
{
    /// @brief Prefix of the download reference derived for completed jobs ("<prefix><id>.txt").
    std::string downloadPrefix = "/downloads/";

    /// @brief Deletes the uploaded source file once the job's pipeline has exited.
    bool removeSourceAfterJob = true;
};

/// @brief A transcription request as accepted from the upload boundary.
struct SubmitRequest
{
    std::filesystem::path sourcePath;
    bool fullAudio = false;
};

/// @brief Owns the job registry and runs one background pipeline per accepted job.
///
/// submit() returns immediately; the pipeline runs on its own thread and drives the
/// record through queued -> processing -> completed | failed. status() may be called
/// concurrently from any thread and always returns a consistent snapshot.
/// Jobs are not cancellable: the destructor waits for all running jobs to finish.
class JobManager
{
  public:
    JobManager(PipelineConfig pipelineConfig, JobManagerConfig config, std::shared_ptr<CommandRunner> runner);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /// @brief Accepts a job and starts its pipeline in the background.
    /// @return The new job identifier, or InvalidArgument for an empty source path.
    [[nodiscard]] auto submit(const SubmitRequest& request) -> Result<JobId>;

    /// @brief Returns the current snapshot of a job, or NotFound.
    [[nodiscard]] auto status(const JobId& id) const -> Result<JobSnapshot>;

    /// @brief Returns snapshots of all known jobs, most recently submitted first.
    [[nodiscard]] auto list() const -> std::vector<JobSnapshot>;

    /// @brief Blocks until the job is terminal or the timeout elapses.
    /// @return The latest snapshot, or NotFound.
    [[nodiscard]] auto waitFor(const JobId& id, std::chrono::milliseconds timeout) const -> Result<JobSnapshot>;

    /// @brief Number of jobs that have not reached a terminal state.
    [[nodiscard]] auto activeJobs() const -> std::size_t;

    /// @brief Overrides the hardware thread count used for worker planning (tests).
    void setHardwareThreads(unsigned threads) noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace scribe
