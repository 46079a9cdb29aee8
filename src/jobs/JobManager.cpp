// SPDX-License-Identifier: Apache-2.0
#include "JobManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <list>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace scribe
{

struct JobManager::Impl
{
    /// @brief A job whose background thread has not been joined yet.
    struct Running
    {
        std::shared_ptr<JobRecord> record;
        std::jthread thread;
    };

    TranscriptionPipeline pipeline;
    JobManagerConfig config;

    mutable std::shared_mutex registryMutex;
    std::unordered_map<JobId, std::shared_ptr<JobRecord>> jobs;

    std::mutex runningMutex;
    std::list<Running> running;

    Impl(PipelineConfig pipelineConfig, JobManagerConfig managerConfig, std::shared_ptr<CommandRunner> runner):
        pipeline(std::move(pipelineConfig), std::move(runner)), config(std::move(managerConfig))
    {
    }

    [[nodiscard]] auto find(const JobId& id) const -> std::shared_ptr<JobRecord>
    {
        auto lock = std::shared_lock(registryMutex);
        auto const it = jobs.find(id);
        return it != jobs.end() ? it->second : nullptr;
    }

    /// @brief Joins threads of jobs that already reached a terminal state.
    /// The terminal transition is the last thing a job thread does, so these joins are short.
    void reapFinished()
    {
        auto lock = std::lock_guard(runningMutex);
        running.remove_if([](Running const& entry) { return entry.record->snapshot().terminal(); });
    }

    void joinAll()
    {
        auto pending = std::list<Running> {};
        {
            auto lock = std::lock_guard(runningMutex);
            pending.swap(running);
        }
        if (!pending.empty())
            log::info("Waiting for {} running job(s) to finish", pending.size());
        pending.clear();
    }

    void removeSource(const std::filesystem::path& source) const
    {
        if (!config.removeSourceAfterJob)
            return;

        auto ec = std::error_code {};
        std::filesystem::remove(source, ec);
        if (ec)
            log::warning("Failed to remove source file '{}': {}", source.string(), ec.message());
    }

    void execute(const std::shared_ptr<JobRecord>& record, const SubmitRequest& request)
    {
        auto const id = record->snapshot().id;
        auto const startTime = std::chrono::steady_clock::now();

        record->markProcessing();
        log::info("Job {} started: {}{}", id, request.sourcePath.string(), request.fullAudio ? " (full audio)" : "");

        auto const sink = [&record](std::string_view stageName, int percent) {
            record->updateProgress(stageName, percent);
        };

        auto const transcriptionRequest = TranscriptionRequest {
            .sourcePath = request.sourcePath,
            .fullAudio = request.fullAudio,
            .outputName = id,
        };

        auto result = Result<TranscriptionResult> {};
        try
        {
            result = pipeline.run(transcriptionRequest, sink);
        }
        catch (const std::exception& e)
        {
            result = makeError(ErrorCode::Unknown, std::format("Unexpected error during transcription: {}", e.what()));
        }

        removeSource(request.sourcePath);

        auto const elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

        if (result)
        {
            log::info("Job {} completed in {:.1f}s ({} chunk(s), {})",
                      id,
                      elapsed,
                      result->chunkCount,
                      result->outputFile.string());
            record->markCompleted(std::move(result->transcript),
                                  result->outputFile.string(),
                                  std::format("{}{}.txt", config.downloadPrefix, id));
        }
        else
        {
            log::error("Job {} failed after {:.1f}s: {}", id, elapsed, result.error());
            record->markFailed(std::move(result.error()));
        }
    }
};

JobManager::JobManager(PipelineConfig pipelineConfig,
                       JobManagerConfig config,
                       std::shared_ptr<CommandRunner> runner):
    _impl(std::make_unique<Impl>(std::move(pipelineConfig), std::move(config), std::move(runner)))
{
}

JobManager::~JobManager()
{
    _impl->joinAll();
}

auto JobManager::submit(const SubmitRequest& request) -> Result<JobId>
{
    if (request.sourcePath.empty())
        return makeError(ErrorCode::InvalidArgument, "Source audio path is required");

    _impl->reapFinished();

    auto record = std::make_shared<JobRecord>(generateJobId());
    auto const id = record->snapshot().id;

    {
        auto lock = std::unique_lock(_impl->registryMutex);
        _impl->jobs.emplace(id, record);
    }

    try
    {
        auto lock = std::lock_guard(_impl->runningMutex);
        _impl->running.push_back(Impl::Running {
            .record = record,
            .thread = std::jthread([impl = _impl.get(), record, request] { impl->execute(record, request); }),
        });
    }
    catch (const std::system_error& e)
    {
        auto lock = std::unique_lock(_impl->registryMutex);
        _impl->jobs.erase(id);
        return makeError(ErrorCode::Unknown, std::format("Failed to start transcription job: {}", e.what()));
    }

    log::info("Job {} accepted: {}", id, request.sourcePath.string());
    return id;
}

auto JobManager::status(const JobId& id) const -> Result<JobSnapshot>
{
    auto const record = _impl->find(id);
    if (!record)
        return makeError(ErrorCode::NotFound, std::format("Job not found: {}", id));
    return record->snapshot();
}

auto JobManager::list() const -> std::vector<JobSnapshot>
{
    auto snapshots = std::vector<JobSnapshot> {};
    {
        auto lock = std::shared_lock(_impl->registryMutex);
        snapshots.reserve(_impl->jobs.size());
        for (auto const& [id, record]: _impl->jobs)
            snapshots.push_back(record->snapshot());
    }

    std::ranges::sort(snapshots, [](auto const& a, auto const& b) { return a.submittedAt > b.submittedAt; });
    return snapshots;
}

auto JobManager::waitFor(const JobId& id, std::chrono::milliseconds timeout) const -> Result<JobSnapshot>
{
    auto const record = _impl->find(id);
    if (!record)
        return makeError(ErrorCode::NotFound, std::format("Job not found: {}", id));
    return record->waitUntilTerminal(timeout);
}

auto JobManager::activeJobs() const -> std::size_t
{
    // Derived from the records so it always agrees with status().
    auto lock = std::shared_lock(_impl->registryMutex);
    return static_cast<std::size_t>(std::ranges::count_if(
        _impl->jobs, [](auto const& entry) { return !entry.second->snapshot().terminal(); }));
}

void JobManager::setHardwareThreads(unsigned threads) noexcept
{
    _impl->pipeline.setHardwareThreads(threads);
}

} // namespace scribe
