// SPDX-License-Identifier: Apache-2.0
#include "ChunkDispatcher.hpp"

#include <core/Log.hpp>
#include <pipeline/ProgressTracker.hpp>

#include <algorithm>
#include <deque>
#include <exception>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace scribe
{

namespace
{

    auto trimmed(std::string_view text) -> std::string
    {
        auto const begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return std::string(text.substr(begin, end - begin + 1));
    }

    /// @brief State shared by all workers of one dispatch.
    struct DispatchState
    {
        std::mutex mutex;
        std::deque<std::size_t> pending;
        std::vector<std::string> results;
        std::optional<Error> failure;
    };

} // namespace

auto planWorkers(unsigned hardwareThreads, std::size_t chunkCount, const WorkerPolicy& policy) -> WorkerPlan
{
    auto const cpus = static_cast<int>(std::max(hardwareThreads, 1u));
    auto const maxCount = std::max(policy.maxCount, 1);

    auto workers = policy.count > 0 ? policy.count : std::clamp(cpus / 4, 1, maxCount);
    if (chunkCount > 0)
        workers = std::min(workers, static_cast<int>(std::min<std::size_t>(chunkCount, 1024)));
    workers = std::max(workers, 1);

    auto const threads = std::max(std::max(policy.minThreadsPerWorker, 1), cpus / workers);
    return WorkerPlan { .workers = workers, .threadsPerWorker = threads };
}

auto joinTranscript(const std::vector<std::string>& parts) -> std::string
{
    auto transcript = std::string {};
    for (auto i = std::size_t { 0 }; i < parts.size(); ++i)
    {
        if (i > 0)
            transcript += '\n';
        transcript += parts[i];
    }
    return transcript;
}

ChunkDispatcher::ChunkDispatcher(RecognizerConfig config, WorkerPolicy policy, CommandRunner& runner):
    _config(std::move(config)), _policy(policy), _runner(runner)
{
}

auto ChunkDispatcher::recognizeCommand(const std::filesystem::path& chunk,
                                       const std::filesystem::path& outputBase,
                                       int threads) const -> Command
{
    auto command = Command {
        .program = _config.binary,
        .args = {
            "-m", _config.modelPath,
            "-l", _config.language,
            "-t", std::to_string(threads),
            "-bo", std::to_string(_config.bestOf),
            "-bs", std::to_string(_config.beamSize),
        },
        .label = "Speech recognition",
    };

    if (!_config.prompt.empty())
    {
        command.args.emplace_back("--prompt");
        command.args.push_back(_config.prompt);
    }

    command.args.insert(command.args.end(),
                        {
                            "-f",
                            chunk.string(),
                            "-otxt",
                            "-of",
                            outputBase.string(),
                            "-nth",
                            std::format("{}", _config.noSpeechThreshold),
                            "-et",
                            std::format("{}", _config.entropyThreshold),
                            "-lpt",
                            std::format("{}", _config.logprobThreshold),
                        });
    return command;
}

auto ChunkDispatcher::transcribeChunk(std::size_t index,
                                      const std::filesystem::path& chunk,
                                      const std::filesystem::path& partialDir,
                                      int threads) const -> Result<std::string>
{
    auto const outputBase = partialDir / std::format("part_{:03}", index);

    if (auto result = _runner.run(recognizeCommand(chunk, outputBase, threads)); !result)
        return std::unexpected(result.error());

    auto outputFile = outputBase;
    outputFile += ".txt";

    auto file = std::ifstream(outputFile);
    if (!file.is_open())
        return makeError(ErrorCode::OutputMissing,
                         std::format("Transcript of chunk {} was not produced: {}", index + 1, outputFile.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return trimmed(ss.str());
}

auto ChunkDispatcher::dispatch(const std::vector<std::filesystem::path>& chunks,
                               const std::filesystem::path& partialDir,
                               ProgressTracker& progress) const -> Result<std::vector<std::string>>
{
    if (chunks.empty())
        return makeError(ErrorCode::NoChunksProduced, "No audio chunks to transcribe.");

    auto const hardware = _hardwareThreads > 0 ? _hardwareThreads : std::thread::hardware_concurrency();
    auto const plan = planWorkers(hardware, chunks.size(), _policy);

    log::info("Transcribing {} chunk(s) with {} worker(s), {} thread(s) each",
              chunks.size(),
              plan.workers,
              plan.threadsPerWorker);

    auto state = DispatchState {};
    state.results.resize(chunks.size());
    for (auto i = std::size_t { 0 }; i < chunks.size(); ++i)
        state.pending.push_back(i);

    progress.beginDispatch(chunks.size());

    auto const drain = [&](int workerId) {
        while (true)
        {
            auto index = std::size_t { 0 };
            {
                auto lock = std::lock_guard(state.mutex);
                if (state.failure || state.pending.empty())
                    return;
                index = state.pending.front();
                state.pending.pop_front();
            }

            log::debug("Worker {} takes chunk {}/{}", workerId, index + 1, chunks.size());
            auto text = Result<std::string> {};
            try
            {
                text = transcribeChunk(index, chunks[index], partialDir, plan.threadsPerWorker);
            }
            catch (const std::exception& e)
            {
                // Nothing may leave the thread body; the failure is reported like a returned error.
                text = makeError(ErrorCode::Unknown,
                                 std::format("Chunk {} raised an exception: {}", index + 1, e.what()));
            }

            {
                auto lock = std::lock_guard(state.mutex);
                if (!text)
                {
                    log::error("Chunk {}/{} failed: {}", index + 1, chunks.size(), text.error().message);
                    if (!state.failure)
                        state.failure = std::move(text.error());
                    return;
                }
                state.results[index] = std::move(*text);
            }

            progress.chunkCompleted();
        }
    };

    auto const worker = [&](int workerId) {
        try
        {
            drain(workerId);
        }
        catch (const std::exception& e)
        {
            auto lock = std::lock_guard(state.mutex);
            if (!state.failure)
                state.failure = Error { .code = ErrorCode::Unknown,
                                        .message = std::format("Transcription worker {} failed: {}", workerId, e.what()),
                                        .exitCode = {},
                                        .details = {} };
        }
    };

    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(static_cast<std::size_t>(plan.workers));
        for (auto id = 0; id < plan.workers; ++id)
            workers.emplace_back(worker, id);
        // jthread joins on destruction; all workers have drained the queue past this scope.
    }

    if (state.failure)
        return std::unexpected(std::move(*state.failure));

    return std::move(state.results);
}

} // namespace scribe
