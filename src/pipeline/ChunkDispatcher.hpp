// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <process/CommandRunner.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace scribe
{

class ProgressTracker;

/// @brief Configuration of the external speech-recognition tool (whisper-cli).
struct RecognizerConfig
{
    std::string binary = "whisper-cli";
    std::string modelPath;
    std::string language = "pt";

    /// @brief Optional context prompt biasing the recognition vocabulary.
    std::string prompt;

    int bestOf = 1;
    int beamSize = 1;
    float noSpeechThreshold = 0.7f;
    float entropyThreshold = 2.0f;
    float logprobThreshold = -0.5f;
};

/// @brief How many recognition processes run concurrently.
struct WorkerPolicy
{
    /// @brief Fixed worker count; 0 derives it from the hardware.
    int count = 0;

    /// @brief Upper bound of the derived worker count.
    int maxCount = 4;

    /// @brief Lower bound of threads handed to each recognition process.
    int minThreadsPerWorker = 2;
};

/// @brief Concrete concurrency chosen for one dispatch.
struct WorkerPlan
{
    int workers = 1;
    int threadsPerWorker = 1;
};

/// @brief Derives the worker count and per-process thread budget.
///
/// Each recognition process is itself multi-threaded, so only a few run at once
/// and the CPU budget is split among them. Never plans more workers than chunks.
[[nodiscard]] auto planWorkers(unsigned hardwareThreads, std::size_t chunkCount, const WorkerPolicy& policy)
    -> WorkerPlan;

/// @brief Joins per-chunk transcripts in chunk order, one line per chunk.
[[nodiscard]] auto joinTranscript(const std::vector<std::string>& parts) -> std::string;

/// @brief Transcribes ordered chunks with a bounded pool of workers draining a shared queue.
///
/// Results are placed by chunk index, so completion order never affects the transcript.
/// The first failing chunk fails the whole dispatch; workers stop taking new chunks
/// once a failure has been recorded.
class ChunkDispatcher
{
  public:
    ChunkDispatcher(RecognizerConfig config, WorkerPolicy policy, CommandRunner& runner);

    /// @brief Builds the recognition command for one chunk writing "<outputBase>.txt".
    [[nodiscard]] auto recognizeCommand(const std::filesystem::path& chunk,
                                        const std::filesystem::path& outputBase,
                                        int threads) const -> Command;

    /// @brief Transcribes all chunks.
    /// @param chunks Chunk files in chronological order.
    /// @param partialDir Directory receiving the per-chunk "part_NNN.txt" outputs.
    /// @param progress Receives one update per finished chunk.
    /// @return Trimmed transcripts indexed like @p chunks, or the first chunk error.
    [[nodiscard]] auto dispatch(const std::vector<std::filesystem::path>& chunks,
                                const std::filesystem::path& partialDir,
                                ProgressTracker& progress) const -> Result<std::vector<std::string>>;

    /// @brief Overrides the hardware thread count used for planning (0 = query the system).
    void setHardwareThreads(unsigned threads) noexcept { _hardwareThreads = threads; }

  private:
    [[nodiscard]] auto transcribeChunk(std::size_t index,
                                       const std::filesystem::path& chunk,
                                       const std::filesystem::path& partialDir,
                                       int threads) const -> Result<std::string>;

    RecognizerConfig _config;
    WorkerPolicy _policy;
    CommandRunner& _runner;
    unsigned _hardwareThreads = 0;
};

} // namespace scribe
