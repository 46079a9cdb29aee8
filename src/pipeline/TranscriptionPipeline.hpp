// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/AudioPreprocessor.hpp>
#include <pipeline/ChunkDispatcher.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <process/CommandRunner.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace scribe
{

/// @brief Everything one pipeline execution needs to know.
struct PipelineConfig
{
    AudioPreprocessorConfig audio;
    RecognizerConfig recognizer;
    WorkerPolicy workers;

    /// @brief Directory receiving the final "<name>.txt" transcripts.
    std::filesystem::path outputDir = "outputs";

    /// @brief Parent of the per-job scratch workspaces; empty means the system temp directory.
    std::filesystem::path scratchRoot;
};

/// @brief Input of a single pipeline execution.
struct TranscriptionRequest
{
    std::filesystem::path sourcePath;
    bool fullAudio = false;

    /// @brief Base name of the persisted transcript (the job identifier).
    std::string outputName;
};

/// @brief Outcome of a successful pipeline execution.
struct TranscriptionResult
{
    std::string transcript;
    std::filesystem::path outputFile;
    std::size_t chunkCount = 0;
};

/// @brief Runs normalization, segmentation, parallel recognition and reassembly for one job.
///
/// Stateless between executions; a single instance serves all jobs concurrently.
class TranscriptionPipeline
{
  public:
    TranscriptionPipeline(PipelineConfig config, std::shared_ptr<CommandRunner> runner);

    /// @brief Executes the pipeline synchronously on the calling thread.
    ///
    /// The scratch workspace is allocated at start and removed before this returns,
    /// whatever the outcome.
    /// @param request The job input.
    /// @param sink Receives monotonic (stage, percent) updates, never 100.
    /// @return The transcript and its persisted location, or the first error.
    [[nodiscard]] auto run(const TranscriptionRequest& request, const ProgressSink& sink) const
        -> Result<TranscriptionResult>;

    [[nodiscard]] auto config() const -> const PipelineConfig& { return _config; }

    /// @brief Overrides the hardware thread count used for worker planning (tests).
    void setHardwareThreads(unsigned threads) noexcept { _dispatcher.setHardwareThreads(threads); }

  private:
    [[nodiscard]] auto writeTranscript(const std::string& name, const std::string& transcript) const
        -> Result<std::filesystem::path>;

    PipelineConfig _config;
    std::shared_ptr<CommandRunner> _runner;
    AudioPreprocessor _preprocessor;
    ChunkDispatcher _dispatcher;
};

} // namespace scribe
