// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionPipeline.hpp"

#include <core/Log.hpp>
#include <process/ScratchDirectory.hpp>

#include <format>
#include <fstream>

namespace scribe
{

TranscriptionPipeline::TranscriptionPipeline(PipelineConfig config, std::shared_ptr<CommandRunner> runner):
    _config(std::move(config)),
    _runner(std::move(runner)),
    _preprocessor(_config.audio, *_runner),
    _dispatcher(_config.recognizer, _config.workers, *_runner)
{
}

auto TranscriptionPipeline::run(const TranscriptionRequest& request, const ProgressSink& sink) const
    -> Result<TranscriptionResult>
{
    if (request.outputName.empty())
        return makeError(ErrorCode::InvalidArgument, "Transcription request without output name");

    auto progress = ProgressTracker(sink);

    auto const scratchRoot =
        _config.scratchRoot.empty() ? std::filesystem::temp_directory_path() : _config.scratchRoot;
    auto scratch = ScratchDirectory::create(scratchRoot);
    if (!scratch)
        return std::unexpected(scratch.error());

    auto prepared = _preprocessor.prepare(request.sourcePath, request.fullAudio, *scratch, progress);
    if (!prepared)
        return std::unexpected(prepared.error());

    auto partialDir = scratch->subdirectory("partial");
    if (!partialDir)
        return std::unexpected(partialDir.error());

    auto parts = _dispatcher.dispatch(prepared->chunks, *partialDir, progress);
    if (!parts)
        return std::unexpected(parts.error());

    progress.checkpoint(stage::Finalizing, checkpoint::Finalizing);

    auto result = TranscriptionResult {
        .transcript = joinTranscript(*parts),
        .outputFile = {},
        .chunkCount = parts->size(),
    };

    auto outputFile = writeTranscript(request.outputName, result.transcript);
    if (!outputFile)
        return std::unexpected(outputFile.error());

    result.outputFile = std::move(*outputFile);
    return result;
}

auto TranscriptionPipeline::writeTranscript(const std::string& name, const std::string& transcript) const
    -> Result<std::filesystem::path>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_config.outputDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create output directory '{}': {}",
                                     _config.outputDir.string(),
                                     ec.message()));

    auto path = std::filesystem::absolute(_config.outputDir / std::format("{}.txt", name), ec);
    if (ec)
        path = _config.outputDir / std::format("{}.txt", name);

    auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write transcript file: {}", path.string()));

    file << transcript;
    file.close();
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write transcript file: {}", path.string()));

    log::debug("Transcript written to {}", path.string());
    return path;
}

} // namespace scribe
