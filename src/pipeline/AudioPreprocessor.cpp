// SPDX-License-Identifier: Apache-2.0
#include "AudioPreprocessor.hpp"

#include <core/Log.hpp>
#include <pipeline/ProgressTracker.hpp>
#include <process/ScratchDirectory.hpp>

#include <algorithm>
#include <format>

namespace scribe
{

namespace
{
    constexpr auto ChunkPattern = std::string_view { "chunk_%03d.wav" };
    constexpr auto NormalizedName = std::string_view { "normalized.wav" };
} // namespace

auto collectChunkFiles(const std::filesystem::path& directory) -> Result<std::vector<std::filesystem::path>>
{
    auto chunks = std::vector<std::filesystem::path> {};

    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot read chunk directory '{}': {}", directory.string(), ec.message()));

    for (auto const& entry: it)
    {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".wav")
            chunks.push_back(entry.path());
    }

    if (chunks.empty())
        return makeError(ErrorCode::NoChunksProduced, "No audio chunks were produced for transcription.");

    std::ranges::sort(chunks, [](auto const& a, auto const& b) {
        auto const nameA = a.filename().string();
        auto const nameB = b.filename().string();
        if (nameA.size() != nameB.size())
            return nameA.size() < nameB.size();
        return nameA < nameB;
    });

    return chunks;
}

AudioPreprocessor::AudioPreprocessor(AudioPreprocessorConfig config, CommandRunner& runner):
    _config(std::move(config)), _runner(runner)
{
}

auto AudioPreprocessor::normalizeCommand(const std::filesystem::path& source,
                                         const std::filesystem::path& output,
                                         bool fullAudio) const -> Command
{
    auto command = Command {
        .program = _config.binary,
        .args = { "-y", "-i", source.string(), "-ac", "1", "-ar", std::to_string(_config.sampleRate) },
        .label = "Audio normalization",
    };

    if (!fullAudio && _config.maxDurationSeconds > 0)
    {
        command.args.emplace_back("-t");
        command.args.push_back(std::to_string(_config.maxDurationSeconds));
    }

    command.args.push_back(output.string());
    return command;
}

auto AudioPreprocessor::segmentCommand(const std::filesystem::path& normalized,
                                       const std::filesystem::path& chunksDir) const -> Command
{
    auto const sampleRate = std::to_string(_config.sampleRate);

    auto command = Command {
        .program = _config.binary,
        .args = { "-y", "-i", normalized.string() },
        .label = "Audio segmentation",
    };

    if (!_config.silenceFilter.empty())
    {
        command.args.emplace_back("-af");
        command.args.push_back(_config.silenceFilter);
    }

    command.args.insert(command.args.end(),
                        {
                            "-f",
                            "segment",
                            "-segment_time",
                            std::to_string(_config.chunkSeconds),
                            "-c:a",
                            "pcm_s16le",
                            "-ar",
                            sampleRate,
                            "-ac",
                            "1",
                            (chunksDir / ChunkPattern).string(),
                        });
    return command;
}

auto AudioPreprocessor::prepare(const std::filesystem::path& source,
                                bool fullAudio,
                                const ScratchDirectory& scratch,
                                ProgressTracker& progress) const -> Result<PreparedAudio>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(source, ec))
        return makeError(ErrorCode::IoError, std::format("Source audio file not found: {}", source.string()));

    auto chunksDir = scratch.subdirectory("chunks");
    if (!chunksDir)
        return std::unexpected(chunksDir.error());

    auto prepared = PreparedAudio { .normalizedFile = scratch.path() / NormalizedName, .chunks = {} };

    progress.checkpoint(stage::Normalizing, checkpoint::Starting);
    if (auto result = _runner.run(normalizeCommand(source, prepared.normalizedFile, fullAudio)); !result)
        return std::unexpected(result.error());

    if (!std::filesystem::exists(prepared.normalizedFile, ec))
        return makeError(ErrorCode::OutputMissing,
                         std::format("Normalized audio was not produced: {}", prepared.normalizedFile.string()));

    progress.checkpoint(stage::Segmenting, checkpoint::Normalized);
    if (auto result = _runner.run(segmentCommand(prepared.normalizedFile, *chunksDir)); !result)
        return std::unexpected(result.error());

    auto chunks = collectChunkFiles(*chunksDir);
    if (!chunks)
        return std::unexpected(chunks.error());

    prepared.chunks = std::move(*chunks);
    log::info("Audio segmented into {} chunk(s) of up to {}s{}",
              prepared.chunks.size(),
              _config.chunkSeconds,
              fullAudio ? " (full audio)" : "");
    return prepared;
}

} // namespace scribe
