// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <process/CommandRunner.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace scribe
{

class ProgressTracker;
class ScratchDirectory;

/// @brief Configuration of the external audio tool (ffmpeg) invocations.
struct AudioPreprocessorConfig
{
    std::string binary = "ffmpeg";
    int sampleRate = 16000;

    /// @brief Fixed duration of each chunk in seconds.
    int chunkSeconds = 120;

    /// @brief Duration cap applied unless the caller requests the full audio. 0 disables the cap.
    int maxDurationSeconds = 1800;

    /// @brief Filter applied before segmentation so chunk cuts tend to fall into silence.
    std::string silenceFilter = "silenceremove=stop_periods=-1:stop_duration=0.7:stop_threshold=-35dB";
};

/// @brief Normalized audio and its ordered chunk files inside a scratch workspace.
struct PreparedAudio
{
    std::filesystem::path normalizedFile;
    std::vector<std::filesystem::path> chunks;
};

/// @brief Lists the chunk files of @p directory in chronological order.
///
/// Only regular "*.wav" files are considered. Names share a zero-padded sequence suffix,
/// so shorter names sort first and equal-length names sort lexicographically.
/// @return The ordered list, IoError if the directory cannot be read, or NoChunksProduced if it is empty.
[[nodiscard]] auto collectChunkFiles(const std::filesystem::path& directory)
    -> Result<std::vector<std::filesystem::path>>;

/// @brief Converts arbitrary input audio into 16 kHz mono chunks via the external audio tool.
class AudioPreprocessor
{
  public:
    AudioPreprocessor(AudioPreprocessorConfig config, CommandRunner& runner);

    /// @brief Builds the normalization command (downmix, resample, optional duration cap).
    [[nodiscard]] auto normalizeCommand(const std::filesystem::path& source,
                                        const std::filesystem::path& output,
                                        bool fullAudio) const -> Command;

    /// @brief Builds the segmentation command writing "chunk_NNN.wav" files into @p chunksDir.
    [[nodiscard]] auto segmentCommand(const std::filesystem::path& normalized,
                                      const std::filesystem::path& chunksDir) const -> Command;

    /// @brief Normalizes, segments and enumerates @p source inside @p scratch.
    /// @param source The uploaded audio file.
    /// @param fullAudio Disables the duration cap when true.
    /// @param scratch The job's scratch workspace.
    /// @param progress Receives the normalization and segmentation checkpoints.
    /// @return The prepared audio or the first error encountered.
    [[nodiscard]] auto prepare(const std::filesystem::path& source,
                               bool fullAudio,
                               const ScratchDirectory& scratch,
                               ProgressTracker& progress) const -> Result<PreparedAudio>;

    [[nodiscard]] auto config() const -> const AudioPreprocessorConfig& { return _config; }

  private:
    AudioPreprocessorConfig _config;
    CommandRunner& _runner;
};

} // namespace scribe
