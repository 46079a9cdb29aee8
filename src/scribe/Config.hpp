// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <jobs/JobManager.hpp>
#include <pipeline/AudioPreprocessor.hpp>
#include <pipeline/ChunkDispatcher.hpp>
#include <pipeline/TranscriptionPipeline.hpp>

#include <string>
#include <string_view>

namespace scribe
{

/// @brief Storage configuration section.
struct StorageConfig
{
    /// @brief Directory receiving "<job-id>.txt" transcripts.
    std::string outputDir = "outputs";

    /// @brief Parent directory of per-job scratch workspaces (empty = system temp directory).
    std::string scratchRoot;

    /// @brief Prefix of the download reference reported for completed jobs.
    std::string downloadPrefix = "/downloads/";

    /// @brief Whether the uploaded source file is deleted once its job has finished.
    bool removeSourceAfterJob = true;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    RecognizerConfig recognizer;
    AudioPreprocessorConfig audio;
    WorkerPolicy workers;
    StorageConfig storage;

    /// @brief Log level name ("error", "warning", "info", "debug", "trace").
    std::string logLevel = "info";
};

/// @brief Loads the configuration from the default config path.
/// A missing default file yields the built-in defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating its directory if needed.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Applies WHISPER_PATH, WHISPER_MODEL and SCRIBE_LOG_LEVEL from the environment.
void applyEnvironmentOverrides(AppConfig& config);

/// @brief Checks the values the pipeline cannot run without.
/// @return Success or a ConfigError naming the offending setting.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Builds the pipeline configuration from the application configuration.
[[nodiscard]] auto pipelineConfig(const AppConfig& config) -> PipelineConfig;

/// @brief Builds the job manager configuration from the application configuration.
[[nodiscard]] auto jobManagerConfig(const AppConfig& config) -> JobManagerConfig;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/scribe or ~/.config/scribe
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace scribe
