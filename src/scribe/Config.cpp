// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace scribe
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/scribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/scribe";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file is not a JSON object: {}", path));

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    // Recognizer section
    auto const recognizer = json::section(root, "recognizer");
    config.recognizer.binary = json::getStringOr(recognizer, "binary", defaults.recognizer.binary);
    config.recognizer.modelPath = json::getStringOr(recognizer, "modelPath", "");
    config.recognizer.language = json::getStringOr(recognizer, "language", defaults.recognizer.language);
    config.recognizer.prompt = json::getStringOr(recognizer, "prompt", "");
    config.recognizer.bestOf = json::getIntOr(recognizer, "bestOf", defaults.recognizer.bestOf);
    config.recognizer.beamSize = json::getIntOr(recognizer, "beamSize", defaults.recognizer.beamSize);
    config.recognizer.noSpeechThreshold =
        json::getFloatOr(recognizer, "noSpeechThreshold", defaults.recognizer.noSpeechThreshold);
    config.recognizer.entropyThreshold =
        json::getFloatOr(recognizer, "entropyThreshold", defaults.recognizer.entropyThreshold);
    config.recognizer.logprobThreshold =
        json::getFloatOr(recognizer, "logprobThreshold", defaults.recognizer.logprobThreshold);

    // Audio section
    auto const audio = json::section(root, "audio");
    config.audio.binary = json::getStringOr(audio, "binary", defaults.audio.binary);
    config.audio.sampleRate = json::getIntOr(audio, "sampleRate", defaults.audio.sampleRate);
    config.audio.chunkSeconds = json::getIntOr(audio, "chunkSeconds", defaults.audio.chunkSeconds);
    config.audio.maxDurationSeconds = json::getIntOr(audio, "maxDurationSeconds", defaults.audio.maxDurationSeconds);
    config.audio.silenceFilter = json::getStringOr(audio, "silenceFilter", defaults.audio.silenceFilter);

    // Workers section
    auto const workers = json::section(root, "workers");
    config.workers.count = json::getIntOr(workers, "count", defaults.workers.count);
    config.workers.maxCount = json::getIntOr(workers, "maxCount", defaults.workers.maxCount);
    config.workers.minThreadsPerWorker =
        json::getIntOr(workers, "minThreadsPerWorker", defaults.workers.minThreadsPerWorker);

    // Storage section
    auto const storage = json::section(root, "storage");
    config.storage.outputDir = json::getStringOr(storage, "outputDir", defaults.storage.outputDir);
    config.storage.scratchRoot = json::getStringOr(storage, "scratchRoot", "");
    config.storage.downloadPrefix = json::getStringOr(storage, "downloadPrefix", defaults.storage.downloadPrefix);
    config.storage.removeSourceAfterJob =
        json::getBoolOr(storage, "removeSourceAfterJob", defaults.storage.removeSourceAfterJob);

    // Log section
    config.logLevel = json::getStringOr(json::section(root, "log"), "level", defaults.logLevel);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto recognizer = nlohmann::json::object();
    recognizer["binary"] = config.recognizer.binary;
    if (!config.recognizer.modelPath.empty())
        recognizer["modelPath"] = config.recognizer.modelPath;
    recognizer["language"] = config.recognizer.language;
    if (!config.recognizer.prompt.empty())
        recognizer["prompt"] = config.recognizer.prompt;
    recognizer["bestOf"] = config.recognizer.bestOf;
    recognizer["beamSize"] = config.recognizer.beamSize;
    recognizer["noSpeechThreshold"] = config.recognizer.noSpeechThreshold;
    recognizer["entropyThreshold"] = config.recognizer.entropyThreshold;
    recognizer["logprobThreshold"] = config.recognizer.logprobThreshold;
    root["recognizer"] = std::move(recognizer);

    auto audio = nlohmann::json::object();
    audio["binary"] = config.audio.binary;
    audio["sampleRate"] = config.audio.sampleRate;
    audio["chunkSeconds"] = config.audio.chunkSeconds;
    audio["maxDurationSeconds"] = config.audio.maxDurationSeconds;
    audio["silenceFilter"] = config.audio.silenceFilter;
    root["audio"] = std::move(audio);

    auto workers = nlohmann::json::object();
    workers["count"] = config.workers.count;
    workers["maxCount"] = config.workers.maxCount;
    workers["minThreadsPerWorker"] = config.workers.minThreadsPerWorker;
    root["workers"] = std::move(workers);

    auto storage = nlohmann::json::object();
    storage["outputDir"] = config.storage.outputDir;
    if (!config.storage.scratchRoot.empty())
        storage["scratchRoot"] = config.storage.scratchRoot;
    storage["downloadPrefix"] = config.storage.downloadPrefix;
    storage["removeSourceAfterJob"] = config.storage.removeSourceAfterJob;
    root["storage"] = std::move(storage);

    root["log"] = nlohmann::json { { "level", config.logLevel } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

void applyEnvironmentOverrides(AppConfig& config)
{
    if (auto const* const whisperPath = std::getenv("WHISPER_PATH"); whisperPath && *whisperPath)
        config.recognizer.binary = whisperPath;
    if (auto const* const whisperModel = std::getenv("WHISPER_MODEL"); whisperModel && *whisperModel)
        config.recognizer.modelPath = whisperModel;
    if (auto const* const logLevel = std::getenv("SCRIBE_LOG_LEVEL"); logLevel && *logLevel)
        config.logLevel = logLevel;
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.recognizer.modelPath.empty())
        return makeError(ErrorCode::ConfigError,
                         "No recognition model configured (recognizer.modelPath or WHISPER_MODEL)");
    if (config.recognizer.binary.empty())
        return makeError(ErrorCode::ConfigError, "recognizer.binary must not be empty");
    if (config.audio.binary.empty())
        return makeError(ErrorCode::ConfigError, "audio.binary must not be empty");
    if (config.audio.chunkSeconds <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("audio.chunkSeconds must be positive (got {})", config.audio.chunkSeconds));
    if (config.audio.sampleRate <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("audio.sampleRate must be positive (got {})", config.audio.sampleRate));
    if (config.audio.maxDurationSeconds < 0)
        return makeError(ErrorCode::ConfigError, "audio.maxDurationSeconds must not be negative");
    if (config.workers.count < 0)
        return makeError(ErrorCode::ConfigError, "workers.count must not be negative");
    if (!log::parseLevel(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.logLevel));
    return {};
}

auto pipelineConfig(const AppConfig& config) -> PipelineConfig
{
    return PipelineConfig {
        .audio = config.audio,
        .recognizer = config.recognizer,
        .workers = config.workers,
        .outputDir = config.storage.outputDir,
        .scratchRoot = config.storage.scratchRoot,
    };
}

auto jobManagerConfig(const AppConfig& config) -> JobManagerConfig
{
    return JobManagerConfig {
        .downloadPrefix = config.storage.downloadPrefix,
        .removeSourceAfterJob = config.storage.removeSourceAfterJob,
    };
}

} // namespace scribe
