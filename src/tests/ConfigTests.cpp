// SPDX-License-Identifier: Apache-2.0
#include <scribe/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace scribe;

namespace
{

/// @brief Sets an environment variable for the lifetime of the guard.
class ScopedEnv
{
  public:
    ScopedEnv(const char* name, const char* value): _name(name)
    {
        ::setenv(name, value, 1);
    }

    ~ScopedEnv() { ::unsetenv(_name); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

  private:
    const char* _name;
};

auto validConfig() -> AppConfig
{
    auto config = AppConfig {};
    config.recognizer.modelPath = "/models/ggml-large-v3.bin";
    return config;
}

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    REQUIRE(defaultConfigPath().ends_with("scribe/config.json"));
}

TEST_CASE("defaultConfigDir honours XDG_CONFIG_HOME", "[config]")
{
    auto const env = ScopedEnv("XDG_CONFIG_HOME", "/tmp/xdg");
    CHECK(defaultConfigDir() == "/tmp/xdg/scribe");
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.recognizer.binary == "whisper-cli");
    CHECK(config.recognizer.modelPath.empty());
    CHECK(config.recognizer.language == "pt");
    CHECK(config.recognizer.bestOf == 1);
    CHECK(config.recognizer.beamSize == 1);
    CHECK(config.audio.binary == "ffmpeg");
    CHECK(config.audio.sampleRate == 16000);
    CHECK(config.audio.chunkSeconds == 120);
    CHECK(config.audio.maxDurationSeconds == 1800);
    CHECK(config.workers.count == 0);
    CHECK(config.workers.maxCount == 4);
    CHECK(config.workers.minThreadsPerWorker == 2);
    CHECK(config.storage.outputDir == "outputs");
    CHECK(config.storage.downloadPrefix == "/downloads/");
    CHECK(config.storage.removeSourceAfterJob == true);
    CHECK(config.logLevel == "info");
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "scribe_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "recognizer": {
                "binary": "/opt/whisper/bin/whisper-cli",
                "modelPath": "/models/ggml-medium.bin",
                "language": "en",
                "prompt": "Kubernetes, gRPC",
                "beamSize": 5,
                "noSpeechThreshold": 0.6
            },
            "audio": {
                "chunkSeconds": 300,
                "maxDurationSeconds": 0,
                "silenceFilter": ""
            },
            "workers": {
                "count": 3
            },
            "storage": {
                "outputDir": "/srv/transcripts",
                "scratchRoot": "/var/tmp/scribe",
                "removeSourceAfterJob": false
            },
            "log": {
                "level": "debug"
            }
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Recognizer config")
    {
        CHECK(config.recognizer.binary == "/opt/whisper/bin/whisper-cli");
        CHECK(config.recognizer.modelPath == "/models/ggml-medium.bin");
        CHECK(config.recognizer.language == "en");
        CHECK(config.recognizer.prompt == "Kubernetes, gRPC");
        CHECK(config.recognizer.beamSize == 5);
        CHECK(config.recognizer.bestOf == 1);
        CHECK(config.recognizer.noSpeechThreshold == 0.6f);
    }

    SECTION("Audio config")
    {
        CHECK(config.audio.binary == "ffmpeg");
        CHECK(config.audio.chunkSeconds == 300);
        CHECK(config.audio.maxDurationSeconds == 0);
        CHECK(config.audio.silenceFilter.empty());
    }

    SECTION("Workers and storage config")
    {
        CHECK(config.workers.count == 3);
        CHECK(config.workers.maxCount == 4);
        CHECK(config.storage.outputDir == "/srv/transcripts");
        CHECK(config.storage.scratchRoot == "/var/tmp/scribe");
        CHECK(config.storage.removeSourceAfterJob == false);
        CHECK(config.logLevel == "debug");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects malformed files", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "scribe_test_bad_config.json";

    SECTION("invalid JSON")
    {
        {
            auto file = std::ofstream(tempPath);
            file << R"({ "audio": { "chunkSeconds": )";
        }
        auto const result = loadConfigFromFile(tempPath.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("root is not an object")
    {
        {
            auto file = std::ofstream(tempPath);
            file << "[1, 2, 3]";
        }
        auto const result = loadConfigFromFile(tempPath.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto const result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile writes a file loadConfigFromFile reads back", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "scribe_test_save_config";
    std::filesystem::remove_all(dir);
    auto const path = (dir / "nested" / "config.json").string();

    auto config = validConfig();
    config.recognizer.language = "es";
    config.audio.chunkSeconds = 45;
    config.workers.count = 2;
    config.storage.scratchRoot = "/scratch";
    config.logLevel = "trace";

    REQUIRE(saveConfigToFile(path, config).has_value());

    auto const loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->recognizer.modelPath == config.recognizer.modelPath);
    CHECK(loaded->recognizer.language == "es");
    CHECK(loaded->audio.chunkSeconds == 45);
    CHECK(loaded->audio.silenceFilter == config.audio.silenceFilter);
    CHECK(loaded->workers.count == 2);
    CHECK(loaded->storage.scratchRoot == "/scratch");
    CHECK(loaded->logLevel == "trace");

    std::filesystem::remove_all(dir);
}

TEST_CASE("applyEnvironmentOverrides takes recognizer settings from the environment", "[config]")
{
    auto config = AppConfig {};

    SECTION("set variables override")
    {
        auto const whisper = ScopedEnv("WHISPER_PATH", "/usr/local/bin/whisper-cli");
        auto const model = ScopedEnv("WHISPER_MODEL", "/models/ggml-tiny.bin");
        auto const level = ScopedEnv("SCRIBE_LOG_LEVEL", "warning");
        applyEnvironmentOverrides(config);

        CHECK(config.recognizer.binary == "/usr/local/bin/whisper-cli");
        CHECK(config.recognizer.modelPath == "/models/ggml-tiny.bin");
        CHECK(config.logLevel == "warning");
    }

    SECTION("empty variables are ignored")
    {
        auto const whisper = ScopedEnv("WHISPER_PATH", "");
        ::unsetenv("WHISPER_MODEL");
        applyEnvironmentOverrides(config);

        CHECK(config.recognizer.binary == "whisper-cli");
        CHECK(config.recognizer.modelPath.empty());
    }
}

TEST_CASE("validateConfig reports the offending setting", "[config]")
{
    CHECK(validateConfig(validConfig()).has_value());

    auto config = validConfig();

    SECTION("missing model")
    {
        config.recognizer.modelPath.clear();
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.find("WHISPER_MODEL") != std::string::npos);
    }

    SECTION("non-positive chunk duration")
    {
        config.audio.chunkSeconds = 0;
        auto const result = validateConfig(config);
        REQUIRE(!result.has_value());
        CHECK(result.error().message.find("chunkSeconds") != std::string::npos);
    }

    SECTION("negative worker count")
    {
        config.workers.count = -1;
        CHECK(!validateConfig(config).has_value());
    }

    SECTION("unknown log level")
    {
        config.logLevel = "chatty";
        CHECK(!validateConfig(config).has_value());
    }
}

TEST_CASE("pipelineConfig and jobManagerConfig map the storage section", "[config]")
{
    auto config = validConfig();
    config.storage.outputDir = "/srv/out";
    config.storage.scratchRoot = "/srv/scratch";
    config.storage.downloadPrefix = "/files/";
    config.storage.removeSourceAfterJob = false;
    config.workers.count = 5;

    auto const pipeline = pipelineConfig(config);
    CHECK(pipeline.outputDir == "/srv/out");
    CHECK(pipeline.scratchRoot == "/srv/scratch");
    CHECK(pipeline.workers.count == 5);
    CHECK(pipeline.recognizer.modelPath == config.recognizer.modelPath);

    auto const manager = jobManagerConfig(config);
    CHECK(manager.downloadPrefix == "/files/");
    CHECK(manager.removeSourceAfterJob == false);
}
