// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <jobs/JobManager.hpp>
#include <process/ProcessRunner.hpp>
#include <scribe/Config.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace
{

constexpr auto PollInterval = std::chrono::milliseconds { 250 };

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "scribe: chunked parallel transcription through whisper-cli" };

    auto inputPath = std::string {};
    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto language = std::string {};
    auto whisperBinary = std::string {};
    auto ffmpegBinary = std::string {};
    auto prompt = std::string {};
    auto outputDir = std::string {};
    auto chunkSeconds = 0;
    auto workers = 0;
    auto fullAudio = false;
    auto removeSource = false;
    auto printJson = false;
    auto verbose = false;

    app.add_option("input", inputPath, "Audio file to transcribe")->required()->check(CLI::ExistingFile);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Path to the whisper model file");
    app.add_option("-l,--language", language, "Spoken language code (e.g. pt, en)");
    app.add_option("--whisper", whisperBinary, "Speech recognition executable");
    app.add_option("--ffmpeg", ffmpegBinary, "Audio tool executable");
    app.add_option("--prompt", prompt, "Context prompt biasing the recognition vocabulary");
    app.add_option("-o,--output-dir", outputDir, "Directory receiving the transcript file");
    app.add_option("--chunk-seconds", chunkSeconds, "Duration of each audio chunk in seconds");
    app.add_option("--workers", workers, "Number of concurrent recognition processes (0 = auto)");
    app.add_flag("--full-audio", fullAudio, "Transcribe the whole file instead of the capped duration");
    app.add_flag("--remove-source", removeSource, "Delete the input file once the job has finished");
    app.add_flag("--json", printJson, "Print the final job status as JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? scribe::loadConfig() : scribe::loadConfigFromFile(configPath);
    if (!configResult)
    {
        scribe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    scribe::applyEnvironmentOverrides(config);

    // Apply CLI overrides
    if (!modelPath.empty())
        config.recognizer.modelPath = modelPath;
    if (!language.empty())
        config.recognizer.language = language;
    if (!whisperBinary.empty())
        config.recognizer.binary = whisperBinary;
    if (!ffmpegBinary.empty())
        config.audio.binary = ffmpegBinary;
    if (!prompt.empty())
        config.recognizer.prompt = prompt;
    if (!outputDir.empty())
        config.storage.outputDir = outputDir;
    if (chunkSeconds > 0)
        config.audio.chunkSeconds = chunkSeconds;
    if (workers > 0)
        config.workers.count = workers;
    config.storage.removeSourceAfterJob = removeSource;
    if (verbose)
        config.logLevel = "debug";

    if (auto valid = scribe::validateConfig(config); !valid)
    {
        scribe::log::error("{}", valid.error().message);
        return 1;
    }

    scribe::log::setLevel(scribe::log::parseLevel(config.logLevel).value_or(scribe::log::Level::Info));

    auto manager = scribe::JobManager(scribe::pipelineConfig(config),
                                      scribe::jobManagerConfig(config),
                                      std::make_shared<scribe::ProcessRunner>());

    auto submitted = manager.submit(scribe::SubmitRequest { .sourcePath = inputPath, .fullAudio = fullAudio });
    if (!submitted)
    {
        scribe::log::error("Failed to submit job: {}", submitted.error().message);
        return 1;
    }

    auto const& jobId = *submitted;
    auto lastProgress = -1;
    auto lastStage = std::string {};

    while (true)
    {
        auto snapshot = manager.waitFor(jobId, PollInterval);
        if (!snapshot)
        {
            scribe::log::error("{}", snapshot.error().message);
            return 1;
        }

        if (snapshot->progress != lastProgress || snapshot->stage != lastStage)
        {
            lastProgress = snapshot->progress;
            lastStage = snapshot->stage;
            std::cerr << std::format("[{:3}%] {}\n", lastProgress, lastStage);
        }

        if (!snapshot->terminal())
            continue;

        if (printJson)
            std::cout << scribe::toJson(*snapshot).dump(2) << '\n';
        else if (snapshot->status == scribe::JobStatus::Completed)
            std::cout << snapshot->transcription.value_or("") << '\n';
        else
            std::cerr << std::format("Transcription failed: {}\n", snapshot->error ? snapshot->error->message : "");

        return snapshot->status == scribe::JobStatus::Completed ? 0 : 1;
    }
}
