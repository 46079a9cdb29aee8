// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <process/CommandRunner.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scribe::test
{

/// @brief Scripted stand-in for ffmpeg and whisper-cli.
///
/// Normalization writes the output file, segmentation writes chunkCount "chunk_NNN.wav"
/// files, recognition writes "<-of>.txt" with the scripted text of the chunk.
/// Thread-safe, so it can serve all dispatcher workers at once.
class FakeToolRunner: public CommandRunner
{
  public:
    std::size_t chunkCount = 3;

    /// @brief Recognized text per chunk index; missing entries yield "chunk <index>".
    std::map<std::size_t, std::string> chunkTexts;

    /// @brief Chunk indices whose recognition exits with status 1.
    std::set<std::size_t> failingChunks;

    /// @brief Chunk indices whose recognition exits 0 without writing a transcript.
    std::set<std::size_t> silentChunks;

    /// @brief Chunk indices whose recognition throws instead of returning an error.
    std::set<std::size_t> throwingChunks;

    bool failNormalize = false;

    /// @brief Sleeps longer for earlier chunks so completion order is reversed.
    std::chrono::milliseconds reverseDelayStep { 0 };

    auto run(const Command& command) -> VoidResult override
    {
        {
            auto lock = std::lock_guard(_mutex);
            _commands.push_back(command);
        }

        if (command.label == "Audio normalization")
            return normalize(command);
        if (command.label == "Audio segmentation")
            return segment(command);
        if (command.label == "Speech recognition")
            return recognize(command);

        return makeError(ErrorCode::ProcessSpawn, std::format("{}: unknown fake tool", command.label));
    }

    [[nodiscard]] auto commands() const -> std::vector<Command>
    {
        auto lock = std::lock_guard(_mutex);
        return _commands;
    }

    [[nodiscard]] auto commandsLabelled(std::string_view label) const -> std::vector<Command>
    {
        auto result = std::vector<Command> {};
        for (auto const& command: commands())
        {
            if (command.label == label)
                result.push_back(command);
        }
        return result;
    }

    [[nodiscard]] auto maxConcurrentRecognitions() const -> int
    {
        auto lock = std::lock_guard(_mutex);
        return _maxConcurrent;
    }

    /// @brief Chunk indices in the order their recognition finished.
    [[nodiscard]] auto completionOrder() const -> std::vector<std::size_t>
    {
        auto lock = std::lock_guard(_mutex);
        return _completionOrder;
    }

    /// @brief Returns the value following @p flag in @p args, or an empty string.
    [[nodiscard]] static auto argAfter(const std::vector<std::string>& args, std::string_view flag) -> std::string
    {
        auto const it = std::ranges::find(args, flag);
        if (it == args.end() || std::next(it) == args.end())
            return {};
        return *std::next(it);
    }

  private:
    static void touch(const std::filesystem::path& path, std::string_view content)
    {
        auto file = std::ofstream(path, std::ios::binary);
        file << content;
    }

    auto normalize(const Command& command) -> VoidResult
    {
        if (failNormalize)
            return makeProcessExitError(
                "Audio normalization: exit code 1. Invalid data found when processing input",
                1,
                "Invalid data found when processing input");

        touch(command.args.back(), "RIFF");
        return {};
    }

    auto segment(const Command& command) -> VoidResult
    {
        auto const pattern = std::filesystem::path(command.args.back());
        auto const dir = pattern.parent_path();

        // Written in reverse so enumeration order cannot come from creation order.
        for (auto i = chunkCount; i > 0; --i)
            touch(dir / std::format("chunk_{:03}.wav", i - 1), "RIFF");
        return {};
    }

    auto recognize(const Command& command) -> VoidResult
    {
        auto const chunk = std::filesystem::path(argAfter(command.args, "-f"));
        auto const base = argAfter(command.args, "-of");
        auto const index = static_cast<std::size_t>(std::stoul(chunk.stem().string().substr(6)));

        if (throwingChunks.contains(index))
            throw std::runtime_error(std::format("recognizer crashed on {}", chunk.filename().string()));

        {
            auto lock = std::lock_guard(_mutex);
            _maxConcurrent = std::max(_maxConcurrent, ++_concurrent);
        }

        if (reverseDelayStep.count() > 0)
            std::this_thread::sleep_for(reverseDelayStep * static_cast<int>(chunkCount - index));

        auto result = VoidResult {};
        if (failingChunks.contains(index))
        {
            result = makeProcessExitError(
                std::format("Speech recognition: exit code 1. failed to decode {}", chunk.filename().string()),
                1,
                std::format("failed to decode {}", chunk.filename().string()));
        }
        else if (!silentChunks.contains(index))
        {
            auto const it = chunkTexts.find(index);
            auto const text = it != chunkTexts.end() ? it->second : std::format("chunk {}", index);
            touch(base + ".txt", std::format("  {}\n\n", text));
        }

        {
            auto lock = std::lock_guard(_mutex);
            --_concurrent;
            _completionOrder.push_back(index);
        }
        return result;
    }

    mutable std::mutex _mutex;
    std::vector<Command> _commands;
    std::vector<std::size_t> _completionOrder;
    int _concurrent = 0;
    int _maxConcurrent = 0;
};

} // namespace scribe::test
