// SPDX-License-Identifier: Apache-2.0
#include <pipeline/ProgressTracker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace scribe;

TEST_CASE("ProgressTracker interpolates dispatch progress between checkpoints", "[progress]")
{
    CHECK(ProgressTracker::dispatchPercent(0, 4) == checkpoint::Segmented);
    CHECK(ProgressTracker::dispatchPercent(2, 4) == 57);
    CHECK(ProgressTracker::dispatchPercent(4, 4) == checkpoint::Finalizing);
    CHECK(ProgressTracker::dispatchPercent(9, 4) == checkpoint::Finalizing);
    CHECK(ProgressTracker::dispatchPercent(0, 0) == checkpoint::Segmented);
}

TEST_CASE("ProgressTracker never moves backwards", "[progress]")
{
    auto reported = std::vector<int> {};
    auto tracker = ProgressTracker([&](std::string_view, int percent) { reported.push_back(percent); });

    tracker.checkpoint(stage::Segmenting, checkpoint::Normalized);
    tracker.checkpoint(stage::Normalizing, checkpoint::Starting);

    CHECK(tracker.percent() == checkpoint::Normalized);
    CHECK(tracker.stageName() == stage::Normalizing);
    REQUIRE(reported.size() == 2);
    CHECK(reported[1] == checkpoint::Normalized);
}

TEST_CASE("ProgressTracker stays below 100 while active", "[progress]")
{
    auto tracker = ProgressTracker({});
    tracker.checkpoint(stage::Finalizing, checkpoint::Complete);
    CHECK(tracker.percent() == checkpoint::ActiveCeiling);
}

TEST_CASE("ProgressTracker reports chunk counts in the stage name", "[progress]")
{
    auto stages = std::vector<std::string> {};
    auto tracker = ProgressTracker([&](std::string_view stageName, int) { stages.emplace_back(stageName); });

    tracker.beginDispatch(3);
    tracker.chunkCompleted();

    REQUIRE(stages.size() == 2);
    CHECK(stages[0] == "Transcribing (0/3)");
    CHECK(stages[1] == "Transcribing (1/3)");
    CHECK(tracker.completedChunks() == 1);
}

TEST_CASE("ProgressTracker aggregates concurrent chunk completions", "[progress]")
{
    constexpr auto Chunks = 64;
    constexpr auto Workers = 8;

    auto mutex = std::mutex {};
    auto reported = std::vector<int> {};
    auto tracker = ProgressTracker([&](std::string_view, int percent) {
        auto lock = std::lock_guard(mutex);
        reported.push_back(percent);
    });

    tracker.beginDispatch(Chunks);
    {
        auto threads = std::vector<std::jthread> {};
        for (auto w = 0; w < Workers; ++w)
            threads.emplace_back([&] {
                for (auto i = 0; i < Chunks / Workers; ++i)
                    tracker.chunkCompleted();
            });
    }

    CHECK(tracker.completedChunks() == Chunks);
    CHECK(tracker.percent() == checkpoint::Finalizing);
    REQUIRE(reported.size() == Chunks + 1);
    for (auto i = std::size_t { 1 }; i < reported.size(); ++i)
        CHECK(reported[i - 1] <= reported[i]);
}
