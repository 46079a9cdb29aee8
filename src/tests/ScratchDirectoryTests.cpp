// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <process/ScratchDirectory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace scribe;

namespace
{

auto testRoot() -> std::filesystem::path
{
    return std::filesystem::temp_directory_path() / "scribe_scratch_tests";
}

} // namespace

TEST_CASE("ScratchDirectory creates a unique directory under the root", "[scratch]")
{
    auto first = ScratchDirectory::create(testRoot());
    auto second = ScratchDirectory::create(testRoot());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(std::filesystem::is_directory(first->path()));
    CHECK(std::filesystem::is_directory(second->path()));
    CHECK(first->path() != second->path());
    CHECK(first->path().parent_path() == testRoot());
    CHECK(first->path().filename().string().starts_with("scribe-job-"));
}

TEST_CASE("ScratchDirectory removes its tree on destruction", "[scratch]")
{
    auto path = std::filesystem::path {};
    {
        auto scratch = ScratchDirectory::create(testRoot());
        REQUIRE(scratch.has_value());
        path = scratch->path();

        auto chunks = scratch->subdirectory("chunks");
        REQUIRE(chunks.has_value());
        CHECK(std::filesystem::is_directory(*chunks));
        auto file = std::ofstream(*chunks / "chunk_000.wav");
        file << "RIFF";
    }
    CHECK(!std::filesystem::exists(path));
}

TEST_CASE("ScratchDirectory removes its tree when the scope exits by exception", "[scratch]")
{
    auto path = std::filesystem::path {};
    try
    {
        auto scratch = ScratchDirectory::create(testRoot());
        REQUIRE(scratch.has_value());
        path = scratch->path();
        throw std::runtime_error("pipeline step failed");
    }
    catch (const std::runtime_error&)
    {
    }
    REQUIRE(!path.empty());
    CHECK(!std::filesystem::exists(path));
}

TEST_CASE("ScratchDirectory move transfers ownership", "[scratch]")
{
    auto created = ScratchDirectory::create(testRoot());
    REQUIRE(created.has_value());
    auto const path = created->path();

    auto owner = std::move(*created);
    CHECK(owner.path() == path);
    CHECK(created->path().empty());

    created->remove();
    CHECK(std::filesystem::exists(path));

    owner.remove();
    CHECK(!std::filesystem::exists(path));
    CHECK(owner.path().empty());
}

TEST_CASE("ScratchDirectory reports an unusable root", "[scratch]")
{
    auto const blocker = std::filesystem::temp_directory_path() / "scribe_scratch_blocker";
    {
        auto file = std::ofstream(blocker);
        file << "not a directory";
    }

    auto result = ScratchDirectory::create(blocker / "nested");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);

    std::filesystem::remove(blocker);
}

TEST_CASE("ScratchDirectory removal survives a logger that throws", "[scratch]")
{
    auto const previousLevel = log::getLevel();
    log::setLevel(log::Level::Debug);

    auto path = std::filesystem::path {};
    {
        auto scratch = ScratchDirectory::create(testRoot());
        if (scratch)
            path = scratch->path();

        // Every log line emitted while the directory is destroyed now throws.
        log::setCallback([](log::Level, std::string_view) { throw std::runtime_error("log sink unavailable"); });
    }

    log::setCallback({});
    log::setLevel(previousLevel);

    REQUIRE(!path.empty());
    CHECK(!std::filesystem::exists(path));
}
