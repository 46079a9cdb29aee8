// SPDX-License-Identifier: Apache-2.0
#include <process/ProcessRunner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace scribe;

namespace
{

auto shell(std::string script) -> Command
{
    return Command { .program = "/bin/sh", .args = { "-c", std::move(script) }, .label = "Test tool" };
}

} // namespace

TEST_CASE("ProcessRunner succeeds on exit status zero", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(Command { .program = "true", .args = {}, .label = "Test tool" });
    CHECK(result.has_value());
}

TEST_CASE("ProcessRunner reports non-zero exit with captured stderr", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(shell("echo 'bad input' >&2; exit 3"));

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessExit);
    REQUIRE(result.error().exitCode.has_value());
    CHECK(*result.error().exitCode == 3);
    CHECK(result.error().details == "bad input");
    CHECK(result.error().message == "Test tool: exit code 3. bad input");
}

TEST_CASE("ProcessRunner does not mix stdout into diagnostics", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(shell("echo 'regular output'; exit 1"));

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessExit);
    CHECK(result.error().details.empty());
    CHECK(result.error().message == "Test tool: exit code 1.");
}

TEST_CASE("ProcessRunner reports a missing executable as ProcessSpawn", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(Command {
        .program = "/nonexistent/scribe/tool",
        .args = { "--help" },
        .label = "Speech recognition",
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessSpawn);
    CHECK(result.error().message.starts_with("Speech recognition: "));
    CHECK(!result.error().exitCode.has_value());
}

TEST_CASE("ProcessRunner rejects an empty program", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(Command { .program = "", .args = {}, .label = "Test tool" });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ProcessRunner leaves the tool's files in place", "[process]")
{
    auto const path = std::filesystem::temp_directory_path() / "scribe_process_runner_side_effect.txt";
    std::filesystem::remove(path);

    auto runner = ProcessRunner();
    auto result = runner.run(shell("printf 'written' > '" + path.string() + "'"));
    REQUIRE(result.has_value());

    auto file = std::ifstream(path);
    auto content = std::string {};
    std::getline(file, content);
    CHECK(content == "written");

    std::filesystem::remove(path);
}

TEST_CASE("ProcessRunner maps termination by signal to 128 + signal", "[process]")
{
    auto runner = ProcessRunner();
    auto result = runner.run(shell("kill -9 $$"));

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessExit);
    REQUIRE(result.error().exitCode.has_value());
    CHECK(*result.error().exitCode == 137);
}

TEST_CASE("ProcessRunner keeps only the tail of long diagnostics", "[process]")
{
    auto runner = ProcessRunner(16);
    auto result = runner.run(shell("i=0; while [ $i -lt 200 ]; do printf 'xxxxxxxxxx' >&2; i=$((i+1)); done; "
                                   "printf 'END' >&2; exit 2"));

    REQUIRE(!result.has_value());
    CHECK(result.error().details.size() <= 16);
    CHECK(result.error().details.ends_with("END"));
}
