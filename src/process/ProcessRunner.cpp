// SPDX-License-Identifier: Apache-2.0
#include "ProcessRunner.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <vector>

#include <sys/wait.h>

#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace scribe
{

namespace
{

    /// @brief Closes a file descriptor on scope exit.
    struct FdGuard
    {
        int fd = -1;

        ~FdGuard()
        {
            if (fd >= 0)
                ::close(fd);
        }
    };

    auto trimmed(std::string_view text) -> std::string
    {
        auto const begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return std::string(text.substr(begin, end - begin + 1));
    }

    /// @brief Drains the pipe until EOF, keeping at most @p limit trailing bytes.
    auto drainPipe(int fd, std::size_t limit) -> std::string
    {
        auto captured = std::string {};
        auto buf = std::array<char, 4096> {};
        while (true)
        {
            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;

            captured.append(buf.data(), static_cast<size_t>(bytesRead));
            if (captured.size() > limit)
                captured.erase(0, captured.size() - limit);
        }
        return captured;
    }

    /// @brief Waits for the child and maps its termination to an exit code.
    /// A child killed by a signal yields 128 + signal number, as shells report it.
    auto waitForExit(pid_t pid) -> std::expected<int, int>
    {
        auto status = 0;
        while (::waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return std::unexpected(errno);
        }

        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

} // namespace

ProcessRunner::ProcessRunner(std::size_t stderrLimit): _stderrLimit(stderrLimit)
{
}

auto ProcessRunner::run(const Command& command) -> VoidResult
{
    if (command.program.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("{}: empty program name", command.label));

    int stderrPipe[2];
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ProcessSpawn,
                         std::format("{}: failed to create stderr pipe: {}", command.label, strerror(errno)));

    auto readEnd = FdGuard { stderrPipe[0] };
    auto writeEnd = FdGuard { stderrPipe[1] };

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, writeEnd.fd, STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto programCopy = command.program;
    argv.push_back(programCopy.data());
    auto argCopies = std::vector<std::string>(command.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    log::debug("{}: spawning {} with {} argument(s)", command.label, command.program, command.args.size());

    pid_t pid;
    auto const status = posix_spawnp(&pid, command.program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    // Only the child may hold the write end, otherwise the read below never sees EOF.
    ::close(writeEnd.fd);
    writeEnd.fd = -1;

    if (status != 0)
        return makeError(ErrorCode::ProcessSpawn,
                         std::format("{}: failed to spawn '{}': {}", command.label, command.program, strerror(status)));

    auto const diagnostics = drainPipe(readEnd.fd, _stderrLimit);

    auto const exitCode = waitForExit(pid);
    if (!exitCode)
        return makeError(ErrorCode::ProcessSpawn,
                         std::format("{}: failed to wait for '{}': {}",
                                     command.label,
                                     command.program,
                                     strerror(exitCode.error())));

    if (*exitCode != 0)
    {
        auto details = trimmed(diagnostics);
        auto message = details.empty() ? std::format("{}: exit code {}.", command.label, *exitCode)
                                       : std::format("{}: exit code {}. {}", command.label, *exitCode, details);
        return makeProcessExitError(std::move(message), *exitCode, std::move(details));
    }

    log::trace("{}: {} exited cleanly", command.label, command.program);
    return {};
}

} // namespace scribe
