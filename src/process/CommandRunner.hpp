// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <vector>

namespace scribe
{

/// @brief A single external command invocation.
struct Command
{
    /// @brief Program name (looked up in PATH) or path to the executable.
    std::string program;

    /// @brief Ordered argument list, not including the program name.
    std::vector<std::string> args;

    /// @brief Diagnostic label prefixed to error messages (e.g. "Audio normalization").
    std::string label;
};

/// @brief Abstract interface for running an external command to completion.
///
/// Implementations block the calling thread until the child has exited.
/// Side effects are the files written by the external tool; nothing is returned on success.
class CommandRunner
{
  public:
    virtual ~CommandRunner() = default;

    /// @brief Runs the command and waits for it to exit.
    /// @param command The command to execute.
    /// @return Success on exit status 0; ProcessSpawn if the command could not be launched;
    ///         ProcessExit with exit code and captured standard error otherwise.
    [[nodiscard]] virtual auto run(const Command& command) -> VoidResult = 0;
};

} // namespace scribe
