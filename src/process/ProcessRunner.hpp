// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <process/CommandRunner.hpp>

#include <cstddef>

namespace scribe
{

/// @brief CommandRunner that spawns a real child process.
///
/// Standard input and standard output of the child are bound to /dev/null.
/// Standard error is captured through a pipe and attached to the error on failure.
/// Stateless apart from its configuration, so one instance may be shared by all workers.
class ProcessRunner: public CommandRunner
{
  public:
    /// @brief Default upper bound of captured standard-error bytes (the tail is kept).
    static constexpr std::size_t DefaultStderrLimit = 64 * 1024;

    explicit ProcessRunner(std::size_t stderrLimit = DefaultStderrLimit);

    [[nodiscard]] auto run(const Command& command) -> VoidResult override;

  private:
    std::size_t _stderrLimit;
};

} // namespace scribe
