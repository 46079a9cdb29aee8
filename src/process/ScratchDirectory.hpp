// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string_view>

namespace scribe
{

/// @brief Uniquely named temporary directory owned by a single job.
///
/// The directory and everything below it is removed recursively when the owning
/// object is destroyed, on every exit path. Removal failures are logged, never reported.
class ScratchDirectory
{
  public:
    /// @brief Creates a fresh directory "<root>/<prefix>XXXXXX".
    /// @param root Parent directory; created if missing.
    /// @param prefix Name prefix of the new directory.
    /// @return The owning handle or an IoError.
    [[nodiscard]] static auto create(const std::filesystem::path& root, std::string_view prefix = "scribe-job-")
        -> Result<ScratchDirectory>;

    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

    /// @brief Creates (if needed) and returns a subdirectory of the workspace.
    [[nodiscard]] auto subdirectory(std::string_view name) const -> Result<std::filesystem::path>;

    /// @brief Removes the directory tree now. Called by the destructor; idempotent.
    void remove() noexcept;

  private:
    explicit ScratchDirectory(std::filesystem::path path);

    std::filesystem::path _path;
};

} // namespace scribe
