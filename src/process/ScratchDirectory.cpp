// SPDX-License-Identifier: Apache-2.0
#include "ScratchDirectory.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <format>
#include <string>
#include <utility>

namespace scribe
{

auto ScratchDirectory::create(const std::filesystem::path& root, std::string_view prefix) -> Result<ScratchDirectory>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(root, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create scratch root '{}': {}", root.string(), ec.message()));

    auto pattern = (root / std::format("{}XXXXXX", prefix)).string();
    if (::mkdtemp(pattern.data()) == nullptr)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create scratch directory under '{}': {}",
                                     root.string(),
                                     strerror(errno)));

    log::debug("Scratch workspace created: {}", pattern);
    return ScratchDirectory(std::filesystem::path(pattern));
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path): _path(std::move(path))
{
}

ScratchDirectory::~ScratchDirectory()
{
    remove();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept: _path(std::exchange(other._path, {}))
{
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept
{
    if (this != &other)
    {
        remove();
        _path = std::exchange(other._path, {});
    }
    return *this;
}

auto ScratchDirectory::subdirectory(std::string_view name) const -> Result<std::filesystem::path>
{
    auto dir = _path / name;
    auto ec = std::error_code {};
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create '{}': {}", dir.string(), ec.message()));
    return dir;
}

void ScratchDirectory::remove() noexcept
{
    if (_path.empty())
        return;

    auto ec = std::error_code {};
    std::filesystem::remove_all(_path, ec);

    // Runs from the destructor: a failure to log must not terminate the process.
    try
    {
        if (ec)
            log::warning("Failed to remove scratch workspace '{}': {}", _path.string(), ec.message());
        else
            log::debug("Scratch workspace removed: {}", _path.string());
    }
    catch (const std::exception&)
    {
    }

    _path.clear();
}

} // namespace scribe
