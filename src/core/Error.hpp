// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace scribe
{

/// @brief Error codes for categorizing failures across the transcription pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProcessSpawn,     ///< External tool could not be launched (missing binary, permissions).
    ProcessExit,      ///< External tool ran but exited with a non-zero status.
    OutputMissing,    ///< External tool exited cleanly but did not produce its artifact.
    NoChunksProduced, ///< Segmentation yielded zero chunk files.
    NotFound,         ///< Unknown job identifier.
};

/// @brief Returns the stable textual name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProcessSpawn: return "ProcessSpawn";
        case ErrorCode::ProcessExit: return "ProcessExit";
        case ErrorCode::OutputMissing: return "OutputMissing";
        case ErrorCode::NoChunksProduced: return "NoChunksProduced";
        case ErrorCode::NotFound: return "NotFound";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief Exit status of the failed child process (ProcessExit only).
    std::optional<int> exitCode;

    /// @brief Captured standard-error text of the failed child process, if any.
    std::string details;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message), .exitCode = {}, .details = {} });
}

/// @brief Creates an unexpected ProcessExit error carrying the child's exit code and diagnostics.
[[nodiscard]] inline auto makeProcessExitError(std::string message, int exitCode, std::string details)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::ProcessExit,
        .message = std::move(message),
        .exitCode = exitCode,
        .details = std::move(details),
    });
}

} // namespace scribe

template <>
struct std::formatter<scribe::Error>: std::formatter<std::string>
{
    auto format(const scribe::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", scribe::errorCodeName(error.code), error.message), ctx);
    }
};
