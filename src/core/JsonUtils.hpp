// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "Error.hpp"

namespace scribe::json
{

/// @brief Parses a JSON document, returning a Result.
/// @param input The JSON text to parse.
/// @return The parsed JSON value or a ConfigError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the object stored under @p key, or an empty object when absent or not an object.
[[nodiscard]] inline auto section(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_object())
        return *it;
    return nlohmann::json::object();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional floating-point field from a JSON object.
/// Integers are accepted as well ("chunkSeconds": 90 and 90.0 are equivalent).
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number())
        return it->get<float>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

} // namespace scribe::json
