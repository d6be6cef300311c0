// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace vocatype::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
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

/// @brief Extracts an optional unsigned integer field; negative values fall back to the default.
[[nodiscard]] inline auto getUintOr(const nlohmann::json& obj, std::string_view key, std::uint32_t defaultValue)
    -> std::uint32_t
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0)
        return it->get<std::uint32_t>();
    return defaultValue;
}

/// @brief Extracts an optional float field from a JSON object.
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

/// @brief Extracts an optional millisecond duration stored as an integer field.
[[nodiscard]] inline auto getMillisecondsOr(const nlohmann::json& obj,
                                            std::string_view key,
                                            std::chrono::milliseconds defaultValue)
    -> std::chrono::milliseconds
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return std::chrono::milliseconds(it->get<std::int64_t>());
    return defaultValue;
}

/// @brief Extracts the string elements of an optional array field; non-string elements are skipped.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return result;
    for (auto const& element: *it)
    {
        if (element.is_string())
            result.push_back(element.get<std::string>());
    }
    return result;
}

} // namespace vocatype::json
