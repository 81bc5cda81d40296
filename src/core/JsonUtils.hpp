// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace tfview::json
{

/// @brief Parses a JSON document, returning a Result.
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

/// @brief Reads an optional string field, falling back to @p defaultValue when absent or mistyped.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Reads an optional integer field, falling back to @p defaultValue when absent or mistyped.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Reads an optional boolean field, falling back to @p defaultValue when absent or mistyped.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(key);
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Reads an optional array of strings.
///
/// Non-string elements are skipped. A missing or non-array field yields @p defaultValue.
[[nodiscard]] inline auto getStringListOr(const nlohmann::json& obj,
                                          std::string_view key,
                                          std::vector<std::string> defaultValue) -> std::vector<std::string>
{
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_array())
        return defaultValue;

    auto result = std::vector<std::string> {};
    for (auto const& element: *it)
        if (element.is_string())
            result.push_back(element.get<std::string>());
    return result;
}

} // namespace tfview::json
