// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace sessionpulse::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON object or an Error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::MalformedEvent, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value, or std::nullopt if missing or not a string.
[[nodiscard]] inline auto findString(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::string>
{
    if (!obj.is_object())
        return std::nullopt;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    return findString(obj, key).value_or(std::string(defaultValue));
}

/// @brief Extracts a token-style counter from a JSON object.
///
/// Negative or non-integral values are treated as zero, since counters never decrease.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The counter value, or std::nullopt if the field is missing.
[[nodiscard]] inline auto findCount(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::uint64_t>
{
    if (!obj.is_object())
        return std::nullopt;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_number())
        return std::nullopt;
    if (it->is_number_unsigned())
        return it->get<std::uint64_t>();
    if (it->is_number_integer())
    {
        auto const value = it->get<std::int64_t>();
        return value > 0 ? static_cast<std::uint64_t>(value) : std::uint64_t { 0 };
    }
    auto const value = it->get<double>();
    return value > 0.0 ? static_cast<std::uint64_t>(value) : std::uint64_t { 0 };
}

} // namespace sessionpulse::json
