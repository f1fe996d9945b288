//----------------------------------------------------------------------------------------------------------------------
// File: JsonUtils.hpp
// Description: Small accessors for reading typed members out of boost::json documents.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JsonUtils {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string_view ToStringView(boost::json::string const& value);
[[nodiscard]] std::optional<std::string_view> GetString(boost::json::object const& json, std::string_view key);
[[nodiscard]] std::optional<boost::json::object> ParseObject(std::string_view serialized);

//----------------------------------------------------------------------------------------------------------------------
} // JsonUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline std::string_view JsonUtils::ToStringView(boost::json::string const& value)
{
    return std::string_view{ value.data(), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::string_view> JsonUtils::GetString(boost::json::object const& json, std::string_view key)
{
    auto const pValue = json.if_contains(key);
    if (!pValue || !pValue->is_string()) { return {}; }
    return ToStringView(pValue->get_string());
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<boost::json::object> JsonUtils::ParseObject(std::string_view serialized)
{
    boost::json::error_code error;
    auto json = boost::json::parse(serialized, error);
    if (error || !json.is_object()) { return {}; }
    return std::move(json.get_object());
}

//----------------------------------------------------------------------------------------------------------------------
