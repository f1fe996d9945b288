//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Messages describing why a configuration field was rejected. Field names are joined with '.' to give
// the full path of the offending field.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cctype>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string GetIndefiniteArticle(std::string_view value)
{
    if (value.empty()) { return ""; }

    switch (std::tolower(static_cast<unsigned char>(value.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u': return "an";
        default: return "a";
    }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result += std::string(result.empty() ? "" : ".").append(std::string_view{ fields })), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field was not found.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be {} {}.",
        ConcatenateFieldNames(fields...), GetIndefiniteArticle(type), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(std::string_view expectation, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. Expected {}.", ConcatenateFieldNames(fields...), expectation);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateValueRangeMessage(
    std::integral auto min, std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be a value between '{}' and '{}'.", ConcatenateFieldNames(fields...), min, max);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
