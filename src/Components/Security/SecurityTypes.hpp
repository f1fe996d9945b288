//----------------------------------------------------------------------------------------------------------------------
// File: SecurityTypes.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using ReadableView = std::span<std::uint8_t const, std::dynamic_extent>;
using WriteableView = std::span<std::uint8_t, std::dynamic_extent>;
using OptionalBuffer = std::optional<Buffer>;

template<typename ValueType>
using Result = std::variant<ValueType, Error>;

using BufferResult = Result<Buffer>;
using StringResult = Result<std::string>;

// The output of a content cipher, each member maps to one segment of a compact JWE.
struct SealedContent
{
    Buffer initializationVector;
    Buffer ciphertext;
    Buffer tag;
};

using SealedContentResult = Result<SealedContent>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
