//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.hpp
// Description: Random data generation, memory erasure, and the base64 alphabets used by the JOSE serializations.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] OptionalBuffer GenerateRandomData(std::size_t size);
[[nodiscard]] bool GenerateRandomData(WriteableView writeable);

void EraseMemory(void* begin, std::size_t size);

[[nodiscard]] bool ConstantTimeEquals(ReadableView left, ReadableView right);

// Standard alphabet with padding. Used for the x5c certificate entries.
[[nodiscard]] std::string EncodeBase64(ReadableView data);
[[nodiscard]] OptionalBuffer DecodeBase64(std::string_view encoded);

// URL safe alphabet without padding. Used for every compact JOSE segment and JWK coordinate.
[[nodiscard]] std::string EncodeBase64Url(ReadableView data);
[[nodiscard]] std::string EncodeBase64Url(std::string_view data);
[[nodiscard]] OptionalBuffer DecodeBase64Url(std::string_view encoded);

[[nodiscard]] ReadableView ToReadableView(std::string_view data);
[[nodiscard]] std::string_view ToStringView(ReadableView data);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
