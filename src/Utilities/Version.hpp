//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Acs {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";
constexpr std::string_view ProtocolVersion = "2.2.0";

//----------------------------------------------------------------------------------------------------------------------
} // Acs namespace
//----------------------------------------------------------------------------------------------------------------------
