//----------------------------------------------------------------------------------------------------------------------
// File: PlatformDetector.hpp
// Description: Maps the content encryption algorithm of an inbound envelope to the device platform that produced it.
// The mapping is fixed by the device SDKs: A128CBC-HS256 is only sent by Android and A128GCM only by iOS. Unknown
// values are rejected, guessing a platform would only surface later as an opaque authentication failure.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Result<Platform> DetectPlatform(std::string_view algorithm);
[[nodiscard]] Result<Platform> DetectPlatform(boost::json::object const& header);

[[nodiscard]] Result<std::string_view> GetEncryptionAlgorithm(Platform platform);

// Reads the user facing platform names ("android", "ios"), case insensitive.
[[nodiscard]] std::optional<Platform> ParsePlatform(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
