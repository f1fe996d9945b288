//----------------------------------------------------------------------------------------------------------------------
// File: PlatformDetector.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PlatformDetector.hpp"
#include "Utilities/JsonUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view EncryptionAlgorithm = "enc";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::Platform> Security::DetectPlatform(std::string_view algorithm)
{
    if (algorithm == Algorithm::CbcHmac) { return Platform::Android; }
    if (algorithm == Algorithm::Gcm) { return Platform::iOS; }
    return Error::UnsupportedPlatform; // No platform is guessed for an unrecognized "enc".
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::Platform> Security::DetectPlatform(boost::json::object const& header)
{
    auto const optAlgorithm = JsonUtils::GetString(header, symbols::EncryptionAlgorithm);
    if (!optAlgorithm) { return Error::MalformedEnvelope; }
    return DetectPlatform(*optAlgorithm);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<std::string_view> Security::GetEncryptionAlgorithm(Platform platform)
{
    switch (platform) {
        case Platform::Android: return Algorithm::CbcHmac;
        case Platform::iOS: return Algorithm::Gcm;
        default: return Error::UnsupportedPlatform;
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::Platform> Security::ParsePlatform(std::string_view name)
{
    std::string lowered{ name };
    std::ranges::transform(lowered, lowered.begin(), [] (unsigned char c) { return std::tolower(c); });
    if (lowered == ToString(Platform::Android)) { return Platform::Android; }
    if (lowered == ToString(Platform::iOS)) { return Platform::iOS; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
