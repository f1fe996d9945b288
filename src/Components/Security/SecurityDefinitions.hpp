//----------------------------------------------------------------------------------------------------------------------
// File: SecurityDefinitions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

enum class Platform : std::uint32_t { Unknown, Android, iOS };

// Selects the half of the derived key used by direction dependent constructions. The names are relative to the ACS.
enum class KeyUsage : std::uint32_t { EncryptHalf, DecryptHalf };

enum class VerificationStatus : std::uint32_t { Failed, Success };

enum class Error : std::uint32_t {
    UnsupportedPlatform,
    UnsupportedAlgorithm,
    AuthenticationFailed,
    MalformedEnvelope,
    CertificateLoadError,
    KeyGenerationFailure,
    InvalidPublicKey,
    KeyContextMismatch,
    CryptographicFailure
};

[[nodiscard]] constexpr std::string_view ToString(Error error);
[[nodiscard]] constexpr std::string_view ToString(Platform platform);

namespace Algorithm {

constexpr std::string_view CbcHmac = "A128CBC-HS256";
constexpr std::string_view Gcm = "A128GCM";
constexpr std::string_view Direct = "dir";
constexpr std::string_view ProbabilisticSignature = "PS256";

} // Algorithm namespace

namespace ReferenceNumber {

constexpr std::string_view Android = "3DS_LOA_SDK_JTPL_020200_00788";
constexpr std::string_view iOS = "3DS_LOA_SDK_JTPL_020200_00805";

} // ReferenceNumber namespace

constexpr std::string_view CurveName = "P-256";
constexpr std::size_t CoordinateSize = 32;
constexpr std::size_t UncompressedPointSize = 1 + 2 * CoordinateSize;
constexpr std::size_t DerivedKeySize = 32;
constexpr std::size_t ContentKeySize = 16;
constexpr std::size_t AuthenticationTagSize = 16;
constexpr std::size_t CbcInitializationVectorSize = 16;
constexpr std::size_t GcmInitializationVectorSize = 12;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Security::ToString(Error error)
{
    switch (error) {
        case Error::UnsupportedPlatform: return "unsupported platform";
        case Error::UnsupportedAlgorithm: return "unsupported encryption algorithm";
        case Error::AuthenticationFailed: return "authentication failed";
        case Error::MalformedEnvelope: return "malformed envelope";
        case Error::CertificateLoadError: return "certificate load error";
        case Error::KeyGenerationFailure: return "key generation failure";
        case Error::InvalidPublicKey: return "invalid public key";
        case Error::KeyContextMismatch: return "key context mismatch";
        case Error::CryptographicFailure: return "cryptographic failure";
    }
    return "unknown error";
}

//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Security::ToString(Platform platform)
{
    switch (platform) {
        case Platform::Android: return "android";
        case Platform::iOS: return "ios";
        default: return "unknown";
    }
}

//----------------------------------------------------------------------------------------------------------------------
