//----------------------------------------------------------------------------------------------------------------------
// File: KeyDerivation.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "KeyDerivation.hpp"
#include "EphemeralKeyPair.hpp"
#include "PlatformDetector.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using KeyDerivationFunction = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using KeyDerivationFunctionContext = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

constexpr std::uint32_t DerivedKeyBits = Security::DerivedKeySize * 8;

void AppendLength(Security::Buffer& buffer, std::uint32_t value);

// AlgorithmID || PartyUInfo || PartyVInfo || SuppPubInfo. The device SDKs leave the algorithm and party U fields
// empty and carry the reference number as party V.
[[nodiscard]] Security::Buffer CreateOtherInfo(std::string_view referenceNumber);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::Result<std::string_view> Security::GetSdkReferenceNumber(Platform platform)
{
    switch (platform) {
        case Platform::Android: return ReferenceNumber::Android;
        case Platform::iOS: return ReferenceNumber::iOS;
        default: return Error::UnsupportedPlatform;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::DerivedKeyMaterial> Security::DeriveKey(
    SharedSecret const& secret, std::string_view algorithm, Platform platform)
{
    auto const referenceNumber = GetSdkReferenceNumber(platform);
    if (auto const pError = std::get_if<Error>(&referenceNumber); pError) { return *pError; }

    // Each platform is bound to a single content encryption algorithm. Deriving a key for any other pairing would
    // produce material that neither SDK could use.
    auto const expected = GetEncryptionAlgorithm(platform);
    if (auto const pExpected = std::get_if<std::string_view>(&expected); !pExpected || *pExpected != algorithm) {
        return Error::UnsupportedAlgorithm;
    }

    if (secret.IsEmpty()) { return Error::CryptographicFailure; }

    local::KeyDerivationFunction const upFunction(EVP_KDF_fetch(nullptr, "SSKDF", nullptr), &EVP_KDF_free);
    if (!upFunction) { return Error::CryptographicFailure; }

    local::KeyDerivationFunctionContext const upContext(EVP_KDF_CTX_new(upFunction.get()), &EVP_KDF_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    auto otherInfo = local::CreateOtherInfo(std::get<std::string_view>(referenceNumber));

    std::array<OSSL_PARAM, 4> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, const_cast<char*>(SN_sha256), 0),
        OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<std::uint8_t*>(secret.GetData().data()), secret.GetSize()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, otherInfo.data(), otherInfo.size()),
        OSSL_PARAM_construct_end()
    };

    SecureBuffer key{ DerivedKeySize };
    if (EVP_KDF_derive(upContext.get(), key.GetData().data(), key.GetSize(), params.data()) <= 0) {
        return Error::CryptographicFailure;
    }

    return DerivedKeyMaterial{ platform, algorithm, std::move(key) };
}

//----------------------------------------------------------------------------------------------------------------------

Security::DerivedKeyMaterial::DerivedKeyMaterial(Platform platform, std::string_view algorithm, SecureBuffer&& key)
    : m_platform(platform)
    , m_algorithm(algorithm)
    , m_key(std::move(key))
{
    if (m_key.GetSize() != DerivedKeySize) {
        throw std::runtime_error("Derived key material must be exactly 32 bytes!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

void local::AppendLength(Security::Buffer& buffer, std::uint32_t value)
{
    buffer.emplace_back(static_cast<std::uint8_t>(value >> 24));
    buffer.emplace_back(static_cast<std::uint8_t>(value >> 16));
    buffer.emplace_back(static_cast<std::uint8_t>(value >> 8));
    buffer.emplace_back(static_cast<std::uint8_t>(value));
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer local::CreateOtherInfo(std::string_view referenceNumber)
{
    Security::Buffer info;
    info.reserve(4 + 4 + 4 + referenceNumber.size() + 4);
    AppendLength(info, 0); // AlgorithmID
    AppendLength(info, 0); // PartyUInfo
    AppendLength(info, static_cast<std::uint32_t>(referenceNumber.size()));
    info.insert(info.end(), referenceNumber.begin(), referenceNumber.end());
    AppendLength(info, DerivedKeyBits);
    return info;
}

//----------------------------------------------------------------------------------------------------------------------
