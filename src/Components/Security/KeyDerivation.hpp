//----------------------------------------------------------------------------------------------------------------------
// File: KeyDerivation.hpp
// Description: ConcatKDF (NIST SP 800-56A, single step with SHA-256) over an ECDH shared secret. The derivation context
// carries the SDK reference number of the device platform, so a key derived for one platform is well formed but
// useless for the other. The resulting material remembers the platform and algorithm it was derived for and the codec
// refuses to apply it in any other context.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SharedSecret;
class DerivedKeyMaterial;

[[nodiscard]] Result<std::string_view> GetSdkReferenceNumber(Platform platform);

[[nodiscard]] Result<DerivedKeyMaterial> DeriveKey(
    SharedSecret const& secret, std::string_view algorithm, Platform platform);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::DerivedKeyMaterial
{
public:
    DerivedKeyMaterial(Platform platform, std::string_view algorithm, SecureBuffer&& key);

    DerivedKeyMaterial(DerivedKeyMaterial const&) = delete;
    DerivedKeyMaterial& operator=(DerivedKeyMaterial const&) = delete;

    DerivedKeyMaterial(DerivedKeyMaterial&& other) noexcept = default;
    DerivedKeyMaterial& operator=(DerivedKeyMaterial&& other) noexcept = default;

    [[nodiscard]] Platform GetPlatform() const { return m_platform; }
    [[nodiscard]] std::string const& GetAlgorithm() const { return m_algorithm; }
    [[nodiscard]] ReadableView GetData() const { return m_key.GetData(); }
    [[nodiscard]] std::size_t GetSize() const { return m_key.GetSize(); }

    [[nodiscard]] ReadableView GetFirstHalf() const { return m_key.GetCordon(0, ContentKeySize); }
    [[nodiscard]] ReadableView GetSecondHalf() const { return m_key.GetCordon(ContentKeySize, ContentKeySize); }

private:
    Platform m_platform;
    std::string m_algorithm;
    SecureBuffer m_key;
};

//----------------------------------------------------------------------------------------------------------------------
