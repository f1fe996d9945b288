//----------------------------------------------------------------------------------------------------------------------
// File: KeyMaterial.hpp
// Description: The long lived ACS signing identity, a PEM certificate and the matching RSA private key (PKCS#1 or
// PKCS#8). The material is loaded once before any request is served and is afterwards only shared read only.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLHandles.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class KeyMaterial;

using SharedKeyMaterial = std::shared_ptr<KeyMaterial const>;

struct CertificateLoadFailure
{
    Error error = Error::CertificateLoadError;
    std::string reason;
};

using KeyMaterialResult = std::variant<SharedKeyMaterial, CertificateLoadFailure>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::KeyMaterial
{
public:
    KeyMaterial(OpenSSL::Certificate&& upCertificate, OpenSSL::Key&& upPrivateKey);

    KeyMaterial(KeyMaterial const&) = delete;
    KeyMaterial& operator=(KeyMaterial const&) = delete;

    [[nodiscard]] static KeyMaterialResult Load(
        std::filesystem::path const& certificatePath, std::filesystem::path const& privateKeyPath);

    [[nodiscard]] static KeyMaterialResult FromPem(std::string_view certificate, std::string_view privateKey);

    [[nodiscard]] X509* GetCertificate() const { return m_upCertificate.get(); }
    [[nodiscard]] EVP_PKEY* GetPrivateKey() const { return m_upPrivateKey.get(); }

    // Standard base64 of the DER certificate, as carried in an x5c header entry.
    [[nodiscard]] std::string const& GetEncodedCertificate() const { return m_encodedCertificate; }

private:
    OpenSSL::Certificate m_upCertificate;
    OpenSSL::Key m_upPrivateKey;
    std::string m_encodedCertificate;
};

//----------------------------------------------------------------------------------------------------------------------
