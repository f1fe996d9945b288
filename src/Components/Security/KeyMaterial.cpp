//----------------------------------------------------------------------------------------------------------------------
// File: KeyMaterial.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "KeyMaterial.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
//----------------------------------------------------------------------------------------------------------------------
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::optional<std::string> ReadFile(std::filesystem::path const& path);
[[nodiscard]] Security::OpenSSL::BasicInputOutput CreateMemoryReader(std::string_view pem);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::KeyMaterial::KeyMaterial(OpenSSL::Certificate&& upCertificate, OpenSSL::Key&& upPrivateKey)
    : m_upCertificate(std::move(upCertificate))
    , m_upPrivateKey(std::move(upPrivateKey))
    , m_encodedCertificate()
{
    if (!m_upCertificate || !m_upPrivateKey) {
        throw std::runtime_error("Key material requires both a certificate and a private key!");
    }

    std::int32_t const size = i2d_X509(m_upCertificate.get(), nullptr);
    if (size <= 0) {
        throw std::runtime_error("Failed to encode the certificate!");
    }

    Buffer der(static_cast<std::size_t>(size), 0x00);
    auto pDer = der.data();
    if (i2d_X509(m_upCertificate.get(), &pDer) != size) {
        throw std::runtime_error("Failed to encode the certificate!");
    }

    m_encodedCertificate = EncodeBase64(der);
}

//----------------------------------------------------------------------------------------------------------------------

Security::KeyMaterialResult Security::KeyMaterial::Load(
    std::filesystem::path const& certificatePath, std::filesystem::path const& privateKeyPath)
{
    auto const optCertificate = local::ReadFile(certificatePath);
    if (!optCertificate) {
        return CertificateLoadFailure{ .reason = "Unable to read the certificate at " + certificatePath.string() };
    }

    auto optPrivateKey = local::ReadFile(privateKeyPath);
    if (!optPrivateKey) {
        return CertificateLoadFailure{ .reason = "Unable to read the private key at " + privateKeyPath.string() };
    }

    auto result = FromPem(*optCertificate, *optPrivateKey);
    EraseMemory(optPrivateKey->data(), optPrivateKey->size());
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Security::KeyMaterialResult Security::KeyMaterial::FromPem(std::string_view certificate, std::string_view privateKey)
{
    auto upCertificate = [&certificate] () -> OpenSSL::Certificate {
        auto const upReader = local::CreateMemoryReader(certificate);
        if (!upReader) { return nullptr; }
        return OpenSSL::Certificate{ PEM_read_bio_X509(upReader.get(), nullptr, nullptr, nullptr) };
    }();

    if (!upCertificate) {
        return CertificateLoadFailure{ .reason = "The certificate is not a valid PEM encoded X.509 certificate" };
    }

    // PEM_read_bio_PrivateKey accepts both the traditional PKCS#1 and the PKCS#8 encodings.
    auto upPrivateKey = [&privateKey] () -> OpenSSL::Key {
        auto const upReader = local::CreateMemoryReader(privateKey);
        if (!upReader) { return nullptr; }
        return OpenSSL::Key{ PEM_read_bio_PrivateKey(upReader.get(), nullptr, nullptr, nullptr) };
    }();

    if (!upPrivateKey) {
        return CertificateLoadFailure{ .reason = "The private key is not a valid PEM encoded key" };
    }

    if (EVP_PKEY_is_a(upPrivateKey.get(), "RSA") != 1) {
        return CertificateLoadFailure{ .reason = "The private key is not an RSA key" };
    }

    if (X509_check_private_key(upCertificate.get(), upPrivateKey.get()) != 1) {
        return CertificateLoadFailure{ .reason = "The private key does not match the certificate" };
    }

    try {
        return std::make_shared<KeyMaterial const>(std::move(upCertificate), std::move(upPrivateKey));
    } catch (std::runtime_error const& exception) {
        return CertificateLoadFailure{ .reason = exception.what() };
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::ReadFile(std::filesystem::path const& path)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) { return {}; }

    std::ifstream reader(path, std::ios::in | std::ios::binary);
    if (reader.fail()) { return {}; }

    std::stringstream buffer;
    buffer << reader.rdbuf();
    return buffer.str();
}

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::BasicInputOutput local::CreateMemoryReader(std::string_view pem)
{
    if (pem.empty() || !std::in_range<std::int32_t>(pem.size())) { return nullptr; }
    return Security::OpenSSL::BasicInputOutput{ BIO_new_mem_buf(pem.data(), static_cast<std::int32_t>(pem.size())) };
}

//----------------------------------------------------------------------------------------------------------------------
