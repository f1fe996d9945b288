//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/KeyDerivation.hpp"
#include "Components/Security/OpenSSLHandles.hpp"
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <random>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security::Test {
//----------------------------------------------------------------------------------------------------------------------

enum class KeyEncoding : std::uint32_t { Traditional, Pkcs8 };

struct PemIdentity
{
    std::string certificate;
    std::string privateKey;
};

[[nodiscard]] Buffer GenerateGarbageData(std::size_t size);
[[nodiscard]] DerivedKeyMaterial GenerateDerivedKey(Platform platform);

// Generates an RSA-2048 key and a matching self-signed certificate, both PEM encoded.
[[nodiscard]] PemIdentity GeneratePemIdentity(KeyEncoding encoding = KeyEncoding::Pkcs8);

[[nodiscard]] std::filesystem::path WriteTemporaryFile(std::string_view filename, std::string_view content);

[[nodiscard]] std::string ReadMemoryBuffer(BIO* pBio);

//----------------------------------------------------------------------------------------------------------------------
} // Security::Test namespace
//----------------------------------------------------------------------------------------------------------------------

inline Security::Buffer Security::Test::GenerateGarbageData(std::size_t size)
{
    std::random_device device;
    std::mt19937 engine(device());
    std::uniform_int_distribution<std::int32_t> distribution(
        std::numeric_limits<std::uint8_t>::min(), std::numeric_limits<std::uint8_t>::max());

    Security::Buffer data;
    data.reserve(size);

    for (std::size_t idx = 0; idx < size; ++idx) {
        data.emplace_back(static_cast<std::uint8_t>(distribution(engine)));
    }

    return data;
}

//----------------------------------------------------------------------------------------------------------------------

inline Security::DerivedKeyMaterial Security::Test::GenerateDerivedKey(Platform platform)
{
    std::string_view const algorithm = (platform == Platform::Android) ? Algorithm::CbcHmac : Algorithm::Gcm;
    return DerivedKeyMaterial{ platform, algorithm, SecureBuffer{ GenerateGarbageData(DerivedKeySize) } };
}

//----------------------------------------------------------------------------------------------------------------------

inline Security::Test::PemIdentity Security::Test::GeneratePemIdentity(KeyEncoding encoding)
{
    OpenSSL::Key upKey{ EVP_RSA_gen(2048) };
    assert(upKey);

    OpenSSL::Certificate upCertificate{ X509_new() };
    assert(upCertificate);

    X509_set_version(upCertificate.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(upCertificate.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(upCertificate.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(upCertificate.get()), 60 * 60 * 24);
    X509_set_pubkey(upCertificate.get(), upKey.get());

    X509_NAME* const pName = X509_get_subject_name(upCertificate.get());
    X509_NAME_add_entry_by_txt(
        pName, "CN", MBSTRING_ASC, reinterpret_cast<unsigned char const*>("acs.test"), -1, -1, 0);
    X509_set_issuer_name(upCertificate.get(), pName);

    [[maybe_unused]] auto const signature = X509_sign(upCertificate.get(), upKey.get(), EVP_sha256());
    assert(signature > 0);

    PemIdentity identity;
    {
        OpenSSL::BasicInputOutput upWriter{ BIO_new(BIO_s_mem()) };
        PEM_write_bio_X509(upWriter.get(), upCertificate.get());
        identity.certificate = ReadMemoryBuffer(upWriter.get());
    }

    {
        OpenSSL::BasicInputOutput upWriter{ BIO_new(BIO_s_mem()) };
        switch (encoding) {
            case KeyEncoding::Traditional: {
                PEM_write_bio_PrivateKey_traditional(upWriter.get(), upKey.get(), nullptr, nullptr, 0, nullptr, nullptr);
            } break;
            case KeyEncoding::Pkcs8: {
                PEM_write_bio_PrivateKey(upWriter.get(), upKey.get(), nullptr, nullptr, 0, nullptr, nullptr);
            } break;
        }
        identity.privateKey = ReadMemoryBuffer(upWriter.get());
    }

    return identity;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::filesystem::path Security::Test::WriteTemporaryFile(std::string_view filename, std::string_view content)
{
    auto const path = std::filesystem::temp_directory_path() / filename;
    std::ofstream writer{ path, std::ios::out | std::ios::binary | std::ios::trunc };
    writer.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Security::Test::ReadMemoryBuffer(BIO* pBio)
{
    char* pData = nullptr;
    auto const size = BIO_get_mem_data(pBio, &pData);
    return (size > 0 && pData) ? std::string(pData, static_cast<std::size_t>(size)) : std::string{};
}

//----------------------------------------------------------------------------------------------------------------------
