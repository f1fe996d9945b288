//----------------------------------------------------------------------------------------------------------------------
// File: OpenSSLHandles.hpp
// Description: Owning handles for the OpenSSL objects shared between the security components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security::OpenSSL {
//----------------------------------------------------------------------------------------------------------------------

struct KeyContextDeleter
{
    void operator()(EVP_PKEY_CTX* pContext) const
    {
        EVP_PKEY_CTX_free(pContext);
    }
};

using KeyContext = std::unique_ptr<EVP_PKEY_CTX, KeyContextDeleter>;

struct KeyDeleter
{
    void operator()(EVP_PKEY* pKey) const
    {
        EVP_PKEY_free(pKey);
    }
};

using Key = std::unique_ptr<EVP_PKEY, KeyDeleter>;

struct CertificateDeleter
{
    void operator()(X509* pCertificate) const
    {
        X509_free(pCertificate);
    }
};

using Certificate = std::unique_ptr<X509, CertificateDeleter>;

struct BasicInputOutputDeleter
{
    void operator()(BIO* pBio) const
    {
        BIO_free_all(pBio);
    }
};

using BasicInputOutput = std::unique_ptr<BIO, BasicInputOutputDeleter>;

struct CipherAlgorithmDeleter
{
    void operator()(EVP_CIPHER* pCipher) const
    {
        EVP_CIPHER_free(pCipher);
    }
};

using CipherAlgorithm = std::unique_ptr<EVP_CIPHER, CipherAlgorithmDeleter>;

struct MessageAuthenticatorDeleter
{
    void operator()(EVP_MAC* pMac) const
    {
        EVP_MAC_free(pMac);
    }
};

using MessageAuthenticator = std::unique_ptr<EVP_MAC, MessageAuthenticatorDeleter>;

//----------------------------------------------------------------------------------------------------------------------
} // Security::OpenSSL namespace
//----------------------------------------------------------------------------------------------------------------------
