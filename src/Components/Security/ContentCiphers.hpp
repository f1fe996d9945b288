//----------------------------------------------------------------------------------------------------------------------
// File: ContentCiphers.hpp
// Description: The two content encryption constructions spoken by the device SDKs.
//  - CbcHmacCipher: A128CBC-HS256 composed by hand from AES-128-CBC and HMAC-SHA-256 (RFC 7516 section 5.1 via
//    RFC 7518 section 5.2). The first half of the derived key authenticates, the second half encrypts.
//  - GcmCipher: A128GCM using the library AEAD. The key half depends on the direction of the message.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLHandles.hpp"
#include "SecurityTypes.hpp"
#include "Interfaces/ContentCipher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class CbcHmacCipher;
class GcmCipher;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::CbcHmacCipher : public IContentCipher
{
public:
    CbcHmacCipher();

    CbcHmacCipher(CbcHmacCipher const&) = delete;
    CbcHmacCipher& operator=(CbcHmacCipher const&) = delete;

    // IContentCipher {
    [[nodiscard]] virtual std::string_view GetAlgorithm() const override;
    [[nodiscard]] virtual std::size_t GetInitializationVectorSize() const override;
    [[nodiscard]] virtual SealedContentResult Seal(
        DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, ReadableView plaintext) const override;
    [[nodiscard]] virtual BufferResult Open(
        DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, SealedContent const& sealed) const override;
    // } IContentCipher

    // HMAC-SHA-256(key, AAD || IV || Ciphertext || AL) truncated to the first 16 bytes. AL is the bit length of the
    // AAD as a 64 bit big endian integer.
    [[nodiscard]] OptionalBuffer ComputeTag(
        ReadableView key, ReadableView additional, ReadableView iv, ReadableView ciphertext) const;

private:
    OpenSSL::CipherAlgorithm m_upCipher;
    OpenSSL::MessageAuthenticator m_upMac;
};

//----------------------------------------------------------------------------------------------------------------------

class Security::GcmCipher : public IContentCipher
{
public:
    GcmCipher();

    GcmCipher(GcmCipher const&) = delete;
    GcmCipher& operator=(GcmCipher const&) = delete;

    // IContentCipher {
    [[nodiscard]] virtual std::string_view GetAlgorithm() const override;
    [[nodiscard]] virtual std::size_t GetInitializationVectorSize() const override;
    [[nodiscard]] virtual SealedContentResult Seal(
        DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, ReadableView plaintext) const override;
    [[nodiscard]] virtual BufferResult Open(
        DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, SealedContent const& sealed) const override;
    // } IContentCipher

    // DecryptHalf selects bytes [0, 16) and EncryptHalf selects bytes [16, 32) of the derived key.
    [[nodiscard]] static ReadableView SelectKey(DerivedKeyMaterial const& key, KeyUsage usage);

private:
    OpenSSL::CipherAlgorithm m_upCipher;
};

//----------------------------------------------------------------------------------------------------------------------
