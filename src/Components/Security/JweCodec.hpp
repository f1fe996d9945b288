//----------------------------------------------------------------------------------------------------------------------
// File: JweCodec.hpp
// Description: Encrypts and decrypts challenge messages as compact JWE. The codec is the single dispatch point between
// the two content ciphers, selected by the "enc" header value. Derived key material is only accepted for the algorithm
// it was derived for.
//
// Key usage is named relative to the ACS. The ACS decrypts requests with DecryptHalf and encrypts responses with
// EncryptHalf, a device holding the same key uses the mirrored usages. Only the A128GCM construction distinguishes the
// halves, A128CBC-HS256 always splits the key into a MAC half and an encryption half.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "JweEnvelope.hpp"
#include "SecurityTypes.hpp"
#include "Interfaces/ContentCipher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class DerivedKeyMaterial;
class JweCodec;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::JweCodec
{
public:
    JweCodec();

    JweCodec(JweCodec const&) = delete;
    JweCodec& operator=(JweCodec const&) = delete;

    [[nodiscard]] Result<JweEnvelope> Encrypt(
        std::string_view plaintext,
        JweHeader const& header,
        DerivedKeyMaterial const& key,
        KeyUsage usage = KeyUsage::EncryptHalf) const;

    [[nodiscard]] StringResult Decrypt(
        JweEnvelope const& envelope, DerivedKeyMaterial const& key, KeyUsage usage = KeyUsage::DecryptHalf) const;

    [[nodiscard]] StringResult Decrypt(
        std::string_view compact, DerivedKeyMaterial const& key, KeyUsage usage = KeyUsage::DecryptHalf) const;

    [[nodiscard]] bool IsAlgorithmSupported(std::string_view algorithm) const;

private:
    [[nodiscard]] Result<IContentCipher const*> SelectCipher(std::string_view algorithm, DerivedKeyMaterial const& key) const;

    std::unique_ptr<IContentCipher> m_upCbcHmacCipher;
    std::unique_ptr<IContentCipher> m_upGcmCipher;
};

//----------------------------------------------------------------------------------------------------------------------
