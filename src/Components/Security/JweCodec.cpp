//----------------------------------------------------------------------------------------------------------------------
// File: JweCodec.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "JweCodec.hpp"
#include "ContentCiphers.hpp"
#include "KeyDerivation.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------

Security::JweCodec::JweCodec()
    : m_upCbcHmacCipher(std::make_unique<CbcHmacCipher>())
    , m_upGcmCipher(std::make_unique<GcmCipher>())
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JweEnvelope> Security::JweCodec::Encrypt(
    std::string_view plaintext, JweHeader const& header, DerivedKeyMaterial const& key, KeyUsage usage) const
{
    auto const selected = SelectCipher(header.algorithm, key);
    if (auto const pError = std::get_if<Error>(&selected); pError) { return *pError; }
    auto const pCipher = std::get<IContentCipher const*>(selected);

    auto const encodedHeader = JweEnvelope::EncodeHeader(header);
    auto sealed = pCipher->Seal(key, usage, ToReadableView(encodedHeader), ToReadableView(plaintext));
    if (auto const pError = std::get_if<Error>(&sealed); pError) { return *pError; }

    return JweEnvelope{ encodedHeader, header, std::move(std::get<SealedContent>(sealed)) };
}

//----------------------------------------------------------------------------------------------------------------------

Security::StringResult Security::JweCodec::Decrypt(
    JweEnvelope const& envelope, DerivedKeyMaterial const& key, KeyUsage usage) const
{
    auto const selected = SelectCipher(envelope.GetAlgorithm(), key);
    if (auto const pError = std::get_if<Error>(&selected); pError) { return *pError; }
    auto const pCipher = std::get<IContentCipher const*>(selected);

    auto opened = pCipher->Open(key, usage, envelope.GetAdditionalData(), envelope.GetContent());
    if (auto const pError = std::get_if<Error>(&opened); pError) { return *pError; }

    auto& plaintext = std::get<Buffer>(opened);
    std::string decrypted(plaintext.begin(), plaintext.end());
    EraseMemory(plaintext.data(), plaintext.size());
    return decrypted;
}

//----------------------------------------------------------------------------------------------------------------------

Security::StringResult Security::JweCodec::Decrypt(
    std::string_view compact, DerivedKeyMaterial const& key, KeyUsage usage) const
{
    auto const parsed = JweEnvelope::Parse(compact);
    if (auto const pError = std::get_if<Error>(&parsed); pError) { return *pError; }
    return Decrypt(std::get<JweEnvelope>(parsed), key, usage);
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::JweCodec::IsAlgorithmSupported(std::string_view algorithm) const
{
    return algorithm == m_upCbcHmacCipher->GetAlgorithm() || algorithm == m_upGcmCipher->GetAlgorithm();
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<IContentCipher const*> Security::JweCodec::SelectCipher(
    std::string_view algorithm, DerivedKeyMaterial const& key) const
{
    IContentCipher const* pCipher = nullptr;
    if (algorithm == m_upCbcHmacCipher->GetAlgorithm()) {
        pCipher = m_upCbcHmacCipher.get();
    } else if (algorithm == m_upGcmCipher->GetAlgorithm()) {
        pCipher = m_upGcmCipher.get();
    } else {
        return Error::UnsupportedAlgorithm;
    }

    // Material derived for one algorithm must never be applied with another.
    if (key.GetAlgorithm() != algorithm) { return Error::KeyContextMismatch; }

    return pCipher;
}

//----------------------------------------------------------------------------------------------------------------------
