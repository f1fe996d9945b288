//----------------------------------------------------------------------------------------------------------------------
// File: ContentCiphers.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ContentCiphers.hpp"
#include "KeyDerivation.hpp"
#include "SecureBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using MessageAuthenticationCodeContext = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

constexpr std::size_t BlockSize = 16;
constexpr std::size_t MaximumBlockSize = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

// Feeds the source through EVP_CipherUpdate in chunks that fit the int sized OpenSSL interface. A null destination is
// used to supply additional authenticated data.
[[nodiscard]] bool Update(EVP_CIPHER_CTX* pContext, std::uint8_t* pDestination, std::size_t& processed, Security::ReadableView source);

[[nodiscard]] Security::Buffer EncodeAdditionalDataLength(std::size_t size);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Security::CbcHmacCipher {
//----------------------------------------------------------------------------------------------------------------------

Security::CbcHmacCipher::CbcHmacCipher()
    : m_upCipher(EVP_CIPHER_fetch(nullptr, "AES-128-CBC", nullptr))
    , m_upMac(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr))
{
    if (!m_upCipher || !m_upMac) {
        throw std::runtime_error("Failed to fetch the AES-128-CBC and HMAC implementations!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Security::CbcHmacCipher::GetAlgorithm() const { return Algorithm::CbcHmac; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::CbcHmacCipher::GetInitializationVectorSize() const { return CbcInitializationVectorSize; }

//----------------------------------------------------------------------------------------------------------------------

Security::SealedContentResult Security::CbcHmacCipher::Seal(
    DerivedKeyMaterial const& key, [[maybe_unused]] KeyUsage usage, ReadableView additional, ReadableView plaintext) const
{
    // Both directions share the same split of the key for this construction.
    auto const macKey = key.GetFirstHalf();
    auto const encryptionKey = key.GetSecondHalf();

    SealedContent sealed;
    sealed.initializationVector.resize(CbcInitializationVectorSize);
    if (!GenerateRandomData(sealed.initializationVector)) { return Error::CryptographicFailure; }

    local::CipherContext const upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    if (EVP_EncryptInit_ex2(
        upContext.get(), m_upCipher.get(), encryptionKey.data(), sealed.initializationVector.data(), nullptr) <= 0) {
        return Error::CryptographicFailure;
    }

    // PKCS#7 padding always adds between one and sixteen bytes.
    sealed.ciphertext.resize(plaintext.size() + local::BlockSize);
    std::size_t encrypted = 0;
    if (!local::Update(upContext.get(), sealed.ciphertext.data(), encrypted, plaintext)) {
        return Error::CryptographicFailure;
    }

    std::int32_t processed = 0;
    if (EVP_EncryptFinal_ex(upContext.get(), sealed.ciphertext.data() + encrypted, &processed) <= 0) {
        return Error::CryptographicFailure;
    }
    sealed.ciphertext.resize(encrypted + static_cast<std::size_t>(processed));

    auto optTag = ComputeTag(macKey, additional, sealed.initializationVector, sealed.ciphertext);
    if (!optTag) { return Error::CryptographicFailure; }
    sealed.tag = std::move(*optTag);

    return sealed;
}

//----------------------------------------------------------------------------------------------------------------------

Security::BufferResult Security::CbcHmacCipher::Open(
    DerivedKeyMaterial const& key, [[maybe_unused]] KeyUsage usage, ReadableView additional, SealedContent const& sealed) const
{
    auto const& [iv, ciphertext, tag] = sealed;
    if (iv.size() != CbcInitializationVectorSize || tag.size() != AuthenticationTagSize) {
        return Error::MalformedEnvelope;
    }

    if (ciphertext.empty() || ciphertext.size() % local::BlockSize != 0) { return Error::MalformedEnvelope; }

    auto const macKey = key.GetFirstHalf();
    auto const encryptionKey = key.GetSecondHalf();

    // The tag must be verified before any of the ciphertext is touched.
    auto const optExpected = ComputeTag(macKey, additional, iv, ciphertext);
    if (!optExpected) { return Error::CryptographicFailure; }
    if (!ConstantTimeEquals(*optExpected, tag)) { return Error::AuthenticationFailed; }

    local::CipherContext const upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    if (EVP_DecryptInit_ex2(upContext.get(), m_upCipher.get(), encryptionKey.data(), iv.data(), nullptr) <= 0) {
        return Error::CryptographicFailure;
    }

    Buffer plaintext(ciphertext.size() + local::BlockSize, 0x00);
    std::size_t decrypted = 0;
    if (!local::Update(upContext.get(), plaintext.data(), decrypted, ciphertext)) {
        EraseMemory(plaintext.data(), plaintext.size());
        return Error::CryptographicFailure;
    }

    std::int32_t processed = 0;
    if (EVP_DecryptFinal_ex(upContext.get(), plaintext.data() + decrypted, &processed) <= 0) {
        // The sender authenticated a ciphertext with invalid padding.
        EraseMemory(plaintext.data(), plaintext.size());
        return Error::MalformedEnvelope;
    }
    plaintext.resize(decrypted + static_cast<std::size_t>(processed));

    return plaintext;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::CbcHmacCipher::ComputeTag(
    ReadableView key, ReadableView additional, ReadableView iv, ReadableView ciphertext) const
{
    local::MessageAuthenticationCodeContext const upContext(EVP_MAC_CTX_new(m_upMac.get()), &EVP_MAC_CTX_free);
    if (!upContext) { return {}; }

    // Note: The OpenSSL interface only supports taking non-const values, however, they are only read.
    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>(SN_sha256), 0),
        OSSL_PARAM_construct_end()
    };

    if (EVP_MAC_init(upContext.get(), key.data(), key.size(), params.data()) <= 0) { return {}; }

    auto const length = local::EncodeAdditionalDataLength(additional.size());
    for (ReadableView const segment : { additional, iv, ciphertext, ReadableView{ length } }) {
        if (segment.empty()) { continue; }
        if (EVP_MAC_update(upContext.get(), segment.data(), segment.size()) <= 0) { return {}; }
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    std::size_t hashed = 0;
    if (EVP_MAC_final(upContext.get(), digest.data(), &hashed, digest.size()) <= 0) { return {}; }
    if (hashed < AuthenticationTagSize) { return {}; }

    Buffer tag(digest.begin(), digest.begin() + AuthenticationTagSize);
    OPENSSL_cleanse(digest.data(), digest.size());
    return tag;
}

//----------------------------------------------------------------------------------------------------------------------
// } Security::CbcHmacCipher
//----------------------------------------------------------------------------------------------------------------------
// Security::GcmCipher {
//----------------------------------------------------------------------------------------------------------------------

Security::GcmCipher::GcmCipher()
    : m_upCipher(EVP_CIPHER_fetch(nullptr, "AES-128-GCM", nullptr))
{
    if (!m_upCipher) {
        throw std::runtime_error("Failed to fetch the AES-128-GCM implementation!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Security::GcmCipher::GetAlgorithm() const { return Algorithm::Gcm; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::GcmCipher::GetInitializationVectorSize() const { return GcmInitializationVectorSize; }

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::GcmCipher::SelectKey(DerivedKeyMaterial const& key, KeyUsage usage)
{
    switch (usage) {
        case KeyUsage::DecryptHalf: return key.GetFirstHalf();
        case KeyUsage::EncryptHalf: return key.GetSecondHalf();
    }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Security::SealedContentResult Security::GcmCipher::Seal(
    DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, ReadableView plaintext) const
{
    auto const contentKey = SelectKey(key, usage);
    if (contentKey.size() != ContentKeySize) { return Error::CryptographicFailure; }

    SealedContent sealed;
    sealed.initializationVector.resize(GcmInitializationVectorSize);
    if (!GenerateRandomData(sealed.initializationVector)) { return Error::CryptographicFailure; }

    local::CipherContext const upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    std::size_t ivSize = GcmInitializationVectorSize;
    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_size_t(OSSL_CIPHER_PARAM_AEAD_IVLEN, &ivSize),
        OSSL_PARAM_construct_end()
    };

    if (EVP_EncryptInit_ex2(
        upContext.get(), m_upCipher.get(), contentKey.data(), sealed.initializationVector.data(), params.data()) <= 0) {
        return Error::CryptographicFailure;
    }

    std::size_t ignored = 0;
    if (!local::Update(upContext.get(), nullptr, ignored, additional)) { return Error::CryptographicFailure; }

    sealed.ciphertext.resize(plaintext.size());
    std::size_t encrypted = 0;
    if (!local::Update(upContext.get(), sealed.ciphertext.data(), encrypted, plaintext)) {
        return Error::CryptographicFailure;
    }

    std::int32_t processed = 0;
    if (EVP_EncryptFinal_ex(upContext.get(), sealed.ciphertext.data() + encrypted, &processed) <= 0) {
        return Error::CryptographicFailure;
    }
    sealed.ciphertext.resize(encrypted + static_cast<std::size_t>(processed));

    sealed.tag.resize(AuthenticationTagSize);
    std::array<OSSL_PARAM, 2> tagParams = {
        OSSL_PARAM_construct_octet_string(OSSL_CIPHER_PARAM_AEAD_TAG, sealed.tag.data(), sealed.tag.size()),
        OSSL_PARAM_construct_end()
    };

    if (EVP_CIPHER_CTX_get_params(upContext.get(), tagParams.data()) <= 0) { return Error::CryptographicFailure; }

    return sealed;
}

//----------------------------------------------------------------------------------------------------------------------

Security::BufferResult Security::GcmCipher::Open(
    DerivedKeyMaterial const& key, KeyUsage usage, ReadableView additional, SealedContent const& sealed) const
{
    auto const& [iv, ciphertext, tag] = sealed;
    if (iv.size() != GcmInitializationVectorSize || tag.size() != AuthenticationTagSize) {
        return Error::MalformedEnvelope;
    }

    auto const contentKey = SelectKey(key, usage);
    if (contentKey.size() != ContentKeySize) { return Error::CryptographicFailure; }

    local::CipherContext const upContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    std::size_t ivSize = GcmInitializationVectorSize;
    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_size_t(OSSL_CIPHER_PARAM_AEAD_IVLEN, &ivSize),
        OSSL_PARAM_construct_end()
    };

    if (EVP_DecryptInit_ex2(upContext.get(), m_upCipher.get(), contentKey.data(), iv.data(), params.data()) <= 0) {
        return Error::CryptographicFailure;
    }

    Buffer expected(tag.begin(), tag.end());
    std::array<OSSL_PARAM, 2> tagParams = {
        OSSL_PARAM_construct_octet_string(OSSL_CIPHER_PARAM_AEAD_TAG, expected.data(), expected.size()),
        OSSL_PARAM_construct_end()
    };

    if (EVP_CIPHER_CTX_set_params(upContext.get(), tagParams.data()) <= 0) { return Error::CryptographicFailure; }

    std::size_t ignored = 0;
    if (!local::Update(upContext.get(), nullptr, ignored, additional)) { return Error::CryptographicFailure; }

    Buffer plaintext(ciphertext.size(), 0x00);
    std::size_t decrypted = 0;
    if (!local::Update(upContext.get(), plaintext.data(), decrypted, ciphertext)) {
        EraseMemory(plaintext.data(), plaintext.size());
        return Error::CryptographicFailure;
    }

    // The AEAD only reports the tag comparison when finalized, nothing decrypted above may escape before that.
    std::int32_t processed = 0;
    if (EVP_DecryptFinal_ex(upContext.get(), plaintext.data() + decrypted, &processed) <= 0) {
        EraseMemory(plaintext.data(), plaintext.size());
        return Error::AuthenticationFailed;
    }
    plaintext.resize(decrypted + static_cast<std::size_t>(processed));

    return plaintext;
}

//----------------------------------------------------------------------------------------------------------------------
// } Security::GcmCipher
//----------------------------------------------------------------------------------------------------------------------

bool local::Update(EVP_CIPHER_CTX* pContext, std::uint8_t* pDestination, std::size_t& processed, Security::ReadableView source)
{
    processed = 0;
    for (std::size_t offset = 0; offset < source.size();) {
        auto const block = static_cast<std::int32_t>(std::min(source.size() - offset, MaximumBlockSize));
        std::int32_t written = 0;
        auto const pOutput = pDestination ? pDestination + processed : nullptr;
        if (EVP_CipherUpdate(pContext, pOutput, &written, source.data() + offset, block) <= 0) {
            return false;
        }
        processed += static_cast<std::size_t>(written);
        offset += static_cast<std::size_t>(block);
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer local::EncodeAdditionalDataLength(std::size_t size)
{
    std::uint64_t const bits = static_cast<std::uint64_t>(size) * 8;
    Security::Buffer encoded(sizeof(bits), 0x00);
    for (std::size_t index = 0; index < encoded.size(); ++index) {
        encoded[index] = static_cast<std::uint8_t>(bits >> (8 * (encoded.size() - 1 - index)));
    }
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------
