//----------------------------------------------------------------------------------------------------------------------
// File: EphemeralKeyPair.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "EphemeralKeyPair.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

struct BigNumberDeleter
{
    void operator()(BIGNUM* pNumber) const
    {
        BN_clear_free(pNumber);
    }
};

using BigNumber = std::unique_ptr<BIGNUM, BigNumberDeleter>;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::EphemeralKeyPair Security::GenerateEphemeralKeyPair()
{
    if (RAND_status() != 1) {
        throw std::runtime_error(ToString(Error::KeyGenerationFailure).data());
    }

    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(SN_X9_62_prime256v1), 0),
        OSSL_PARAM_construct_end()
    };

    auto const upContext = OpenSSL::KeyContext{ EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr) };
    if (!upContext) {
        throw std::runtime_error("Failed to create the elliptic curve key generation context!");
    }

    if (EVP_PKEY_keygen_init(upContext.get()) <= 0) {
        throw std::runtime_error("Failed to initialize the elliptic curve key generation context!");
    }

    if (EVP_PKEY_CTX_set_params(upContext.get(), params.data()) <= 0) {
        throw std::runtime_error("Failed to set the elliptic curve key generation parameters!");
    }

    auto upKey = [&upContext] () -> OpenSSL::Key {
        EVP_PKEY* pKey = nullptr;
        if (EVP_PKEY_generate(upContext.get(), &pKey) <= 0) {
            return nullptr;
        }
        return OpenSSL::Key{ pKey };
    }();

    if (!upKey) {
        throw std::runtime_error(ToString(Error::KeyGenerationFailure).data());
    }

    auto const result = JsonWebKey::FromKey(upKey.get());
    auto const pPublicKey = std::get_if<JsonWebKey>(&result);
    if (!pPublicKey) {
        throw std::runtime_error("Failed to export the generated elliptic curve public key!");
    }

    return EphemeralKeyPair{ std::move(upKey), *pPublicKey };
}

//----------------------------------------------------------------------------------------------------------------------

Security::EphemeralKeyPair::EphemeralKeyPair(OpenSSL::Key&& upKey, JsonWebKey const& publicKey)
    : m_upKey(std::move(upKey))
    , m_publicKey(publicKey)
{
    if (!m_upKey) {
        throw std::runtime_error("An ephemeral key pair requires a generated key!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer Security::EphemeralKeyPair::ExportPrivateScalar() const
{
    BIGNUM* pScalar = nullptr;
    if (EVP_PKEY_get_bn_param(m_upKey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &pScalar) <= 0) {
        return {};
    }

    local::BigNumber const upScalar{ pScalar };

    SecureBuffer scalar{ CoordinateSize };
    if (BN_bn2binpad(upScalar.get(), scalar.GetData().data(), static_cast<int>(scalar.GetSize())) < 0) {
        return {};
    }

    return scalar;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::SharedSecret> Security::EphemeralKeyPair::ComputeSharedSecret(JsonWebKey const& peer) const
{
    auto const upPeerKey = peer.ToKey();
    if (!upPeerKey) {
        return Error::InvalidPublicKey;
    }

    auto const upDeriveContext = OpenSSL::KeyContext{ EVP_PKEY_CTX_new_from_pkey(nullptr, m_upKey.get(), nullptr) };
    if (!upDeriveContext) {
        return Error::CryptographicFailure; // If we fail to make a context, an error has occurred.
    }

    if (EVP_PKEY_derive_init(upDeriveContext.get()) <= 0) {
        return Error::CryptographicFailure;
    }

    if (EVP_PKEY_derive_set_peer(upDeriveContext.get(), upPeerKey.get()) <= 0) {
        return Error::InvalidPublicKey; // The peer key is rejected when it does not share our group.
    }

    std::size_t size = 0;
    if (EVP_PKEY_derive(upDeriveContext.get(), nullptr, &size) <= 0) {
        return Error::CryptographicFailure;
    }

    Buffer buffer(size, 0x00);
    if (EVP_PKEY_derive(upDeriveContext.get(), buffer.data(), &size) <= 0) {
        EraseMemory(buffer.data(), buffer.size());
        return Error::CryptographicFailure;
    }
    buffer.resize(size);

    return SharedSecret{ std::move(buffer) };
}

//----------------------------------------------------------------------------------------------------------------------
