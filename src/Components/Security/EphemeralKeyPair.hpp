//----------------------------------------------------------------------------------------------------------------------
// File: EphemeralKeyPair.hpp
// Description: A per transaction P-256 key pair. The private scalar stays inside the OpenSSL key object, only the public
// point is exported (as a JWK) for embedding in the ACS signed content. The pair is immutable once generated and may
// be shared read only between the request that created it and the transaction store.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "JsonWebKey.hpp"
#include "OpenSSLHandles.hpp"
#include "SecureBuffer.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class EphemeralKeyPair;
class SharedSecret;

using SharedEphemeralKeyPair = std::shared_ptr<EphemeralKeyPair const>;

// Throws std::runtime_error when the entropy source or the key generator fails. There is no safe way to continue a
// transaction without fresh key material.
[[nodiscard]] EphemeralKeyPair GenerateEphemeralKeyPair();

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SharedSecret
{
public:
    explicit SharedSecret(Buffer&& data) : m_data(std::move(data)) {}

    SharedSecret(SharedSecret const&) = delete;
    SharedSecret& operator=(SharedSecret const&) = delete;

    SharedSecret(SharedSecret&& other) noexcept = default;
    SharedSecret& operator=(SharedSecret&& other) noexcept = default;

    [[nodiscard]] ReadableView GetData() const { return m_data.GetData(); }
    [[nodiscard]] std::size_t GetSize() const { return m_data.GetSize(); }
    [[nodiscard]] bool IsEmpty() const { return m_data.IsEmpty(); }

private:
    SecureBuffer m_data;
};

//----------------------------------------------------------------------------------------------------------------------

class Security::EphemeralKeyPair
{
public:
    EphemeralKeyPair(OpenSSL::Key&& upKey, JsonWebKey const& publicKey);

    EphemeralKeyPair(EphemeralKeyPair const&) = delete;
    EphemeralKeyPair& operator=(EphemeralKeyPair const&) = delete;

    EphemeralKeyPair(EphemeralKeyPair&& other) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&& other) noexcept = default;

    [[nodiscard]] JsonWebKey const& GetPublicKey() const { return m_publicKey; }

    // Exposes the raw scalar for in process persistence and uniqueness checks. It must never be serialized into an
    // outbound message.
    [[nodiscard]] SecureBuffer ExportPrivateScalar() const;

    // ECDH against the peer's public point, producing the affine x-coordinate of the shared point.
    [[nodiscard]] Result<SharedSecret> ComputeSharedSecret(JsonWebKey const& peer) const;

private:
    OpenSSL::Key m_upKey;
    JsonWebKey m_publicKey;
};

//----------------------------------------------------------------------------------------------------------------------
