//----------------------------------------------------------------------------------------------------------------------
// File: AcsContentSigner.hpp
// Description: Produces the ACS signed content handed to the device SDK during a mobile challenge. The content is a
// PS256 JWT whose header carries the ACS certificate as a single x5c entry and whose payload carries the transaction
// identifiers and the ACS ephemeral public key.
//
// When the signing identity could not be loaded the signer keeps serving a fixed JWT and warns about it.
// Callers can tell the two outcomes apart through the variant returned by Sign.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "JsonWebKey.hpp"
#include "KeyMaterial.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class AcsContentSigner;

struct AcsContent
{
    std::string acsTransactionId;
    std::string acsReferenceNumber;
    std::string acsUrl;
    JsonWebKey ephemeralPublicKey;
};

struct SignedContent
{
    std::string jwt;
};

struct FallbackContent
{
    std::string jwt;
    std::string reason;
};

using SigningResult = std::variant<SignedContent, FallbackContent>;

// A fixed JWT describing a placeholder transaction. Its signature segment is a placeholder as well, it will never
// verify and is only served when no signing identity is available.
constexpr std::string_view FallbackJwt =
    "eyJhbGciOiJQUzI1NiIsInR5cCI6IkpXVCJ9."
    "eyJhY3NUcmFuc0lEIjoiMDAwMDAwMDAtMDAwMC0wMDAwLTAwMDAtMDAwMDAwMDAwMDAwIiwiYWNzUmVmTnVtYmVyIjoiaXNzdWVyMSIsImFjc1VS"
    "TCI6Imh0dHA6Ly8xMjcuMC4wLjE6ODA4MC9jaGFsbGVuZ2UiLCJhY3NFcGhlbVB1YktleSI6eyJrdHkiOiJFQyIsImNydiI6IlAtMjU2IiwieCI6"
    "IldLbi1aSUdldmN3R0l5eXJ6Rm9aTkJkYXE5X1RzcXpHbDk2b2MwQ1d1aXMiLCJ5IjoieTc3dC1SdkFIUktUc1NHZElZVWZ3ZXVPdndydkRELVEz"
    "SHY1SjBmU0tiRSJ9fQ."
    "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8gISIjJCUmJygpKissLS4vMDEyMzQ1Njc4OTo7PD0-Pw";

[[nodiscard]] StringResult SignAcsContent(AcsContent const& content, KeyMaterial const& material);

// Verifies a PS256 JWT against the public key of its first x5c certificate and returns the decoded payload.
[[nodiscard]] Result<boost::json::object> VerifyAcsContent(std::string_view jwt);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::AcsContentSigner
{
public:
    explicit AcsContentSigner(KeyMaterialResult const& material);

    [[nodiscard]] bool HasKeyMaterial() const { return m_spKeyMaterial != nullptr; }
    [[nodiscard]] SigningResult Sign(AcsContent const& content) const;

private:
    [[nodiscard]] FallbackContent CreateFallback(std::string_view reason) const;

    SharedKeyMaterial m_spKeyMaterial;
    std::string m_unavailableReason;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
