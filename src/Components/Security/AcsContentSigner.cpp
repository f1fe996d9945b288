//----------------------------------------------------------------------------------------------------------------------
// File: AcsContentSigner.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "AcsContentSigner.hpp"
#include "SecurityUtils.hpp"
#include "Utilities/JsonUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr char Separator = '.';
constexpr std::string_view DigestName = "SHA256";

// Selects RSASSA-PSS with MGF1 over the message digest and a salt as long as the digest.
[[nodiscard]] bool ConfigureProbabilisticPadding(EVP_PKEY_CTX* pContext);

[[nodiscard]] std::optional<boost::json::object> DecodeSegment(std::string_view segment);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Algorithm = "alg";
constexpr std::string_view Type = "typ";
constexpr std::string_view CertificateChain = "x5c";

constexpr std::string_view TokenType = "JWT";

constexpr std::string_view AcsTransactionId = "acsTransID";
constexpr std::string_view AcsReferenceNumber = "acsRefNumber";
constexpr std::string_view AcsUrl = "acsURL";
constexpr std::string_view AcsEphemeralPublicKey = "acsEphemPubKey";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::StringResult Security::SignAcsContent(AcsContent const& content, KeyMaterial const& material)
{
    boost::json::object header;
    header[symbols::Algorithm] = Algorithm::ProbabilisticSignature;
    header[symbols::Type] = symbols::TokenType;
    header[symbols::CertificateChain] = boost::json::array{ boost::json::string{ material.GetEncodedCertificate() } };

    boost::json::object payload;
    payload[symbols::AcsTransactionId] = content.acsTransactionId;
    payload[symbols::AcsReferenceNumber] = content.acsReferenceNumber;
    payload[symbols::AcsUrl] = content.acsUrl;
    payload[symbols::AcsEphemeralPublicKey] = content.ephemeralPublicKey.ToJson();

    std::string jwt;
    jwt.append(EncodeBase64Url(std::string_view{ boost::json::serialize(header) }));
    jwt.push_back(local::Separator);
    jwt.append(EncodeBase64Url(std::string_view{ boost::json::serialize(payload) }));

    local::DigestContext const upContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    EVP_PKEY_CTX* pKeyContext = nullptr; // Owned by the digest context.
    if (EVP_DigestSignInit_ex(
        upContext.get(), &pKeyContext, local::DigestName.data(), nullptr, nullptr, material.GetPrivateKey(), nullptr) <= 0) {
        return Error::CryptographicFailure;
    }

    if (!local::ConfigureProbabilisticPadding(pKeyContext)) { return Error::CryptographicFailure; }

    auto const input = ToReadableView(jwt);
    std::size_t size = 0;
    if (EVP_DigestSign(upContext.get(), nullptr, &size, input.data(), input.size()) <= 0) {
        return Error::CryptographicFailure;
    }

    Buffer signature(size, 0x00);
    if (EVP_DigestSign(upContext.get(), signature.data(), &size, input.data(), input.size()) <= 0) {
        return Error::CryptographicFailure;
    }
    signature.resize(size);

    jwt.push_back(local::Separator);
    jwt.append(EncodeBase64Url(ReadableView{ signature }));

    return jwt;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<boost::json::object> Security::VerifyAcsContent(std::string_view jwt)
{
    auto const first = jwt.find(local::Separator);
    auto const second = first == std::string_view::npos ? first : jwt.find(local::Separator, first + 1);
    if (second == std::string_view::npos || jwt.find(local::Separator, second + 1) != std::string_view::npos) {
        return Error::MalformedEnvelope;
    }

    auto const signingInput = jwt.substr(0, second);
    auto const optHeader = local::DecodeSegment(jwt.substr(0, first));
    auto optPayload = local::DecodeSegment(jwt.substr(first + 1, second - first - 1));
    auto const optSignature = DecodeBase64Url(jwt.substr(second + 1));
    if (!optHeader || !optPayload || !optSignature || optSignature->empty()) { return Error::MalformedEnvelope; }

    if (JsonUtils::GetString(*optHeader, symbols::Algorithm) != Algorithm::ProbabilisticSignature) {
        return Error::UnsupportedAlgorithm;
    }

    auto const upCertificate = [&optHeader] () -> OpenSSL::Certificate {
        auto const pChain = optHeader->if_contains(symbols::CertificateChain);
        if (!pChain || !pChain->is_array() || pChain->get_array().empty()) { return nullptr; }

        auto const& leaf = pChain->get_array().front();
        if (!leaf.is_string()) { return nullptr; }

        auto const optDer = DecodeBase64(JsonUtils::ToStringView(leaf.get_string()));
        if (!optDer || optDer->empty()) { return nullptr; }

        auto pDer = optDer->data();
        return OpenSSL::Certificate{ d2i_X509(nullptr, &pDer, static_cast<long>(optDer->size())) };
    }();

    if (!upCertificate) { return Error::CertificateLoadError; }

    EVP_PKEY* const pPublicKey = X509_get0_pubkey(upCertificate.get()); // Owned by the certificate.
    if (!pPublicKey || EVP_PKEY_is_a(pPublicKey, "RSA") != 1) { return Error::CertificateLoadError; }

    local::DigestContext const upContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!upContext) { return Error::CryptographicFailure; }

    EVP_PKEY_CTX* pKeyContext = nullptr;
    if (EVP_DigestVerifyInit_ex(
        upContext.get(), &pKeyContext, local::DigestName.data(), nullptr, nullptr, pPublicKey, nullptr) <= 0) {
        return Error::CryptographicFailure;
    }

    if (!local::ConfigureProbabilisticPadding(pKeyContext)) { return Error::CryptographicFailure; }

    auto const input = ToReadableView(signingInput);
    if (EVP_DigestVerify(upContext.get(), optSignature->data(), optSignature->size(), input.data(), input.size()) != 1) {
        return Error::AuthenticationFailed;
    }

    return std::move(*optPayload);
}

//----------------------------------------------------------------------------------------------------------------------

Security::AcsContentSigner::AcsContentSigner(KeyMaterialResult const& material)
    : m_spKeyMaterial()
    , m_unavailableReason()
    , m_logger(spdlog::get(Logger::Name.data()))
{
    assert(m_logger);
    if (auto const pMaterial = std::get_if<SharedKeyMaterial>(&material); pMaterial && *pMaterial) {
        m_spKeyMaterial = *pMaterial;
    } else if (auto const pFailure = std::get_if<CertificateLoadFailure>(&material); pFailure) {
        m_unavailableReason = pFailure->reason;
        m_logger->warn("Unable to load the ACS signing identity: {}. Serving fallback signed content.", pFailure->reason);
    } else {
        m_unavailableReason = "No signing identity was provided";
        m_logger->warn("{}. Serving fallback signed content.", m_unavailableReason);
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::SigningResult Security::AcsContentSigner::Sign(AcsContent const& content) const
{
    if (!m_spKeyMaterial) { return CreateFallback(m_unavailableReason); }

    auto result = SignAcsContent(content, *m_spKeyMaterial);
    if (auto const pError = std::get_if<Error>(&result); pError) {
        return CreateFallback(ToString(*pError));
    }

    m_logger->debug("Generated ACS signed content for transaction {}.", content.acsTransactionId);
    return SignedContent{ std::move(std::get<std::string>(result)) };
}

//----------------------------------------------------------------------------------------------------------------------

Security::FallbackContent Security::AcsContentSigner::CreateFallback(std::string_view reason) const
{
    m_logger->warn("Using fallback ACS signed content: {}.", reason);
    return FallbackContent{ std::string{ FallbackJwt }, std::string{ reason } };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::ConfigureProbabilisticPadding(EVP_PKEY_CTX* pContext)
{
    if (EVP_PKEY_CTX_set_rsa_padding(pContext, RSA_PKCS1_PSS_PADDING) <= 0) { return false; }
    if (EVP_PKEY_CTX_set_rsa_pss_saltlen(pContext, RSA_PSS_SALTLEN_DIGEST) <= 0) { return false; }
    if (EVP_PKEY_CTX_set_rsa_mgf1_md_name(pContext, DigestName.data(), nullptr) <= 0) { return false; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::json::object> local::DecodeSegment(std::string_view segment)
{
    auto const optDecoded = Security::DecodeBase64Url(segment);
    if (!optDecoded) { return {}; }
    return JsonUtils::ParseObject(Security::ToStringView(*optDecoded));
}

//----------------------------------------------------------------------------------------------------------------------
