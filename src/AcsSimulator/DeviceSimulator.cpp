//----------------------------------------------------------------------------------------------------------------------
// File: DeviceSimulator.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "DeviceSimulator.hpp"
#include "Components/Security/AcsContentSigner.hpp"
#include "Components/Security/PlatformDetector.hpp"
#include "Utilities/JsonUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string GenerateTransactionIdentifier();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view AcsTransactionId = "acsTransID";
constexpr std::string_view AcsEphemeralPublicKey = "acsEphemPubKey";
constexpr std::string_view SdkTransactionId = "sdkTransID";
constexpr std::string_view ServerTransactionId = "threeDSServerTransID";
constexpr std::string_view MessageType = "messageType";
constexpr std::string_view MessageVersion = "messageVersion";
constexpr std::string_view SdkCounter = "sdkCounterStoA";
constexpr std::string_view ChallengeDataEntry = "challengeDataEntry";

constexpr std::string_view RequestType = "CReq";
constexpr std::string_view InitialCounter = "000";
constexpr std::string_view SubmissionCounter = "001";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Simulator::Device::Device(Security::Platform platform)
    : m_platform(platform)
    , m_sdkTransactionId(local::GenerateTransactionIdentifier())
    , m_serverTransactionId(local::GenerateTransactionIdentifier())
    , m_keyPair(Security::GenerateEphemeralKeyPair())
    , m_codec()
    , m_optAcsTransactionId()
    , m_upSessionKey()
    , m_logger(spdlog::get(Logger::Name.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::VerificationStatus> Simulator::Device::Establish(std::string_view acsSignedContent)
{
    auto const verified = Security::VerifyAcsContent(acsSignedContent);
    if (auto const pError = std::get_if<Security::Error>(&verified); pError) { return *pError; }

    auto const& payload = std::get<boost::json::object>(verified);
    auto const optAcsTransactionId = JsonUtils::GetString(payload, symbols::AcsTransactionId);
    auto const pAcsPublicKey = payload.if_contains(symbols::AcsEphemeralPublicKey);
    if (!optAcsTransactionId || !pAcsPublicKey || !pAcsPublicKey->is_object()) {
        return Security::Error::MalformedEnvelope;
    }

    auto const acsPublicKey = Security::JsonWebKey::Parse(pAcsPublicKey->get_object());
    if (auto const pError = std::get_if<Security::Error>(&acsPublicKey); pError) { return *pError; }

    auto const secret = m_keyPair.ComputeSharedSecret(std::get<Security::JsonWebKey>(acsPublicKey));
    if (auto const pError = std::get_if<Security::Error>(&secret); pError) { return *pError; }

    auto const algorithm = Security::GetEncryptionAlgorithm(m_platform);
    if (auto const pError = std::get_if<Security::Error>(&algorithm); pError) { return *pError; }

    auto derived = Security::DeriveKey(
        std::get<Security::SharedSecret>(secret), std::get<std::string_view>(algorithm), m_platform);
    if (auto const pError = std::get_if<Security::Error>(&derived); pError) { return *pError; }

    m_upSessionKey = std::make_unique<Security::DerivedKeyMaterial>(
        std::move(std::get<Security::DerivedKeyMaterial>(derived)));
    m_optAcsTransactionId = std::string{ *optAcsTransactionId };

    m_logger->debug("Established a {} session for transaction {}.", Security::ToString(m_platform), *m_optAcsTransactionId);
    return Security::VerificationStatus::Success;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Simulator::Device::CreateInitialRequest() const
{
    return CreateRequestBase(symbols::InitialCounter);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Simulator::Device::CreateSubmissionRequest(std::string_view password) const
{
    auto request = CreateRequestBase(symbols::SubmissionCounter);
    request[symbols::ChallengeDataEntry] = password;
    return request;
}

//----------------------------------------------------------------------------------------------------------------------

Security::StringResult Simulator::Device::Seal(boost::json::object const& request) const
{
    if (!m_upSessionKey || !m_optAcsTransactionId) { return Security::Error::KeyContextMismatch; }

    Security::JweHeader const header{ m_upSessionKey->GetAlgorithm(), m_optAcsTransactionId };
    auto const sealed = m_codec.Encrypt(
        boost::json::serialize(request), header, *m_upSessionKey, Security::KeyUsage::DecryptHalf);
    if (auto const pError = std::get_if<Security::Error>(&sealed); pError) { return *pError; }

    return std::get<Security::JweEnvelope>(sealed).Serialize();
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<boost::json::object> Simulator::Device::Open(std::string_view response) const
{
    if (!m_upSessionKey) { return Security::Error::KeyContextMismatch; }

    auto const opened = m_codec.Decrypt(response, *m_upSessionKey, Security::KeyUsage::EncryptHalf);
    if (auto const pError = std::get_if<Security::Error>(&opened); pError) { return *pError; }

    auto optJson = JsonUtils::ParseObject(std::get<std::string>(opened));
    if (!optJson) { return Security::Error::MalformedEnvelope; }
    return std::move(*optJson);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Simulator::Device::CreateRequestBase(std::string_view counter) const
{
    boost::json::object request;
    request[symbols::MessageType] = symbols::RequestType;
    request[symbols::MessageVersion] = Acs::ProtocolVersion;
    request[symbols::ServerTransactionId] = m_serverTransactionId;
    request[symbols::AcsTransactionId] = m_optAcsTransactionId.value_or("");
    request[symbols::SdkTransactionId] = m_sdkTransactionId;
    request[symbols::SdkCounter] = counter;
    return request;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GenerateTransactionIdentifier()
{
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

//----------------------------------------------------------------------------------------------------------------------
