//----------------------------------------------------------------------------------------------------------------------
// File: Service.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Service.hpp"
#include "Messages.hpp"
#include "Components/Security/EphemeralKeyPair.hpp"
#include "Components/Security/JweEnvelope.hpp"
#include "Components/Security/KeyDerivation.hpp"
#include "Components/Security/PlatformDetector.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Whitespace = " \t\r\n";

[[nodiscard]] std::string GenerateTransactionIdentifier();
[[nodiscard]] bool IsTransactionIdentifier(std::string_view identifier);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Challenge::Service::Service(
    Settings const& settings,
    std::shared_ptr<ITransactionStore> const& spStore,
    std::shared_ptr<Security::AcsContentSigner const> const& spSigner)
    : m_settings(settings)
    , m_spStore(spStore)
    , m_spSigner(spSigner)
    , m_codec()
    , m_logger(spdlog::get(Logger::Name.data()))
{
    assert(m_logger);
    if (!m_spStore || !m_spSigner) {
        throw std::runtime_error("The challenge service requires a transaction store and a content signer!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

Challenge::PreparationResult Challenge::Service::Prepare(PreparationRequest const& request) const
{
    auto const sdkPublicKey = Security::JsonWebKey::Parse(request.sdkEphemeralPublicKey);
    if (auto const pError = std::get_if<Security::Error>(&sdkPublicKey); pError) {
        return Reject({ Failure::Reason::MalformedRequest, "Invalid SDK ephemeral public key" });
    }

    Security::SharedEphemeralKeyPair spKeyPair;
    try {
        spKeyPair = std::make_shared<Security::EphemeralKeyPair const>(Security::GenerateEphemeralKeyPair());
    } catch (std::runtime_error const& exception) {
        m_logger->critical("Unable to generate the ACS ephemeral key pair: {}", exception.what());
        return Failure{ Failure::Reason::InternalFailure, "Internal server error" };
    }

    auto const referenceNumber = (request.challengeIndicator == ExemptionIndicator) ?
        ReferenceNumber::Exemption : ReferenceNumber::Default;

    Transaction::Record record{
        .acsTransactionId = local::GenerateTransactionIdentifier(),
        .threeDsServerTransactionId = request.threeDsServerTransactionId,
        .sdkTransactionId = request.sdkTransactionId,
        .acsReferenceNumber = std::string{ referenceNumber },
        .spAcsKeyPair = spKeyPair,
        .sdkPublicKey = std::get<Security::JsonWebKey>(sdkPublicKey),
        .optOutcome = {}
    };

    auto signing = m_spSigner->Sign(Security::AcsContent{
        record.acsTransactionId, record.acsReferenceNumber, m_settings.acsUrl, spKeyPair->GetPublicKey() });

    Preparation preparation{ record.acsTransactionId, record.acsReferenceNumber, {}, false };
    if (auto const pSigned = std::get_if<Security::SignedContent>(&signing); pSigned) {
        preparation.acsSignedContent = std::move(pSigned->jwt);
    } else {
        preparation.acsSignedContent = std::move(std::get<Security::FallbackContent>(signing).jwt);
        preparation.usesFallbackContent = true;
    }

    m_spStore->Put(record.acsTransactionId, record, m_settings.lifetime);
    m_logger->info("Prepared challenge transaction {} ({}).", record.acsTransactionId, record.acsReferenceNumber);

    return preparation;
}

//----------------------------------------------------------------------------------------------------------------------

Challenge::ProcessResult Challenge::Service::Process(std::string_view body) const
{
    if (auto const begin = body.find_first_not_of(local::Whitespace); begin != std::string_view::npos) {
        body.remove_prefix(begin);
        body.remove_suffix(body.size() - body.find_last_not_of(local::Whitespace) - 1);
    }

    // A JSON document here is usually an error object echoed back by the device instead of an encrypted request.
    if (body.empty() || body.front() == '{') {
        return Reject({ Failure::Reason::MalformedRequest, "Expected a compact JWE challenge request" });
    }

    auto parsed = Security::JweEnvelope::Parse(body);
    if (auto const pError = std::get_if<Security::Error>(&parsed); pError) {
        return Reject(Failure::FromError(*pError));
    }

    auto const& envelope = std::get<Security::JweEnvelope>(parsed);
    auto const& optKeyIdentifier = envelope.GetKeyIdentifier();
    if (!optKeyIdentifier) {
        return Reject({ Failure::Reason::MalformedRequest, "Missing kid in JWE header" });
    }

    if (!local::IsTransactionIdentifier(*optKeyIdentifier)) {
        return Reject({ Failure::Reason::MalformedRequest, "Invalid kid format: " + *optKeyIdentifier });
    }

    auto const platform = Security::DetectPlatform(envelope.GetAlgorithm());
    if (auto const pError = std::get_if<Security::Error>(&platform); pError) {
        return Reject(Failure::FromError(*pError));
    }

    auto optRecord = m_spStore->Get(*optKeyIdentifier);
    if (!optRecord) {
        return Reject({ Failure::Reason::UnknownTransaction, "Transaction not found" });
    }

    auto const& record = *optRecord;
    if (!record.spAcsKeyPair) {
        return Reject({ Failure::Reason::InternalFailure, "Transaction is missing its ACS ephemeral key" });
    }

    auto const secret = record.spAcsKeyPair->ComputeSharedSecret(record.sdkPublicKey);
    if (auto const pError = std::get_if<Security::Error>(&secret); pError) {
        return Reject(Failure::FromError(*pError));
    }

    auto const derived = Security::DeriveKey(
        std::get<Security::SharedSecret>(secret), envelope.GetAlgorithm(), std::get<Security::Platform>(platform));
    if (auto const pError = std::get_if<Security::Error>(&derived); pError) {
        return Reject(Failure::FromError(*pError));
    }

    auto const& key = std::get<Security::DerivedKeyMaterial>(derived);
    auto const decrypted = m_codec.Decrypt(envelope, key, Security::KeyUsage::DecryptHalf);
    if (auto const pError = std::get_if<Security::Error>(&decrypted); pError) {
        return Reject(Failure::FromError(*pError));
    }

    auto const optRequest = Message::ParseChallengeRequest(std::get<std::string>(decrypted));
    if (!optRequest) {
        return Reject({ Failure::Reason::MalformedRequest, "Invalid challenge request" });
    }

    bool const isSubmission = optRequest->challengeDataEntry.has_value();
    auto const expectedCounter = isSubmission ? Message::Counter::Submission : Message::Counter::Initial;
    if (optRequest->sdkCounter != expectedCounter) {
        m_logger->warn(
            "Unexpected SDK counter {} for transaction {} (expected {}).",
            optRequest->sdkCounter.value_or("<missing>"), record.acsTransactionId, expectedCounter);
    }

    boost::json::object response;
    if (isSubmission) {
        auto const outcome = Message::Authenticate(*optRequest->challengeDataEntry, m_settings.oneTimePassword);

        // The outcome is recorded at most once, a concurrent or repeated submission cannot replace it.
        bool completed = false;
        bool const recorded = m_spStore->Update(
            record.acsTransactionId, [&outcome, &completed] (Transaction::Record& stored) -> bool {
                if (stored.optOutcome) { completed = true; return false; }
                stored.optOutcome = outcome;
                return true;
            });

        if (completed) {
            return Reject({ Failure::Reason::MalformedRequest, "Challenge already completed" });
        }

        if (!recorded) {
            return Reject({ Failure::Reason::UnknownTransaction, "Transaction not found" });
        }

        response = Message::CreateCompletionResponse(record, outcome, optRequest->messageVersion);
        m_logger->info("Challenge for transaction {} completed with status {}.", record.acsTransactionId, outcome.status);
    } else {
        response = Message::CreateInitialResponse(record);
        m_logger->debug("Issuing the initial challenge for transaction {}.", record.acsTransactionId);
    }

    Security::JweHeader const header{ envelope.GetAlgorithm(), record.acsTransactionId };
    auto encrypted = m_codec.Encrypt(boost::json::serialize(response), header, key, Security::KeyUsage::EncryptHalf);
    if (auto const pError = std::get_if<Security::Error>(&encrypted); pError) {
        return Reject(Failure::FromError(*pError));
    }

    return Response{
        std::get<Security::JweEnvelope>(encrypted).Serialize(), std::get<Security::Platform>(platform), isSubmission };
}

//----------------------------------------------------------------------------------------------------------------------

Challenge::Failure Challenge::Service::Reject(Failure&& failure) const
{
    m_logger->warn("Rejected a challenge request ({}): {}.", failure.GetStatusCode(), failure.description);
    return std::move(failure);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GenerateTransactionIdentifier()
{
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsTransactionIdentifier(std::string_view identifier)
{
    try {
        boost::uuids::string_generator generator;
        [[maybe_unused]] auto const uuid = generator(identifier.begin(), identifier.end());
        return true;
    } catch (std::runtime_error const&) {
        return false;
    }
}

//----------------------------------------------------------------------------------------------------------------------
