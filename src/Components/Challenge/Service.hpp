//----------------------------------------------------------------------------------------------------------------------
// File: Service.hpp
// Description: The ACS side of a mobile challenge. Prepare handles the challenge branch of authentication by creating
// the per transaction key pair and the ACS signed content. Process handles each encrypted challenge request (CReq)
// and returns the encrypted challenge response (CRes) for the same platform.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Failure.hpp"
#include "Components/Security/AcsContentSigner.hpp"
#include "Components/Security/JweCodec.hpp"
#include "Components/Security/SecurityDefinitions.hpp"
#include "Interfaces/TransactionStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Challenge {
//----------------------------------------------------------------------------------------------------------------------

class Service;

struct Settings
{
    std::string acsUrl;
    std::chrono::seconds lifetime;
    std::string oneTimePassword;
};

struct PreparationRequest
{
    std::string threeDsServerTransactionId;
    std::string sdkTransactionId;
    std::string sdkEphemeralPublicKey; // A serialized JWK.
    std::string challengeIndicator;
};

struct Preparation
{
    std::string acsTransactionId;
    std::string acsReferenceNumber;
    std::string acsSignedContent;
    bool usesFallbackContent;
};

struct Response
{
    std::string jwe;
    Security::Platform platform;
    bool isComplete;
};

using PreparationResult = std::variant<Preparation, Failure>;
using ProcessResult = std::variant<Response, Failure>;

namespace ReferenceNumber {

constexpr std::string_view Default = "issuer1";
constexpr std::string_view Exemption = "issuer2";

} // ReferenceNumber namespace

// The requestor challenge indicator that selects the exemption reference number.
constexpr std::string_view ExemptionIndicator = "05";

//----------------------------------------------------------------------------------------------------------------------
} // Challenge namespace
//----------------------------------------------------------------------------------------------------------------------

class Challenge::Service
{
public:
    Service(
        Settings const& settings,
        std::shared_ptr<ITransactionStore> const& spStore,
        std::shared_ptr<Security::AcsContentSigner const> const& spSigner);

    Service(Service const&) = delete;
    Service& operator=(Service const&) = delete;

    [[nodiscard]] PreparationResult Prepare(PreparationRequest const& request) const;
    [[nodiscard]] ProcessResult Process(std::string_view body) const;

    [[nodiscard]] Settings const& GetSettings() const { return m_settings; }

private:
    [[nodiscard]] Failure Reject(Failure&& failure) const;

    Settings const m_settings;
    std::shared_ptr<ITransactionStore> m_spStore;
    std::shared_ptr<Security::AcsContentSigner const> m_spSigner;
    Security::JweCodec m_codec;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
