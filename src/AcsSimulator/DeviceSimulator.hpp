//----------------------------------------------------------------------------------------------------------------------
// File: DeviceSimulator.hpp
// Description: Plays the device SDK side of a mobile challenge. The device verifies the ACS signed content, agrees a
// key with the ACS ephemeral key and then exchanges encrypted challenge messages. Key usage is mirrored relative to
// the ACS: requests are sealed with the half the ACS decrypts with and responses opened with the half it encrypts with.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/EphemeralKeyPair.hpp"
#include "Components/Security/JweCodec.hpp"
#include "Components/Security/KeyDerivation.hpp"
#include "Components/Security/SecurityDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Simulator {
//----------------------------------------------------------------------------------------------------------------------

class Device;

//----------------------------------------------------------------------------------------------------------------------
} // Simulator namespace
//----------------------------------------------------------------------------------------------------------------------

class Simulator::Device
{
public:
    explicit Device(Security::Platform platform);

    Device(Device const&) = delete;
    Device& operator=(Device const&) = delete;

    [[nodiscard]] Security::Platform GetPlatform() const { return m_platform; }
    [[nodiscard]] std::string const& GetSdkTransactionId() const { return m_sdkTransactionId; }
    [[nodiscard]] std::string const& GetServerTransactionId() const { return m_serverTransactionId; }
    [[nodiscard]] Security::JsonWebKey const& GetPublicKey() const { return m_keyPair.GetPublicKey(); }
    [[nodiscard]] std::optional<std::string> const& GetAcsTransactionId() const { return m_optAcsTransactionId; }

    // Verifies the ACS signed content and derives the session key from the embedded ACS ephemeral key.
    [[nodiscard]] Security::Result<Security::VerificationStatus> Establish(std::string_view acsSignedContent);

    [[nodiscard]] boost::json::object CreateInitialRequest() const;
    [[nodiscard]] boost::json::object CreateSubmissionRequest(std::string_view password) const;

    [[nodiscard]] Security::StringResult Seal(boost::json::object const& request) const;
    [[nodiscard]] Security::Result<boost::json::object> Open(std::string_view response) const;

private:
    [[nodiscard]] boost::json::object CreateRequestBase(std::string_view counter) const;

    Security::Platform const m_platform;
    std::string const m_sdkTransactionId;
    std::string const m_serverTransactionId;
    Security::EphemeralKeyPair m_keyPair;
    Security::JweCodec m_codec;

    std::optional<std::string> m_optAcsTransactionId;
    std::unique_ptr<Security::DerivedKeyMaterial> m_upSessionKey;

    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
