//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description: Drives a complete mobile challenge between the ACS challenge service and a simulated device SDK.
//----------------------------------------------------------------------------------------------------------------------
#include "DeviceSimulator.hpp"
#include "StartupOptions.hpp"
#include "Components/Challenge/Service.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Security/AcsContentSigner.hpp"
#include "Components/Security/KeyMaterial.hpp"
#include "Components/Transaction/MemoryStore.hpp"
#include "Utilities/JsonUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

using Resources = std::pair<ParseCode, std::unique_ptr<Configuration::Parser>>;

[[nodiscard]] Resources InitializeResources(Options const& options);

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// Sends one challenge request through the service and returns the decrypted response.
[[nodiscard]] std::optional<boost::json::object> Exchange(
    Challenge::Service const& service,
    Simulator::Device const& device,
    boost::json::object const& request,
    spdlog::logger& logger);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Startup::Options options;
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: {
            std::cout << "Unable to parse startup options!" << std::endl;
            return 1;
        }
    }

    auto const [code, upParser] = Startup::InitializeResources(options);
    if (code != Startup::ParseCode::Success) { return 1; }

    auto const logger = spdlog::get(Logger::Name.data());

    try {
        auto const spSigner = std::make_shared<Security::AcsContentSigner const>(
            Security::KeyMaterial::Load(upParser->GetCertificatePath(), upParser->GetPrivateKeyPath()));

        Challenge::Settings const settings{
            .acsUrl = upParser->GetAcsUrl(),
            .lifetime = upParser->GetTransactionLifetime(),
            .oneTimePassword = upParser->GetOneTimePassword()
        };

        Challenge::Service const service(settings, std::make_shared<Transaction::MemoryStore>(), spSigner);
        Simulator::Device device(options.GetPlatform());

        logger->info(
            "Simulating a {} device challenge against {}.", Security::ToString(device.GetPlatform()), settings.acsUrl);

        auto const prepared = service.Prepare({
            .threeDsServerTransactionId = device.GetServerTransactionId(),
            .sdkTransactionId = device.GetSdkTransactionId(),
            .sdkEphemeralPublicKey = device.GetPublicKey().ToString(),
            .challengeIndicator = "01"
        });

        if (auto const pFailure = std::get_if<Challenge::Failure>(&prepared); pFailure) {
            logger->critical("Failed to prepare the challenge transaction: {}", pFailure->description);
            return 1;
        }

        auto const& preparation = std::get<Challenge::Preparation>(prepared);
        if (auto const result = device.Establish(preparation.acsSignedContent); std::holds_alternative<Security::Error>(result)) {
            logger->critical(
                "The device rejected the ACS signed content: {}", Security::ToString(std::get<Security::Error>(result)));
            return 1;
        }

        auto const optInitial = local::Exchange(service, device, device.CreateInitialRequest(), *logger);
        if (!optInitial) { return 1; }
        logger->info("Received the initial challenge: {}", boost::json::serialize(*optInitial));

        auto const& password = options.GetOneTimePassword().value_or(upParser->GetOneTimePassword());
        auto const optFinal = local::Exchange(service, device, device.CreateSubmissionRequest(password), *logger);
        if (!optFinal) { return 1; }
        logger->info("Received the final challenge response: {}", boost::json::serialize(*optFinal));

        auto const optStatus = JsonUtils::GetString(*optFinal, "transStatus");
        logger->info("Transaction status: {}", optStatus.value_or("<missing>"));
        return (optStatus == "Y") ? 0 : 1;
    } catch (std::runtime_error const& exception) {
        logger->critical("An unexpected error occured during the simulation: {}", exception.what());
        return 1;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Startup::Resources Startup::InitializeResources(Options const& options)
{
    // Initialize the logging resources for the application.
    Logger::Initialize(options.GetVerbosityLevel(), true);
    auto const logger = spdlog::get(Logger::Name.data()); // From here on we should use the logger for errors.

    // Create a configuration parser to read the configuration file at the provided location. If we fail to read the
    // file log an error and return early.
    auto upParser = std::make_unique<Configuration::Parser>(options.GetConfigPath());
    if (auto const [status, message] = upParser->FetchOptions(); status != Configuration::StatusCode::Success) {
        logger->critical("An error occured while parsing the configuration file: {}", message);
        return { ParseCode::Malformed, nullptr };
    }

    return { ParseCode::Success, std::move(upParser) };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::json::object> local::Exchange(
    Challenge::Service const& service,
    Simulator::Device const& device,
    boost::json::object const& request,
    spdlog::logger& logger)
{
    auto const sealed = device.Seal(request);
    if (auto const pError = std::get_if<Security::Error>(&sealed); pError) {
        logger.critical("The device failed to encrypt the challenge request: {}", Security::ToString(*pError));
        return {};
    }

    auto const processed = service.Process(std::get<std::string>(sealed));
    if (auto const pFailure = std::get_if<Challenge::Failure>(&processed); pFailure) {
        logger.critical("The ACS rejected the challenge request: {}", boost::json::serialize(pFailure->ToJson()));
        return {};
    }

    auto opened = device.Open(std::get<Challenge::Response>(processed).jwe);
    if (auto const pError = std::get_if<Security::Error>(&opened); pError) {
        logger.critical("The device failed to decrypt the challenge response: {}", Security::ToString(*pError));
        return {};
    }

    return std::move(std::get<boost::json::object>(opened));
}

//----------------------------------------------------------------------------------------------------------------------
