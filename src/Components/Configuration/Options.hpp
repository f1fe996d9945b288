//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The sections of the ACS configuration file. Each section merges its fields from the matching JSON
// object and validates the merged values before they are handed out.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

// Trims any trailing '/' from the base URL and appends the challenge endpoint path.
[[nodiscard]] std::string CreateAcsUrl(std::string_view baseUrl);

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Server;
class Security;
class Transactions;
class Challenge;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "version";
constexpr std::string_view Server = "server";
constexpr std::string_view BaseUrl = "base_url";
constexpr std::string_view Security = "security";
constexpr std::string_view Certificate = "certificate";
constexpr std::string_view PrivateKey = "private_key";
constexpr std::string_view Transactions = "transactions";
constexpr std::string_view Lifetime = "lifetime";
constexpr std::string_view Challenge = "challenge";
constexpr std::string_view OneTimePassword = "one_time_password";

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The public facing address of the ACS, used to derive the challenge URL handed to the device SDK.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Server
{
public:
    static constexpr std::string_view Symbol = Symbols::Server;

    Server() = default;
    explicit Server(std::string_view baseUrl);

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return false; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetBaseUrl() const { return m_baseUrl; }
    [[nodiscard]] std::string GetAcsUrl() const { return CreateAcsUrl(m_baseUrl); }

private:
    std::string m_baseUrl;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The locations of the certificate and private key used to sign the ACS content.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Security
{
public:
    static constexpr std::string_view Symbol = Symbols::Security;

    Security();
    Security(std::filesystem::path const& certificate, std::filesystem::path const& privateKey);

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    // Relative paths are resolved against the provided folder, typically the one holding the configuration file.
    void ResolvePaths(std::filesystem::path const& folder);

    [[nodiscard]] std::filesystem::path const& GetCertificatePath() const { return m_certificate; }
    [[nodiscard]] std::filesystem::path const& GetPrivateKeyPath() const { return m_privateKey; }

private:
    std::filesystem::path m_certificate;
    std::filesystem::path m_privateKey;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: How long a prepared transaction remains available to the challenge exchange.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Transactions
{
public:
    static constexpr std::string_view Symbol = Symbols::Transactions;

    Transactions();
    explicit Transactions(std::chrono::seconds const& lifetime);

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::chrono::seconds const& GetLifetime() const { return m_lifetime; }

private:
    std::chrono::seconds m_lifetime;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The one time password accepted by the simulated cardholder challenge.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Challenge
{
public:
    static constexpr std::string_view Symbol = Symbols::Challenge;

    Challenge();
    explicit Challenge(std::string_view password);

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetOneTimePassword() const { return m_password; }

private:
    std::string m_password;
};

//----------------------------------------------------------------------------------------------------------------------
