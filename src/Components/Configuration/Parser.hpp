//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads and validates the ACS configuration file. The SDK reference numbers and the platform pairing
// are compiled in and can not be configured.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    explicit Parser(std::filesystem::path const& filepath);

    [[nodiscard]] DeserializationResult FetchOptions();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const { return m_filepath; }
    [[nodiscard]] std::string const& GetVersion() const { return m_version; }
    [[nodiscard]] std::string const& GetBaseUrl() const { return m_server.GetBaseUrl(); }
    [[nodiscard]] std::string GetAcsUrl() const { return m_server.GetAcsUrl(); }
    [[nodiscard]] std::filesystem::path const& GetCertificatePath() const { return m_security.GetCertificatePath(); }
    [[nodiscard]] std::filesystem::path const& GetPrivateKeyPath() const { return m_security.GetPrivateKeyPath(); }
    [[nodiscard]] std::chrono::seconds const& GetTransactionLifetime() const { return m_transactions.GetLifetime(); }
    [[nodiscard]] std::string const& GetOneTimePassword() const { return m_challenge.GetOneTimePassword(); }

    [[nodiscard]] bool Validated() const { return m_validated; }

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] ValidationResult ValidateOptions();

    template<typename OptionsType>
    [[nodiscard]] DeserializationResult MergeSection(boost::json::object const& json, OptionsType& options);

    std::shared_ptr<spdlog::logger> m_logger;

    std::filesystem::path m_filepath;
    std::string m_version;
    Options::Server m_server;
    Options::Security m_security;
    Options::Transactions m_transactions;
    Options::Challenge m_challenge;

    bool m_validated;
};

//----------------------------------------------------------------------------------------------------------------------
