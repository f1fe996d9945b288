//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

std::filesystem::path const ConfigurationFilepath = "config/acs.json";

constexpr std::string_view CertificatePath = "certs/acs-cert.pem";
constexpr std::string_view PrivateKeyPath = "certs/acs-private-key.pem";

constexpr auto TransactionLifetime = std::chrono::seconds{ 1'200 };
constexpr auto MinimumTransactionLifetime = std::chrono::seconds{ 1 };
constexpr auto MaximumTransactionLifetime = std::chrono::seconds{ 86'400 };

constexpr std::string_view OneTimePassword = "1234";
constexpr std::size_t MinimumPasswordLength = 4;
constexpr std::size_t MaximumPasswordLength = 8;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
