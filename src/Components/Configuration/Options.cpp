//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/JsonUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cctype>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ChallengePath = "/challenge";
constexpr std::string_view HttpScheme = "http://";
constexpr std::string_view HttpsScheme = "https://";

[[nodiscard]] bool HasSupportedScheme(std::string_view url);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::CreateAcsUrl(std::string_view baseUrl)
{
    while (!baseUrl.empty() && baseUrl.back() == '/') { baseUrl.remove_suffix(1); }
    std::string url{ baseUrl };
    url.append(local::ChallengePath);
    return url;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Server::Server(std::string_view baseUrl)
    : m_baseUrl(baseUrl)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Server::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "server": {
    //     "base_url": String
    // },

    if (auto const itr = json.find(Symbols::BaseUrl); itr != json.end()) {
        if (itr->value().is_string()) {
            m_baseUrl = JsonUtils::ToStringView(itr->value().as_string());
        } else {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("string", GetFieldName(), Symbols::BaseUrl)
            };
        }
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(GetFieldName(), Symbols::BaseUrl) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Server::AreOptionsAllowable() const
{
    if (!local::HasSupportedScheme(m_baseUrl)) {
        return {
            StatusCode::InputError,
            CreateInvalidValueMessage("an http:// or https:// URL", GetFieldName(), Symbols::BaseUrl)
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Security::Security()
    : m_certificate(Defaults::CertificatePath)
    , m_privateKey(Defaults::PrivateKeyPath)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Security::Security(
    std::filesystem::path const& certificate, std::filesystem::path const& privateKey)
    : m_certificate(certificate)
    , m_privateKey(privateKey)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Security::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "security": {
    //     "certificate": Optional String,
    //     "private_key": Optional String
    // },

    for (auto const& [field, pDestination] : {
        std::pair{ Symbols::Certificate, &m_certificate },
        std::pair{ Symbols::PrivateKey, &m_privateKey } }) {
        if (auto const itr = json.find(field); itr != json.end()) {
            if (!itr->value().is_string()) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("string", GetFieldName(), field)
                };
            }
            *pDestination = JsonUtils::ToStringView(itr->value().as_string());
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Security::AreOptionsAllowable() const
{
    if (m_certificate.empty()) {
        return { StatusCode::InputError, CreateInvalidValueMessage("a filepath", GetFieldName(), Symbols::Certificate) };
    }

    if (m_privateKey.empty()) {
        return { StatusCode::InputError, CreateInvalidValueMessage("a filepath", GetFieldName(), Symbols::PrivateKey) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Security::ResolvePaths(std::filesystem::path const& folder)
{
    if (m_certificate.is_relative()) { m_certificate = folder / m_certificate; }
    if (m_privateKey.is_relative()) { m_privateKey = folder / m_privateKey; }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Transactions::Transactions()
    : m_lifetime(Defaults::TransactionLifetime)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Transactions::Transactions(std::chrono::seconds const& lifetime)
    : m_lifetime(lifetime)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Transactions::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "transactions": {
    //     "lifetime": Optional Integer (seconds)
    // },

    if (auto const itr = json.find(Symbols::Lifetime); itr != json.end()) {
        if (!itr->value().is_int64()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", GetFieldName(), Symbols::Lifetime)
            };
        }
        m_lifetime = std::chrono::seconds{ itr->value().as_int64() };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Transactions::AreOptionsAllowable() const
{
    if (m_lifetime < Defaults::MinimumTransactionLifetime || m_lifetime > Defaults::MaximumTransactionLifetime) {
        return {
            StatusCode::InputError,
            CreateValueRangeMessage(
                Defaults::MinimumTransactionLifetime.count(), Defaults::MaximumTransactionLifetime.count(),
                GetFieldName(), Symbols::Lifetime)
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Challenge::Challenge()
    : m_password(Defaults::OneTimePassword)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Challenge::Challenge(std::string_view password)
    : m_password(password)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Challenge::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "challenge": {
    //     "one_time_password": Optional String
    // },

    if (auto const itr = json.find(Symbols::OneTimePassword); itr != json.end()) {
        if (!itr->value().is_string()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("string", GetFieldName(), Symbols::OneTimePassword)
            };
        }
        m_password = JsonUtils::ToStringView(itr->value().as_string());
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Challenge::AreOptionsAllowable() const
{
    bool const isAllowable = m_password.size() >= Defaults::MinimumPasswordLength &&
        m_password.size() <= Defaults::MaximumPasswordLength &&
        std::ranges::all_of(m_password, [] (char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });

    if (!isAllowable) {
        return {
            StatusCode::InputError,
            CreateInvalidValueMessage("4 to 8 digits", GetFieldName(), Symbols::OneTimePassword)
        };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::HasSupportedScheme(std::string_view url)
{
    auto const hasPrefix = [&url] (std::string_view scheme) {
        return url.size() > scheme.size() && url.starts_with(scheme);
    };
    return hasPrefix(HttpScheme) || hasPrefix(HttpsScheme);
}

//----------------------------------------------------------------------------------------------------------------------
