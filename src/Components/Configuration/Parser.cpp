//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Utilities/JsonUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <fstream>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "server": {
//     "base_url": String
// },
// "security": {
//     "certificate": Optional String,
//     "private_key": Optional String
// },
// "transactions": {
//     "lifetime": Optional Integer
// },
// "challenge": {
//     "one_time_password": Optional String
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : m_logger(spdlog::get(Logger::Name.data()))
    , m_filepath(filepath)
    , m_version()
    , m_server()
    , m_security()
    , m_transactions()
    , m_challenge()
    , m_validated(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; }
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    m_security.ResolvePaths(m_filepath.parent_path());
    m_logger->debug("Loaded configuration version {} from: {}.", m_version, m_filepath.string());

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(m_filepath, error)) {
        std::ostringstream oss;
        oss << "Failed to locate a configuration file at: " << m_filepath;
        return { StatusCode::FileError, oss.str() };
    }

    if (auto const size = std::filesystem::file_size(m_filepath, error); error || size > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file exceeds the maximum allowable size." };
    }

    m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
    return Deserialize();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    constexpr boost::json::parse_options ParserOptions{
        .allow_comments = true,
        .allow_trailing_commas = true,
    };

    std::stringstream buffer;
    {
        std::ifstream reader{ m_filepath };
        if (reader.fail()) [[unlikely]] {
            return { StatusCode::FileError, "Failed to open configuration file for reading." };
        }
        buffer << reader.rdbuf(); // Read the file into the buffer stream.
    }

    auto const serialized = buffer.str();
    if (serialized.empty()) {
        return { StatusCode::DecodeError, "The configuration file is empty." };
    }

    boost::json::error_code error;
    auto const parsed = boost::json::parse(serialized, error, boost::json::storage_ptr{}, ParserOptions);
    if (error || !parsed.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const& json = parsed.get_object();

    // Required field parsing.
    if (auto const itr = json.find(Symbols::Version); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", Symbols::Version) };
        }
        m_version = JsonUtils::ToStringView(itr->value().as_string());
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(Symbols::Version) };
    }

    if (auto const status = MergeSection(json, m_server); status.first != StatusCode::Success) { return status; }
    if (auto const status = MergeSection(json, m_security); status.first != StatusCode::Success) { return status; }
    if (auto const status = MergeSection(json, m_transactions); status.first != StatusCode::Success) { return status; }
    if (auto const status = MergeSection(json, m_challenge); status.first != StatusCode::Success) { return status; }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails.

    if (m_version.empty()) {
        return { StatusCode::InputError, CreateInvalidValueMessage("a version string", Symbols::Version) };
    }

    if (auto const status = m_server.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_security.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_transactions.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_challenge.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

template<typename OptionsType>
Configuration::DeserializationResult Configuration::Parser::MergeSection(
    boost::json::object const& json, OptionsType& options)
{
    auto const itr = json.find(OptionsType::GetFieldName());
    if (itr == json.end()) {
        if (OptionsType::IsOptional()) { return { StatusCode::Success, "" }; }
        return { StatusCode::DecodeError, CreateMissingFieldMessage(OptionsType::GetFieldName()) };
    }

    if (!itr->value().is_object()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", OptionsType::GetFieldName()) };
    }

    return options.Merge(itr->value().as_object());
}

//----------------------------------------------------------------------------------------------------------------------
