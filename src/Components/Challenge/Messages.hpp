//----------------------------------------------------------------------------------------------------------------------
// File: Messages.hpp
// Description: Builders for the challenge response (CRes) payloads and the authentication outcome of an OTP
// submission. Payloads are returned as plain JSON objects, encryption is left to the challenge service.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Transaction/Record.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Challenge::Message {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ResponseType = "CRes";
constexpr std::string_view DefaultVersion = "2.2.0";

namespace Counter {

constexpr std::string_view Initial = "000";
constexpr std::string_view Submission = "001";

} // Counter namespace

namespace Status {

constexpr std::string_view Authenticated = "Y";
constexpr std::string_view NotAuthenticated = "N";

} // Status namespace

namespace Eci {

constexpr std::string_view Authenticated = "02";
constexpr std::string_view NotAuthenticated = "07";

} // Eci namespace

constexpr std::string_view FailedAuthenticationValue = "AAAAAAAAAAAAAAAAAAAAAA==";

// The fields of a decrypted challenge request (CReq) the ACS acts upon.
struct ChallengeRequest
{
    std::string messageVersion;
    std::optional<std::string> sdkCounter;
    std::optional<std::string> challengeDataEntry;
};

[[nodiscard]] std::optional<ChallengeRequest> ParseChallengeRequest(std::string_view plaintext);

// A 20 byte CAVV style value: a version byte, a method byte and a fixed filler pattern, base64 encoded.
[[nodiscard]] std::string GenerateAuthenticationValue();

// Compares the submitted password in constant time and produces the matching status, ECI and authentication value.
[[nodiscard]] Transaction::Outcome Authenticate(std::string_view submitted, std::string_view expected);

[[nodiscard]] boost::json::object CreateInitialResponse(Transaction::Record const& record);
[[nodiscard]] boost::json::object CreateCompletionResponse(
    Transaction::Record const& record, Transaction::Outcome const& outcome, std::string_view messageVersion);

//----------------------------------------------------------------------------------------------------------------------
} // Challenge::Message namespace
//----------------------------------------------------------------------------------------------------------------------
