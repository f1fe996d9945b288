//----------------------------------------------------------------------------------------------------------------------
// File: Messages.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Messages.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/JsonUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t AuthenticationValueSize = 20;
constexpr std::uint8_t AuthenticationValueVersion = 0x02;
constexpr std::uint8_t AuthenticationMethod = 0x01;

[[nodiscard]] boost::json::object CreateResponseBase(Transaction::Record const& record);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view AcsTransactionId = "acsTransID";
constexpr std::string_view SdkTransactionId = "sdkTransID";
constexpr std::string_view ServerTransactionId = "threeDSServerTransID";
constexpr std::string_view MessageType = "messageType";
constexpr std::string_view MessageVersion = "messageVersion";
constexpr std::string_view AcsCounter = "acsCounterAtoS";
constexpr std::string_view SdkCounter = "sdkCounterStoA";
constexpr std::string_view ChallengeDataEntry = "challengeDataEntry";
constexpr std::string_view CompletionIndicator = "challengeCompletionInd";
constexpr std::string_view TransactionStatus = "transStatus";
constexpr std::string_view UiType = "acsUiType";
constexpr std::string_view InfoHeader = "challengeInfoHeader";
constexpr std::string_view InfoLabel = "challengeInfoLabel";
constexpr std::string_view SubmitLabel = "submitAuthenticationLabel";

constexpr std::string_view TextUiType = "01";
constexpr std::string_view InfoHeaderText = "Authentication Required";
constexpr std::string_view InfoLabelText = "Enter OTP:";
constexpr std::string_view SubmitLabelText = "Submit";
constexpr std::string_view Incomplete = "N";
constexpr std::string_view Complete = "Y";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Challenge::Message::ChallengeRequest> Challenge::Message::ParseChallengeRequest(
    std::string_view plaintext)
{
    auto const optJson = JsonUtils::ParseObject(plaintext);
    if (!optJson) { return {}; }

    ChallengeRequest request;
    request.messageVersion = JsonUtils::GetString(*optJson, symbols::MessageVersion).value_or(DefaultVersion);

    if (auto const optCounter = JsonUtils::GetString(*optJson, symbols::SdkCounter); optCounter) {
        request.sdkCounter = std::string{ *optCounter };
    }

    // The presence of the entry marks a submission. A non-string entry is treated as an empty submission.
    if (auto const pEntry = optJson->if_contains(symbols::ChallengeDataEntry); pEntry) {
        request.challengeDataEntry = pEntry->is_string() ?
            std::string{ JsonUtils::ToStringView(pEntry->get_string()) } : std::string{};
    }

    return request;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Challenge::Message::GenerateAuthenticationValue()
{
    std::array<std::uint8_t, local::AuthenticationValueSize> value{};
    value[0] = local::AuthenticationValueVersion;
    value[1] = local::AuthenticationMethod;
    for (std::size_t idx = 2; idx < value.size(); ++idx) {
        value[idx] = static_cast<std::uint8_t>((idx * 17 + 13 + 0x4A) % 256);
    }
    return Security::EncodeBase64(value);
}

//----------------------------------------------------------------------------------------------------------------------

Transaction::Outcome Challenge::Message::Authenticate(std::string_view submitted, std::string_view expected)
{
    bool const authenticated = !expected.empty() &&
        Security::ConstantTimeEquals(Security::ToReadableView(submitted), Security::ToReadableView(expected));

    if (authenticated) {
        return { std::string{ Status::Authenticated }, std::string{ Eci::Authenticated }, GenerateAuthenticationValue() };
    }

    return {
        std::string{ Status::NotAuthenticated },
        std::string{ Eci::NotAuthenticated },
        std::string{ FailedAuthenticationValue } };
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Challenge::Message::CreateInitialResponse(Transaction::Record const& record)
{
    auto response = local::CreateResponseBase(record);
    response[symbols::MessageVersion] = DefaultVersion;
    response[symbols::AcsCounter] = Counter::Initial;
    response[symbols::UiType] = symbols::TextUiType;
    response[symbols::CompletionIndicator] = symbols::Incomplete;
    response[symbols::InfoHeader] = symbols::InfoHeaderText;
    response[symbols::InfoLabel] = symbols::InfoLabelText;
    response[symbols::SubmitLabel] = symbols::SubmitLabelText;
    return response;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Challenge::Message::CreateCompletionResponse(
    Transaction::Record const& record, Transaction::Outcome const& outcome, std::string_view messageVersion)
{
    auto response = local::CreateResponseBase(record);
    response[symbols::MessageVersion] = messageVersion.empty() ? DefaultVersion : messageVersion;
    response[symbols::AcsCounter] = Counter::Submission;
    response[symbols::CompletionIndicator] = symbols::Complete;
    response[symbols::TransactionStatus] = outcome.status;
    return response;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object local::CreateResponseBase(Transaction::Record const& record)
{
    boost::json::object response;
    response[symbols::MessageType] = Challenge::Message::ResponseType;
    response[symbols::AcsTransactionId] = record.acsTransactionId;
    response[symbols::SdkTransactionId] = record.sdkTransactionId;
    response[symbols::ServerTransactionId] = record.threeDsServerTransactionId;
    return response;
}

//----------------------------------------------------------------------------------------------------------------------
