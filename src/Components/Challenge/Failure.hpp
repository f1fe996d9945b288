//----------------------------------------------------------------------------------------------------------------------
// File: Failure.hpp
// Description: The reasons a challenge exchange is refused and their mapping onto the protocol error codes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Challenge {
//----------------------------------------------------------------------------------------------------------------------

struct Failure;

//----------------------------------------------------------------------------------------------------------------------
} // Challenge namespace
//----------------------------------------------------------------------------------------------------------------------

struct Challenge::Failure
{
    enum class Reason : std::uint32_t {
        MalformedRequest,
        UnsupportedAlgorithm,
        DecryptionFailure,
        UnknownTransaction,
        InternalFailure
    };

    [[nodiscard]] static Failure FromError(Security::Error error);

    [[nodiscard]] std::uint16_t GetStatusCode() const;
    [[nodiscard]] boost::json::object ToJson() const;

    Reason reason;
    std::string description;
};

//----------------------------------------------------------------------------------------------------------------------

inline Challenge::Failure Challenge::Failure::FromError(Security::Error error)
{
    auto const reason = [&error] () -> Reason {
        switch (error) {
            case Security::Error::MalformedEnvelope:
            case Security::Error::InvalidPublicKey: return Reason::MalformedRequest;
            case Security::Error::UnsupportedAlgorithm:
            case Security::Error::UnsupportedPlatform: return Reason::UnsupportedAlgorithm;
            case Security::Error::AuthenticationFailed: return Reason::DecryptionFailure;
            default: return Reason::InternalFailure;
        }
    }();

    return Failure{ reason, std::string{ Security::ToString(error) } };
}

//----------------------------------------------------------------------------------------------------------------------

inline std::uint16_t Challenge::Failure::GetStatusCode() const
{
    switch (reason) {
        case Reason::MalformedRequest:
        case Reason::UnsupportedAlgorithm:
        case Reason::DecryptionFailure: return 400;
        case Reason::UnknownTransaction: return 404;
        case Reason::InternalFailure: return 500;
    }
    return 500;
}

//----------------------------------------------------------------------------------------------------------------------

inline boost::json::object Challenge::Failure::ToJson() const
{
    boost::json::object json;
    json["errorCode"] = std::to_string(GetStatusCode());
    json["errorDescription"] = description;
    return json;
}

//----------------------------------------------------------------------------------------------------------------------
