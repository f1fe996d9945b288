//----------------------------------------------------------------------------------------------------------------------
// File: Record.hpp
// Description: The state of a single mobile challenge transaction. The ACS key pair is shared read only between the
// request that generated it and the store, it is never mutated after generation.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/EphemeralKeyPair.hpp"
#include "Components/Security/JsonWebKey.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Transaction {
//----------------------------------------------------------------------------------------------------------------------

struct Outcome;
struct Record;

//----------------------------------------------------------------------------------------------------------------------
} // Transaction namespace
//----------------------------------------------------------------------------------------------------------------------

struct Transaction::Outcome
{
    std::string status;
    std::string eci;
    std::string authenticationValue;
};

//----------------------------------------------------------------------------------------------------------------------

struct Transaction::Record
{
    std::string acsTransactionId;
    std::string threeDsServerTransactionId;
    std::string sdkTransactionId;
    std::string acsReferenceNumber;
    Security::SharedEphemeralKeyPair spAcsKeyPair;
    Security::JsonWebKey sdkPublicKey;
    std::optional<Outcome> optOutcome;
};

//----------------------------------------------------------------------------------------------------------------------
