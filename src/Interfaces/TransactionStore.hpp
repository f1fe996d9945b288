//----------------------------------------------------------------------------------------------------------------------
// File: TransactionStore.hpp
// Description: Persistence of challenge transactions between the authentication step and the challenge exchange.
// Records are keyed by the ACS transaction identifier and expire after the lifetime given when they are stored.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Transaction/Record.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <functional>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ITransactionStore
{
public:
    using UpdateFunction = std::function<bool(Transaction::Record& record)>;

    virtual ~ITransactionStore() = default;

    // Inserts or replaces the record, restarting its lifetime.
    virtual void Put(std::string_view identifier, Transaction::Record const& record, std::chrono::seconds lifetime) = 0;
    [[nodiscard]] virtual std::optional<Transaction::Record> Get(std::string_view identifier) const = 0;
    virtual bool Erase(std::string_view identifier) = 0;

    // Applies the function to a live record while the store is locked. The record is only written back when the
    // function returns true, its lifetime is left unchanged.
    virtual bool Update(std::string_view identifier, UpdateFunction const& update) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
