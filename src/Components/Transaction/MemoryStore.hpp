//----------------------------------------------------------------------------------------------------------------------
// File: MemoryStore.hpp
// Description: An in process transaction store. Entries are indexed by the ACS transaction identifier and by their
// expiration, expired entries are never returned and are pruned whenever the store is modified.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Record.hpp"
#include "Interfaces/TransactionStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/tag.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Transaction {
//----------------------------------------------------------------------------------------------------------------------

class MemoryStore;

//----------------------------------------------------------------------------------------------------------------------
} // Transaction namespace
//----------------------------------------------------------------------------------------------------------------------

class Transaction::MemoryStore final : public ITransactionStore
{
public:
    using Clock = std::chrono::steady_clock;

    MemoryStore();

    // ITransactionStore {
    virtual void Put(std::string_view identifier, Record const& record, std::chrono::seconds lifetime) override;
    [[nodiscard]] virtual std::optional<Record> Get(std::string_view identifier) const override;
    virtual bool Erase(std::string_view identifier) override;
    virtual bool Update(std::string_view identifier, UpdateFunction const& update) override;
    // } ITransactionStore

    [[nodiscard]] std::size_t Size() const;
    std::size_t Prune();

private:
    struct IdentifierIndex {};
    struct ExpirationIndex {};

    struct Entry
    {
        std::string identifier;
        Record record;
        Clock::time_point expiration;
    };

    using EntryMap = boost::multi_index_container<
        Entry,
        boost::multi_index::indexed_by<
            boost::multi_index::hashed_unique<
                boost::multi_index::tag<IdentifierIndex>,
                boost::multi_index::member<Entry, std::string, &Entry::identifier>>,
            boost::multi_index::ordered_non_unique<
                boost::multi_index::tag<ExpirationIndex>,
                boost::multi_index::member<Entry, Clock::time_point, &Entry::expiration>>>>;

    // Callers must hold the entries mutex exclusively.
    std::size_t PruneExpired(Clock::time_point now);

    mutable std::shared_mutex m_entriesMutex;
    EntryMap m_entries;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
