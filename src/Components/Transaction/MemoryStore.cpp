//----------------------------------------------------------------------------------------------------------------------
// File: MemoryStore.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MemoryStore.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <iterator>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

Transaction::MemoryStore::MemoryStore()
    : m_entriesMutex()
    , m_entries()
    , m_logger(spdlog::get(Logger::Name.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

void Transaction::MemoryStore::Put(std::string_view identifier, Record const& record, std::chrono::seconds lifetime)
{
    auto const now = Clock::now();
    Entry entry{ std::string{ identifier }, record, now + lifetime };

    std::scoped_lock lock{ m_entriesMutex };
    PruneExpired(now);

    auto& index = m_entries.template get<IdentifierIndex>();
    if (auto const itr = index.find(entry.identifier); itr != index.end()) {
        index.replace(itr, std::move(entry));
    } else {
        index.emplace(std::move(entry));
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Transaction::Record> Transaction::MemoryStore::Get(std::string_view identifier) const
{
    std::shared_lock lock{ m_entriesMutex };
    auto const& index = m_entries.template get<IdentifierIndex>();
    auto const itr = index.find(std::string{ identifier });
    if (itr == index.end() || itr->expiration <= Clock::now()) { return {}; }
    return itr->record;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transaction::MemoryStore::Erase(std::string_view identifier)
{
    std::scoped_lock lock{ m_entriesMutex };
    PruneExpired(Clock::now());
    return m_entries.template get<IdentifierIndex>().erase(std::string{ identifier }) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

bool Transaction::MemoryStore::Update(std::string_view identifier, UpdateFunction const& update)
{
    std::scoped_lock lock{ m_entriesMutex };
    PruneExpired(Clock::now());

    auto& index = m_entries.template get<IdentifierIndex>();
    auto const itr = index.find(std::string{ identifier });
    if (itr == index.end()) { return false; }

    // The function works on a copy so a declined update leaves the stored record untouched.
    Record updated = itr->record;
    if (!update(updated)) { return false; }

    return index.modify(itr, [&updated] (Entry& entry) { entry.record = std::move(updated); });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transaction::MemoryStore::Size() const
{
    std::shared_lock lock{ m_entriesMutex };
    auto const& index = m_entries.template get<ExpirationIndex>();
    return static_cast<std::size_t>(std::distance(index.upper_bound(Clock::now()), index.end()));
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transaction::MemoryStore::Prune()
{
    std::scoped_lock lock{ m_entriesMutex };
    return PruneExpired(Clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Transaction::MemoryStore::PruneExpired(Clock::time_point now)
{
    auto& index = m_entries.template get<ExpirationIndex>();
    auto const end = index.upper_bound(now);
    auto const pruned = static_cast<std::size_t>(std::distance(index.begin(), end));
    if (pruned != 0) {
        index.erase(index.begin(), end);
        m_logger->debug("Pruned {} expired transaction(s).", pruned);
    }
    return pruned;
}

//----------------------------------------------------------------------------------------------------------------------
