//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.hpp
// Description: Owning byte container for secret material. The contents are zeroed whenever the buffer is released,
// reassigned, or destroyed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <optional>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SecureBuffer;

using OptionalSecureBuffer = std::optional<Security::SecureBuffer>;

template <typename Container>
concept ByteLikeBuffer = std::same_as<typename Container::value_type, std::uint8_t> ||
                         std::same_as<typename Container::value_type, char>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SecureBuffer
{
public:
    SecureBuffer() = default;
    explicit SecureBuffer(std::size_t size);
    explicit SecureBuffer(Buffer&& buffer) noexcept : m_buffer(std::move(buffer)) {}

    template <typename... Containers>
    explicit SecureBuffer(Containers const&... containers) requires (sizeof...(Containers) > 0 && (ByteLikeBuffer<Containers> && ...))
    {
        Append(containers...);
    }

    SecureBuffer(SecureBuffer const& other) = delete;
    SecureBuffer& operator=(SecureBuffer const& other) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept : m_buffer(std::exchange(other.m_buffer, {})) {}
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    ~SecureBuffer();

    [[nodiscard]] bool operator==(SecureBuffer const& other) const noexcept;

    [[nodiscard]] ReadableView GetData() const { return m_buffer; }
    [[nodiscard]] WriteableView GetData() { return m_buffer; }
    [[nodiscard]] ReadableView GetCordon(std::size_t offset, std::size_t size) const;
    [[nodiscard]] std::size_t GetSize() const { return m_buffer.size(); }
    [[nodiscard]] bool IsEmpty() const { return m_buffer.empty(); }

    template <typename... Containers>
    void Append(Containers const&... containers) requires (ByteLikeBuffer<Containers> && ...)
    {
        if constexpr (sizeof...(Containers) != 0) {
            std::size_t const total = m_buffer.size() + (containers.size() + ...);
            // Growing a vector may relocate the secret, reserve up front and wipe the old storage if that happens.
            if (total > m_buffer.capacity()) {
                Buffer grown;
                grown.reserve(total);
                grown.insert(grown.end(), m_buffer.begin(), m_buffer.end());
                Erase();
                m_buffer = std::move(grown);
            }
            (m_buffer.insert(m_buffer.end(), containers.begin(), containers.end()), ...);
        }
    }

    void Erase();

private:
    Buffer m_buffer;
};

//----------------------------------------------------------------------------------------------------------------------
