//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(std::size_t size)
    : m_buffer(size, 0x00)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer& Security::SecureBuffer::operator=(SecureBuffer&& other) noexcept
{
    if (this != &other) {
        Erase();
        m_buffer = std::exchange(other.m_buffer, {});
    }
    return *this;
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::~SecureBuffer()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::operator==(SecureBuffer const& other) const noexcept
{
    return ConstantTimeEquals(m_buffer, other.m_buffer);
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SecureBuffer::GetCordon(std::size_t offset, std::size_t size) const
{
    // Requests reaching past the end are clamped to the bytes that are available.
    auto const clampedOffset = std::min(offset, m_buffer.size());
    auto const clampedSize = std::min(size, m_buffer.size() - clampedOffset);
    return ReadableView{ m_buffer.data() + clampedOffset, clampedSize };
}

//----------------------------------------------------------------------------------------------------------------------

void Security::SecureBuffer::Erase()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
    m_buffer.clear();
}

//----------------------------------------------------------------------------------------------------------------------
