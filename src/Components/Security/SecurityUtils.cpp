//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#ifndef __STDC_WANT_LIB_EXT1__
#define __STDC_WANT_LIB_EXT1__ 1
#endif
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstring>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsStandardCharacter(char c);
[[nodiscard]] bool IsUrlSafeCharacter(char c);
[[nodiscard]] Security::OptionalBuffer DecodeBlocks(std::string_view encoded);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Generate and return a buffer of the provided size filled with random data.
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::GenerateRandomData(std::size_t size)
{
    if (!std::in_range<std::int32_t>(size)) { return {}; }
    auto buffer = Buffer(size, 0x00);
    if (RAND_bytes(buffer.data(), static_cast<std::int32_t>(size)) != 1) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::GenerateRandomData(WriteableView writeable)
{
    if (!std::in_range<std::int32_t>(writeable.size())) { return false; }
    return RAND_bytes(writeable.data(), static_cast<std::int32_t>(writeable.size())) == 1;
}

//----------------------------------------------------------------------------------------------------------------------

void Security::EraseMemory(void* begin, std::size_t size)
{
    if (begin == nullptr || size == 0) { return; }
#if defined(__STDC_LIB_EXT1__)
    std::memset_s(begin, size, 0, size);
#else
    OPENSSL_cleanse(begin, size);
#endif
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::ConstantTimeEquals(ReadableView left, ReadableView right)
{
    // The lengths of tags and signatures are public, only the contents need constant time treatment.
    if (left.size() != right.size()) { return false; }
    return CRYPTO_memcmp(left.data(), right.data(), left.size()) == 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::EncodeBase64(ReadableView data)
{
    if (data.empty() || !std::in_range<std::int32_t>(data.size())) { return {}; }

    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    auto const written = EVP_EncodeBlock(
        reinterpret_cast<std::uint8_t*>(encoded.data()), data.data(), static_cast<std::int32_t>(data.size()));
    if (written < 0) { return {}; }
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::DecodeBase64(std::string_view encoded)
{
    if (encoded.size() % 4 != 0) { return {}; }

    auto const padding = encoded.find('=');
    if (padding != std::string_view::npos) {
        // Padding may only appear as the final one or two characters.
        if (encoded.size() - padding > 2) { return {}; }
        if (!std::ranges::all_of(encoded.substr(padding), [] (char c) { return c == '='; })) { return {}; }
    }

    auto const body = encoded.substr(0, padding);
    if (!std::ranges::all_of(body, local::IsStandardCharacter)) { return {}; }

    return local::DecodeBlocks(encoded);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::EncodeBase64Url(ReadableView data)
{
    auto encoded = EncodeBase64(data);

    while (!encoded.empty() && encoded.back() == '=') { encoded.pop_back(); }
    std::ranges::replace(encoded, '+', '-');
    std::ranges::replace(encoded, '/', '_');

    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::EncodeBase64Url(std::string_view data)
{
    return EncodeBase64Url(ToReadableView(data));
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::DecodeBase64Url(std::string_view encoded)
{
    // A single trailing character can never be produced by an encoder.
    if (encoded.size() % 4 == 1) { return {}; }
    if (!std::ranges::all_of(encoded, local::IsUrlSafeCharacter)) { return {}; }

    std::string translated{ encoded };
    std::ranges::replace(translated, '-', '+');
    std::ranges::replace(translated, '_', '/');
    translated.append((4 - translated.size() % 4) % 4, '=');

    return local::DecodeBlocks(translated);
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::ToReadableView(std::string_view data)
{
    return ReadableView{ reinterpret_cast<std::uint8_t const*>(data.data()), data.size() };
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Security::ToStringView(ReadableView data)
{
    return std::string_view{ reinterpret_cast<char const*>(data.data()), data.size() };
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsStandardCharacter(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsUrlSafeCharacter(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer local::DecodeBlocks(std::string_view encoded)
{
    if (encoded.empty()) { return Security::Buffer{}; }
    if (!std::in_range<std::int32_t>(encoded.size())) { return {}; }

    Security::Buffer decoded(3 * (encoded.size() / 4), 0x00);
    auto const written = EVP_DecodeBlock(
        decoded.data(), reinterpret_cast<std::uint8_t const*>(encoded.data()), static_cast<std::int32_t>(encoded.size()));
    if (written < 0) { return {}; }

    // EVP_DecodeBlock does not account for padding, the trailing zero bytes it produces must be dropped.
    auto const padding = static_cast<std::size_t>(std::ranges::count(encoded.substr(encoded.size() - 2), '='));
    decoded.resize(static_cast<std::size_t>(written) - padding);

    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------
