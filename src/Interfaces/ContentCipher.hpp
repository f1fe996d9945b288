//----------------------------------------------------------------------------------------------------------------------
// File: ContentCipher.hpp
// Description: A content encryption strategy for compact JWE. Implementations own the mapping from derived key
// material to the concrete cipher and MAC keys.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityDefinitions.hpp"
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace Security { class DerivedKeyMaterial; }

//----------------------------------------------------------------------------------------------------------------------

class IContentCipher
{
public:
    virtual ~IContentCipher() = default;

    [[nodiscard]] virtual std::string_view GetAlgorithm() const = 0;
    [[nodiscard]] virtual std::size_t GetInitializationVectorSize() const = 0;

    [[nodiscard]] virtual Security::SealedContentResult Seal(
        Security::DerivedKeyMaterial const& key,
        Security::KeyUsage usage,
        Security::ReadableView additional,
        Security::ReadableView plaintext) const = 0;

    // The plaintext is only returned after the tag has been verified. Any mismatch yields AuthenticationFailed.
    [[nodiscard]] virtual Security::BufferResult Open(
        Security::DerivedKeyMaterial const& key,
        Security::KeyUsage usage,
        Security::ReadableView additional,
        Security::SealedContent const& sealed) const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
