//----------------------------------------------------------------------------------------------------------------------
// File: JweEnvelope.hpp
// Description: The compact JWE serialization used for challenge messages:
//     BASE64URL(header) . "" . BASE64URL(iv) . BASE64URL(ciphertext) . BASE64URL(tag)
// Keys are agreed directly, so the encrypted key segment is always empty. The ASCII of the header segment, exactly as
// transmitted, is the additional authenticated data of the content cipher.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

struct JweHeader;
class JweEnvelope;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

struct Security::JweHeader
{
    std::string algorithm;
    std::optional<std::string> keyIdentifier;
};

//----------------------------------------------------------------------------------------------------------------------

class Security::JweEnvelope
{
public:
    static constexpr std::size_t SegmentCount = 5;

    JweEnvelope(std::string const& encodedHeader, JweHeader const& header, SealedContent&& content);

    [[nodiscard]] static Result<JweEnvelope> Parse(std::string_view compact);

    // Produces {"alg":"dir","enc":<algorithm>,"kid":<key identifier>} in base64url form.
    [[nodiscard]] static std::string EncodeHeader(JweHeader const& header);

    [[nodiscard]] std::string const& GetEncodedHeader() const { return m_encodedHeader; }
    [[nodiscard]] ReadableView GetAdditionalData() const;
    [[nodiscard]] JweHeader const& GetHeader() const { return m_header; }
    [[nodiscard]] std::string const& GetAlgorithm() const { return m_header.algorithm; }
    [[nodiscard]] std::optional<std::string> const& GetKeyIdentifier() const { return m_header.keyIdentifier; }
    [[nodiscard]] SealedContent const& GetContent() const { return m_content; }

    [[nodiscard]] std::string Serialize() const;

private:
    std::string m_encodedHeader;
    JweHeader m_header;
    SealedContent m_content;
};

//----------------------------------------------------------------------------------------------------------------------
