//----------------------------------------------------------------------------------------------------------------------
// File: JweEnvelope.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "JweEnvelope.hpp"
#include "SecurityUtils.hpp"
#include "Utilities/JsonUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr char Separator = '.';

using Segments = std::array<std::string_view, Security::JweEnvelope::SegmentCount>;

[[nodiscard]] std::optional<Segments> Split(std::string_view compact);
[[nodiscard]] std::optional<std::size_t> GetExpectedInitializationVectorSize(std::string_view algorithm);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Algorithm = "alg";
constexpr std::string_view EncryptionAlgorithm = "enc";
constexpr std::string_view KeyIdentifier = "kid";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::JweEnvelope::JweEnvelope(std::string const& encodedHeader, JweHeader const& header, SealedContent&& content)
    : m_encodedHeader(encodedHeader)
    , m_header(header)
    , m_content(std::move(content))
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JweEnvelope> Security::JweEnvelope::Parse(std::string_view compact)
{
    auto const optSegments = local::Split(compact);
    if (!optSegments) { return Error::MalformedEnvelope; }

    auto const& [encodedHeader, encryptedKey, encodedIv, encodedCiphertext, encodedTag] = *optSegments;
    if (encodedHeader.empty() || !encryptedKey.empty()) { return Error::MalformedEnvelope; }

    auto const optDecodedHeader = DecodeBase64Url(encodedHeader);
    if (!optDecodedHeader) { return Error::MalformedEnvelope; }

    auto const optJson = JsonUtils::ParseObject(ToStringView(*optDecodedHeader));
    if (!optJson) { return Error::MalformedEnvelope; }

    JweHeader header;
    if (auto const optAlgorithm = JsonUtils::GetString(*optJson, symbols::EncryptionAlgorithm); optAlgorithm) {
        header.algorithm = *optAlgorithm;
    } else {
        return Error::MalformedEnvelope;
    }

    // Only direct key agreement is spoken. A present but different key management algorithm is unsupported.
    if (optJson->contains(symbols::Algorithm)) {
        auto const optManagement = JsonUtils::GetString(*optJson, symbols::Algorithm);
        if (!optManagement) { return Error::MalformedEnvelope; }
        if (*optManagement != Algorithm::Direct) { return Error::UnsupportedAlgorithm; }
    }

    if (optJson->contains(symbols::KeyIdentifier)) {
        auto const optKeyIdentifier = JsonUtils::GetString(*optJson, symbols::KeyIdentifier);
        if (!optKeyIdentifier) { return Error::MalformedEnvelope; }
        header.keyIdentifier = std::string{ *optKeyIdentifier };
    }

    SealedContent content;
    for (auto const& [encoded, destination] : {
        std::pair{ encodedIv, &content.initializationVector },
        std::pair{ encodedCiphertext, &content.ciphertext },
        std::pair{ encodedTag, &content.tag } }) {
        auto optDecoded = DecodeBase64Url(encoded);
        if (!optDecoded) { return Error::MalformedEnvelope; }
        *destination = std::move(*optDecoded);
    }

    if (content.tag.size() != AuthenticationTagSize) { return Error::MalformedEnvelope; }

    // Unknown algorithms are left for the platform detector to reject, their IV size can not be known here.
    if (auto const optSize = local::GetExpectedInitializationVectorSize(header.algorithm); optSize) {
        if (content.initializationVector.size() != *optSize) { return Error::MalformedEnvelope; }
    }

    return JweEnvelope{ std::string{ encodedHeader }, header, std::move(content) };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::JweEnvelope::EncodeHeader(JweHeader const& header)
{
    boost::json::object json;
    json[symbols::Algorithm] = Algorithm::Direct;
    json[symbols::EncryptionAlgorithm] = header.algorithm;
    if (header.keyIdentifier) {
        json[symbols::KeyIdentifier] = *header.keyIdentifier;
    }
    return EncodeBase64Url(std::string_view{ boost::json::serialize(json) });
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::JweEnvelope::GetAdditionalData() const
{
    return ToReadableView(m_encodedHeader);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::JweEnvelope::Serialize() const
{
    std::string compact;
    compact.append(m_encodedHeader);
    compact.push_back(local::Separator); // The encrypted key is always empty.
    compact.push_back(local::Separator);
    compact.append(EncodeBase64Url(ReadableView{ m_content.initializationVector }));
    compact.push_back(local::Separator);
    compact.append(EncodeBase64Url(ReadableView{ m_content.ciphertext }));
    compact.push_back(local::Separator);
    compact.append(EncodeBase64Url(ReadableView{ m_content.tag }));
    return compact;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<local::Segments> local::Split(std::string_view compact)
{
    Segments segments;
    std::size_t count = 0;
    for (std::size_t begin = 0;;) {
        if (count == segments.size()) { return {}; }
        auto const end = compact.find(Separator, begin);
        segments[count++] = compact.substr(begin, end == std::string_view::npos ? end : end - begin);
        if (end == std::string_view::npos) { break; }
        begin = end + 1;
    }

    if (count != segments.size()) { return {}; }
    return segments;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::size_t> local::GetExpectedInitializationVectorSize(std::string_view algorithm)
{
    if (algorithm == Security::Algorithm::CbcHmac) { return Security::CbcInitializationVectorSize; }
    if (algorithm == Security::Algorithm::Gcm) { return Security::GcmInitializationVectorSize; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
