//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Security/JweEnvelope.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string EncodeJson(boost::json::object const& json);
[[nodiscard]] std::string CreateCompact(
    std::string_view header, std::size_t ivSize, std::size_t tagSize = Security::AuthenticationTagSize);
void ExpectError(std::string_view compact, Security::Error expected);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view KeyIdentifier = "8a880dc0-d2d2-4067-bcb1-b08d1690b26e";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, ParseTest)
{
    auto const header = Security::JweEnvelope::EncodeHeader(
        { std::string{ Security::Algorithm::Gcm }, std::string{ test::KeyIdentifier } });
    auto const compact = local::CreateCompact(header, Security::GcmInitializationVectorSize);

    auto const result = Security::JweEnvelope::Parse(compact);
    auto const pEnvelope = std::get_if<Security::JweEnvelope>(&result);
    ASSERT_TRUE(pEnvelope);

    EXPECT_EQ(pEnvelope->GetAlgorithm(), Security::Algorithm::Gcm);
    ASSERT_TRUE(pEnvelope->GetKeyIdentifier());
    EXPECT_EQ(*pEnvelope->GetKeyIdentifier(), test::KeyIdentifier);
    EXPECT_EQ(pEnvelope->GetEncodedHeader(), header);
    EXPECT_EQ(pEnvelope->GetContent().initializationVector.size(), Security::GcmInitializationVectorSize);
    EXPECT_EQ(pEnvelope->GetContent().tag.size(), Security::AuthenticationTagSize);

    // The additional authenticated data is the ASCII of the encoded header, exactly as received.
    auto const additional = pEnvelope->GetAdditionalData();
    EXPECT_EQ(std::string(additional.begin(), additional.end()), header);

    EXPECT_EQ(pEnvelope->Serialize(), compact);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, OptionalMembersTest)
{
    // Neither "alg" nor "kid" are required to parse the envelope.
    auto const header = local::EncodeJson({ { "enc", "A128CBC-HS256" } });
    auto const result = Security::JweEnvelope::Parse(local::CreateCompact(header, Security::CbcInitializationVectorSize));
    auto const pEnvelope = std::get_if<Security::JweEnvelope>(&result);
    ASSERT_TRUE(pEnvelope);
    EXPECT_EQ(pEnvelope->GetAlgorithm(), Security::Algorithm::CbcHmac);
    EXPECT_FALSE(pEnvelope->GetKeyIdentifier());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, UnknownAlgorithmTest)
{
    // The envelope is structurally sound, the detector is left to reject the algorithm.
    auto const header = local::EncodeJson({ { "alg", "dir" }, { "enc", "A256GCM" } });
    auto const result = Security::JweEnvelope::Parse(local::CreateCompact(header, 12));
    ASSERT_TRUE(std::holds_alternative<Security::JweEnvelope>(result));
    EXPECT_EQ(std::get<Security::JweEnvelope>(result).GetAlgorithm(), "A256GCM");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, SegmentCountTest)
{
    auto const header = local::EncodeJson({ { "alg", "dir" }, { "enc", "A128GCM" } });
    auto const compact = local::CreateCompact(header, Security::GcmInitializationVectorSize);

    local::ExpectError(compact.substr(0, compact.rfind('.')), Security::Error::MalformedEnvelope);
    local::ExpectError(compact + ".", Security::Error::MalformedEnvelope);
    local::ExpectError(compact + ".AAAA", Security::Error::MalformedEnvelope);
    local::ExpectError("", Security::Error::MalformedEnvelope);
    local::ExpectError("....", Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, EncryptedKeyTest)
{
    auto const header = local::EncodeJson({ { "alg", "dir" }, { "enc", "A128GCM" } });
    auto compact = local::CreateCompact(header, Security::GcmInitializationVectorSize);
    compact.insert(header.size() + 1, "AAAA");
    local::ExpectError(compact, Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, MalformedHeaderTest)
{
    auto const iv = Security::GcmInitializationVectorSize;
    local::ExpectError(local::CreateCompact("!!!!", iv), Security::Error::MalformedEnvelope);
    local::ExpectError(
        local::CreateCompact(Security::EncodeBase64Url(std::string_view{ "not json" }), iv),
        Security::Error::MalformedEnvelope);
    local::ExpectError(
        local::CreateCompact(local::EncodeJson({ { "alg", "dir" } }), iv), Security::Error::MalformedEnvelope);
    local::ExpectError(
        local::CreateCompact(local::EncodeJson({ { "enc", 7 } }), iv), Security::Error::MalformedEnvelope);
    local::ExpectError(
        local::CreateCompact(local::EncodeJson({ { "enc", "A128GCM" }, { "kid", 7 } }), iv),
        Security::Error::MalformedEnvelope);
    local::ExpectError(
        local::CreateCompact(local::EncodeJson({ { "enc", "A128GCM" }, { "alg", false } }), iv),
        Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, KeyManagementAlgorithmTest)
{
    auto const header = local::EncodeJson({ { "alg", "RSA-OAEP-256" }, { "enc", "A128GCM" } });
    local::ExpectError(
        local::CreateCompact(header, Security::GcmInitializationVectorSize), Security::Error::UnsupportedAlgorithm);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, ContentSizeTest)
{
    auto const gcm = local::EncodeJson({ { "alg", "dir" }, { "enc", "A128GCM" } });
    auto const cbc = local::EncodeJson({ { "alg", "dir" }, { "enc", "A128CBC-HS256" } });

    local::ExpectError(local::CreateCompact(gcm, Security::CbcInitializationVectorSize), Security::Error::MalformedEnvelope);
    local::ExpectError(local::CreateCompact(cbc, Security::GcmInitializationVectorSize), Security::Error::MalformedEnvelope);
    local::ExpectError(local::CreateCompact(gcm, Security::GcmInitializationVectorSize, 12), Security::Error::MalformedEnvelope);
    local::ExpectError(local::CreateCompact(cbc, Security::CbcInitializationVectorSize, 32), Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(JweEnvelopeSuite, InvalidSegmentEncodingTest)
{
    auto const header = local::EncodeJson({ { "alg", "dir" }, { "enc", "A128GCM" } });
    auto const compact = local::CreateCompact(header, Security::GcmInitializationVectorSize);

    // Standard base64 characters are not part of the URL safe alphabet.
    auto const ciphertextBegin = compact.find('.', header.size() + 2) + 1;
    auto mutated = compact;
    mutated[ciphertextBegin] = '+';
    local::ExpectError(mutated, Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::EncodeJson(boost::json::object const& json)
{
    return Security::EncodeBase64Url(std::string_view{ boost::json::serialize(json) });
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::CreateCompact(std::string_view header, std::size_t ivSize, std::size_t tagSize)
{
    auto const iv = Security::Test::GenerateGarbageData(ivSize);
    auto const ciphertext = Security::Test::GenerateGarbageData(48);
    auto const tag = Security::Test::GenerateGarbageData(tagSize);

    std::string compact{ header };
    compact.append("..");
    compact.append(Security::EncodeBase64Url(Security::ReadableView{ iv }));
    compact.push_back('.');
    compact.append(Security::EncodeBase64Url(Security::ReadableView{ ciphertext }));
    compact.push_back('.');
    compact.append(Security::EncodeBase64Url(Security::ReadableView{ tag }));
    return compact;
}

//----------------------------------------------------------------------------------------------------------------------

void local::ExpectError(std::string_view compact, Security::Error expected)
{
    auto const result = Security::JweEnvelope::Parse(compact);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(result)) << compact;
    EXPECT_EQ(std::get<Security::Error>(result), expected);
}

//----------------------------------------------------------------------------------------------------------------------
