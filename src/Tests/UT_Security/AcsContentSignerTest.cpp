//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Security/AcsContentSigner.hpp"
#include "Components/Security/EphemeralKeyPair.hpp"
#include "Components/Security/KeyMaterial.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/JsonUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] Security::AcsContent CreateContent();
[[nodiscard]] Security::SharedKeyMaterial LoadKeyMaterial();
[[nodiscard]] std::string ReplaceSegment(std::string_view jwt, std::size_t segment, std::string_view json);
void ExpectFileFallback(std::filesystem::path const& certificatePath, std::filesystem::path const& privateKeyPath);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view AcsTransactionId = "5f1c3e7a-9b42-4c1d-8e6f-2a7b9c0d1e3f";
constexpr std::string_view AcsReferenceNumber = "issuer1";
constexpr std::string_view AcsUrl = "http://localhost:8080/challenge";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, SignAndVerifyTest)
{
    auto const spMaterial = local::LoadKeyMaterial();
    ASSERT_TRUE(spMaterial);

    auto const content = local::CreateContent();
    Security::AcsContentSigner const signer{ spMaterial };
    EXPECT_TRUE(signer.HasKeyMaterial());

    auto const result = signer.Sign(content);
    auto const pSigned = std::get_if<Security::SignedContent>(&result);
    ASSERT_TRUE(pSigned);
    EXPECT_EQ(std::count(pSigned->jwt.begin(), pSigned->jwt.end(), '.'), 2);

    auto const verified = Security::VerifyAcsContent(pSigned->jwt);
    auto const pPayload = std::get_if<boost::json::object>(&verified);
    ASSERT_TRUE(pPayload);
    EXPECT_EQ(JsonUtils::GetString(*pPayload, "acsTransID"), test::AcsTransactionId);
    EXPECT_EQ(JsonUtils::GetString(*pPayload, "acsRefNumber"), test::AcsReferenceNumber);
    EXPECT_EQ(JsonUtils::GetString(*pPayload, "acsURL"), test::AcsUrl);

    auto const pKey = pPayload->if_contains("acsEphemPubKey");
    ASSERT_TRUE(pKey && pKey->is_object());
    auto const parsed = Security::JsonWebKey::Parse(pKey->get_object());
    ASSERT_TRUE(std::holds_alternative<Security::JsonWebKey>(parsed));
    EXPECT_EQ(std::get<Security::JsonWebKey>(parsed), content.ephemeralPublicKey);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, HeaderTest)
{
    auto const spMaterial = local::LoadKeyMaterial();
    ASSERT_TRUE(spMaterial);

    auto const result = Security::SignAcsContent(local::CreateContent(), *spMaterial);
    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    auto const& jwt = std::get<std::string>(result);

    auto const optDecoded = Security::DecodeBase64Url(std::string_view{ jwt }.substr(0, jwt.find('.')));
    ASSERT_TRUE(optDecoded);
    auto const optHeader = JsonUtils::ParseObject(std::string(optDecoded->begin(), optDecoded->end()));
    ASSERT_TRUE(optHeader);

    EXPECT_EQ(JsonUtils::GetString(*optHeader, "alg"), "PS256");
    EXPECT_EQ(JsonUtils::GetString(*optHeader, "typ"), "JWT");

    // The chain carries the leaf certificate as standard base64 DER.
    auto const pChain = optHeader->if_contains("x5c");
    ASSERT_TRUE(pChain && pChain->is_array());
    ASSERT_EQ(pChain->get_array().size(), std::size_t{ 1 });
    EXPECT_EQ(pChain->get_array().front().as_string(), spMaterial->GetEncodedCertificate());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, ProbabilisticSignatureTest)
{
    auto const spMaterial = local::LoadKeyMaterial();
    ASSERT_TRUE(spMaterial);

    // PSS signatures are salted, signing the same content twice must differ.
    auto const content = local::CreateContent();
    auto const first = Security::SignAcsContent(content, *spMaterial);
    auto const second = Security::SignAcsContent(content, *spMaterial);
    ASSERT_TRUE(std::holds_alternative<std::string>(first));
    ASSERT_TRUE(std::holds_alternative<std::string>(second));
    EXPECT_NE(std::get<std::string>(first), std::get<std::string>(second));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, TamperedTokenTest)
{
    auto const spMaterial = local::LoadKeyMaterial();
    ASSERT_TRUE(spMaterial);

    auto const result = Security::SignAcsContent(local::CreateContent(), *spMaterial);
    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    auto const& jwt = std::get<std::string>(result);

    {
        auto const tampered = local::ReplaceSegment(jwt, 1, R"({"acsTransID":"forged"})");
        auto const verified = Security::VerifyAcsContent(tampered);
        ASSERT_TRUE(std::holds_alternative<Security::Error>(verified));
        EXPECT_EQ(std::get<Security::Error>(verified), Security::Error::AuthenticationFailed);
    }

    {
        auto const tampered = local::ReplaceSegment(jwt, 0, R"({"alg":"none","typ":"JWT"})");
        auto const verified = Security::VerifyAcsContent(tampered);
        ASSERT_TRUE(std::holds_alternative<Security::Error>(verified));
        EXPECT_EQ(std::get<Security::Error>(verified), Security::Error::UnsupportedAlgorithm);
    }

    {
        auto const verified = Security::VerifyAcsContent(jwt.substr(0, jwt.rfind('.')));
        ASSERT_TRUE(std::holds_alternative<Security::Error>(verified));
        EXPECT_EQ(std::get<Security::Error>(verified), Security::Error::MalformedEnvelope);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, FallbackContentTest)
{
    std::ostringstream captured;
    auto const spSink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    Logger::AttachSink(spSink);

    auto const spCore = spdlog::get(Logger::Name.data());
    ASSERT_TRUE(spCore);
    auto const level = spCore->level();
    spCore->set_level(spdlog::level::warn);

    Security::AcsContentSigner const signer{ Security::CertificateLoadFailure{ .reason = "missing test identity" } };
    EXPECT_FALSE(signer.HasKeyMaterial());

    auto const result = signer.Sign(local::CreateContent());
    auto const pFallback = std::get_if<Security::FallbackContent>(&result);
    ASSERT_TRUE(pFallback);
    EXPECT_EQ(pFallback->jwt, Security::FallbackJwt);
    EXPECT_EQ(pFallback->reason, "missing test identity");

    spCore->flush();
    EXPECT_NE(captured.str().find("missing test identity"), std::string::npos);
    EXPECT_NE(captured.str().find("fallback"), std::string::npos);

    spCore->set_level(level);
    std::erase(spCore->sinks(), spSink);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, MissingCertificateFileTest)
{
    auto const identity = Security::Test::GeneratePemIdentity();
    auto const privateKeyPath = Security::Test::WriteTemporaryFile("acs-signer-key.pem", identity.privateKey);
    auto const missingPath = std::filesystem::temp_directory_path() / "acs-signer-nonexistent-cert.pem";
    std::filesystem::remove(missingPath);

    local::ExpectFileFallback(missingPath, privateKeyPath);

    std::filesystem::remove(privateKeyPath);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, CorruptCertificateFileTest)
{
    auto const identity = Security::Test::GeneratePemIdentity();
    auto const privateKeyPath = Security::Test::WriteTemporaryFile("acs-signer-key.pem", identity.privateKey);

    auto const garbage = Security::Test::GenerateGarbageData(512);
    auto const certificatePath = Security::Test::WriteTemporaryFile(
        "acs-signer-corrupt-cert.pem", std::string{ garbage.begin(), garbage.end() });
    local::ExpectFileFallback(certificatePath, privateKeyPath);

    // A PEM frame around corrupted contents is rejected the same way.
    auto const framed =
        "-----BEGIN CERTIFICATE-----\n" + Security::EncodeBase64(garbage) + "\n-----END CERTIFICATE-----\n";
    auto const framedPath = Security::Test::WriteTemporaryFile("acs-signer-framed-cert.pem", framed);
    local::ExpectFileFallback(framedPath, privateKeyPath);

    std::filesystem::remove(privateKeyPath);
    std::filesystem::remove(certificatePath);
    std::filesystem::remove(framedPath);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(AcsContentSignerSuite, FallbackStructureTest)
{
    // The fallback token is structurally a JWS, but carries no certificate chain to verify against.
    auto const verified = Security::VerifyAcsContent(Security::FallbackJwt);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(verified));
    EXPECT_EQ(std::get<Security::Error>(verified), Security::Error::CertificateLoadError);

    auto const payload = Security::FallbackJwt.substr(
        Security::FallbackJwt.find('.') + 1,
        Security::FallbackJwt.rfind('.') - Security::FallbackJwt.find('.') - 1);
    auto const optDecoded = Security::DecodeBase64Url(payload);
    ASSERT_TRUE(optDecoded);

    auto const optJson = JsonUtils::ParseObject(std::string(optDecoded->begin(), optDecoded->end()));
    ASSERT_TRUE(optJson);
    EXPECT_TRUE(JsonUtils::GetString(*optJson, "acsTransID"));
    EXPECT_TRUE(optJson->contains("acsEphemPubKey"));
}

//----------------------------------------------------------------------------------------------------------------------

Security::AcsContent local::CreateContent()
{
    auto const pair = Security::GenerateEphemeralKeyPair();
    return Security::AcsContent{
        .acsTransactionId = std::string{ test::AcsTransactionId },
        .acsReferenceNumber = std::string{ test::AcsReferenceNumber },
        .acsUrl = std::string{ test::AcsUrl },
        .ephemeralPublicKey = pair.GetPublicKey()
    };
}

//----------------------------------------------------------------------------------------------------------------------

Security::SharedKeyMaterial local::LoadKeyMaterial()
{
    auto const identity = Security::Test::GeneratePemIdentity();
    auto const result = Security::KeyMaterial::FromPem(identity.certificate, identity.privateKey);
    if (auto const pMaterial = std::get_if<Security::SharedKeyMaterial>(&result); pMaterial) {
        return *pMaterial;
    }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ReplaceSegment(std::string_view jwt, std::size_t segment, std::string_view json)
{
    auto const first = jwt.find('.');
    auto const second = jwt.find('.', first + 1);
    auto const encoded = Security::EncodeBase64Url(json);

    std::string replaced;
    replaced.append(segment == 0 ? std::string_view{ encoded } : jwt.substr(0, first));
    replaced.push_back('.');
    replaced.append(segment == 1 ? std::string_view{ encoded } : jwt.substr(first + 1, second - first - 1));
    replaced.push_back('.');
    replaced.append(jwt.substr(second + 1));
    return replaced;
}

//----------------------------------------------------------------------------------------------------------------------

void local::ExpectFileFallback(
    std::filesystem::path const& certificatePath, std::filesystem::path const& privateKeyPath)
{
    std::ostringstream captured;
    auto const spSink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    Logger::AttachSink(spSink);

    auto const spCore = spdlog::get(Logger::Name.data());
    ASSERT_TRUE(spCore);
    auto const level = spCore->level();
    spCore->set_level(spdlog::level::warn);

    auto const material = Security::KeyMaterial::Load(certificatePath, privateKeyPath);
    auto const pFailure = std::get_if<Security::CertificateLoadFailure>(&material);
    EXPECT_TRUE(pFailure);

    Security::AcsContentSigner const signer{ material };
    EXPECT_FALSE(signer.HasKeyMaterial());

    auto const result = signer.Sign(CreateContent());
    auto const pFallback = std::get_if<Security::FallbackContent>(&result);
    EXPECT_TRUE(pFallback);
    if (pFallback) {
        EXPECT_EQ(pFallback->jwt, Security::FallbackJwt);
        EXPECT_FALSE(pFallback->reason.empty());
        if (pFailure) { EXPECT_EQ(pFallback->reason, pFailure->reason); }
    }

    spCore->flush();
    EXPECT_NE(captured.str().find("fallback"), std::string::npos);

    spCore->set_level(level);
    std::erase(spCore->sinks(), spSink);
}

//----------------------------------------------------------------------------------------------------------------------
