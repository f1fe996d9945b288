//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/PlatformDetector.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

TEST(PlatformDetectorSuite, AlgorithmDetectionTest)
{
    auto const android = Security::DetectPlatform(std::string_view{ "A128CBC-HS256" });
    ASSERT_TRUE(std::holds_alternative<Security::Platform>(android));
    EXPECT_EQ(std::get<Security::Platform>(android), Security::Platform::Android);

    auto const ios = Security::DetectPlatform(std::string_view{ "A128GCM" });
    ASSERT_TRUE(std::holds_alternative<Security::Platform>(ios));
    EXPECT_EQ(std::get<Security::Platform>(ios), Security::Platform::iOS);

    for (std::string_view const algorithm : { "A256GCM", "A256CBC-HS512", "a128gcm", "" }) {
        auto const result = Security::DetectPlatform(algorithm);
        ASSERT_TRUE(std::holds_alternative<Security::Error>(result));
        EXPECT_EQ(std::get<Security::Error>(result), Security::Error::UnsupportedPlatform);
    }

    boost::json::object const header{ { "alg", "dir" }, { "enc", "A256GCM" } };
    auto const unknown = Security::DetectPlatform(header);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(unknown));
    EXPECT_EQ(std::get<Security::Error>(unknown), Security::Error::UnsupportedPlatform);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PlatformDetectorSuite, HeaderDetectionTest)
{
    boost::json::object header{ { "alg", "dir" }, { "enc", "A128GCM" } };
    auto const detected = Security::DetectPlatform(header);
    ASSERT_TRUE(std::holds_alternative<Security::Platform>(detected));
    EXPECT_EQ(std::get<Security::Platform>(detected), Security::Platform::iOS);

    header.erase("enc");
    auto const missing = Security::DetectPlatform(header);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(missing));
    EXPECT_EQ(std::get<Security::Error>(missing), Security::Error::MalformedEnvelope);

    header["enc"] = 128;
    auto const mistyped = Security::DetectPlatform(header);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(mistyped));
    EXPECT_EQ(std::get<Security::Error>(mistyped), Security::Error::MalformedEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PlatformDetectorSuite, EncryptionAlgorithmTest)
{
    auto const android = Security::GetEncryptionAlgorithm(Security::Platform::Android);
    ASSERT_TRUE(std::holds_alternative<std::string_view>(android));
    EXPECT_EQ(std::get<std::string_view>(android), Security::Algorithm::CbcHmac);

    auto const ios = Security::GetEncryptionAlgorithm(Security::Platform::iOS);
    ASSERT_TRUE(std::holds_alternative<std::string_view>(ios));
    EXPECT_EQ(std::get<std::string_view>(ios), Security::Algorithm::Gcm);

    auto const unknown = Security::GetEncryptionAlgorithm(Security::Platform::Unknown);
    ASSERT_TRUE(std::holds_alternative<Security::Error>(unknown));
    EXPECT_EQ(std::get<Security::Error>(unknown), Security::Error::UnsupportedPlatform);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(PlatformDetectorSuite, ParsePlatformTest)
{
    EXPECT_EQ(Security::ParsePlatform("android"), Security::Platform::Android);
    EXPECT_EQ(Security::ParsePlatform("Android"), Security::Platform::Android);
    EXPECT_EQ(Security::ParsePlatform("iOS"), Security::Platform::iOS);
    EXPECT_EQ(Security::ParsePlatform("IOS"), Security::Platform::iOS);
    EXPECT_FALSE(Security::ParsePlatform("windows"));
    EXPECT_FALSE(Security::ParsePlatform(""));
}

//----------------------------------------------------------------------------------------------------------------------
