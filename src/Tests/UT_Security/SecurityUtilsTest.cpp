//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string ToString(Security::Buffer const& buffer);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, EncodeBase64Test)
{
    EXPECT_EQ(Security::EncodeBase64(Security::ToReadableView("")), "");
    EXPECT_EQ(Security::EncodeBase64(Security::ToReadableView("f")), "Zg==");
    EXPECT_EQ(Security::EncodeBase64(Security::ToReadableView("fo")), "Zm8=");
    EXPECT_EQ(Security::EncodeBase64(Security::ToReadableView("foo")), "Zm9v");
    EXPECT_EQ(Security::EncodeBase64(Security::ToReadableView("foobar")), "Zm9vYmFy");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, DecodeBase64Test)
{
    auto const optDecoded = Security::DecodeBase64("Zm9vYg==");
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(local::ToString(*optDecoded), "foob");

    EXPECT_FALSE(Security::DecodeBase64("Zm9vYg="));  // Truncated padding
    EXPECT_FALSE(Security::DecodeBase64("Zm=vYg=="));  // Interior padding
    EXPECT_FALSE(Security::DecodeBase64("Zm9v-_=="));  // URL safe alphabet
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, Base64UrlTest)
{
    Security::Buffer const data{ 0xFB, 0xFF, 0xBF, 0x00 };
    auto const encoded = Security::EncodeBase64Url(Security::ReadableView{ data });
    EXPECT_EQ(encoded, "-_-_AA");
    EXPECT_EQ(encoded.find('='), std::string::npos);

    auto const optDecoded = Security::DecodeBase64Url(encoded);
    ASSERT_TRUE(optDecoded);
    EXPECT_EQ(*optDecoded, data);

    auto const optEmpty = Security::DecodeBase64Url("");
    ASSERT_TRUE(optEmpty);
    EXPECT_TRUE(optEmpty->empty());

    EXPECT_FALSE(Security::DecodeBase64Url("A"));
    EXPECT_FALSE(Security::DecodeBase64Url("ab+/"));
    EXPECT_FALSE(Security::DecodeBase64Url("YWJj="));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, ConstantTimeEqualsTest)
{
    auto const data = Security::Test::GenerateGarbageData(32);
    auto mutated = data;
    mutated.back() ^= 0x01;

    EXPECT_TRUE(Security::ConstantTimeEquals(data, data));
    EXPECT_FALSE(Security::ConstantTimeEquals(data, mutated));
    EXPECT_FALSE(Security::ConstantTimeEquals(data, Security::ReadableView{ data }.first(16)));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, StringViewConversionTest)
{
    EXPECT_TRUE(Security::ToStringView(Security::ReadableView{}).empty());

    auto const optDecoded = Security::DecodeBase64Url("eyJhbGciOiJkaXIifQ");
    ASSERT_TRUE(optDecoded);
    auto const text = Security::ToStringView(*optDecoded);
    EXPECT_EQ(text, R"({"alg":"dir"})");
    EXPECT_EQ(text.size(), optDecoded->size());

    // Bytes outside the ASCII range are carried through unchanged.
    Security::Buffer const binary{ 0x00, 0x7F, 0x80, 0xFF };
    auto const view = Security::ToStringView(binary);
    ASSERT_EQ(view.size(), binary.size());
    EXPECT_TRUE(std::equal(view.begin(), view.end(), binary.begin(), [] (char left, std::uint8_t right) {
        return static_cast<std::uint8_t>(left) == right;
    }));
    EXPECT_EQ(Security::ToReadableView(view).data(), binary.data());
}
//----------------------------------------------------------------------------------------------------------------------

TEST(SecurityUtilsSuite, GenerateRandomDataTest)
{
    auto const optFirst = Security::GenerateRandomData(32);
    auto const optSecond = Security::GenerateRandomData(32);
    ASSERT_TRUE(optFirst && optSecond);
    EXPECT_EQ(optFirst->size(), std::size_t{ 32 });
    EXPECT_NE(*optFirst, *optSecond);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, CordonTest)
{
    auto const data = Security::Test::GenerateGarbageData(32);
    Security::SecureBuffer const buffer{ Security::Buffer{ data } };
    EXPECT_EQ(buffer.GetSize(), data.size());

    auto const first = buffer.GetCordon(0, 16);
    auto const second = buffer.GetCordon(16, 16);
    EXPECT_TRUE(std::equal(first.begin(), first.end(), data.begin()));
    EXPECT_TRUE(std::equal(second.begin(), second.end(), data.begin() + 16));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecureBufferSuite, OutOfRangeCordonTest)
{
    auto const data = Security::Test::GenerateGarbageData(32);
    Security::SecureBuffer const buffer{ Security::Buffer{ data } };

    auto const overhanging = buffer.GetCordon(24, 16);
    EXPECT_EQ(overhanging.size(), std::size_t{ 8 });
    EXPECT_TRUE(std::equal(overhanging.begin(), overhanging.end(), data.begin() + 24));

    EXPECT_TRUE(buffer.GetCordon(32, 16).empty());
    EXPECT_TRUE(buffer.GetCordon(64, 1).empty());
    EXPECT_EQ(buffer.GetCordon(0, 64).size(), data.size());

    Security::SecureBuffer const empty;
    EXPECT_TRUE(empty.GetCordon(0, 16).empty());
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ToString(Security::Buffer const& buffer)
{
    return std::string(buffer.begin(), buffer.end());
}

//----------------------------------------------------------------------------------------------------------------------
