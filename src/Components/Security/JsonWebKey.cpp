//----------------------------------------------------------------------------------------------------------------------
// File: JsonWebKey.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "JsonWebKey.hpp"
#include "SecurityUtils.hpp"
#include "Utilities/JsonUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint8_t UncompressedPointPrefix = 0x04;

[[nodiscard]] std::optional<Security::JsonWebKey::Coordinate> DecodeCoordinate(boost::json::value const* pValue);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view KeyType = "kty";
constexpr std::string_view Curve = "crv";
constexpr std::string_view X = "x";
constexpr std::string_view Y = "y";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::JsonWebKey::JsonWebKey(Coordinate const& x, Coordinate const& y)
    : m_x(x)
    , m_y(y)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JsonWebKey> Security::JsonWebKey::Parse(boost::json::object const& json)
{
    auto const IsStringEqualTo = [&json] (std::string_view key, std::string_view expected) -> bool {
        auto const optValue = JsonUtils::GetString(json, key);
        return optValue && *optValue == expected;
    };

    if (!IsStringEqualTo(symbols::KeyType, KeyType)) { return Error::InvalidPublicKey; }
    if (!IsStringEqualTo(symbols::Curve, CurveName)) { return Error::InvalidPublicKey; }

    auto const optX = local::DecodeCoordinate(json.if_contains(symbols::X));
    auto const optY = local::DecodeCoordinate(json.if_contains(symbols::Y));
    if (!optX || !optY) { return Error::InvalidPublicKey; }

    JsonWebKey key{ *optX, *optY };
    if (!key.ToKey()) { return Error::InvalidPublicKey; } // The coordinates must describe a point on the curve.

    return key;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JsonWebKey> Security::JsonWebKey::Parse(std::string_view serialized)
{
    auto const optJson = JsonUtils::ParseObject(serialized);
    if (!optJson) { return Error::InvalidPublicKey; }
    return Parse(*optJson);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JsonWebKey> Security::JsonWebKey::FromUncompressedPoint(ReadableView point)
{
    if (point.size() != UncompressedPointSize || point.front() != local::UncompressedPointPrefix) {
        return Error::InvalidPublicKey;
    }

    Coordinate x{};
    Coordinate y{};
    std::ranges::copy(point.subspan(1, CoordinateSize), x.begin());
    std::ranges::copy(point.subspan(1 + CoordinateSize, CoordinateSize), y.begin());

    JsonWebKey key{ x, y };
    if (!key.ToKey()) { return Error::InvalidPublicKey; }

    return key;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Result<Security::JsonWebKey> Security::JsonWebKey::FromKey(EVP_PKEY const* pKey)
{
    if (!pKey) { return Error::InvalidPublicKey; }

    Buffer point(UncompressedPointSize, 0x00);
    std::size_t size = 0;
    if (EVP_PKEY_get_octet_string_param(pKey, OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size(), &size) <= 0) {
        return Error::CryptographicFailure;
    }
    point.resize(size);

    return FromUncompressedPoint(point);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Security::JsonWebKey::GetUncompressedPoint() const
{
    Buffer point;
    point.reserve(UncompressedPointSize);
    point.emplace_back(local::UncompressedPointPrefix);
    point.insert(point.end(), m_x.begin(), m_x.end());
    point.insert(point.end(), m_y.begin(), m_y.end());
    return point;
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object Security::JsonWebKey::ToJson() const
{
    boost::json::object json;
    json[symbols::KeyType] = KeyType;
    json[symbols::Curve] = CurveName;
    json[symbols::X] = EncodeBase64Url(ReadableView{ m_x });
    json[symbols::Y] = EncodeBase64Url(ReadableView{ m_y });
    return json;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::JsonWebKey::ToString() const
{
    return boost::json::serialize(ToJson());
}

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::Key Security::JsonWebKey::ToKey() const
{
    auto const upContext = OpenSSL::KeyContext{ EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr) };
    if (!upContext) {
        return nullptr; // If we fail to make a context, an error has occurred.
    }

    if (EVP_PKEY_fromdata_init(upContext.get()) <= 0) {
        return nullptr;
    }

    auto point = GetUncompressedPoint();
    std::array<OSSL_PARAM, 3> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(SN_X9_62_prime256v1), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
        OSSL_PARAM_construct_end()
    };

    EVP_PKEY* pKey = nullptr;
    if (EVP_PKEY_fromdata(upContext.get(), &pKey, EVP_PKEY_PUBLIC_KEY, params.data()) <= 0) {
        return nullptr; // Decoding the point fails when it does not lie on the curve.
    }

    OpenSSL::Key upKey{ pKey };

    auto const upCheckContext = OpenSSL::KeyContext{ EVP_PKEY_CTX_new_from_pkey(nullptr, upKey.get(), nullptr) };
    if (!upCheckContext || EVP_PKEY_public_check(upCheckContext.get()) != 1) {
        return nullptr;
    }

    return upKey;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::JsonWebKey::Coordinate> local::DecodeCoordinate(boost::json::value const* pValue)
{
    if (!pValue || !pValue->is_string()) { return {}; }

    auto const optDecoded = Security::DecodeBase64Url(JsonUtils::ToStringView(pValue->get_string()));
    if (!optDecoded || optDecoded->empty() || optDecoded->size() > Security::CoordinateSize) { return {}; }

    // Some encoders strip leading zero bytes, restore the fixed width before use.
    Security::JsonWebKey::Coordinate coordinate{};
    std::ranges::copy(*optDecoded, coordinate.begin() + (Security::CoordinateSize - optDecoded->size()));
    return coordinate;
}

//----------------------------------------------------------------------------------------------------------------------
