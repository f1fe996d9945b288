//----------------------------------------------------------------------------------------------------------------------
// File: JsonWebKey.hpp
// Description: Public half of an EC P-256 key in JWK form. Coordinates are kept as raw 32 byte big endian values and
// are only base64url encoded when serialized.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLHandles.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class JsonWebKey;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::JsonWebKey
{
public:
    using Coordinate = std::array<std::uint8_t, CoordinateSize>;

    static constexpr std::string_view KeyType = "EC";

    JsonWebKey(Coordinate const& x, Coordinate const& y);

    [[nodiscard]] static Result<JsonWebKey> Parse(boost::json::object const& json);
    [[nodiscard]] static Result<JsonWebKey> Parse(std::string_view serialized);
    [[nodiscard]] static Result<JsonWebKey> FromUncompressedPoint(ReadableView point);
    [[nodiscard]] static Result<JsonWebKey> FromKey(EVP_PKEY const* pKey);

    [[nodiscard]] bool operator==(JsonWebKey const& other) const noexcept = default;

    [[nodiscard]] Coordinate const& GetX() const { return m_x; }
    [[nodiscard]] Coordinate const& GetY() const { return m_y; }
    [[nodiscard]] Buffer GetUncompressedPoint() const;

    [[nodiscard]] boost::json::object ToJson() const;
    [[nodiscard]] std::string ToString() const;

    // Imports the coordinates as an OpenSSL public key. The import fails for points that are not on P-256.
    [[nodiscard]] OpenSSL::Key ToKey() const;

private:
    Coordinate m_x;
    Coordinate m_y;
};

//----------------------------------------------------------------------------------------------------------------------
