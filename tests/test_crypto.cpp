#include <catch2/catch_test_macros.hpp>
#include <streamgate/crypto.h>
#include <streamgate/util/string.h>
#include <set>

using namespace streamgate::crypto;

TEST_CASE("Crypto: Base64 and Hex", "[crypto]") {
    std::string raw = "StreamGate Gateway";

    SECTION("Base64 Encoding/Decoding") {
        std::string encoded = base64_encode(raw);
        CHECK(encoded != raw);
        CHECK(base64_decode(encoded) == raw);
    }

    SECTION("Base64url drops padding and unsafe characters") {
        std::string encoded = base64url_encode("\xfb\xff?");
        CHECK(encoded.find('=') == std::string::npos);
        CHECK(encoded.find('+') == std::string::npos);
        CHECK(encoded.find('/') == std::string::npos);
        CHECK(base64url_decode(encoded) == "\xfb\xff?");
    }

    SECTION("Hex Encoding") {
        CHECK(streamgate::util::hex_encode("ABC") == "414243");
    }
}

TEST_CASE("Crypto: JWT Signing and Verification", "[crypto]") {
    boost::json::object payload{{"id", "user-123"}, {"email", "viewer@example.com"}};
    std::string secret = "super-secret-key";

    SECTION("Valid Token") {
        std::string token = jwt_sign(payload, secret, 3600);
        JwtError error = JwtError::Malformed;
        auto verified = jwt_verify(token, secret, &error);

        REQUIRE(verified.has_value());
        CHECK(error == JwtError::None);
        CHECK(verified->at("id").as_string() == "user-123");
    }

    SECTION("Invalid Secret") {
        std::string token = jwt_sign(payload, secret, 3600);
        JwtError error = JwtError::None;
        CHECK_FALSE(jwt_verify(token, "wrong-secret", &error).has_value());
        CHECK(error == JwtError::InvalidSignature);
    }

    SECTION("Expired Token") {
        std::string token = jwt_sign(payload, secret, -10); // Expired 10s ago
        JwtError error = JwtError::None;
        CHECK_FALSE(jwt_verify(token, secret, &error).has_value());
        CHECK(error == JwtError::Expired);
    }

    SECTION("Malformed Token") {
        JwtError error = JwtError::None;
        CHECK_FALSE(jwt_verify("not-a-token", secret, &error).has_value());
        CHECK(error == JwtError::Malformed);
    }
}

TEST_CASE("Crypto: Identifiers and comparison", "[crypto]") {
    SECTION("UUID v4 layout") {
        auto id = uuid_v4();
        REQUIRE(id.size() == 36);
        CHECK(id[8] == '-');
        CHECK(id[14] == '4');
        CHECK(std::string("89ab").find(id[19]) != std::string::npos);
    }

    SECTION("Identifiers are unique") {
        std::set<std::string> seen;
        for (int i = 0; i < 50; ++i) {
            seen.insert(uuid_v4());
        }
        CHECK(seen.size() == 50);
    }

    SECTION("Constant-time compare") {
        CHECK(secure_compare("operator-key", "operator-key"));
        CHECK_FALSE(secure_compare("operator-key", "operator-kez"));
        CHECK_FALSE(secure_compare("operator-key", "operator"));
    }
}
