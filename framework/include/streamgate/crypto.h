#ifndef STREAMGATE_CRYPTO_H
#define STREAMGATE_CRYPTO_H

#include <optional>
#include <string>
#include <string_view>
#include <boost/json/object.hpp>

namespace streamgate::crypto {

    std::string hmac_sha256(std::string_view key, std::string_view data);

    std::string base64_encode(std::string_view input);
    std::string base64_decode(std::string_view input);

    std::string base64url_encode(std::string_view input);
    std::string base64url_decode(std::string_view input);

    /** @brief Random RFC 4122 version 4 identifier, used for request correlation. */
    std::string uuid_v4();

    /** @brief Constant-time comparison for operator credentials. */
    bool secure_compare(std::string_view a, std::string_view b);

    enum class JwtError {
        None,
        Malformed,
        InvalidSignature,
        Expired
    };

    std::string jwt_sign(boost::json::object payload, std::string_view secret, int expires_in = 3600);

    /**
     * @brief Verifies an HS256 token and returns its claims.
     * Returns nullopt on any failure; the reason is written to @p error when given.
     */
    std::optional<boost::json::object> jwt_verify(std::string_view token, std::string_view secret,
                                                  JwtError* error = nullptr);

} // namespace streamgate::crypto

#endif // STREAMGATE_CRYPTO_H
