#ifndef STREAMGATE_MIDDLEWARE_H
#define STREAMGATE_MIDDLEWARE_H

#include <string>
#include <streamgate/router.h>

namespace streamgate {
class Authenticator;
class Logger;
}

namespace streamgate::middleware {

    /**
     * @brief Reuses an inbound X-Request-ID or generates a v4 UUID, stores it on
     * the request and echoes it on the response.
     */
    Middleware request_id();

    Middleware cors(const std::string& origin,
                    const std::string& methods = "GET, POST, PUT, PATCH, DELETE, OPTIONS",
                    const std::string& headers = "Content-Type, Authorization, X-Request-ID, X-API-Key");

    /** @throws PayloadTooLarge when the body exceeds @p max_bytes. */
    Middleware limit_body_size(size_t max_bytes);

    /** @brief X-Service and X-Version on every response. */
    Middleware service_headers(const std::string& service, const std::string& version);

    /**
     * @brief Optional authentication: a valid bearer token populates
     * Request::caller, a rejected one is remembered under "auth_error" for
     * the route guards. Requests without a token pass untouched.
     */
    Middleware authenticate(const Authenticator& authenticator, Logger* logger = nullptr);

    /**
     * @brief Operator credential check on X-API-Key.
     * Responds 503 when @p api_key is empty (surface disabled), 401 on mismatch.
     */
    Middleware require_api_key(const std::string& api_key);

} // namespace streamgate::middleware

#endif // STREAMGATE_MIDDLEWARE_H
