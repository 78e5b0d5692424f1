#ifndef STREAMGATE_EXCEPTIONS_H
#define STREAMGATE_EXCEPTIONS_H

#include <chrono>
#include <stdexcept>
#include <string>
#include <boost/json/value.hpp>

namespace streamgate {

/**
 * @brief Base class for all HTTP-related exceptions in StreamGate.
 *
 * Carries the status sent to the caller and the machine-readable code that
 * lands in the error envelope.
 */
class HttpError : public std::runtime_error {
    int status_code_;
    std::string code_;
    boost::json::value details_;
public:
    HttpError(int status, std::string code, const std::string& msg,
              boost::json::value details = nullptr)
        : std::runtime_error(msg), status_code_(status), code_(std::move(code)),
          details_(std::move(details)) {}

    int status() const { return status_code_; }
    const std::string& code() const { return code_; }
    const boost::json::value& details() const { return details_; }
};

/** @brief 400 Bad Request */
class ValidationError : public HttpError {
public:
    explicit ValidationError(const std::string& msg = "Validation failed", boost::json::value details = nullptr)
        : HttpError(400, "VALIDATION_ERROR", msg, std::move(details)) {}
};

/** @brief 401 Unauthorized */
class AuthenticationError : public HttpError {
public:
    explicit AuthenticationError(const std::string& msg = "Authentication required")
        : HttpError(401, "AUTHENTICATION_ERROR", msg) {}
};

/** @brief 403 Forbidden */
class AuthorizationError : public HttpError {
public:
    explicit AuthorizationError(const std::string& msg = "Insufficient permissions")
        : HttpError(403, "AUTHORIZATION_ERROR", msg) {}
};

/** @brief 404 Not Found */
class NotFoundError : public HttpError {
public:
    explicit NotFoundError(const std::string& resource = "Resource")
        : HttpError(404, "NOT_FOUND_ERROR", resource + " not found") {}
};

/** @brief 413 Payload Too Large */
class PayloadTooLarge : public HttpError {
public:
    PayloadTooLarge(size_t max_size, size_t received)
        : HttpError(413, "PAYLOAD_TOO_LARGE", "Request body too large",
                    boost::json::object{{"maxSize", max_size}, {"receivedSize", received}}) {}
};

/** @brief 429 Too Many Requests, annotated with the window state. */
class RateLimitError : public HttpError {
    long limit_;
    long remaining_;
    std::chrono::system_clock::time_point reset_;
public:
    RateLimitError(const std::string& msg, long limit, long remaining,
                   std::chrono::system_clock::time_point reset)
        : HttpError(429, "RATE_LIMIT_ERROR", msg), limit_(limit), remaining_(remaining), reset_(reset) {}

    long limit() const { return limit_; }
    long remaining() const { return remaining_; }
    std::chrono::system_clock::time_point reset_time() const { return reset_; }
};

/** @brief 500 Internal Server Error */
class InternalError : public HttpError {
public:
    explicit InternalError(const std::string& msg = "Internal server error")
        : HttpError(500, "INTERNAL_ERROR", msg) {}
};

/** @brief 502 Bad Gateway */
class BadGatewayError : public HttpError {
public:
    explicit BadGatewayError(const std::string& service)
        : HttpError(502, "BAD_GATEWAY", "Bad gateway response from " + service) {}
};

/** @brief 503 Service Unavailable */
class ServiceUnavailableError : public HttpError {
public:
    explicit ServiceUnavailableError(const std::string& service)
        : HttpError(503, "SERVICE_UNAVAILABLE", service + " service is temporarily unavailable") {}
};

/** @brief 504 Gateway Timeout */
class GatewayTimeoutError : public HttpError {
public:
    explicit GatewayTimeoutError(const std::string& service)
        : HttpError(504, "GATEWAY_TIMEOUT", service + " service timeout") {}
};

/**
 * @brief Failure talking to an upstream endpoint.
 *
 * Raised by the outbound client and the load balancer; never reaches the
 * caller directly, the proxy maps it onto one of the HTTP errors above.
 */
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        ConnectionRefused,
        DnsFailure,
        Timeout,
        Reset,
        UpstreamStatus,
        Other
    };

    TransportError(Kind kind, const std::string& msg, int upstream_status = 0)
        : std::runtime_error(msg), kind_(kind), upstream_status_(upstream_status) {}

    Kind kind() const { return kind_; }
    int upstream_status() const { return upstream_status_; }

    // Failures that say something about the endpoint itself rather than the request.
    bool is_connection_class() const { return kind_ != Kind::Other; }

private:
    Kind kind_;
    int upstream_status_;
};

/** @brief The breaker rejected the call without invoking it. */
class BreakerOpenError : public std::runtime_error {
public:
    explicit BreakerOpenError(const std::string& name)
        : std::runtime_error("Circuit breaker " + name + " is OPEN") {}
};

/** @brief The pool had no healthy endpoint to try. */
class NoHealthyEndpointError : public std::runtime_error {
public:
    explicit NoHealthyEndpointError(const std::string& service)
        : std::runtime_error("No healthy endpoints available for " + service) {}
};

} // namespace streamgate

#endif // STREAMGATE_EXCEPTIONS_H
