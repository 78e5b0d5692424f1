#include <streamgate/middleware.h>
#include <streamgate/auth.h>
#include <streamgate/crypto.h>
#include <streamgate/exceptions.h>
#include <streamgate/logger.h>

namespace streamgate::middleware {

Middleware request_id() {
    return [](Request& req, Response& res, Next next) -> Async<void> {
        std::string id(req.get_header("X-Request-ID"));
        if (id.empty() || id.size() > 128) {
            id = crypto::uuid_v4();
        }
        req.request_id = id;
        res.header("X-Request-ID", id);

        co_await next();
    };
}

Middleware cors(const std::string& origin, const std::string& methods, const std::string& headers) {
    return [origin, methods, headers](Request& req, Response& res, Next next) -> Async<void> {
        res.header("Access-Control-Allow-Origin", origin);
        res.header("Access-Control-Allow-Methods", methods);
        res.header("Access-Control-Allow-Headers", headers);
        res.header("Access-Control-Allow-Credentials", "true");

        if (req.method == "OPTIONS") {
            res.no_content();
            co_return;
        }

        co_await next();
    };
}

Middleware limit_body_size(size_t max_bytes) {
    return [max_bytes](Request& req, Response&, Next next) -> Async<void> {
        if (req.body.size() > max_bytes) {
            throw PayloadTooLarge(max_bytes, req.body.size());
        }
        co_await next();
    };
}

Middleware service_headers(const std::string& service, const std::string& version) {
    return [service, version](Request&, Response& res, Next next) -> Async<void> {
        res.header("X-Service", service);
        res.header("X-Version", version);
        co_await next();
    };
}

Middleware authenticate(const Authenticator& authenticator, Logger* logger) {
    return [&authenticator, logger](Request& req, Response&, Next next) -> Async<void> {
        const std::string_view token = extract_bearer(req.get_header("Authorization"));
        if (!token.empty()) {
            try {
                req.caller = authenticator.verify(token);
            } catch (const AuthenticationError& e) {
                if (logger) {
                    logger->debug("Authentication failed for " + req.client_ip + ": " + e.what() +
                                  " [" + req.request_id + "]");
                }
                req.set("auth_error", std::string(e.what()));
            }
        }

        co_await next();
    };
}

Middleware require_api_key(const std::string& api_key) {
    return [api_key](Request& req, Response&, Next next) -> Async<void> {
        if (api_key.empty()) {
            throw HttpError(503, "SERVICE_UNAVAILABLE", "Monitoring API is disabled");
        }
        if (!crypto::secure_compare(req.get_header("X-API-Key"), api_key)) {
            throw AuthenticationError("Invalid or missing API key");
        }
        co_await next();
    };
}

} // namespace streamgate::middleware
