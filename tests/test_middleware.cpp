#include <catch2/catch_test_macros.hpp>
#include <streamgate/app.h>
#include <streamgate/auth.h>
#include <streamgate/crypto.h>
#include <streamgate/exceptions.h>
#include <streamgate/middleware.h>
#include <boost/asio/io_context.hpp>
#include <vector>
#include "test_support.h"

using namespace streamgate;

namespace {

    Async<void> pass(Middleware mw, Request& req, Response& res, bool& reached) {
        co_await mw(req, res, [&reached]() -> Async<void> {
            reached = true;
            co_return;
        });
    }
}

TEST_CASE("Middleware: Execution Order", "[middleware]") {
    App app;
    app.get_logger().configure("/dev/null");
    std::vector<int> execution_order;

    app.use([&](Request&, Response&, Next next) -> Async<void> {
        execution_order.push_back(1);
        co_await next();
        execution_order.push_back(6); // Post-processing
    });

    app.use([&](Request&, Response&, Next next) -> Async<void> {
        execution_order.push_back(2);
        co_await next();
        execution_order.push_back(5);
    });

    app.get("/test", [&](Request&, Response& res) -> Async<void> {
        execution_order.push_back(3);
        res.send("OK");
        execution_order.push_back(4);
        co_return;
    });

    SECTION("Middleware should execute in a nested stack (Onion model)") {
        Request req;
        req.method = "GET";
        req.set_target("/test");

        auto res = testing::run(app.engine(), app.handle_request(req));
        CHECK(res.get_status() == 200);
        CHECK(execution_order == std::vector<int>{1, 2, 3, 4, 5, 6});
    }
}

TEST_CASE("Middleware: Request correlation", "[middleware]") {
    boost::asio::io_context ioc;
    Request req;
    Response res;
    bool reached = false;

    SECTION("Generates an id when none is supplied") {
        testing::run(ioc, pass(middleware::request_id(), req, res, reached));
        CHECK(reached);
        CHECK(req.request_id.size() == 36);
        CHECK(res.get_header("X-Request-ID") == req.request_id);
    }

    SECTION("Reuses a sane inbound id") {
        req.headers.set("X-Request-ID", "trace-abc");
        testing::run(ioc, pass(middleware::request_id(), req, res, reached));
        CHECK(req.request_id == "trace-abc");
    }

    SECTION("Replaces an oversized inbound id") {
        req.headers.set("X-Request-ID", std::string(200, 'x'));
        testing::run(ioc, pass(middleware::request_id(), req, res, reached));
        CHECK(req.request_id.size() == 36);
    }
}

TEST_CASE("Middleware: CORS and limits", "[middleware]") {
    boost::asio::io_context ioc;
    Request req;
    Response res;
    bool reached = false;

    SECTION("Preflight is answered without reaching the handler") {
        req.method = "OPTIONS";
        testing::run(ioc, pass(middleware::cors("https://app.example.com"), req, res, reached));
        CHECK_FALSE(reached);
        CHECK(res.get_status() == 204);
        CHECK(res.get_header("Access-Control-Allow-Origin") == "https://app.example.com");
        CHECK(res.get_header("Access-Control-Allow-Credentials") == "true");
    }

    SECTION("Oversized bodies are refused") {
        req.method = "POST";
        req.body = std::string(2048, 'a');
        CHECK_THROWS_AS(testing::run(ioc, pass(middleware::limit_body_size(1024), req, res, reached)),
                        PayloadTooLarge);
        CHECK_FALSE(reached);
    }

    SECTION("Service headers") {
        testing::run(ioc, pass(middleware::service_headers("api-gateway", "v1"), req, res, reached));
        CHECK(res.get_header("X-Service") == "api-gateway");
        CHECK(res.get_header("X-Version") == "v1");
    }
}

TEST_CASE("Middleware: Optional authentication", "[middleware][auth]") {
    boost::asio::io_context ioc;
    const std::string secret = "test-secret";
    JwtAuthenticator auth(secret);
    Request req;
    Response res;
    bool reached = false;

    SECTION("Valid token populates the caller") {
        req.headers.set("Authorization", "Bearer " + crypto::jwt_sign({{"id", "u-9"}}, secret));
        testing::run(ioc, pass(middleware::authenticate(auth), req, res, reached));
        CHECK(reached);
        REQUIRE(req.caller.has_value());
        CHECK(req.caller->id == "u-9");
        CHECK(req.caller_key() == "user:u-9");
    }

    SECTION("Rejected token continues anonymously and keeps the reason") {
        req.headers.set("Authorization", "Bearer " + crypto::jwt_sign({{"id", "u-9"}}, secret, -5));
        testing::run(ioc, pass(middleware::authenticate(auth), req, res, reached));
        CHECK(reached);
        CHECK_FALSE(req.caller.has_value());
        CHECK(req.get_opt<std::string>("auth_error") == "Token has expired");
    }

    SECTION("No token at all") {
        testing::run(ioc, pass(middleware::authenticate(auth), req, res, reached));
        CHECK(reached);
        CHECK_FALSE(req.get_opt<std::string>("auth_error").has_value());
    }
}

TEST_CASE("Middleware: Operator API key", "[middleware]") {
    boost::asio::io_context ioc;
    Request req;
    Response res;
    bool reached = false;

    SECTION("Disabled when no key is configured") {
        try {
            testing::run(ioc, pass(middleware::require_api_key(""), req, res, reached));
            FAIL("expected HttpError");
        } catch (const HttpError& e) {
            CHECK(e.status() == 503);
        }
    }

    SECTION("Wrong or missing key") {
        CHECK_THROWS_AS(testing::run(ioc, pass(middleware::require_api_key("k-1"), req, res, reached)),
                        AuthenticationError);
        req.headers.set("X-API-Key", "k-2");
        CHECK_THROWS_AS(testing::run(ioc, pass(middleware::require_api_key("k-1"), req, res, reached)),
                        AuthenticationError);
        CHECK_FALSE(reached);
    }

    SECTION("Matching key") {
        req.headers.set("X-API-Key", "k-1");
        testing::run(ioc, pass(middleware::require_api_key("k-1"), req, res, reached));
        CHECK(reached);
    }
}
