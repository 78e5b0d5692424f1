#include <catch2/catch_test_macros.hpp>
#include <streamgate/app.h>
#include <streamgate/exceptions.h>
#include <boost/json/parse.hpp>
#include <chrono>
#include <stdexcept>
#include "test_support.h"

using namespace streamgate;
namespace json = boost::json;

namespace {

    Response dispatch(App& app, std::string method, std::string_view target) {
        Request req;
        req.method = std::move(method);
        req.set_target(target);
        req.request_id = "req-42";
        return testing::run(app.engine(), app.handle_request(req));
    }

    json::object body_of(const Response& res) {
        return json::parse(res.body()).as_object();
    }
}

TEST_CASE("App: Unmatched requests", "[app]") {
    App app;
    app.get_logger().configure("/dev/null");

    SECTION("Default fallback answers with a 404 envelope") {
        auto res = dispatch(app, "GET", "/nowhere");
        CHECK(res.get_status() == 404);
        auto body = body_of(res);
        CHECK(body.at("success") == false);
        CHECK(body.at("error").at("message") == "Route GET /nowhere not found");
        CHECK(body.at("requestId") == "req-42");
        CHECK(body.at("version") == "v1");
    }

    SECTION("Custom fallback") {
        app.fallback([](Request& req, Response& res) -> Async<void> {
            res.status(202).send("fallback:" + req.path);
            co_return;
        });
        auto res = dispatch(app, "DELETE", "/anything/else");
        CHECK(res.get_status() == 202);
        CHECK(res.body() == "fallback:/anything/else");
    }

    SECTION("Method mismatch is not a match") {
        app.get("/only-get", [](Request&, Response& res) -> Async<void> {
            res.send("ok");
            co_return;
        });
        CHECK(dispatch(app, "GET", "/only-get").get_status() == 200);
        CHECK(dispatch(app, "POST", "/only-get").get_status() == 404);
    }
}

TEST_CASE("App: Handler failures become envelopes", "[app]") {
    App app;
    app.get_logger().configure("/dev/null");
    app.config().version = "v2";

    app.get("/boom", [](Request&, Response&) -> Async<void> {
        throw std::runtime_error("database password leaked in message");
        co_return;
    });
    app.get("/limited", [](Request&, Response&) -> Async<void> {
        throw RateLimitError("Too many requests, please try again later", 10, 0,
                             std::chrono::system_clock::now() + std::chrono::seconds(60));
        co_return;
    });
    app.get("/upstream", [](Request&, Response&) -> Async<void> {
        throw GatewayTimeoutError("payment");
        co_return;
    });

    SECTION("Typed errors keep their status") {
        CHECK(dispatch(app, "GET", "/limited").get_status() == 429);

        auto res = dispatch(app, "GET", "/upstream");
        CHECK(res.get_status() == 504);
        CHECK(body_of(res).at("version") == "v2");
    }

    SECTION("Unexpected exceptions are 500 with details outside production") {
        auto res = dispatch(app, "GET", "/boom");
        CHECK(res.get_status() == 500);
        auto body = body_of(res);
        CHECK(body.at("error").at("code") == "INTERNAL_ERROR");
        CHECK(body.at("error").at("details").at("exception") == "database password leaked in message");
    }

    SECTION("Production hides exception text") {
        app.config().production = true;
        auto res = dispatch(app, "GET", "/boom");
        CHECK(res.get_status() == 500);
        CHECK(res.body().find("password") == std::string::npos);
        CHECK_FALSE(body_of(res).at("error").as_object().contains("details"));
    }
}

TEST_CASE("App: Groups and stop hooks", "[app]") {
    App app;
    app.get_logger().configure("/dev/null");

    auto api = app.group("/api/v1");
    api.get("/items/:id", [](Request& req, Response& res) -> Async<void> {
        res.send("item " + req.params["id"]);
        co_return;
    });

    auto res = dispatch(app, "GET", "/api/v1/items/7");
    CHECK(res.get_status() == 200);
    CHECK(res.body() == "item 7");

    int stopped = 0;
    app.on_stop([&] { stopped++; });
    app.on_stop([&] { stopped++; });
    app.stop();
    CHECK(stopped == 2);
    CHECK(app.engine().stopped());
}
