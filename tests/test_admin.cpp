#include <catch2/catch_test_macros.hpp>
#include <streamgate/admin.h>
#include <streamgate/app.h>
#include <boost/json/parse.hpp>
#include "gateway_fixture.h"

using namespace streamgate;
using namespace streamgate::testing;
namespace json = boost::json;

namespace {

    struct AdminFixture : GatewayFixture {
        AdminFixture() : GatewayFixture({make_route("/api/v1/content", "content"),
                                         make_route("/api/v1/payment", "payment")}) {
            app.get_logger().configure("/dev/null");
            admin::register_gateway_routes(app, *context);
            admin::register_monitoring_routes(app, *context);
        }

        Response call(std::string method, std::string_view target, std::string body = {},
                      bool with_key = true) {
            auto req = make_request(std::move(method), target);
            if (with_key) req.headers.set("X-API-Key", "ops-key");
            if (!body.empty()) {
                req.body = std::move(body);
                req.headers.set("Content-Type", "application/json");
            }
            return run(app.engine(), app.handle_request(req));
        }

        App app;
    };

    json::object parse(const Response& res) {
        return json::parse(res.body()).as_object();
    }
}

TEST_CASE("Admin: Gateway health", "[admin]") {
    AdminFixture f;

    SECTION("Endpoints without a successful probe degrade the gateway") {
        auto res = f.call("GET", "/health");
        CHECK(res.get_status() == 503);
        auto body = parse(res);
        CHECK(body.at("status") == "degraded");
        CHECK(body.at("services").at("content").at("available") == false);
        CHECK(body.at("services").at("content").at("circuitBreaker") == "CLOSED");
        CHECK(body.at("services").at("content").at("lastHealthCheck").is_null());
    }

    SECTION("All pools with a healthy endpoint") {
        mark_healthy(f.pool("content").registry);
        mark_healthy(f.pool("payment").registry);

        auto res = f.call("GET", "/ping");
        CHECK(res.get_status() == 200);
        auto body = parse(res);
        CHECK(body.at("status") == "healthy");
        CHECK(body.at("gateway").at("version") == "v1");
        CHECK(body.at("services").at("content").at("healthy") == 2);
    }

    SECTION("Single service") {
        mark_healthy(f.pool("payment").registry);
        CHECK(f.call("GET", "/health/payment").get_status() == 200);
        CHECK(f.call("GET", "/health/content").get_status() == 503);

        auto missing = f.call("GET", "/health/billing");
        CHECK(missing.get_status() == 404);
        CHECK(parse(missing).at("error").at("code") == "NOT_FOUND_ERROR");
    }
}

TEST_CASE("Admin: Monitoring requires the operator key", "[admin]") {
    AdminFixture f;

    auto denied = f.call("GET", "/api/v1/monitoring/metrics", {}, false);
    CHECK(denied.get_status() == 401);
    CHECK(parse(denied).at("success") == false);

    auto allowed = f.call("GET", "/api/v1/monitoring/metrics");
    CHECK(allowed.get_status() == 200);
    auto body = parse(allowed);
    CHECK(body.at("success") == true);
    CHECK(body.at("requestId") == "req-test");
    CHECK(body.at("data").at("requestCount") == 0);
}

TEST_CASE("Admin: Metrics views", "[admin]") {
    AdminFixture f;
    auto& metrics = f.context->metrics();
    for (int i = 0; i < 4; ++i) {
        RequestMetric m;
        m.timestamp = std::chrono::system_clock::now();
        m.method = "GET";
        m.path = "/api/v1/content/catalog/" + std::to_string(i);
        m.status_code = i == 3 ? 503 : 200;
        m.response_time_ms = 20 * (i + 1);
        m.service = "content";
        m.user_id = "u-1";
        metrics.record(m);
    }

    SECTION("Prometheus text") {
        auto res = f.call("GET", "/api/v1/monitoring/metrics/prometheus");
        CHECK(res.get_status() == 200);
        CHECK(res.get_header("Content-Type") == "text/plain; version=0.0.4");
        CHECK(res.body().find("streamgate_requests_total") != std::string::npos);
    }

    SECTION("Per service") {
        CHECK(f.call("GET", "/api/v1/monitoring/metrics/content").get_status() == 200);
        CHECK(f.call("GET", "/api/v1/monitoring/metrics/payment").get_status() == 404);
    }

    SECTION("Slow endpoints limit") {
        auto res = f.call("GET", "/api/v1/monitoring/performance/slow-endpoints?limit=1");
        CHECK(res.get_status() == 200);
        CHECK(parse(res).at("data").as_array().size() == 1);
        CHECK(f.call("GET", "/api/v1/monitoring/performance/slow-endpoints?limit=0").get_status() == 400);
    }

    SECTION("Remaining views answer") {
        for (auto target : {"/api/v1/monitoring/errors/distribution", "/api/v1/monitoring/traffic/patterns",
                            "/api/v1/monitoring/users/activity", "/api/v1/monitoring/health/score",
                            "/api/v1/monitoring/services/health", "/api/v1/monitoring/dashboard"}) {
            INFO(target);
            CHECK(f.call("GET", target).get_status() == 200);
        }
    }
}

TEST_CASE("Admin: Circuit breaker control", "[admin]") {
    AdminFixture f;

    auto opened = f.call("POST", "/api/v1/monitoring/circuit-breakers/payment/open");
    CHECK(opened.get_status() == 200);
    CHECK(parse(opened).at("data").at("state") == "OPEN");
    CHECK(f.context->breaker("payment").state() == CircuitState::Open);

    auto listed = parse(f.call("GET", "/api/v1/monitoring/circuit-breakers"));
    CHECK(listed.at("data").at("circuitBreakers").at("payment").at("state") == "OPEN");

    auto reset = f.call("POST", "/api/v1/monitoring/circuit-breakers/payment/reset");
    CHECK(parse(reset).at("data").at("state") == "CLOSED");
    CHECK(f.context->breaker("payment").state() == CircuitState::Closed);

    CHECK(f.call("POST", "/api/v1/monitoring/circuit-breakers/billing/open").get_status() == 404);
}

TEST_CASE("Admin: Endpoint management", "[admin]") {
    AdminFixture f;
    f.client.respond("http://c3:3002", 200);

    SECTION("Added endpoints are probed before the reply") {
        auto res = f.call("POST", "/api/v1/monitoring/load-balancers/content/endpoints",
                          R"({"url":"http://c3:3002","weight":2})");
        CHECK(res.get_status() == 201);

        auto healthy = f.pool("content").registry.healthy();
        REQUIRE(healthy.size() == 1);
        CHECK(healthy.front()->url == "http://c3:3002");
        CHECK(healthy.front()->weight.load() == 2);

        auto detail = parse(f.call("GET", "/api/v1/monitoring/load-balancers/content"));
        CHECK(detail.at("data").at("endpoints").as_array().size() == 3);
    }

    SECTION("Missing url is rejected") {
        auto res = f.call("POST", "/api/v1/monitoring/load-balancers/content/endpoints", R"({"weight":2})");
        CHECK(res.get_status() == 400);
    }

    SECTION("Removal") {
        CHECK(f.call("DELETE", "/api/v1/monitoring/load-balancers/content/endpoints?url=http%3A%2F%2Fc1%3A3002")
                  .get_status() == 200);
        CHECK(f.pool("content").registry.endpoints().size() == 1);
        CHECK(f.call("DELETE", "/api/v1/monitoring/load-balancers/content/endpoints?url=http%3A%2F%2Fc1%3A3002")
                  .get_status() == 404);
        CHECK(f.call("DELETE", "/api/v1/monitoring/load-balancers/content/endpoints").get_status() == 400);
    }

    SECTION("Weight update") {
        CHECK(f.call("PUT", "/api/v1/monitoring/load-balancers/content/weight",
                     R"({"url":"http://c2:3002","weight":5})").get_status() == 200);
        CHECK(f.pool("content").registry.endpoints().back()->weight.load() == 5);

        CHECK(f.call("PUT", "/api/v1/monitoring/load-balancers/content/weight",
                     R"({"url":"http://c2:3002","weight":0})").get_status() == 400);

        // 2^32 + 1 would wrap to 1 if narrowed
        CHECK(f.call("PUT", "/api/v1/monitoring/load-balancers/content/weight",
                     R"({"url":"http://c2:3002","weight":4294967297})").get_status() == 400);
        CHECK(f.call("PUT", "/api/v1/monitoring/load-balancers/content/weight",
                     R"({"url":"http://c2:3002","weight":18446744073709551615})").get_status() == 400);
        CHECK(f.pool("content").registry.endpoints().back()->weight.load() == 5);
        CHECK(f.call("PUT", "/api/v1/monitoring/load-balancers/content/weight",
                     R"({"url":"http://c9:3002","weight":2})").get_status() == 404);
    }
}

TEST_CASE("Admin: Effective configuration", "[admin]") {
    AdminFixture f;
    auto res = f.call("GET", "/api/v1/monitoring/config");
    REQUIRE(res.get_status() == 200);

    auto data = parse(res).at("data").as_object();
    CHECK(data.at("apiVersion") == "v1");
    CHECK(data.at("routes").as_array().size() == 2);
    CHECK(data.at("routes").at(0).at("rateLimitPolicy") == "default");
    CHECK(res.body().find("ops-key") == std::string::npos);
    CHECK_FALSE(data.contains("jwtSecret"));
}
