#include <catch2/catch_test_macros.hpp>
#include <streamgate/exceptions.h>
#include <streamgate/proxy.h>
#include <streamgate/util/string.h>
#include <algorithm>
#include "gateway_fixture.h"

using namespace streamgate;
using namespace streamgate::testing;
using namespace std::chrono_literals;

namespace {

    int status_of(GatewayFixture& f, ProxyService& proxy, Request& req, Response& res) {
        try {
            run(f.ioc, proxy.handle(req, res));
            return res.get_status();
        } catch (const HttpError& e) {
            return e.status();
        }
    }

    std::vector<std::string> header_values(const UpstreamRequest& req, std::string_view name) {
        std::vector<std::string> out;
        for (const auto& [k, v] : req.headers) {
            if (util::iequals(k, name)) out.push_back(v);
        }
        return out;
    }

    CallerIdentity caller(std::optional<std::string> profile = std::nullopt,
                          std::optional<Subscription> sub = std::nullopt) {
        return CallerIdentity{"u-1", "viewer@example.com", std::move(profile), std::move(sub)};
    }

    std::string error_message(const RouteConfig& route, const Request& req) {
        try {
            ProxyService::check_access(route, req);
        } catch (const HttpError& e) {
            return e.what();
        }
        return {};
    }
}

TEST_CASE("Proxy: Access guards", "[proxy]") {
    auto route = make_route("/api/v1/social/party", "social");
    auto req = make_request("POST", "/api/v1/social/party");

    SECTION("Open routes admit anonymous callers") {
        CHECK_NOTHROW(ProxyService::check_access(route, req));
    }

    SECTION("Authentication required") {
        route.requires_auth = true;
        CHECK_THROWS_AS(ProxyService::check_access(route, req), AuthenticationError);
        CHECK(error_message(route, req) == "Authentication token required");

        req.set("auth_error", std::string("Token has expired"));
        CHECK(error_message(route, req) == "Token has expired");
    }

    SECTION("Profile required") {
        route.requires_profile = true;
        req.caller = caller();
        CHECK_THROWS_AS(ProxyService::check_access(route, req), AuthorizationError);
        CHECK(error_message(route, req) == "Profile selection required");

        req.caller = caller("p-1");
        CHECK_NOTHROW(ProxyService::check_access(route, req));
    }

    SECTION("Subscription and plan required") {
        route.requires_subscription = true;
        route.allowed_plans = {"STANDARD", "PREMIUM"};

        req.caller = caller("p-1");
        CHECK(error_message(route, req) == "Active subscription required");

        req.caller = caller("p-1", Subscription{"PREMIUM", "CANCELLED"});
        CHECK(error_message(route, req) == "Active subscription required");

        req.caller = caller("p-1", Subscription{"BASIC", "ACTIVE"});
        CHECK_THROWS_AS(ProxyService::check_access(route, req), AuthorizationError);
        CHECK(error_message(route, req) == "STANDARD or PREMIUM subscription required");

        req.caller = caller("p-1", Subscription{"STANDARD", "ACTIVE"});
        CHECK_NOTHROW(ProxyService::check_access(route, req));
    }
}

TEST_CASE("Proxy: Outbound request", "[proxy]") {
    auto route = make_route("/api/v1/streaming", "content");
    route.rewrite = PathRewrite{"^/api/v1/streaming", "/v1"};
    route.extra_headers = {{"X-Streaming-Gateway", "true"}};
    route.remove_headers = {"Cookie"};
    route.timeout = 2500ms;

    GatewayFixture f({route});
    ProxyService proxy(*f.context);

    auto req = make_request("POST", "/api/v1/streaming/progress?episode=3");
    req.body = R"({"position": 120})";
    req.headers.set("Authorization", "Bearer abc");
    req.headers.set("Content-Type", "application/json");
    req.headers.set("Connection", "keep-alive");
    req.headers.set("Host", "gateway.example.com");
    req.headers.set("Cookie", "session=1");
    req.headers.set("X-User-ID", "spoofed");
    req.headers.set("X-Forwarded-For", "192.0.2.1");
    req.caller = caller("p-3", Subscription{"BASIC", "ACTIVE"});

    auto out = proxy.build_upstream(route, req);

    CHECK(out.method == "POST");
    CHECK(out.target == "/v1/progress?episode=3");
    CHECK(out.body == req.body);
    CHECK(out.timeout == 2500ms);

    CHECK(header_values(out, "Authorization") == std::vector<std::string>{"Bearer abc"});
    CHECK(header_values(out, "Content-Type") == std::vector<std::string>{"application/json"});
    CHECK(header_values(out, "Connection").empty());
    CHECK(header_values(out, "Host").empty());
    CHECK(header_values(out, "Cookie").empty());

    CHECK(header_values(out, "X-User-ID") == std::vector<std::string>{"u-1"});
    CHECK(header_values(out, "X-Profile-ID") == std::vector<std::string>{"p-3"});
    CHECK(header_values(out, "X-Subscription-Plan") == std::vector<std::string>{"BASIC"});
    CHECK(header_values(out, "X-Forwarded-For") == std::vector<std::string>{"192.0.2.1, 10.0.0.9"});
    CHECK(header_values(out, "X-Real-IP") == std::vector<std::string>{"10.0.0.9"});
    CHECK(header_values(out, "X-Request-ID") == std::vector<std::string>{"req-test"});
    CHECK(header_values(out, "X-Gateway-Service") == std::vector<std::string>{"content"});
    CHECK(header_values(out, "X-Streaming-Gateway") == std::vector<std::string>{"true"});

    SECTION("Route without a timeout uses the configured request timeout") {
        route.timeout.reset();
        CHECK(proxy.build_upstream(route, req).timeout == f.context->config().load_balancer.request_timeout);
    }
}

TEST_CASE("Proxy: Successful forward", "[proxy]") {
    auto route = make_route("/api/v1/content", "content");
    route.rewrite = PathRewrite{"^/api/v1/content", "/v1"};
    GatewayFixture f({route});
    mark_healthy(f.pool("content").registry);

    f.client.on("http://c1:3002", [](const UpstreamRequest& r) {
        UpstreamResponse res;
        res.status = 200;
        res.body = R"({"target":")" + r.target + R"("})";
        res.headers.emplace("Content-Type", "application/json");
        res.headers.emplace("Set-Cookie", "a=1");
        res.headers.emplace("Set-Cookie", "b=2");
        res.headers.emplace("Transfer-Encoding", "chunked");
        return res;
    });

    ProxyService proxy(*f.context);
    auto req = make_request("GET", "/api/v1/content/catalog?page=2");
    Response res;

    REQUIRE(status_of(f, proxy, req, res) == 200);
    CHECK(res.body() == R"({"target":"/v1/catalog?page=2"})");
    CHECK(res.get_header("X-Proxied-By") == "StreamGate");
    CHECK(res.get_header("X-Service-Name") == "content");
    CHECK(res.get_header("Transfer-Encoding").empty());
    CHECK(res.get_beast_response().count("Set-Cookie") == 2);
    CHECK(res.get_header("RateLimit-Limit") == "1000");
    CHECK(res.get_header("RateLimit-Remaining") == "999");

    auto agg = f.context->metrics().aggregated();
    CHECK(agg.total_requests == 1);
    CHECK(agg.services.at("content").count == 1);
}

TEST_CASE("Proxy: Failure mapping", "[proxy]") {
    auto direct = make_route("/api/v1/payment", "payment");
    direct.load_balancer = false;
    auto balanced = make_route("/api/v1/content", "content");
    GatewayFixture f({direct, balanced});
    ProxyService proxy(*f.context);
    Response res;

    SECTION("Unknown route is 404 and still counted") {
        auto req = make_request("GET", "/api/v1/unknown");
        CHECK(status_of(f, proxy, req, res) == 404);
        CHECK(f.context->metrics().aggregated().status_codes.at("4xx") == 1);
    }

    SECTION("Dot segments are 400 and never forwarded") {
        auto req = make_request("GET", "/api/v1/content/../payment/plans");
        CHECK(status_of(f, proxy, req, res) == 400);
        CHECK(f.client.calls.empty());
    }

    SECTION("Timeout is 504") {
        f.client.fail("http://p1:3004", TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
        auto req = make_request("GET", "/api/v1/payment/plans");
        CHECK(status_of(f, proxy, req, res) == 504);
    }

    SECTION("Timeout behind the balancer is 504") {
        mark_healthy(f.pool("content").registry);
        f.client.fail("http://c1:3002", TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
        f.client.fail("http://c2:3002", TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
        auto req = make_request("GET", "/api/v1/content/catalog");
        CHECK(status_of(f, proxy, req, res) == 504);
        CHECK(f.client.calls.size() == 2);
    }

    SECTION("Reset behind the balancer is 502") {
        mark_healthy(f.pool("content").registry);
        f.client.fail("http://c1:3002", TransportError::Kind::Reset, "socket hang up");
        f.client.respond("http://c2:3002", 502);
        auto req = make_request("GET", "/api/v1/content/catalog");
        CHECK(status_of(f, proxy, req, res) == 502);
    }

    SECTION("Refused connection is 503") {
        auto req = make_request("GET", "/api/v1/payment/plans");
        CHECK(status_of(f, proxy, req, res) == 503);
    }

    SECTION("Reset or upstream 5xx is 502") {
        f.client.fail("http://p1:3004", TransportError::Kind::Reset, "socket hang up");
        auto req = make_request("GET", "/api/v1/payment/plans");
        CHECK(status_of(f, proxy, req, res) == 502);

        f.client.respond("http://p1:3004", 500);
        auto again = make_request("GET", "/api/v1/payment/plans");
        Response res2;
        CHECK(status_of(f, proxy, again, res2) == 502);
    }

    SECTION("Upstream 4xx is passed through") {
        f.client.respond("http://p1:3004", 422, R"({"error":"bad card"})");
        auto req = make_request("POST", "/api/v1/payment/methods");
        CHECK(status_of(f, proxy, req, res) == 422);
        CHECK(res.body() == R"({"error":"bad card"})");
    }

    SECTION("No healthy endpoint is 503 without an upstream call") {
        auto req = make_request("GET", "/api/v1/content/catalog");
        CHECK(status_of(f, proxy, req, res) == 503);
        CHECK(f.client.calls.empty());
    }

    SECTION("Open breaker fails fast with 503") {
        f.client.fail("http://p1:3004", TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
        for (int i = 0; i < 3; ++i) {
            auto req = make_request("GET", "/api/v1/payment/plans");
            Response r;
            CHECK(status_of(f, proxy, req, r) == 504);
        }
        CHECK(f.context->breaker("payment").state() == CircuitState::Open);

        auto req = make_request("GET", "/api/v1/payment/plans");
        CHECK(status_of(f, proxy, req, res) == 503);
        CHECK(f.client.calls_to("http://p1:3004") == 3);
    }
}

TEST_CASE("Proxy: Guards and quotas run before forwarding", "[proxy]") {
    auto secured = make_route("/api/v1/payment/subscriptions", "payment");
    secured.requires_auth = true;
    secured.rate_limit_policy = "payment";
    GatewayFixture f({secured});
    f.client.respond("http://p1:3004", 200);
    ProxyService proxy(*f.context);

    SECTION("Missing credentials never reach the backend") {
        auto req = make_request("GET", "/api/v1/payment/subscriptions");
        Response res;
        CHECK(status_of(f, proxy, req, res) == 401);
        CHECK(f.client.calls.empty());
    }

    SECTION("Quota exhaustion is 429") {
        int last = 0;
        for (int i = 0; i < 11; ++i) {
            auto req = make_request("GET", "/api/v1/payment/subscriptions");
            req.caller = caller();
            Response res;
            last = status_of(f, proxy, req, res);
        }
        CHECK(last == 429);
        CHECK(f.client.calls_to("http://p1:3004") == 10);

        auto activity = f.context->metrics().user_activity();
        CHECK(activity.top_users.front() == std::make_pair(std::string("u-1"), 11L));
    }
}

TEST_CASE("Proxy: One endpoint timing out behind the balancer", "[proxy][e2e]") {
    auto route = make_route("/api/v1/content", "content");
    route.rewrite = PathRewrite{"^/api/v1/content", "/v1"};
    GatewayFixture f({route});
    auto& pool = f.pool("content");

    f.client.fail("http://c1:3002", TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
    f.client.respond("http://c2:3002", 200, R"({"items":[]})");
    mark_healthy(pool.registry);

    ProxyService proxy(*f.context);

    for (int i = 0; i < 5; ++i) {
        auto req = make_request("GET", "/api/v1/content/trending");
        Response res;
        CHECK(status_of(f, proxy, req, res) == 200);
    }

    // The timing-out endpoint was tried once, then excluded.
    CHECK(f.client.calls_to("http://c1:3002") == 1);
    CHECK(f.client.calls_to("http://c2:3002") == 5);
    CHECK(f.context->breaker("content").state() == CircuitState::Closed);

    // The next probe round confirms the verdict and keeps it out of rotation.
    run(f.ioc, pool.prober.probe_all());
    auto healthy = pool.registry.healthy();
    REQUIRE(healthy.size() == 1);
    CHECK(healthy.front()->url == "http://c2:3002");

    auto metrics = f.context->metrics().service_metrics("content");
    REQUIRE(metrics.has_value());
    CHECK(metrics->total_requests == 5);
    CHECK(metrics->errors == 0);
}
