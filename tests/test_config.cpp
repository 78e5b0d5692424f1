#include <catch2/catch_test_macros.hpp>
#include <streamgate/config.h>
#include <streamgate/exceptions.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace streamgate;
using namespace std::chrono_literals;

TEST_CASE("Config: Route file parsing", "[config]") {
    SECTION("Full entry") {
        auto routes = parse_routes(R"({"routes": [{
            "pathPrefix": "/api/v1/social/party",
            "service": "social",
            "pathRewrite": {"from": "^/api/v1/social", "to": "/v1"},
            "requiresProfile": true,
            "allowedPlans": ["STANDARD", "PREMIUM"],
            "rateLimitPolicy": "default",
            "circuitBreaker": true,
            "loadBalancer": false,
            "timeoutMs": 5000,
            "retryAttempts": 1,
            "headers": {"X-Party": "true"},
            "removeHeaders": ["Cookie"]
        }]})");

        REQUIRE(routes.size() == 1);
        const auto& r = routes[0];
        CHECK(r.service == "social");
        REQUIRE(r.rewrite.has_value());
        CHECK(r.rewrite->from == "^/api/v1/social");
        // Profile and plan requirements imply authentication and a subscription.
        CHECK(r.requires_auth);
        CHECK(r.requires_subscription);
        CHECK(r.allowed_plans == std::vector<std::string>{"STANDARD", "PREMIUM"});
        CHECK_FALSE(r.load_balancer);
        CHECK(r.timeout == 5000ms);
        CHECK(r.retry_attempts == 1);
        CHECK(r.extra_headers.front() == std::make_pair(std::string("X-Party"), std::string("true")));
        CHECK(r.remove_headers == std::vector<std::string>{"Cookie"});
    }

    SECTION("Defaults and null policy") {
        auto routes = parse_routes(R"([{"pathPrefix": "/api/v1/content", "service": "content", "rateLimitPolicy": null}])");
        REQUIRE(routes.size() == 1);
        CHECK(routes[0].rate_limit_policy.empty());
        CHECK(routes[0].circuit_breaker);
        CHECK(routes[0].load_balancer);
        CHECK_FALSE(routes[0].requires_auth);
    }

    SECTION("Malformed files") {
        CHECK_THROWS_AS(parse_routes("{not json"), ValidationError);
        CHECK_THROWS_AS(parse_routes(R"({"routes": 3})"), ValidationError);
        CHECK_THROWS_AS(parse_routes(R"([{"service": "content"}])"), ValidationError);
        CHECK_THROWS_AS(parse_routes(R"([{"pathPrefix": "/x", "service": "content", "requiresAuth": "yes"}])"),
                        ValidationError);
        CHECK_THROWS_AS(parse_routes(R"([{"pathPrefix": "/x", "service": "content", "timeoutMs": -1}])"),
                        ValidationError);
    }

    SECTION("Missing route file") {
        CHECK_THROWS_AS(load_routes("does-not-exist.json"), std::runtime_error);
    }

    SECTION("Route file on disk") {
        const std::string path = "test_routes.json";
        {
            std::ofstream out(path);
            out << R"({"routes": [{"pathPrefix": "/api/v1/auth/login", "service": "auth", "rateLimitPolicy": "auth"}]})";
        }
        auto routes = load_routes(path);
        std::remove(path.c_str());
        REQUIRE(routes.size() == 1);
        CHECK(routes[0].rate_limit_policy == "auth");
    }
}

TEST_CASE("Config: Strategies", "[config]") {
    CHECK(parse_strategy("least-connections") == BalancingStrategy::LeastConnections);
    CHECK(to_string(BalancingStrategy::Weighted) == "weighted");
    CHECK_THROWS_AS(parse_strategy("fastest"), ValidationError);
}

TEST_CASE("Config: Built-in policies", "[config]") {
    RateLimitPolicy base;
    base.window = 10min;
    base.max_requests = 250;
    auto policies = default_policies(base);

    auto find = [&](const std::string& name) {
        return *std::find_if(policies.begin(), policies.end(), [&](const auto& p) { return p.name == name; });
    };

    CHECK(find("default").max_requests == 250);
    CHECK(find("auth").max_requests == 5);
    CHECK(find("auth").window == 15min);
    CHECK(find("auth").key_by_address);
    CHECK(find("search").max_requests == 30);
    CHECK(find("payment").max_requests == 10);
    CHECK(find("subscription").window == 10min);
}

TEST_CASE("Config: Environment", "[config]") {
    setenv("PORT", "8080", 1);
    setenv("LOAD_BALANCER_STRATEGY", "random", 1);
    setenv("CONTENT_SERVICE_URL", "http://c1:3002, http://c2:3002", 1);

    auto cfg = GatewayConfig::from_env();
    CHECK(cfg.port == 8080);
    CHECK(cfg.load_balancer.strategy == BalancingStrategy::Random);

    auto content = std::find_if(cfg.services.begin(), cfg.services.end(),
                                [](const auto& s) { return s.name == "content"; });
    REQUIRE(content != cfg.services.end());
    REQUIRE(content->endpoints.size() == 2);
    CHECK(content->endpoints[1].url == "http://c2:3002");
    CHECK(cfg.services.size() == 7);

    SECTION("Default routes cover every service") {
        auto routes = default_routes(cfg);
        CHECK(routes.size() == cfg.services.size());
        CHECK(routes.front().path_prefix == "/api/v1/" + routes.front().service);
    }

    SECTION("Secrets stay out of the effective configuration") {
        auto json = cfg.to_json();
        CHECK(json.contains("loadBalancer"));
        CHECK_FALSE(json.contains("jwtSecret"));
        CHECK_FALSE(json.contains("operatorApiKey"));
    }

    unsetenv("PORT");
    unsetenv("LOAD_BALANCER_STRATEGY");
    unsetenv("CONTENT_SERVICE_URL");
}
