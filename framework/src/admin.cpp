#include <streamgate/admin.h>
#include <streamgate/app.h>
#include <streamgate/envelope.h>
#include <streamgate/exceptions.h>
#include <streamgate/gateway.h>
#include <streamgate/logger.h>
#include <streamgate/middleware.h>
#include <streamgate/serialize.h>
#include <boost/json/array.hpp>
#include <boost/json/value_from.hpp>
#include <cstdint>
#include <limits>

namespace json = boost::json;

namespace streamgate::admin {

namespace {

    void ok(Response& res, const Request& req, const GatewayContext& ctx, json::value data,
            std::string_view message = {}) {
        res.json(envelope::success(std::move(data), req.request_id, ctx.config().api_version, message));
    }

    ServicePool& require_pool(GatewayContext& ctx, const std::string& service) {
        auto* pool = ctx.pool(service);
        if (!pool) {
            throw NotFoundError("Service '" + service + "'");
        }
        return *pool;
    }

    std::string required_string(const json::object& body, std::string_view key) {
        const auto* v = body.if_contains(key);
        if (!v || !v->is_string() || v->as_string().empty()) {
            throw ValidationError(std::string(key) + " is required");
        }
        return std::string(v->as_string());
    }

    int weight_field(const json::object& body, bool required) {
        const auto* v = body.if_contains("weight");
        if (!v) {
            if (required) throw ValidationError("weight is required");
            return 1;
        }
        if (!v->is_int64() && !v->is_uint64()) {
            throw ValidationError("weight must be an integer");
        }
        constexpr auto max_weight = std::numeric_limits<int>::max();
        const bool in_range = v->is_int64()
            ? v->get_int64() >= 1 && v->get_int64() <= max_weight
            : v->get_uint64() >= 1 && v->get_uint64() <= static_cast<std::uint64_t>(max_weight);
        if (!in_range) {
            throw ValidationError("weight must be between 1 and " + std::to_string(max_weight));
        }
        return static_cast<int>(v->to_number<std::int64_t>());
    }

    json::object body_object(const Request& req) {
        auto body = req.json();
        if (!body.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }
        return std::move(body.as_object());
    }

    json::object load_balancer_json(ServicePool& pool, bool with_endpoints) {
        json::object out;
        out["stats"] = json::value_from(pool.balancer.stats());
        out["health"] = json::value_from(pool.registry.health_summary());
        if (with_endpoints) {
            json::array endpoints;
            for (const auto& ep : pool.registry.snapshot()) {
                endpoints.push_back(json::value_from(ep));
            }
            out["endpoints"] = std::move(endpoints);
        }
        return out;
    }

    json::object breakers_json(const GatewayContext& ctx) {
        json::object out;
        for (const auto& snapshot : ctx.breaker_snapshots()) {
            out[snapshot.name] = json::value_from(snapshot);
        }
        return out;
    }

    json::object all_services_health(GatewayContext& ctx, bool& all_healthy) {
        all_healthy = true;
        json::object out;
        for (const auto& name : ctx.service_names()) {
            auto health = service_health(ctx, name);
            if (!health.at("available").as_bool()) {
                all_healthy = false;
            }
            out[name] = std::move(health);
        }
        return out;
    }

    Handler gateway_health(GatewayContext& ctx) {
        return [&ctx](Request&, Response& res) -> Async<void> {
            bool all_healthy = true;
            auto services = all_services_health(ctx, all_healthy);

            const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now() - ctx.started_at()).count();

            res.status(all_healthy ? 200 : 503).json(json::object{
                {"status", all_healthy ? "healthy" : "degraded"},
                {"gateway", json::object{{"uptime", uptime}, {"version", ctx.config().api_version}}},
                {"services", std::move(services)},
                {"timestamp", iso_timestamp()},
            });
            co_return;
        };
    }
}

json::object service_health(GatewayContext& ctx, const std::string& service) {
    auto& pool = require_pool(ctx, service);
    const auto summary = pool.registry.health_summary();

    auto* breaker = ctx.find_breaker(service);
    const auto state = breaker ? breaker->state() : CircuitState::Closed;

    json::object out = json::value_from(summary).as_object();
    out["available"] = summary.healthy > 0;
    out["circuitBreaker"] = to_string(state);
    if (auto last = pool.registry.last_health_check()) {
        out["lastHealthCheck"] = iso_timestamp(*last);
    } else {
        out["lastHealthCheck"] = nullptr;
    }
    return out;
}

void register_gateway_routes(App& app, GatewayContext& ctx) {
    app.get("/", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::object{
            {"name", "StreamGate API Gateway"},
            {"version", ctx.config().api_version},
            {"environment", ctx.config().environment},
            {"services", json::value_from(ctx.service_names())},
        }, "StreamGate API Gateway is running");
        co_return;
    });

    app.get("/health", gateway_health(ctx));
    app.get("/ping", gateway_health(ctx));

    app.get("/health/:service", [&ctx](Request& req, Response& res) -> Async<void> {
        const auto& name = req.params["service"];
        auto health = service_health(ctx, name);
        const bool healthy = health.at("available").as_bool();

        res.status(healthy ? 200 : 503).json(json::object{
            {"status", healthy ? "healthy" : "unhealthy"},
            {"service", std::move(health)},
            {"timestamp", iso_timestamp()},
        });
        co_return;
    });
}

void register_monitoring_routes(App& app, GatewayContext& ctx) {
    auto api = app.group("/api/" + ctx.config().api_version + "/monitoring");
    api.use(middleware::require_api_key(ctx.config().operator_api_key));

    api.get("/metrics", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::value_from(ctx.metrics().aggregated()), "Metrics retrieved successfully");
        co_return;
    });

    api.get("/metrics/prometheus", [&ctx](Request&, Response& res) -> Async<void> {
        res.text(ctx.metrics().export_prometheus(), "text/plain; version=0.0.4");
        co_return;
    });

    api.get("/metrics/:service", [&ctx](Request& req, Response& res) -> Async<void> {
        const auto& name = req.params["service"];
        auto metrics = ctx.metrics().service_metrics(name);
        if (!metrics) {
            throw NotFoundError("Metrics for service '" + name + "'");
        }
        ok(res, req, ctx, json::value_from(*metrics), "Metrics for " + name + " retrieved successfully");
        co_return;
    });

    api.get("/performance/slow-endpoints", [&ctx](Request& req, Response& res) -> Async<void> {
        const int limit = req.get_query_int("limit", 10);
        if (limit < 1) {
            throw ValidationError("limit must be a positive integer");
        }
        json::array out;
        for (const auto& e : ctx.metrics().slow_endpoints(static_cast<size_t>(limit))) {
            out.push_back(json::value_from(e));
        }
        ok(res, req, ctx, std::move(out), "Slow endpoints analysis retrieved successfully");
        co_return;
    });

    api.get("/errors/distribution", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::value_from(ctx.metrics().error_distribution()),
           "Error distribution retrieved successfully");
        co_return;
    });

    api.get("/traffic/patterns", [&ctx](Request& req, Response& res) -> Async<void> {
        json::array out;
        for (const auto& bucket : ctx.metrics().traffic_patterns()) {
            out.push_back(json::value_from(bucket));
        }
        ok(res, req, ctx, std::move(out), "Traffic patterns retrieved successfully");
        co_return;
    });

    api.get("/users/activity", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::value_from(ctx.metrics().user_activity()),
           "User activity metrics retrieved successfully");
        co_return;
    });

    api.get("/health/score", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::value_from(ctx.metrics().health_score()), "Health score calculated successfully");
        co_return;
    });

    api.get("/circuit-breakers", [&ctx](Request& req, Response& res) -> Async<void> {
        ok(res, req, ctx, json::object{{"circuitBreakers", breakers_json(ctx)}, {"timestamp", iso_timestamp()}});
        co_return;
    });

    api.post("/circuit-breakers/:service/reset", [&ctx](Request& req, Response& res) -> Async<void> {
        const auto& name = req.params["service"];
        require_pool(ctx, name);
        auto& breaker = ctx.breaker(name);
        breaker.force_close();
        ctx.logger().info("Circuit breaker for " + name + " reset by operator");
        ok(res, req, ctx, json::object{{"service", name}, {"state", to_string(breaker.state())}},
           "Circuit breaker reset");
        co_return;
    });

    api.post("/circuit-breakers/:service/open", [&ctx](Request& req, Response& res) -> Async<void> {
        const auto& name = req.params["service"];
        require_pool(ctx, name);
        auto& breaker = ctx.breaker(name);
        breaker.force_open();
        ctx.logger().warn("Circuit breaker for " + name + " opened by operator");
        ok(res, req, ctx, json::object{{"service", name}, {"state", to_string(breaker.state())}},
           "Circuit breaker opened");
        co_return;
    });

    api.get("/load-balancers", [&ctx](Request& req, Response& res) -> Async<void> {
        json::object out;
        for (const auto& name : ctx.service_names()) {
            out[name] = load_balancer_json(*ctx.pool(name), false);
        }
        ok(res, req, ctx, json::object{{"loadBalancers", std::move(out)}, {"timestamp", iso_timestamp()}});
        co_return;
    });

    api.get("/load-balancers/:service", [&ctx](Request& req, Response& res) -> Async<void> {
        auto& pool = require_pool(ctx, req.params["service"]);
        ok(res, req, ctx, load_balancer_json(pool, true));
        co_return;
    });

    api.post("/load-balancers/:service/endpoints", [&ctx](Request& req, Response& res) -> Async<void> {
        auto& pool = require_pool(ctx, req.params["service"]);
        const auto body = body_object(req);
        const auto url = required_string(body, "url");
        const int weight = weight_field(body, false);

        auto endpoint = pool.registry.add(url, weight);
        ctx.logger().info("Endpoint " + url + " added to " + pool.registry.service_name());
        co_await pool.prober.probe(endpoint);

        res.status(201);
        ok(res, req, ctx, json::value_from(pool.registry.snapshot()), "Endpoint added");
    });

    api.del("/load-balancers/:service/endpoints", [&ctx](Request& req, Response& res) -> Async<void> {
        auto& pool = require_pool(ctx, req.params["service"]);
        const auto url = req.get_query("url");
        if (url.empty()) {
            throw ValidationError("url query parameter is required");
        }
        if (!pool.registry.remove(url)) {
            throw NotFoundError("Endpoint '" + url + "'");
        }
        ctx.logger().info("Endpoint " + url + " removed from " + pool.registry.service_name());
        ok(res, req, ctx, json::value_from(pool.registry.snapshot()), "Endpoint removed");
        co_return;
    });

    api.put("/load-balancers/:service/weight", [&ctx](Request& req, Response& res) -> Async<void> {
        auto& pool = require_pool(ctx, req.params["service"]);
        const auto body = body_object(req);
        const auto url = required_string(body, "url");
        pool.registry.update_weight(url, weight_field(body, true));
        ok(res, req, ctx, json::value_from(pool.registry.snapshot()), "Endpoint weight updated");
        co_return;
    });

    api.get("/services/health", [&ctx](Request& req, Response& res) -> Async<void> {
        bool all_healthy = true;
        auto services = all_services_health(ctx, all_healthy);
        ok(res, req, ctx, json::object{
            {"overall", all_healthy ? "healthy" : "degraded"},
            {"services", std::move(services)},
            {"timestamp", iso_timestamp()},
        });
        co_return;
    });

    api.get("/dashboard", [&ctx](Request& req, Response& res) -> Async<void> {
        auto& metrics = ctx.metrics();

        json::array slow;
        for (const auto& e : metrics.slow_endpoints(5)) {
            slow.push_back(json::value_from(e));
        }
        json::object load_balancers;
        for (const auto& name : ctx.service_names()) {
            load_balancers[name] = load_balancer_json(*ctx.pool(name), false);
        }
        bool all_healthy = true;
        auto services = all_services_health(ctx, all_healthy);

        ok(res, req, ctx, json::object{
            {"overview", json::value_from(metrics.aggregated())},
            {"healthScore", json::value_from(metrics.health_score())},
            {"slowEndpoints", std::move(slow)},
            {"errors", json::value_from(metrics.error_distribution())},
            {"userActivity", json::value_from(metrics.user_activity())},
            {"circuitBreakers", breakers_json(ctx)},
            {"loadBalancers", std::move(load_balancers)},
            {"services", std::move(services)},
            {"timestamp", iso_timestamp()},
        }, "Dashboard data retrieved successfully");
        co_return;
    });

    api.get("/config", [&ctx](Request& req, Response& res) -> Async<void> {
        auto config = ctx.config().to_json();

        json::array routes;
        for (const auto& route : ctx.routes().routes()) {
            routes.push_back(json::object{
                {"pathPrefix", route.path_prefix},
                {"service", route.service},
                {"requiresAuth", route.requires_auth},
                {"rateLimitPolicy", route.rate_limit_policy.empty() ? json::value(nullptr)
                                                                    : json::value(route.rate_limit_policy)},
                {"circuitBreaker", route.circuit_breaker},
                {"loadBalancer", route.load_balancer},
            });
        }
        config["routes"] = std::move(routes);

        ok(res, req, ctx, std::move(config), "Configuration retrieved successfully");
        co_return;
    });
}

} // namespace streamgate::admin
