#include <streamgate/config.h>
#include <streamgate/environment.h>
#include <streamgate/exceptions.h>
#include <streamgate/util/string.h>
#include <boost/json.hpp>
#include <fstream>
#include <sstream>

namespace streamgate {

namespace {

    const std::vector<std::string> kServiceNames = {
        "auth", "content", "streaming", "payment", "social", "analytics", "notification"
    };

    std::string service_env_key(const std::string& name) {
        std::string key;
        for (char c : name) {
            key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return key + "_SERVICE_URL";
    }

    std::string default_service_url(size_t index) {
        return "http://localhost:" + std::to_string(3001 + index);
    }

    bool bool_field(const boost::json::object& obj, std::string_view key, bool fallback) {
        auto* v = obj.if_contains(key);
        if (!v) return fallback;
        if (!v->is_bool()) throw ValidationError("Route field '" + std::string(key) + "' must be a boolean");
        return v->get_bool();
    }

    std::string string_field(const boost::json::object& obj, std::string_view key, std::string fallback = {}) {
        auto* v = obj.if_contains(key);
        if (!v) return fallback;
        if (!v->is_string()) throw ValidationError("Route field '" + std::string(key) + "' must be a string");
        return std::string(v->get_string());
    }

    std::vector<std::string> string_list(const boost::json::object& obj, std::string_view key) {
        std::vector<std::string> out;
        auto* v = obj.if_contains(key);
        if (!v) return out;
        if (!v->is_array()) throw ValidationError("Route field '" + std::string(key) + "' must be an array");
        for (const auto& item : v->get_array()) {
            if (!item.is_string()) throw ValidationError("Route field '" + std::string(key) + "' must hold strings");
            out.emplace_back(item.get_string());
        }
        return out;
    }

    RouteConfig parse_route(const boost::json::object& obj) {
        RouteConfig route;
        route.path_prefix = string_field(obj, "pathPrefix");
        route.service = string_field(obj, "service");
        if (route.path_prefix.empty() || route.path_prefix.front() != '/') {
            throw ValidationError("Route pathPrefix must start with '/'");
        }
        if (route.service.empty()) {
            throw ValidationError("Route " + route.path_prefix + " has no service");
        }

        if (auto* rw = obj.if_contains("pathRewrite")) {
            if (!rw->is_object()) throw ValidationError("Route field 'pathRewrite' must be an object");
            const auto& rw_obj = rw->get_object();
            route.rewrite = PathRewrite{string_field(rw_obj, "from"), string_field(rw_obj, "to")};
        }

        route.requires_auth = bool_field(obj, "requiresAuth", false);
        route.requires_profile = bool_field(obj, "requiresProfile", false);
        route.requires_subscription = bool_field(obj, "requiresSubscription", false);
        route.allowed_plans = string_list(obj, "allowedPlans");
        if (!route.allowed_plans.empty()) {
            route.requires_subscription = true;
        }
        if (route.requires_profile || route.requires_subscription) {
            route.requires_auth = true;
        }

        if (auto* policy = obj.if_contains("rateLimitPolicy")) {
            if (policy->is_null()) {
                route.rate_limit_policy.clear();
            } else if (policy->is_string()) {
                route.rate_limit_policy = std::string(policy->get_string());
            } else {
                throw ValidationError("Route field 'rateLimitPolicy' must be a string or null");
            }
        }

        route.circuit_breaker = bool_field(obj, "circuitBreaker", true);
        route.load_balancer = bool_field(obj, "loadBalancer", true);

        if (auto* t = obj.if_contains("timeoutMs")) {
            if (!t->is_int64() || t->get_int64() <= 0) throw ValidationError("Route field 'timeoutMs' must be a positive integer");
            route.timeout = std::chrono::milliseconds(t->get_int64());
        }
        if (auto* r = obj.if_contains("retryAttempts")) {
            if (!r->is_int64() || r->get_int64() < 0) throw ValidationError("Route field 'retryAttempts' must be a non-negative integer");
            route.retry_attempts = static_cast<int>(r->get_int64());
        }

        if (auto* h = obj.if_contains("headers")) {
            if (!h->is_object()) throw ValidationError("Route field 'headers' must be an object");
            for (const auto& [name, value] : h->get_object()) {
                if (!value.is_string()) throw ValidationError("Route header values must be strings");
                route.extra_headers.emplace_back(std::string(name), std::string(value.get_string()));
            }
        }
        route.remove_headers = string_list(obj, "removeHeaders");
        return route;
    }
}

BalancingStrategy parse_strategy(std::string_view name) {
    if (name == "round-robin") return BalancingStrategy::RoundRobin;
    if (name == "least-connections") return BalancingStrategy::LeastConnections;
    if (name == "weighted") return BalancingStrategy::Weighted;
    if (name == "random") return BalancingStrategy::Random;
    throw ValidationError("Unknown load balancing strategy: " + std::string(name));
}

std::string_view to_string(BalancingStrategy strategy) {
    switch (strategy) {
        case BalancingStrategy::RoundRobin: return "round-robin";
        case BalancingStrategy::LeastConnections: return "least-connections";
        case BalancingStrategy::Weighted: return "weighted";
        case BalancingStrategy::Random: return "random";
    }
    return "round-robin";
}

GatewayConfig GatewayConfig::from_env() {
    GatewayConfig cfg;
    cfg.port = env<int>("PORT", cfg.port);
    cfg.threads = env<int>("GATEWAY_THREADS", cfg.threads);
    cfg.environment = env<std::string>("GATEWAY_ENV", cfg.environment);
    cfg.api_version = env<std::string>("API_VERSION", cfg.api_version);

    cfg.log_path = env<std::string>("LOG_FILE", cfg.log_path);
    cfg.log_level = env<std::string>("LOG_LEVEL", cfg.log_level);

    cfg.max_body_size = static_cast<size_t>(env<long>("MAX_BODY_SIZE", static_cast<long>(cfg.max_body_size)));
    cfg.read_timeout_seconds = env<int>("READ_TIMEOUT_SECONDS", cfg.read_timeout_seconds);

    cfg.jwt_secret = env<std::string>("JWT_SECRET", "");
    cfg.operator_api_key = env<std::string>("MONITORING_API_KEY", "");
    cfg.cors_origin = env<std::string>("CORS_ORIGIN", cfg.cors_origin);

    cfg.redis_url = env<std::string>("REDIS_URL", "");
    cfg.redis_password = env<std::string>("REDIS_PASSWORD", "");
    cfg.rate_limit_store = env<std::string>("RATE_LIMIT_STORE", cfg.redis_url.empty() ? "memory" : "redis");

    cfg.routes_file = env<std::string>("ROUTES_FILE", cfg.routes_file);

    cfg.default_rate_limit.window = env<std::chrono::milliseconds>("RATE_LIMIT_WINDOW_MS", cfg.default_rate_limit.window);
    cfg.default_rate_limit.max_requests = env<long>("RATE_LIMIT_MAX_REQUESTS", cfg.default_rate_limit.max_requests);
    cfg.default_rate_limit.skip_successful_requests = env<bool>("RATE_LIMIT_SKIP_SUCCESSFUL", false);

    cfg.health_check.interval = env<std::chrono::milliseconds>("HEALTH_CHECK_INTERVAL", cfg.health_check.interval);
    cfg.health_check.timeout = env<std::chrono::milliseconds>("HEALTH_CHECK_TIMEOUT", cfg.health_check.timeout);
    cfg.health_check.path = env<std::string>("HEALTH_CHECK_PATH", cfg.health_check.path);

    cfg.circuit_breaker.failure_threshold = env<int>("CIRCUIT_BREAKER_THRESHOLD", cfg.circuit_breaker.failure_threshold);
    cfg.circuit_breaker.reset_timeout = env<std::chrono::milliseconds>("CIRCUIT_BREAKER_TIMEOUT", cfg.circuit_breaker.reset_timeout);
    cfg.circuit_breaker.expected_errors = env_list("CIRCUIT_BREAKER_EXPECTED_ERRORS");

    cfg.load_balancer.strategy = parse_strategy(env<std::string>("LOAD_BALANCER_STRATEGY", "round-robin"));
    cfg.load_balancer.retry_attempts = env<int>("RETRY_ATTEMPTS", cfg.load_balancer.retry_attempts);
    cfg.load_balancer.retry_delay = env<std::chrono::milliseconds>("RETRY_DELAY", cfg.load_balancer.retry_delay);
    cfg.load_balancer.request_timeout = env<std::chrono::milliseconds>("REQUEST_TIMEOUT", cfg.load_balancer.request_timeout);

    cfg.metrics.max_history = static_cast<size_t>(env<long>("METRICS_MAX_HISTORY", static_cast<long>(cfg.metrics.max_history)));
    cfg.metrics.retention = env<std::chrono::milliseconds>("METRICS_RETENTION_MS", cfg.metrics.retention);
    cfg.metrics.window = env<std::chrono::milliseconds>("METRICS_WINDOW_MS", cfg.metrics.window);
    cfg.metrics.compaction_interval = env<std::chrono::milliseconds>("METRICS_COMPACTION_INTERVAL", cfg.metrics.compaction_interval);

    if (cfg.circuit_breaker.failure_threshold < 1) {
        throw ValidationError("CIRCUIT_BREAKER_THRESHOLD must be at least 1");
    }
    if (cfg.load_balancer.retry_attempts < 0) {
        throw ValidationError("RETRY_ATTEMPTS must not be negative");
    }

    for (size_t i = 0; i < kServiceNames.size(); ++i) {
        ServiceConfig svc{kServiceNames[i], {}};
        for (auto& url : env_list(service_env_key(kServiceNames[i]), {default_service_url(i)})) {
            svc.endpoints.push_back({std::move(url), 1});
        }
        cfg.services.push_back(std::move(svc));
    }

    return cfg;
}

boost::json::object GatewayConfig::to_json() const {
    boost::json::array services_json;
    for (const auto& svc : services) {
        boost::json::array urls;
        for (const auto& ep : svc.endpoints) {
            urls.push_back(boost::json::object{{"url", ep.url}, {"weight", ep.weight}});
        }
        services_json.push_back(boost::json::object{{"name", svc.name}, {"endpoints", std::move(urls)}});
    }

    boost::json::array expected;
    for (const auto& e : circuit_breaker.expected_errors) expected.emplace_back(e);

    return {
        {"port", port},
        {"environment", environment},
        {"apiVersion", api_version},
        {"maxBodySize", max_body_size},
        {"corsOrigin", cors_origin},
        {"rateLimit", {
            {"store", rate_limit_store},
            {"windowMs", default_rate_limit.window.count()},
            {"maxRequests", default_rate_limit.max_requests},
            {"skipSuccessfulRequests", default_rate_limit.skip_successful_requests}
        }},
        {"healthCheck", {
            {"intervalMs", health_check.interval.count()},
            {"timeoutMs", health_check.timeout.count()},
            {"path", health_check.path}
        }},
        {"circuitBreaker", {
            {"threshold", circuit_breaker.failure_threshold},
            {"resetTimeoutMs", circuit_breaker.reset_timeout.count()},
            {"expectedErrors", std::move(expected)}
        }},
        {"loadBalancer", {
            {"strategy", std::string(to_string(load_balancer.strategy))},
            {"retryAttempts", load_balancer.retry_attempts},
            {"retryDelayMs", load_balancer.retry_delay.count()},
            {"requestTimeoutMs", load_balancer.request_timeout.count()}
        }},
        {"metrics", {
            {"maxHistory", metrics.max_history},
            {"retentionMs", metrics.retention.count()},
            {"windowMs", metrics.window.count()}
        }},
        {"services", std::move(services_json)}
    };
}

std::vector<RateLimitPolicy> default_policies(const RateLimitPolicy& base) {
    std::vector<RateLimitPolicy> policies;
    policies.push_back(base);

    RateLimitPolicy auth;
    auth.name = "auth";
    auth.window = 15min;
    auth.max_requests = 5;
    auth.key_by_address = true;
    auth.message = "Too many authentication attempts, please try again later";
    policies.push_back(auth);

    auto per_minute = [](std::string name, long max, std::string message) {
        RateLimitPolicy p;
        p.name = std::move(name);
        p.window = 1min;
        p.max_requests = max;
        p.message = std::move(message);
        return p;
    };
    policies.push_back(per_minute("search", 30, "Too many search requests, please slow down"));
    policies.push_back(per_minute("payment", 10, "Too many payment requests, please try again later"));
    policies.push_back(per_minute("upload", 5, "Too many upload requests, please try again later"));
    policies.push_back(per_minute("admin", 100, "Too many admin requests"));
    policies.push_back(per_minute("burst", 100, "Request burst limit exceeded"));

    RateLimitPolicy sub = base;
    sub.name = "subscription";
    sub.message = "Rate limit exceeded for your subscription plan";
    policies.push_back(sub);

    return policies;
}

std::vector<RouteConfig> default_routes(const GatewayConfig& config) {
    std::vector<RouteConfig> routes;
    for (const auto& svc : config.services) {
        RouteConfig route;
        route.path_prefix = "/api/" + config.api_version + "/" + svc.name;
        route.service = svc.name;
        route.rewrite = PathRewrite{"^" + route.path_prefix, "/" + config.api_version};
        routes.push_back(std::move(route));
    }
    return routes;
}

std::vector<RouteConfig> parse_routes(std::string_view json) {
    boost::system::error_code ec;
    auto doc = boost::json::parse(json, ec);
    if (ec) {
        throw ValidationError("Route file is not valid JSON: " + ec.message());
    }

    const boost::json::array* entries = nullptr;
    if (doc.is_array()) {
        entries = &doc.get_array();
    } else if (doc.is_object()) {
        if (auto* r = doc.get_object().if_contains("routes"); r && r->is_array()) {
            entries = &r->get_array();
        }
    }
    if (!entries) {
        throw ValidationError("Route file must be an array or an object with a 'routes' array");
    }

    std::vector<RouteConfig> routes;
    routes.reserve(entries->size());
    for (const auto& entry : *entries) {
        if (!entry.is_object()) {
            throw ValidationError("Route entries must be objects");
        }
        routes.push_back(parse_route(entry.get_object()));
    }
    return routes;
}

std::vector<RouteConfig> load_routes(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open route file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_routes(ss.str());
}

} // namespace streamgate
