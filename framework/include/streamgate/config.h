#ifndef STREAMGATE_CONFIG_H
#define STREAMGATE_CONFIG_H

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/json/object.hpp>

namespace streamgate {

using namespace std::chrono_literals;

enum class BalancingStrategy {
    RoundRobin,
    LeastConnections,
    Weighted,
    Random
};

/** @throws ValidationError for an unknown strategy name. */
BalancingStrategy parse_strategy(std::string_view name);
std::string_view to_string(BalancingStrategy strategy);

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    std::chrono::milliseconds reset_timeout{30s};
    // Error texts containing any of these do not count as failures.
    std::vector<std::string> expected_errors;
};

struct LoadBalancerConfig {
    BalancingStrategy strategy = BalancingStrategy::RoundRobin;
    int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{1s};
    std::chrono::milliseconds request_timeout{30s};
};

struct HealthCheckConfig {
    std::chrono::milliseconds interval{30s};
    std::chrono::milliseconds timeout{5s};
    std::string path = "/health";
};

struct RateLimitPolicy {
    std::string name = "default";
    std::chrono::milliseconds window{15min};
    long max_requests = 1000;
    // Count by client address even when the caller is authenticated.
    bool key_by_address = false;
    bool skip_successful_requests = false;
    std::string message = "Too many requests, please try again later";
};

struct SubscriptionQuotas {
    std::map<std::string, long> per_plan{{"BASIC", 500}, {"STANDARD", 1000}, {"PREMIUM", 2000}};
    long unlisted_plan = 100;
};

struct MetricsConfig {
    size_t max_history = 10000;
    std::chrono::milliseconds retention{24h};
    std::chrono::milliseconds window{1h};
    std::chrono::milliseconds compaction_interval{1min};
};

struct EndpointConfig {
    std::string url;
    int weight = 1;
};

struct ServiceConfig {
    std::string name;
    std::vector<EndpointConfig> endpoints;
};

struct PathRewrite {
    std::string from;
    std::string to;
};

/**
 * @brief One entry of the static route table.
 *
 * Every field is defaulted so a route can be declared with only a prefix and
 * a service name.
 */
struct RouteConfig {
    std::string path_prefix;
    std::string service;
    std::optional<PathRewrite> rewrite;

    bool requires_auth = false;
    bool requires_profile = false;
    bool requires_subscription = false;
    std::vector<std::string> allowed_plans;

    // Empty disables rate limiting for the route.
    std::string rate_limit_policy = "default";

    bool circuit_breaker = true;
    bool load_balancer = true;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> retry_attempts;

    std::vector<std::pair<std::string, std::string>> extra_headers;
    std::vector<std::string> remove_headers;
};

struct GatewayConfig {
    int port = 3000;
    int threads = 0;
    std::string environment = "development";
    std::string api_version = "v1";

    std::string log_path = "stdout";
    std::string log_level = "info";

    size_t max_body_size = 10 * 1024 * 1024;
    int read_timeout_seconds = 30;

    std::string jwt_secret;
    std::string operator_api_key;
    std::string cors_origin = "http://localhost:5173";

    std::string rate_limit_store = "memory";
    std::string redis_url;
    std::string redis_password;

    std::string routes_file = "config/routes.json";

    RateLimitPolicy default_rate_limit;
    SubscriptionQuotas subscription_quotas;
    HealthCheckConfig health_check;
    CircuitBreakerConfig circuit_breaker;
    LoadBalancerConfig load_balancer;
    MetricsConfig metrics;
    std::vector<ServiceConfig> services;

    bool is_production() const { return environment == "production"; }

    /** @brief Builds the configuration from the process environment (see load_env). */
    static GatewayConfig from_env();

    /** @brief Effective configuration with secrets left out. */
    boost::json::object to_json() const;
};

/**
 * @brief Named quota policies. The default policy's window and limit come
 * from the configuration; the rest are fixed.
 */
std::vector<RateLimitPolicy> default_policies(const RateLimitPolicy& base);

/** @brief One catch-all route per configured service: /api/<ver>/<name> -> /<ver>. */
std::vector<RouteConfig> default_routes(const GatewayConfig& config);

/** @throws ValidationError on malformed JSON or missing fields. */
std::vector<RouteConfig> parse_routes(std::string_view json);

/** @throws std::runtime_error when the file cannot be read. */
std::vector<RouteConfig> load_routes(const std::string& path);

} // namespace streamgate

#endif // STREAMGATE_CONFIG_H
