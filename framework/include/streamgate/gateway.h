#ifndef STREAMGATE_GATEWAY_H
#define STREAMGATE_GATEWAY_H

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <streamgate/circuit_breaker.h>
#include <streamgate/client.h>
#include <streamgate/config.h>
#include <streamgate/health_prober.h>
#include <streamgate/instance_registry.h>
#include <streamgate/load_balancer.h>
#include <streamgate/metrics.h>
#include <streamgate/rate_limiter.h>
#include <streamgate/route_table.h>

namespace streamgate {

class Logger;

/**
 * @brief Everything behind one backend-service name.
 */
struct ServicePool {
    ServicePool(const ServiceConfig& service, HttpClient& client, const GatewayConfig& config, Logger* logger);

    ServicePool(const ServicePool&) = delete;
    ServicePool& operator=(const ServicePool&) = delete;

    InstanceRegistry registry;
    LoadBalancer balancer;
    HealthProber prober;
};

/** @brief Writes every breaker transition to the gateway log. */
class LoggingBreakerListener : public CircuitBreakerListener {
public:
    explicit LoggingBreakerListener(Logger& logger) : logger_(logger) {}
    void on_state_change(const std::string& name, CircuitState from, CircuitState to) override;

private:
    Logger& logger_;
};

/**
 * @brief Owns the per-service pools, the breakers, the rate limiter, the
 * metrics aggregator and the route table.
 *
 * Built once at startup and passed by reference to the proxy and the admin
 * handlers. Must outlive the executor it is started on.
 */
class GatewayContext {
public:
    /**
     * @throws ValidationError when a route names a service without a pool,
     * or a route names an unknown rate-limit policy.
     */
    GatewayContext(GatewayConfig config, std::vector<RouteConfig> routes, HttpClient& client,
                   RateLimitStore& store, Logger& logger);

    GatewayContext(const GatewayContext&) = delete;
    GatewayContext& operator=(const GatewayContext&) = delete;

    const GatewayConfig& config() const { return config_; }

    /** @return nullptr for an unknown service. */
    ServicePool* pool(const std::string& service);
    std::vector<std::string> service_names() const;

    /** @brief Breaker for @p service, created on first use. */
    CircuitBreaker& breaker(const std::string& service);
    /** @return nullptr if no breaker was created for @p service yet. */
    CircuitBreaker* find_breaker(const std::string& service);
    std::vector<CircuitBreakerSnapshot> breaker_snapshots() const;

    RateLimiter& rate_limiter() { return rate_limiter_; }
    MetricsAggregator& metrics() { return metrics_; }
    const RouteTable& routes() const { return routes_; }
    HttpClient& client() { return client_; }
    Logger& logger() { return logger_; }

    std::chrono::system_clock::time_point started_at() const { return started_at_; }

    /** @brief Starts the health probers plus the compaction and counter sweep timer. */
    void start(const boost::asio::any_io_executor& executor);
    void stop();

private:
    Async<void> maintain();

    GatewayConfig config_;
    HttpClient& client_;
    RateLimitStore& store_;
    Logger& logger_;
    LoggingBreakerListener breaker_listener_;

    std::map<std::string, std::unique_ptr<ServicePool>> pools_;

    mutable std::mutex breakers_mtx_;
    std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;

    RateLimiter rate_limiter_;
    MetricsAggregator metrics_;
    RouteTable routes_;
    std::chrono::system_clock::time_point started_at_;

    std::atomic<bool> running_{false};
    std::optional<boost::asio::strand<boost::asio::any_io_executor>> maintenance_strand_;
    std::unique_ptr<boost::asio::steady_timer> maintenance_timer_;
};

} // namespace streamgate

#endif // STREAMGATE_GATEWAY_H
