#include <streamgate/gateway.h>
#include <streamgate/exceptions.h>
#include <streamgate/logger.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace net = boost::asio;

namespace streamgate {

ServicePool::ServicePool(const ServiceConfig& service, HttpClient& client, const GatewayConfig& config,
                         Logger* logger)
    : registry(service.name),
      balancer(registry, client, config.load_balancer, logger),
      prober(registry, client, config.health_check, logger) {
    for (const auto& ep : service.endpoints) {
        registry.add(ep.url, ep.weight);
    }
}

void LoggingBreakerListener::on_state_change(const std::string& name, CircuitState from, CircuitState to) {
    logger_.log_circuit_breaker(name, to_string(from), to_string(to));
}

GatewayContext::GatewayContext(GatewayConfig config, std::vector<RouteConfig> routes, HttpClient& client,
                               RateLimitStore& store, Logger& logger)
    : config_(std::move(config)),
      client_(client),
      store_(store),
      logger_(logger),
      breaker_listener_(logger),
      rate_limiter_(store, config_.subscription_quotas, &logger),
      metrics_(config_.metrics),
      routes_(std::move(routes)),
      started_at_(std::chrono::system_clock::now()) {

    for (const auto& service : config_.services) {
        pools_.emplace(service.name, std::make_unique<ServicePool>(service, client_, config_, &logger_));
    }

    for (auto& policy : default_policies(config_.default_rate_limit)) {
        rate_limiter_.add_policy(std::move(policy));
    }

    for (const auto& route : routes_.routes()) {
        if (!pools_.contains(route.service)) {
            throw ValidationError("Route " + route.path_prefix + " targets unknown service " + route.service);
        }
        if (!route.rate_limit_policy.empty() && !rate_limiter_.has_policy(route.rate_limit_policy)) {
            throw ValidationError("Route " + route.path_prefix + " uses unknown rate limit policy " +
                                  route.rate_limit_policy);
        }
    }
}

ServicePool* GatewayContext::pool(const std::string& service) {
    auto it = pools_.find(service);
    return it == pools_.end() ? nullptr : it->second.get();
}

std::vector<std::string> GatewayContext::service_names() const {
    std::vector<std::string> names;
    names.reserve(pools_.size());
    for (const auto& [name, _] : pools_) {
        names.push_back(name);
    }
    return names;
}

CircuitBreaker& GatewayContext::breaker(const std::string& service) {
    std::lock_guard<std::mutex> lock(breakers_mtx_);
    auto& slot = breakers_[service];
    if (!slot) {
        slot = std::make_unique<CircuitBreaker>(service, config_.circuit_breaker, &breaker_listener_);
    }
    return *slot;
}

CircuitBreaker* GatewayContext::find_breaker(const std::string& service) {
    std::lock_guard<std::mutex> lock(breakers_mtx_);
    auto it = breakers_.find(service);
    return it == breakers_.end() ? nullptr : it->second.get();
}

std::vector<CircuitBreakerSnapshot> GatewayContext::breaker_snapshots() const {
    std::lock_guard<std::mutex> lock(breakers_mtx_);
    std::vector<CircuitBreakerSnapshot> out;
    out.reserve(breakers_.size());
    for (const auto& [_, breaker] : breakers_) {
        out.push_back(breaker->snapshot());
    }
    return out;
}

void GatewayContext::start(const boost::asio::any_io_executor& executor) {
    if (running_.exchange(true)) {
        return;
    }

    for (auto& [name, pool] : pools_) {
        pool->prober.start(executor);
    }

    maintenance_strand_.emplace(net::make_strand(executor));
    maintenance_timer_ = std::make_unique<net::steady_timer>(*maintenance_strand_);
    net::co_spawn(*maintenance_strand_, maintain(), net::detached);

    logger_.info("Gateway context started with " + std::to_string(pools_.size()) + " services and " +
                 std::to_string(routes_.routes().size()) + " routes");
}

void GatewayContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    for (auto& [name, pool] : pools_) {
        pool->prober.stop();
    }
    if (maintenance_strand_ && maintenance_timer_) {
        net::post(*maintenance_strand_, [this] { maintenance_timer_->cancel(); });
    }
}

Async<void> GatewayContext::maintain() {
    while (running_) {
        maintenance_timer_->expires_after(config_.metrics.compaction_interval);
        auto [ec] = co_await maintenance_timer_->async_wait(net::as_tuple(net::use_awaitable));
        if (ec == net::error::operation_aborted || !running_) {
            break;
        }

        metrics_.compact();
        if (auto* memory = dynamic_cast<MemoryRateLimitStore*>(&store_)) {
            const size_t removed = memory->sweep();
            if (removed > 0) {
                logger_.debug("Swept " + std::to_string(removed) + " expired rate limit counters");
            }
        }
    }
}

} // namespace streamgate
