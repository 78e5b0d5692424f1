#ifndef STREAMGATE_LOAD_BALANCER_H
#define STREAMGATE_LOAD_BALANCER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <streamgate/async.h>
#include <streamgate/client.h>
#include <streamgate/config.h>
#include <streamgate/instance_registry.h>

namespace streamgate {

class Logger;

struct LoadBalancerStats {
    std::string service_name;
    BalancingStrategy strategy = BalancingStrategy::RoundRobin;
    size_t total_instances = 0;
    size_t healthy_instances = 0;
    long total_connections = 0;
    // Mean of the last probe latency over all endpoints, in milliseconds.
    double average_response_time = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_health_check;
};

/**
 * @brief Picks one healthy endpoint per outbound call and runs the call with
 * bounded retry.
 *
 * One instance per backend-service pool; the round-robin cursor and the
 * random source are shared by all concurrent callers.
 */
class LoadBalancer {
public:
    LoadBalancer(InstanceRegistry& registry, HttpClient& client, LoadBalancerConfig config,
                 Logger* logger = nullptr, std::uint32_t seed = std::random_device{}());

    /**
     * @brief Chooses among the currently healthy endpoints.
     * @return nullptr when the healthy set is empty.
     */
    std::shared_ptr<Endpoint> select_next();

    /**
     * @brief Sends @p request to a selected endpoint, retrying up to
     * @p max_retries times (config().retry_attempts when unset).
     *
     * Connection-class failures mark the endpoint unhealthy at once. Each
     * retry prefers an endpoint not yet tried in this call and waits
     * retry_delay * 2^attempt first. An upstream 5xx counts as a failure.
     *
     * @throws NoHealthyEndpointError when no healthy endpoint is left, without delay.
     * @throws TransportError the last failure once retries are exhausted.
     */
    Async<UpstreamResponse> execute(UpstreamRequest request, std::optional<int> max_retries = std::nullopt);

    LoadBalancerStats stats() const;
    const LoadBalancerConfig& config() const { return config_; }
    InstanceRegistry& registry() { return registry_; }

private:
    std::shared_ptr<Endpoint> select_from(const std::vector<std::shared_ptr<Endpoint>>& candidates);
    std::shared_ptr<Endpoint> select_for_attempt(const std::vector<std::string>& tried);

    InstanceRegistry& registry_;
    HttpClient& client_;
    LoadBalancerConfig config_;
    Logger* logger_;

    std::mutex cursor_mtx_;
    size_t cursor_ = 0;

    std::mutex rng_mtx_;
    std::mt19937 rng_;
};

} // namespace streamgate

#endif // STREAMGATE_LOAD_BALANCER_H
