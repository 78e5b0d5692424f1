#ifndef STREAMGATE_INSTANCE_REGISTRY_H
#define STREAMGATE_INSTANCE_REGISTRY_H

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace streamgate {

enum class HealthStatus {
    Unknown,
    Healthy,
    Unhealthy
};

std::string_view to_string(HealthStatus status);

struct Health {
    HealthStatus status = HealthStatus::Unknown;
    std::chrono::milliseconds response_time{0};
    std::optional<std::chrono::system_clock::time_point> last_checked;
    std::optional<std::string> error;
};

/**
 * @brief One network-addressable instance of a backend service.
 *
 * Health is guarded by the owning registry; weight and the connection
 * counter are atomic so the load balancer can read them without the lock.
 */
struct Endpoint {
    Endpoint(std::string id, std::string url, int weight)
        : id(std::move(id)), url(std::move(url)), weight(weight) {}

    const std::string id;
    const std::string url;
    std::atomic<int> weight;
    Health health;
    std::atomic<int> current_connections{0};
};

/** @brief Copy of an endpoint's state at one instant. */
struct EndpointSnapshot {
    std::string id;
    std::string url;
    int weight = 1;
    Health health;
    int current_connections = 0;
};

struct HealthSummary {
    size_t total = 0;
    size_t healthy = 0;
    size_t unhealthy = 0;
    size_t unknown = 0;
    double healthy_percentage = 0.0;
};

/**
 * @brief Endpoint list of one backend-service pool plus live health state.
 */
class InstanceRegistry {
public:
    explicit InstanceRegistry(std::string service_name);

    const std::string& service_name() const { return service_name_; }

    /**
     * @brief Registers a new endpoint with Unknown health.
     * @throws ValidationError when weight < 1 or the url is already registered.
     */
    std::shared_ptr<Endpoint> add(const std::string& url, int weight = 1);

    /** @return false if no endpoint had that url. */
    bool remove(const std::string& url);

    /** @throws ValidationError when weight < 1, NotFoundError for an unknown url. */
    void update_weight(const std::string& url, int weight);

    std::vector<std::shared_ptr<Endpoint>> endpoints() const;
    std::vector<std::shared_ptr<Endpoint>> healthy() const;
    std::shared_ptr<Endpoint> find(const std::string& url) const;
    std::vector<EndpointSnapshot> snapshot() const;
    size_t size() const;

    void set_health(const std::shared_ptr<Endpoint>& endpoint, Health health);
    void mark_unhealthy(const std::shared_ptr<Endpoint>& endpoint, std::string error);

    HealthSummary health_summary() const;
    std::optional<std::chrono::system_clock::time_point> last_health_check() const;

private:
    const std::string service_name_;
    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<Endpoint>> endpoints_;
    std::atomic<unsigned long> next_id_{0};
};

} // namespace streamgate

#endif // STREAMGATE_INSTANCE_REGISTRY_H
