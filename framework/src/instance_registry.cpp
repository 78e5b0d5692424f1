#include <streamgate/instance_registry.h>
#include <streamgate/exceptions.h>
#include <algorithm>

namespace streamgate {

std::string_view to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Unknown: return "unknown";
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

InstanceRegistry::InstanceRegistry(std::string service_name)
    : service_name_(std::move(service_name)) {}

std::shared_ptr<Endpoint> InstanceRegistry::add(const std::string& url, int weight) {
    if (weight < 1) {
        throw ValidationError("Endpoint weight must be at least 1");
    }
    if (url.empty()) {
        throw ValidationError("Endpoint url must not be empty");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    auto existing = std::find_if(endpoints_.begin(), endpoints_.end(),
                                 [&](const auto& ep) { return ep->url == url; });
    if (existing != endpoints_.end()) {
        throw ValidationError("Endpoint already registered for " + service_name_ + ": " + url);
    }

    // Ids are never reused, even after removal.
    auto id = service_name_ + "-" + std::to_string(next_id_++);
    auto endpoint = std::make_shared<Endpoint>(std::move(id), url, weight);
    endpoints_.push_back(endpoint);
    return endpoint;
}

bool InstanceRegistry::remove(const std::string& url) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [&](const auto& ep) { return ep->url == url; });
    if (it == endpoints_.end()) {
        return false;
    }
    endpoints_.erase(it);
    return true;
}

void InstanceRegistry::update_weight(const std::string& url, int weight) {
    if (weight < 1) {
        throw ValidationError("Endpoint weight must be at least 1");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(endpoints_.begin(), endpoints_.end(),
                           [&](const auto& ep) { return ep->url == url; });
    if (it == endpoints_.end()) {
        throw NotFoundError("Endpoint " + url);
    }
    (*it)->weight = weight;
}

std::vector<std::shared_ptr<Endpoint>> InstanceRegistry::endpoints() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return endpoints_;
}

std::vector<std::shared_ptr<Endpoint>> InstanceRegistry::healthy() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::shared_ptr<Endpoint>> out;
    for (const auto& ep : endpoints_) {
        if (ep->health.status == HealthStatus::Healthy) {
            out.push_back(ep);
        }
    }
    return out;
}

std::shared_ptr<Endpoint> InstanceRegistry::find(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& ep : endpoints_) {
        if (ep->url == url) return ep;
    }
    return nullptr;
}

std::vector<EndpointSnapshot> InstanceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<EndpointSnapshot> out;
    out.reserve(endpoints_.size());
    for (const auto& ep : endpoints_) {
        out.push_back({ep->id, ep->url, ep->weight.load(), ep->health, ep->current_connections.load()});
    }
    return out;
}

size_t InstanceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return endpoints_.size();
}

void InstanceRegistry::set_health(const std::shared_ptr<Endpoint>& endpoint, Health health) {
    std::lock_guard<std::mutex> lock(mtx_);
    endpoint->health = std::move(health);
}

void InstanceRegistry::mark_unhealthy(const std::shared_ptr<Endpoint>& endpoint, std::string error) {
    std::lock_guard<std::mutex> lock(mtx_);
    endpoint->health.status = HealthStatus::Unhealthy;
    endpoint->health.error = std::move(error);
    endpoint->health.last_checked = std::chrono::system_clock::now();
}

HealthSummary InstanceRegistry::health_summary() const {
    std::lock_guard<std::mutex> lock(mtx_);
    HealthSummary summary;
    summary.total = endpoints_.size();
    for (const auto& ep : endpoints_) {
        switch (ep->health.status) {
            case HealthStatus::Healthy: summary.healthy++; break;
            case HealthStatus::Unhealthy: summary.unhealthy++; break;
            case HealthStatus::Unknown: summary.unknown++; break;
        }
    }
    if (summary.total > 0) {
        summary.healthy_percentage = 100.0 * static_cast<double>(summary.healthy) / static_cast<double>(summary.total);
    }
    return summary;
}

std::optional<std::chrono::system_clock::time_point> InstanceRegistry::last_health_check() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::optional<std::chrono::system_clock::time_point> latest;
    for (const auto& ep : endpoints_) {
        if (ep->health.last_checked && (!latest || *ep->health.last_checked > *latest)) {
            latest = ep->health.last_checked;
        }
    }
    return latest;
}

} // namespace streamgate
