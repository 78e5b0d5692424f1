#include <streamgate/load_balancer.h>
#include <streamgate/exceptions.h>
#include <streamgate/logger.h>
#include <algorithm>
#include <exception>

namespace streamgate {

namespace {

    // Holds one slot of an endpoint's connection counter for the duration of a call.
    class ConnectionGuard {
        Endpoint& endpoint_;
    public:
        explicit ConnectionGuard(Endpoint& endpoint) : endpoint_(endpoint) {
            endpoint_.current_connections.fetch_add(1, std::memory_order_acq_rel);
        }
        ~ConnectionGuard() {
            endpoint_.current_connections.fetch_sub(1, std::memory_order_acq_rel);
        }
        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    };

}

LoadBalancer::LoadBalancer(InstanceRegistry& registry, HttpClient& client, LoadBalancerConfig config,
                           Logger* logger, std::uint32_t seed)
    : registry_(registry), client_(client), config_(std::move(config)), logger_(logger), rng_(seed) {}

std::shared_ptr<Endpoint> LoadBalancer::select_next() {
    return select_from(registry_.healthy());
}

std::shared_ptr<Endpoint> LoadBalancer::select_from(const std::vector<std::shared_ptr<Endpoint>>& candidates) {
    if (candidates.empty()) {
        return nullptr;
    }

    switch (config_.strategy) {
        case BalancingStrategy::RoundRobin: {
            std::lock_guard<std::mutex> lock(cursor_mtx_);
            const size_t idx = cursor_ % candidates.size();
            cursor_ = (idx + 1) % candidates.size();
            return candidates[idx];
        }

        case BalancingStrategy::LeastConnections: {
            auto best = candidates.front();
            int best_count = best->current_connections.load(std::memory_order_acquire);
            for (size_t i = 1; i < candidates.size(); ++i) {
                int count = candidates[i]->current_connections.load(std::memory_order_acquire);
                if (count < best_count) {
                    best = candidates[i];
                    best_count = count;
                }
            }
            return best;
        }

        case BalancingStrategy::Weighted: {
            std::vector<int> weights;
            weights.reserve(candidates.size());
            double total = 0;
            for (const auto& ep : candidates) {
                weights.push_back(ep->weight.load(std::memory_order_acquire));
                total += weights.back();
            }

            double draw = 0;
            {
                std::lock_guard<std::mutex> lock(rng_mtx_);
                draw = std::uniform_real_distribution<double>(0.0, total)(rng_);
            }
            for (size_t i = 0; i < candidates.size(); ++i) {
                draw -= weights[i];
                if (draw <= 0) {
                    return candidates[i];
                }
            }
            return candidates.front();
        }

        case BalancingStrategy::Random: {
            std::lock_guard<std::mutex> lock(rng_mtx_);
            std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
            return candidates[dist(rng_)];
        }
    }
    return candidates.front();
}

std::shared_ptr<Endpoint> LoadBalancer::select_for_attempt(const std::vector<std::string>& tried) {
    auto healthy = registry_.healthy();
    if (healthy.empty()) {
        return nullptr;
    }

    std::vector<std::shared_ptr<Endpoint>> fresh;
    for (const auto& ep : healthy) {
        if (std::find(tried.begin(), tried.end(), ep->id) == tried.end()) {
            fresh.push_back(ep);
        }
    }

    // Every healthy endpoint was already tried: reuse one rather than give up.
    return select_from(fresh.empty() ? healthy : fresh);
}

Async<UpstreamResponse> LoadBalancer::execute(UpstreamRequest request, std::optional<int> max_retries) {
    const int retries = std::max(0, max_retries.value_or(config_.retry_attempts));
    std::vector<std::string> tried;
    std::exception_ptr last_error;

    for (int attempt = 0; attempt <= retries; ++attempt) {
        auto endpoint = select_for_attempt(tried);
        if (!endpoint) {
            // Failures earlier in this call emptied the pool: report the last of them.
            if (last_error) {
                std::rethrow_exception(last_error);
            }
            throw NoHealthyEndpointError(registry_.service_name());
        }
        tried.push_back(endpoint->id);

        try {
            UpstreamResponse res;
            {
                ConnectionGuard guard(*endpoint);
                res = co_await client_.send(endpoint->url, request);
            }

            if (res.status >= 500) {
                throw TransportError(TransportError::Kind::UpstreamStatus,
                                     "Upstream " + endpoint->url + " returned " + std::to_string(res.status),
                                     res.status);
            }
            co_return res;
        } catch (const TransportError& e) {
            last_error = std::current_exception();
            if (e.is_connection_class()) {
                registry_.mark_unhealthy(endpoint, e.what());
                if (logger_) {
                    logger_->warn("endpoint " + endpoint->url + " of " + registry_.service_name() +
                                  " marked unhealthy: " + e.what());
                }
            }
        }

        if (attempt == retries) {
            break;
        }

        if (!registry_.healthy().empty()) {
            co_await delay(config_.retry_delay * (1LL << std::min(attempt, 20)));
        }
    }

    std::rethrow_exception(last_error);
}

LoadBalancerStats LoadBalancer::stats() const {
    LoadBalancerStats s;
    s.service_name = registry_.service_name();
    s.strategy = config_.strategy;

    auto snapshot = registry_.snapshot();
    s.total_instances = snapshot.size();

    double latency_sum = 0;
    for (const auto& ep : snapshot) {
        if (ep.health.status == HealthStatus::Healthy) {
            s.healthy_instances++;
        }
        s.total_connections += ep.current_connections;
        latency_sum += static_cast<double>(ep.health.response_time.count());
    }
    if (!snapshot.empty()) {
        s.average_response_time = latency_sum / static_cast<double>(snapshot.size());
    }
    s.last_health_check = registry_.last_health_check();
    return s;
}

} // namespace streamgate
