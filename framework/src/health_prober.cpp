#include <streamgate/health_prober.h>
#include <streamgate/exceptions.h>
#include <streamgate/logger.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <vector>

namespace net = boost::asio;

namespace streamgate {

HealthProber::HealthProber(InstanceRegistry& registry, HttpClient& client, HealthCheckConfig config,
                           Logger* logger)
    : registry_(registry), client_(client), config_(std::move(config)), logger_(logger) {}

Async<Health> HealthProber::probe(std::shared_ptr<Endpoint> endpoint) {
    const auto start = std::chrono::steady_clock::now();
    Health health;
    health.last_checked = std::chrono::system_clock::now();

    UpstreamRequest req;
    req.method = "GET";
    req.target = config_.path;
    req.timeout = config_.timeout;

    try {
        auto res = co_await client_.send(endpoint->url, std::move(req));
        health.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (res.status < 200 || res.status >= 300) {
            health.status = HealthStatus::Unhealthy;
            health.error = "HTTP " + std::to_string(res.status);
        } else if (health.response_time > config_.timeout) {
            health.status = HealthStatus::Unhealthy;
            health.error = "Health check exceeded " + std::to_string(config_.timeout.count()) + "ms";
        } else {
            health.status = HealthStatus::Healthy;
        }
    } catch (const std::exception& e) {
        health.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        health.status = HealthStatus::Unhealthy;
        health.error = e.what();
    }

    registry_.set_health(endpoint, health);

    if (logger_) {
        logger_->log_service_health(registry_.service_name(), endpoint->url,
                                    health.status == HealthStatus::Healthy,
                                    health.response_time.count(), health.error.value_or(""));
    }
    co_return health;
}

Async<void> HealthProber::probe_all() {
    auto endpoints = registry_.endpoints();
    if (endpoints.empty()) {
        co_return;
    }

    auto executor = co_await net::this_coro::executor;

    using ProbeOp = decltype(net::co_spawn(executor, probe(endpoints.front()), net::deferred));
    std::vector<ProbeOp> ops;
    ops.reserve(endpoints.size());
    for (const auto& ep : endpoints) {
        ops.push_back(net::co_spawn(executor, probe(ep), net::deferred));
    }

    // probe() records failures itself, so every slot completes without an exception.
    co_await net::experimental::make_parallel_group(std::move(ops))
        .async_wait(net::experimental::wait_for_all(), net::use_awaitable);
}

void HealthProber::start(const boost::asio::any_io_executor& executor) {
    if (running_.exchange(true)) {
        return;
    }
    strand_.emplace(net::make_strand(executor));
    timer_ = std::make_unique<net::steady_timer>(*strand_);
    net::co_spawn(*strand_, run(), net::detached);
}

void HealthProber::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (strand_ && timer_) {
        net::post(*strand_, [this] { timer_->cancel(); });
    }
}

Async<void> HealthProber::run() {
    while (running_) {
        co_await probe_all();
        if (!running_) break;

        timer_->expires_after(config_.interval);
        auto [ec] = co_await timer_->async_wait(net::as_tuple(net::use_awaitable));
        if (ec == net::error::operation_aborted) {
            break;
        }
    }
}

} // namespace streamgate
