#ifndef STREAMGATE_HEALTH_PROBER_H
#define STREAMGATE_HEALTH_PROBER_H

#include <atomic>
#include <memory>
#include <optional>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <streamgate/async.h>
#include <streamgate/client.h>
#include <streamgate/config.h>
#include <streamgate/instance_registry.h>

namespace streamgate {

class Logger;

/**
 * @brief Periodically probes every endpoint of one pool and records the result
 * in its registry.
 *
 * Each tick fans out one probe per endpoint and waits for all of them before
 * sleeping for the configured interval. The loop and its timer live on a strand
 * of the start executor, so stop() may be called from any thread. The prober
 * must outlive the executor it was started on.
 */
class HealthProber {
public:
    HealthProber(InstanceRegistry& registry, HttpClient& client, HealthCheckConfig config,
                 Logger* logger = nullptr);

    /**
     * @brief GET {url}{path}; 2xx within the timeout is healthy, anything else
     * unhealthy with the reason kept in Health::error.
     */
    Async<Health> probe(std::shared_ptr<Endpoint> endpoint);

    /** @brief Probes all registered endpoints concurrently. */
    Async<void> probe_all();

    void start(const boost::asio::any_io_executor& executor);
    void stop();

    bool running() const { return running_; }
    const HealthCheckConfig& config() const { return config_; }

private:
    Async<void> run();

    InstanceRegistry& registry_;
    HttpClient& client_;
    HealthCheckConfig config_;
    Logger* logger_;

    std::atomic<bool> running_{false};
    std::optional<boost::asio::strand<boost::asio::any_io_executor>> strand_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

} // namespace streamgate

#endif // STREAMGATE_HEALTH_PROBER_H
