#ifndef STREAMGATE_METRICS_H
#define STREAMGATE_METRICS_H

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <streamgate/config.h>

namespace streamgate {

/** @brief One completed request. Immutable once recorded. */
struct RequestMetric {
    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::string path;
    int status_code = 0;
    long long response_time_ms = 0;
    std::string service;
    std::string user_id;
};

struct ServiceBreakdown {
    long count = 0;
    long errors = 0;
    double average_response_time = 0.0;
};

struct AggregatedMetrics {
    std::chrono::milliseconds window{0};
    long total_requests = 0;
    long error_count = 0;
    double error_rate = 0.0;
    double average_response_time = 0.0;
    long long median_response_time = 0;
    long long p95_response_time = 0;
    long long p99_response_time = 0;
    // Keyed by class, "2xx", "4xx", ...
    std::map<std::string, long> status_codes;
    std::map<std::string, ServiceBreakdown> services;
};

struct ServiceMetrics {
    std::string service;
    long total_requests = 0;
    long errors = 0;
    double error_rate = 0.0;
    double average_response_time = 0.0;
    long long p50_response_time = 0;
    long long p95_response_time = 0;
    long long p99_response_time = 0;
    std::map<int, long> status_codes;
    std::optional<std::chrono::system_clock::time_point> last_request;
    double uptime = 100.0;
};

struct SlowEndpoint {
    std::string endpoint;
    long count = 0;
    long long average_response_time = 0;
    long long max_response_time = 0;
};

struct ErrorDistribution {
    long total_errors = 0;
    std::map<int, long> by_status;
    std::vector<std::pair<std::string, long>> by_path;
    std::map<std::string, long> by_service;
};

struct TrafficBucket {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
    long requests = 0;
    long errors = 0;
    double average_response_time = 0.0;
};

struct UserActivity {
    long active_users = 0;
    long total_requests = 0;
    std::vector<std::pair<std::string, long>> top_users;
};

struct HealthScore {
    int score = 0;
    double error_rate = 0.0;
    long long p95_response_time = 0;
    long throughput = 0;
    double availability = 100.0;
};

/**
 * @brief Capacity- and time-bounded request history with on-demand aggregates.
 *
 * record() only appends to a staging buffer under its own lock, so callers on
 * the request path never wait for compaction or for a reader. Readers and
 * compact() fold the staging buffer into the history first.
 */
class MetricsAggregator {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    explicit MetricsAggregator(MetricsConfig config = {}, TimeSource now = {});

    void record(RequestMetric metric);

    /** @brief Drops entries past retention and trims to capacity, oldest first. */
    void compact();
    size_t size();

    AggregatedMetrics aggregated(std::optional<std::chrono::milliseconds> window = std::nullopt);
    std::optional<ServiceMetrics> service_metrics(const std::string& service);
    std::vector<SlowEndpoint> slow_endpoints(size_t limit = 10);
    ErrorDistribution error_distribution();
    std::vector<TrafficBucket> traffic_patterns();
    UserActivity user_activity();
    HealthScore health_score();

    /** @brief Text exposition format of the windowed aggregate. */
    std::string export_prometheus();

    const MetricsConfig& config() const { return config_; }

    /**
     * @brief Value at index ceil(p/100 * n) - 1 of the ascending @p sorted
     * sample, clamped to the valid range; 0 for an empty sample.
     */
    static long long percentile(const std::vector<long long>& sorted, double p);

    /**
     * @brief Weighted 0-100 score: error rate 30, p95 latency 25, throughput 20,
     * availability 25. Each factor is first mapped to a 0-100 impact.
     */
    static HealthScore score_from(double error_rate, long long p95_ms, long request_count, double availability);

    /** @brief Replaces numeric, UUID and 24-hex object-id segments by ":id" and drops the query. */
    static std::string normalize_path(std::string_view path);

private:
    void drain_locked();
    void evict_locked();
    std::vector<RequestMetric> since(std::chrono::system_clock::time_point cutoff);

    MetricsConfig config_;
    TimeSource now_;

    std::mutex incoming_mtx_;
    std::vector<RequestMetric> incoming_;

    std::mutex history_mtx_;
    std::deque<RequestMetric> history_;
};

} // namespace streamgate

#endif // STREAMGATE_METRICS_H
