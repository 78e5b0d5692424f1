#include <streamgate/metrics.h>
#include <streamgate/util/string.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace streamgate {

namespace {

    constexpr size_t kDrainBatch = 256;
    constexpr auto kBucketWidth = std::chrono::minutes(5);
    constexpr int kBucketCount = 12;

    bool is_error(const RequestMetric& m) { return m.status_code >= 400; }

    std::string status_class(int status) {
        return std::to_string(status / 100) + "xx";
    }

    bool all_hex(std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); });
    }

    bool is_uuid(std::string_view s) {
        if (s.size() != 36) return false;
        for (size_t i = 0; i < s.size(); ++i) {
            const bool dash_slot = i == 8 || i == 13 || i == 18 || i == 23;
            if (dash_slot ? s[i] != '-' : !std::isxdigit(static_cast<unsigned char>(s[i]))) {
                return false;
            }
        }
        return true;
    }

    bool is_identifier(std::string_view s) {
        if (s.empty()) return false;
        if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) return true;
        if (s.size() == 24 && all_hex(s)) return true;
        return is_uuid(s);
    }

    double mean(const std::vector<long long>& values) {
        if (values.empty()) return 0.0;
        long double sum = 0;
        for (auto v : values) sum += v;
        return static_cast<double>(sum / values.size());
    }

    std::vector<std::pair<std::string, long>> top_n(const std::unordered_map<std::string, long>& counts, size_t n) {
        std::vector<std::pair<std::string, long>> out(counts.begin(), counts.end());
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
            return a.second != b.second ? a.second > b.second : a.first < b.first;
        });
        if (out.size() > n) out.resize(n);
        return out;
    }
}

MetricsAggregator::MetricsAggregator(MetricsConfig config, TimeSource now)
    : config_(std::move(config)),
      now_(now ? std::move(now) : TimeSource([] { return std::chrono::system_clock::now(); })) {}

void MetricsAggregator::record(RequestMetric metric) {
    metric.path = normalize_path(metric.path);

    bool drain = false;
    {
        std::lock_guard<std::mutex> lock(incoming_mtx_);
        incoming_.push_back(std::move(metric));
        drain = incoming_.size() >= kDrainBatch;
    }

    // Fold the staging buffer only if no reader or compaction holds the history.
    if (drain) {
        std::unique_lock<std::mutex> history_lock(history_mtx_, std::try_to_lock);
        if (history_lock.owns_lock()) {
            drain_locked();
        }
    }
}

void MetricsAggregator::drain_locked() {
    std::vector<RequestMetric> batch;
    {
        std::lock_guard<std::mutex> lock(incoming_mtx_);
        batch.swap(incoming_);
    }
    for (auto& m : batch) {
        history_.push_back(std::move(m));
    }
    evict_locked();
}

void MetricsAggregator::evict_locked() {
    while (history_.size() > config_.max_history) {
        history_.pop_front();
    }
}

void MetricsAggregator::compact() {
    std::lock_guard<std::mutex> lock(history_mtx_);
    drain_locked();

    const auto cutoff = now_() - config_.retention;
    std::erase_if(history_, [&](const RequestMetric& m) { return m.timestamp < cutoff; });
    evict_locked();
}

size_t MetricsAggregator::size() {
    std::lock_guard<std::mutex> lock(history_mtx_);
    drain_locked();
    return history_.size();
}

std::vector<RequestMetric> MetricsAggregator::since(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(history_mtx_);
    drain_locked();

    std::vector<RequestMetric> out;
    for (const auto& m : history_) {
        if (m.timestamp >= cutoff) {
            out.push_back(m);
        }
    }
    return out;
}

long long MetricsAggregator::percentile(const std::vector<long long>& sorted, double p) {
    if (sorted.empty()) return 0;
    const auto n = static_cast<long long>(sorted.size());
    auto index = static_cast<long long>(std::ceil(p / 100.0 * static_cast<double>(n))) - 1;
    index = std::clamp<long long>(index, 0, n - 1);
    return sorted[static_cast<size_t>(index)];
}

HealthScore MetricsAggregator::score_from(double error_rate, long long p95_ms, long request_count, double availability) {
    const double error_impact = std::max(0.0, 100.0 - error_rate * 2.0);
    const double latency_impact = std::max(0.0, 100.0 - std::min(static_cast<double>(p95_ms) / 50.0, 100.0));
    const double throughput_impact = std::min(100.0, static_cast<double>(request_count) / 10.0);
    const double availability_impact = std::clamp(availability, 0.0, 100.0);

    const double weighted = error_impact * 30.0 + latency_impact * 25.0 +
                            throughput_impact * 20.0 + availability_impact * 25.0;

    HealthScore score;
    score.score = static_cast<int>(std::lround(weighted / 100.0));
    score.error_rate = error_rate;
    score.p95_response_time = p95_ms;
    score.throughput = request_count;
    score.availability = availability;
    return score;
}

std::string MetricsAggregator::normalize_path(std::string_view path) {
    path = path.substr(0, path.find('?'));
    std::string out;
    for (auto seg : util::path_segments(path)) {
        out += '/';
        if (is_identifier(seg)) {
            out += ":id";
        } else {
            out.append(seg.data(), seg.size());
        }
    }
    return out.empty() ? "/" : out;
}

AggregatedMetrics MetricsAggregator::aggregated(std::optional<std::chrono::milliseconds> window) {
    AggregatedMetrics agg;
    agg.window = window.value_or(config_.window);
    auto metrics = since(now_() - agg.window);

    std::vector<long long> times;
    times.reserve(metrics.size());
    std::map<std::string, std::pair<ServiceBreakdown, long double>> per_service;

    for (const auto& m : metrics) {
        times.push_back(m.response_time_ms);
        if (is_error(m)) agg.error_count++;
        agg.status_codes[status_class(m.status_code)]++;

        if (!m.service.empty()) {
            auto& [breakdown, total_time] = per_service[m.service];
            breakdown.count++;
            if (is_error(m)) breakdown.errors++;
            total_time += m.response_time_ms;
        }
    }

    agg.total_requests = static_cast<long>(metrics.size());
    if (agg.total_requests > 0) {
        agg.error_rate = 100.0 * agg.error_count / agg.total_requests;
    }
    agg.average_response_time = mean(times);

    std::sort(times.begin(), times.end());
    agg.median_response_time = percentile(times, 50);
    agg.p95_response_time = percentile(times, 95);
    agg.p99_response_time = percentile(times, 99);

    for (auto& [name, entry] : per_service) {
        auto& [breakdown, total_time] = entry;
        breakdown.average_response_time = static_cast<double>(total_time / breakdown.count);
        agg.services[name] = breakdown;
    }
    return agg;
}

std::optional<ServiceMetrics> MetricsAggregator::service_metrics(const std::string& service) {
    auto metrics = since(now_() - config_.retention);

    ServiceMetrics sm;
    sm.service = service;
    std::vector<long long> times;
    long available = 0;

    for (const auto& m : metrics) {
        if (m.service != service) continue;
        sm.total_requests++;
        times.push_back(m.response_time_ms);
        sm.status_codes[m.status_code]++;
        if (is_error(m)) sm.errors++;
        if (m.status_code < 500) available++;
        if (!sm.last_request || m.timestamp > *sm.last_request) sm.last_request = m.timestamp;
    }

    if (sm.total_requests == 0) {
        return std::nullopt;
    }

    sm.error_rate = 100.0 * sm.errors / sm.total_requests;
    sm.average_response_time = mean(times);
    std::sort(times.begin(), times.end());
    sm.p50_response_time = percentile(times, 50);
    sm.p95_response_time = percentile(times, 95);
    sm.p99_response_time = percentile(times, 99);
    sm.uptime = 100.0 * available / sm.total_requests;
    return sm;
}

std::vector<SlowEndpoint> MetricsAggregator::slow_endpoints(size_t limit) {
    auto metrics = since(now_() - config_.window);

    struct Acc { long count = 0; long double total = 0; long long max = 0; };
    std::unordered_map<std::string, Acc> groups;
    for (const auto& m : metrics) {
        auto& acc = groups[m.method + " " + m.path];
        acc.count++;
        acc.total += m.response_time_ms;
        acc.max = std::max(acc.max, m.response_time_ms);
    }

    std::vector<SlowEndpoint> out;
    out.reserve(groups.size());
    for (const auto& [endpoint, acc] : groups) {
        out.push_back({endpoint, acc.count, std::llround(static_cast<double>(acc.total / acc.count)), acc.max});
    }
    std::sort(out.begin(), out.end(), [](const SlowEndpoint& a, const SlowEndpoint& b) {
        return a.average_response_time != b.average_response_time
            ? a.average_response_time > b.average_response_time
            : a.endpoint < b.endpoint;
    });
    if (out.size() > limit) out.resize(limit);
    return out;
}

ErrorDistribution MetricsAggregator::error_distribution() {
    auto metrics = since(now_() - config_.window);

    ErrorDistribution dist;
    std::unordered_map<std::string, long> by_path;
    for (const auto& m : metrics) {
        if (!is_error(m)) continue;
        dist.total_errors++;
        dist.by_status[m.status_code]++;
        by_path[m.method + " " + m.path]++;
        if (!m.service.empty()) dist.by_service[m.service]++;
    }
    dist.by_path = top_n(by_path, 10);
    return dist;
}

std::vector<TrafficBucket> MetricsAggregator::traffic_patterns() {
    const auto now = now_();
    auto metrics = since(now - kBucketWidth * kBucketCount);

    std::vector<TrafficBucket> buckets(kBucketCount);
    std::vector<long double> totals(kBucketCount, 0);
    for (int i = 0; i < kBucketCount; ++i) {
        // Oldest bucket first
        buckets[i].end = now - kBucketWidth * (kBucketCount - 1 - i);
        buckets[i].start = buckets[i].end - kBucketWidth;
    }

    for (const auto& m : metrics) {
        if (m.timestamp > now) continue;
        const auto age = (now - m.timestamp) / kBucketWidth;
        if (age >= kBucketCount) continue;
        const auto i = static_cast<size_t>(kBucketCount - 1 - age);
        buckets[i].requests++;
        if (is_error(m)) buckets[i].errors++;
        totals[i] += m.response_time_ms;
    }

    for (int i = 0; i < kBucketCount; ++i) {
        if (buckets[i].requests > 0) {
            buckets[i].average_response_time = static_cast<double>(totals[i] / buckets[i].requests);
        }
    }
    return buckets;
}

UserActivity MetricsAggregator::user_activity() {
    auto metrics = since(now_() - config_.window);

    UserActivity activity;
    std::unordered_map<std::string, long> per_user;
    for (const auto& m : metrics) {
        if (m.user_id.empty()) continue;
        per_user[m.user_id]++;
        activity.total_requests++;
    }
    activity.active_users = static_cast<long>(per_user.size());
    activity.top_users = top_n(per_user, 10);
    return activity;
}

HealthScore MetricsAggregator::health_score() {
    auto metrics = since(now_() - config_.window);

    std::vector<long long> times;
    times.reserve(metrics.size());
    long errors = 0;
    long available = 0;
    for (const auto& m : metrics) {
        times.push_back(m.response_time_ms);
        if (is_error(m)) errors++;
        if (m.status_code < 500) available++;
    }

    const long count = static_cast<long>(metrics.size());
    const double error_rate = count > 0 ? 100.0 * errors / count : 0.0;
    const double availability = count > 0 ? 100.0 * available / count : 100.0;

    std::sort(times.begin(), times.end());
    return score_from(error_rate, percentile(times, 95), count, availability);
}

std::string MetricsAggregator::export_prometheus() {
    auto agg = aggregated();
    auto score = health_score();

    std::ostringstream out;
    out << "# HELP streamgate_requests_total Requests observed in the metrics window\n"
        << "# TYPE streamgate_requests_total gauge\n"
        << "streamgate_requests_total " << agg.total_requests << "\n"
        << "# HELP streamgate_errors_total Requests with status >= 400 in the metrics window\n"
        << "# TYPE streamgate_errors_total gauge\n"
        << "streamgate_errors_total " << agg.error_count << "\n"
        << "# HELP streamgate_response_time_ms Response time in milliseconds\n"
        << "# TYPE streamgate_response_time_ms summary\n"
        << "streamgate_response_time_ms{quantile=\"0.5\"} " << agg.median_response_time << "\n"
        << "streamgate_response_time_ms{quantile=\"0.95\"} " << agg.p95_response_time << "\n"
        << "streamgate_response_time_ms{quantile=\"0.99\"} " << agg.p99_response_time << "\n"
        << "# HELP streamgate_requests_by_status Requests per status class\n"
        << "# TYPE streamgate_requests_by_status gauge\n";
    for (const auto& [cls, count] : agg.status_codes) {
        out << "streamgate_requests_by_status{class=\"" << cls << "\"} " << count << "\n";
    }

    out << "# HELP streamgate_service_requests_total Requests per backend service\n"
        << "# TYPE streamgate_service_requests_total gauge\n";
    for (const auto& [name, svc] : agg.services) {
        out << "streamgate_service_requests_total{service=\"" << name << "\"} " << svc.count << "\n";
    }
    out << "# HELP streamgate_service_errors_total Errors per backend service\n"
        << "# TYPE streamgate_service_errors_total gauge\n";
    for (const auto& [name, svc] : agg.services) {
        out << "streamgate_service_errors_total{service=\"" << name << "\"} " << svc.errors << "\n";
    }
    out << "# HELP streamgate_service_response_time_ms Mean response time per backend service\n"
        << "# TYPE streamgate_service_response_time_ms gauge\n";
    for (const auto& [name, svc] : agg.services) {
        out << "streamgate_service_response_time_ms{service=\"" << name << "\"} "
            << std::llround(svc.average_response_time) << "\n";
    }

    out << "# HELP streamgate_health_score Composite health score (0-100)\n"
        << "# TYPE streamgate_health_score gauge\n"
        << "streamgate_health_score " << score.score << "\n";
    return out.str();
}

} // namespace streamgate
