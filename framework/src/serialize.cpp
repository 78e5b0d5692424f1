#include <streamgate/serialize.h>
#include <streamgate/envelope.h>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <cmath>
#include <type_traits>

namespace json = boost::json;

namespace streamgate {

namespace {

    json::value time_or_null(const std::optional<std::chrono::system_clock::time_point>& tp) {
        if (!tp) return nullptr;
        return json::string(iso_timestamp(*tp));
    }

    double round2(double v) {
        return std::round(v * 100.0) / 100.0;
    }

    template <typename Map>
    json::object counts(const Map& m) {
        json::object out;
        for (const auto& [key, count] : m) {
            if constexpr (std::is_integral_v<std::decay_t<decltype(key)>>) {
                out[std::to_string(key)] = count;
            } else {
                out[key] = count;
            }
        }
        return out;
    }

    json::array ranked(const std::vector<std::pair<std::string, long>>& entries, std::string_view key_name) {
        json::array out;
        for (const auto& [key, count] : entries) {
            out.push_back(json::object{{key_name, key}, {"count", count}});
        }
        return out;
    }
}

void tag_invoke(json::value_from_tag, json::value& jv, const Health& h) {
    jv = json::object{
        {"status", to_string(h.status)},
        {"responseTime", h.response_time.count()},
        {"lastChecked", time_or_null(h.last_checked)},
        {"error", h.error ? json::value(*h.error) : json::value(nullptr)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const EndpointSnapshot& ep) {
    jv = json::object{
        {"id", ep.id},
        {"url", ep.url},
        {"weight", ep.weight},
        {"currentConnections", ep.current_connections},
        {"health", json::value_from(ep.health)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const HealthSummary& s) {
    jv = json::object{
        {"total", s.total},
        {"healthy", s.healthy},
        {"unhealthy", s.unhealthy},
        {"unknown", s.unknown},
        {"healthyPercentage", round2(s.healthy_percentage)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const LoadBalancerStats& s) {
    jv = json::object{
        {"serviceName", s.service_name},
        {"strategy", to_string(s.strategy)},
        {"totalInstances", s.total_instances},
        {"healthyInstances", s.healthy_instances},
        {"totalConnections", s.total_connections},
        {"averageResponseTime", round2(s.average_response_time)},
        {"lastHealthCheck", time_or_null(s.last_health_check)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const CircuitBreakerSnapshot& s) {
    jv = json::object{
        {"name", s.name},
        {"state", to_string(s.state)},
        {"failureCount", s.failure_count},
        {"successCount", s.success_count},
        {"lastFailureTime", time_or_null(s.last_failure_time)},
        {"retryInMs", s.retry_in ? json::value(s.retry_in->count()) : json::value(nullptr)},
        {"uptime", round2(s.uptime)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const ServiceBreakdown& b) {
    jv = json::object{
        {"count", b.count},
        {"errors", b.errors},
        {"averageResponseTime", std::llround(b.average_response_time)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const AggregatedMetrics& m) {
    json::object services;
    for (const auto& [name, breakdown] : m.services) {
        services[name] = json::value_from(breakdown);
    }

    jv = json::object{
        {"windowMs", m.window.count()},
        {"requestCount", m.total_requests},
        {"errorCount", m.error_count},
        {"errorRate", round2(m.error_rate)},
        {"responseTime", json::object{
            {"average", std::llround(m.average_response_time)},
            {"p50", m.median_response_time},
            {"p95", m.p95_response_time},
            {"p99", m.p99_response_time},
        }},
        {"statusCodes", counts(m.status_codes)},
        {"services", std::move(services)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const ServiceMetrics& m) {
    jv = json::object{
        {"serviceName", m.service},
        {"requestCount", m.total_requests},
        {"errorCount", m.errors},
        {"errorRate", round2(m.error_rate)},
        {"averageResponseTime", round2(m.average_response_time)},
        {"p50ResponseTime", m.p50_response_time},
        {"p95ResponseTime", m.p95_response_time},
        {"p99ResponseTime", m.p99_response_time},
        {"statusCodes", counts(m.status_codes)},
        {"lastRequestTime", time_or_null(m.last_request)},
        {"uptime", round2(m.uptime)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const SlowEndpoint& e) {
    jv = json::object{
        {"endpoint", e.endpoint},
        {"count", e.count},
        {"averageResponseTime", e.average_response_time},
        {"maxResponseTime", e.max_response_time},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const ErrorDistribution& d) {
    jv = json::object{
        {"total", d.total_errors},
        {"byStatus", counts(d.by_status)},
        {"byPath", ranked(d.by_path, "path")},
        {"byService", counts(d.by_service)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const TrafficBucket& b) {
    jv = json::object{
        {"start", iso_timestamp(b.start)},
        {"end", iso_timestamp(b.end)},
        {"requests", b.requests},
        {"errors", b.errors},
        {"averageResponseTime", std::llround(b.average_response_time)},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const UserActivity& a) {
    jv = json::object{
        {"activeUsers", a.active_users},
        {"totalRequests", a.total_requests},
        {"topUsers", ranked(a.top_users, "userId")},
    };
}

void tag_invoke(json::value_from_tag, json::value& jv, const HealthScore& s) {
    jv = json::object{
        {"score", s.score},
        {"factors", json::object{
            {"errorRate", json::object{{"value", round2(s.error_rate)}, {"weight", 30}}},
            {"responseTime", json::object{{"value", s.p95_response_time}, {"weight", 25}}},
            {"throughput", json::object{{"value", s.throughput}, {"weight", 20}}},
            {"availability", json::object{{"value", round2(s.availability)}, {"weight", 25}}},
        }},
    };
}

} // namespace streamgate
