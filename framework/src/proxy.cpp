#include <streamgate/proxy.h>
#include <streamgate/exceptions.h>
#include <streamgate/gateway.h>
#include <streamgate/logger.h>
#include <streamgate/route_table.h>
#include <streamgate/util/string.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <set>

namespace streamgate {

namespace {

    constexpr std::array<std::string_view, 8> kHopByHop = {
        "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
        "te", "trailer", "transfer-encoding", "upgrade"
    };

    // Set by the gateway only; a caller-supplied copy is dropped.
    constexpr std::array<std::string_view, 8> kGatewayOwned = {
        "x-gateway-service", "x-request-id", "x-real-ip", "x-user-id", "x-user-email",
        "x-profile-id", "x-subscription-plan", "x-subscription-status"
    };

    template <size_t N>
    bool listed(const std::array<std::string_view, N>& names, std::string_view name) {
        return std::any_of(names.begin(), names.end(),
                           [&](std::string_view n) { return util::iequals(n, name); });
    }

    std::string join(const std::vector<std::string>& parts, std::string_view sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += sep;
            out += parts[i];
        }
        return out;
    }
}

ProxyService::ProxyService(GatewayContext& context) : context_(context) {}

Handler ProxyService::handler() {
    return [this](Request& req, Response& res) -> Async<void> {
        co_await handle(req, res);
    };
}

void ProxyService::check_access(const RouteConfig& route, const Request& req) {
    const bool needs_caller = route.requires_auth || route.requires_profile || route.requires_subscription;
    if (needs_caller && !req.caller) {
        // A rejected token reports why; no token at all asks for one.
        auto reason = req.get_opt<std::string>("auth_error");
        throw AuthenticationError(reason.value_or("Authentication token required"));
    }

    if (route.requires_profile && !req.caller->profile_id) {
        throw AuthorizationError("Profile selection required");
    }

    if (route.requires_subscription) {
        const auto& sub = req.caller->subscription;
        if (!sub || !sub->is_active()) {
            throw AuthorizationError("Active subscription required");
        }
        const auto& plans = route.allowed_plans;
        if (!plans.empty() && std::find(plans.begin(), plans.end(), sub->plan_type) == plans.end()) {
            throw AuthorizationError(join(plans, " or ") + " subscription required");
        }
    }
}

UpstreamRequest ProxyService::build_upstream(const RouteConfig& route, const Request& req) const {
    UpstreamRequest out;
    out.method = req.method;
    out.target = RouteTable::apply_rewrite(route, req.target);
    out.body = req.body;
    out.timeout = route.timeout.value_or(context_.config().load_balancer.request_timeout);

    auto removed = [&](std::string_view name) {
        return std::any_of(route.remove_headers.begin(), route.remove_headers.end(),
                           [&](const std::string& h) { return util::iequals(h, name); });
    };

    std::string forwarded_for;
    for (const auto& field : req.headers) {
        const std::string_view name = field.name_string();
        const std::string_view value = field.value();

        if (util::iequals(name, "x-forwarded-for")) {
            forwarded_for = std::string(value);
            continue;
        }
        if (listed(kHopByHop, name) || listed(kGatewayOwned, name) ||
            util::iequals(name, "host") || util::iequals(name, "content-length") || removed(name)) {
            continue;
        }
        out.headers.emplace_back(std::string(name), std::string(value));
    }

    out.headers.emplace_back("X-Gateway-Service", route.service);
    out.headers.emplace_back("X-Request-ID", req.request_id);
    out.headers.emplace_back("X-Forwarded-For",
                             forwarded_for.empty() ? req.client_ip : forwarded_for + ", " + req.client_ip);
    out.headers.emplace_back("X-Real-IP", req.client_ip);

    if (req.caller) {
        out.headers.emplace_back("X-User-ID", req.caller->id);
        out.headers.emplace_back("X-User-Email", req.caller->email);
        if (req.caller->profile_id) {
            out.headers.emplace_back("X-Profile-ID", *req.caller->profile_id);
        }
        if (req.caller->subscription) {
            out.headers.emplace_back("X-Subscription-Plan", req.caller->subscription->plan_type);
            out.headers.emplace_back("X-Subscription-Status", req.caller->subscription->status);
        }
    }

    for (const auto& [name, value] : route.extra_headers) {
        out.headers.emplace_back(name, value);
    }
    return out;
}

Async<void> ProxyService::handle(Request& req, Response& res) {
    const auto start = std::chrono::steady_clock::now();

    RequestMetric metric;
    metric.timestamp = std::chrono::system_clock::now();
    metric.method = req.method;
    metric.path = req.path;
    if (req.caller) {
        metric.user_id = req.caller->id;
    }

    std::exception_ptr failure;
    try {
        co_await dispatch(req, res, metric.service);
        metric.status_code = res.get_status();
    } catch (const HttpError& e) {
        metric.status_code = e.status();
        failure = std::current_exception();
    } catch (const std::exception&) {
        metric.status_code = 500;
        failure = std::current_exception();
    }

    metric.response_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    context_.metrics().record(std::move(metric));

    if (failure) {
        std::rethrow_exception(failure);
    }
}

Async<void> ProxyService::dispatch(Request& req, Response& res, std::string& service) {
    auto resolved = context_.routes().resolve(req.path);
    if (!resolved) {
        throw NotFoundError("Route " + req.method + " " + req.path);
    }
    const RouteConfig& route = *resolved->route;
    service = route.service;
    req.params = std::move(resolved->params);

    check_access(route, req);

    std::optional<RateLimitDecision> decision;
    if (!route.rate_limit_policy.empty()) {
        auto& limiter = context_.rate_limiter();
        decision = co_await limiter.check_request(route.rate_limit_policy, req);
        RateLimiter::apply_headers(res, *decision);
        if (!decision->allowed) {
            throw RateLimitError(limiter.policy(route.rate_limit_policy).message,
                                 decision->limit, decision->remaining, decision->reset_time);
        }
    }

    ServicePool* pool = context_.pool(route.service);
    if (!pool) {
        throw ServiceUnavailableError(route.service);
    }

    auto upstream = build_upstream(route, req);
    const std::string target = upstream.target;

    UpstreamResponse upstream_res;
    try {
        upstream_res = co_await forward(route, *pool, std::move(upstream));
    } catch (const BreakerOpenError& e) {
        context_.logger().log_proxy_error(route.service, target, e.what());
        throw ServiceUnavailableError(route.service);
    } catch (const NoHealthyEndpointError& e) {
        context_.logger().log_proxy_error(route.service, target, e.what());
        throw ServiceUnavailableError(route.service);
    } catch (const TransportError& e) {
        context_.logger().log_proxy_error(route.service, target, e.what());
        switch (e.kind()) {
            case TransportError::Kind::Timeout:
                throw GatewayTimeoutError(route.service);
            case TransportError::Kind::ConnectionRefused:
            case TransportError::Kind::DnsFailure:
                throw ServiceUnavailableError(route.service);
            default:
                throw BadGatewayError(route.service);
        }
    }

    res.status(upstream_res.status);
    std::set<std::string, CaseInsensitiveCompare> seen;
    for (const auto& [name, value] : upstream_res.headers) {
        if (listed(kHopByHop, name) || util::iequals(name, "content-length")) {
            continue;
        }
        if (seen.insert(name).second) {
            res.header(name, value);
        } else {
            res.add_header(name, value);
        }
    }
    res.header("X-Proxied-By", "StreamGate");
    res.header("X-Service-Name", route.service);
    res.send(std::move(upstream_res.body));

    if (decision && upstream_res.status < 400 &&
        context_.rate_limiter().policy(route.rate_limit_policy).skip_successful_requests) {
        co_await context_.rate_limiter().refund(*decision);
    }
}

Async<UpstreamResponse> ProxyService::forward(const RouteConfig& route, ServicePool& pool, UpstreamRequest request) {
    std::function<Async<UpstreamResponse>()> call;
    if (route.load_balancer) {
        call = [&pool, request, retries = route.retry_attempts]() -> Async<UpstreamResponse> {
            co_return co_await pool.balancer.execute(request, retries);
        };
    } else {
        call = [this, &pool, request]() -> Async<UpstreamResponse> {
            co_return co_await send_direct(pool, request);
        };
    }

    if (route.circuit_breaker) {
        co_return co_await context_.breaker(route.service).execute<UpstreamResponse>(std::move(call));
    }
    co_return co_await call();
}

Async<UpstreamResponse> ProxyService::send_direct(ServicePool& pool, UpstreamRequest request) {
    auto endpoints = pool.registry.endpoints();
    if (endpoints.empty()) {
        throw NoHealthyEndpointError(pool.registry.service_name());
    }
    const auto& endpoint = endpoints.front();

    auto res = co_await context_.client().send(endpoint->url, std::move(request));
    if (res.status >= 500) {
        throw TransportError(TransportError::Kind::UpstreamStatus,
                             "Upstream " + endpoint->url + " returned " + std::to_string(res.status),
                             res.status);
    }
    co_return res;
}

} // namespace streamgate
