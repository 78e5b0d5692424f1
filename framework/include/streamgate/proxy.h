#ifndef STREAMGATE_PROXY_H
#define STREAMGATE_PROXY_H

#include <string>
#include <streamgate/client.h>
#include <streamgate/config.h>
#include <streamgate/router.h>

namespace streamgate {

class GatewayContext;
struct ServicePool;

/**
 * @brief Forwards a caller request to the backend its route names.
 *
 * Per request: resolve the route, apply the identity guards and the route's
 * quota, rewrite the target, then call through the service's circuit breaker
 * and load balancer. Upstream failures are mapped onto 502/503/504 errors.
 * Exactly one RequestMetric is recorded per request, whatever the outcome.
 */
class ProxyService {
public:
    explicit ProxyService(GatewayContext& context);

    Async<void> handle(Request& req, Response& res);

    /** @brief The proxy as an App fallback handler. */
    Handler handler();

    /**
     * @brief Route guards.
     * @throws AuthenticationError when the route needs a caller and there is none.
     * @throws AuthorizationError for a missing profile or an inactive or unlisted plan.
     */
    static void check_access(const RouteConfig& route, const Request& req);

    /** @brief Outbound request: rewritten target, filtered headers plus identity context. */
    UpstreamRequest build_upstream(const RouteConfig& route, const Request& req) const;

private:
    Async<void> dispatch(Request& req, Response& res, std::string& service);
    Async<UpstreamResponse> forward(const RouteConfig& route, ServicePool& pool, UpstreamRequest request);
    Async<UpstreamResponse> send_direct(ServicePool& pool, UpstreamRequest request);

    GatewayContext& context_;
};

} // namespace streamgate

#endif // STREAMGATE_PROXY_H
