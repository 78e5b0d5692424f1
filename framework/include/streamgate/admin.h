#ifndef STREAMGATE_ADMIN_H
#define STREAMGATE_ADMIN_H

#include <string>
#include <boost/json/object.hpp>

namespace streamgate {
class App;
class GatewayContext;
}

namespace streamgate::admin {

    /**
     * @brief Gateway-local endpoints: GET /, /health, /ping and /health/:service.
     * Health answers 503 while any service has no healthy endpoint.
     */
    void register_gateway_routes(App& app, GatewayContext& context);

    /**
     * @brief Operator surface under /api/<version>/monitoring, guarded by the
     * X-API-Key operator credential.
     */
    void register_monitoring_routes(App& app, GatewayContext& context);

    /** @brief Health summary plus breaker state of one service. */
    boost::json::object service_health(GatewayContext& context, const std::string& service);

} // namespace streamgate::admin

#endif // STREAMGATE_ADMIN_H
