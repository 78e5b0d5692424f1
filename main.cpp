#include <streamgate/admin.h>
#include <streamgate/app.h>
#include <streamgate/auth.h>
#include <streamgate/client.h>
#include <streamgate/config.h>
#include <streamgate/environment.h>
#include <streamgate/gateway.h>
#include <streamgate/middleware.h>
#include <streamgate/proxy.h>
#include <streamgate/rate_limiter.h>
#include <streamgate/redis.h>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace streamgate;

int main() {
    try {
        load_env();
        auto config = GatewayConfig::from_env();

        App app;
        app.config().version = config.api_version;
        app.config().production = config.is_production();
        app.config().max_body_size = config.max_body_size;
        app.config().timeout_seconds = config.read_timeout_seconds;
        app.config().log_path = config.log_path;

        auto& logger = app.get_logger();
        logger.configure(config.log_path);
        logger.set_level(parse_log_level(config.log_level));

        if (config.jwt_secret.empty()) {
            logger.warn("JWT_SECRET is not set; every bearer token will be rejected");
        }
        if (config.operator_api_key.empty()) {
            logger.warn("MONITORING_API_KEY is not set; the monitoring API is disabled");
        }

        BeastHttpClient client;

        // Counter store: Redis shares quotas across gateway instances.
        std::unique_ptr<Redis> redis;
        std::unique_ptr<RateLimitStore> store;
        if (config.rate_limit_store == "redis") {
            auto address = parse_redis_url(config.redis_url);
            if (!config.redis_password.empty()) {
                address.password = config.redis_password;
            }
            redis = std::make_unique<Redis>(app.engine(), address, 4, &logger);
            redis->connect();
            store = std::make_unique<RedisRateLimitStore>(*redis);
            logger.info("Rate limit counters stored in Redis at " + address.host + ":" + address.port);
        } else {
            store = std::make_unique<MemoryRateLimitStore>();
            logger.info("Rate limit counters stored in memory");
        }

        auto routes = std::filesystem::exists(config.routes_file)
            ? load_routes(config.routes_file)
            : default_routes(config);
        logger.info("Loaded " + std::to_string(routes.size()) + " routes");

        GatewayContext context(config, std::move(routes), client, *store, logger);
        JwtAuthenticator authenticator(config.jwt_secret);
        ProxyService proxy(context);

        app.use(middleware::request_id());
        app.use(middleware::cors(config.cors_origin));
        app.use(middleware::limit_body_size(config.max_body_size));
        app.use(middleware::service_headers("api-gateway", config.api_version));
        app.use(middleware::authenticate(authenticator, &logger));

        admin::register_gateway_routes(app, context);
        admin::register_monitoring_routes(app, context);
        app.fallback(proxy.handler());

        context.start(app.engine().get_executor());
        app.on_stop([&context] { context.stop(); });

        logger.info("StreamGate " + config.api_version + " starting in " + config.environment + " mode");
        app.listen(config.port, config.threads);

    } catch (const std::exception& e) {
        std::cerr << "[StreamGate] FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
