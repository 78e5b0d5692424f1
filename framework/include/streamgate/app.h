#ifndef STREAMGATE_APP_H
#define STREAMGATE_APP_H

#include <functional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <streamgate/async.h>
#include <streamgate/logger.h>
#include <streamgate/router.h>

namespace streamgate {

namespace net = boost::asio;

struct AppConfig {
    size_t max_body_size = 10 * 1024 * 1024; // 10MB default
    int timeout_seconds = 30;                // Inbound read timeout
    std::string log_path = "stdout";         // Logging destination
    std::string version = "v1";              // Stamped into every envelope
    bool production = false;                 // Hides internals in error envelopes
};

/**
 * @brief HTTP front of the gateway.
 *
 * Owns the Boost.Asio engine, the logger, the global middleware chain and the
 * router for gateway-local endpoints. Requests no local route claims go to
 * the fallback handler (the proxy).
 */
class App {
private:
    Router router_;
    Logger logger_;
    net::io_context ioc_;
    std::vector<Middleware> middleware_;
    Handler fallback_;
    std::vector<std::function<void()>> stop_hooks_;
    AppConfig config_;

public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    AppConfig& config() { return config_; }
    const AppConfig& get_config() const { return config_; }

    App& log_to(const std::string& path) { config_.log_path = path; return *this; }
    App& max_body_size(size_t bytes) { config_.max_body_size = bytes; return *this; }

    /** @brief Registers a GET route. @param path The URL path (e.g., "/health/:service"). */
    void get(const std::string& path, const Handler& handler) { router_.add_route("GET", path, handler); }
    void post(const std::string& path, const Handler& handler) { router_.add_route("POST", path, handler); }
    void put(const std::string& path, const Handler& handler) { router_.add_route("PUT", path, handler); }
    void del(const std::string& path, const Handler& handler) { router_.add_route("DELETE", path, handler); }

    /** @brief Creates a route group with a common prefix. */
    RouteGroup group(const std::string& prefix);

    /** @brief Registers global middleware. Runs for local routes and the fallback alike. */
    void use(const Middleware& mw);

    /** @brief Handler for requests no local route matches. Defaults to a 404 envelope. */
    void fallback(Handler handler) { fallback_ = std::move(handler); }

    /** @brief Runs @p hook on SIGINT/SIGTERM before the engine stops. */
    void on_stop(std::function<void()> hook) { stop_hooks_.push_back(std::move(hook)); }

    /** @brief Starts a background task (coroutine) in the event loop. */
    void spawn(Async<void> task);

    /**
     * @brief Starts the HTTP server on the specified port.
     *
     * @param port The port to listen on.
     * @param num_threads Number of threads for the event loop (0 = hardware concurrency).
     */
    void listen(int port, int num_threads = 0);

    /** @brief Stops the engine after running the stop hooks. */
    void stop();

    Router& get_router() { return router_; }
    Logger& get_logger() { return logger_; }

    /** @brief Returns the internal io_context engine. */
    net::io_context& engine() { return ioc_; }

    /**
     * @brief Runs one request through middleware and routing.
     * Never throws; every failure becomes an error envelope.
     */
    Async<Response> handle_request(Request& req);

private:
    Async<void> run_middleware(size_t index, Request& req, Response& res, const Handler& final_handler);
};

} // namespace streamgate

#endif // STREAMGATE_APP_H
