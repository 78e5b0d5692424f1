#ifndef STREAMGATE_ROUTER_H
#define STREAMGATE_ROUTER_H

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <streamgate/async.h>
#include <streamgate/request.h>
#include <streamgate/response.h>

namespace streamgate {

using Next = std::function<Async<void>()>;
using Middleware = std::function<Async<void>(Request&, Response&, Next)>;
using Handler = std::function<Async<void>(Request&, Response&)>;

struct RouteMatch {
    Handler handler;                                      // The function to call
    std::unordered_map<std::string, std::string> params;  // Extracted params like {"service": "auth"}
};

class Router;

/**
 * @brief A helper class for grouping routes under a common path prefix.
 */
class RouteGroup {
private:
    Router& router_;
    std::string prefix_;

public:
    RouteGroup(Router& router, std::string prefix);

    /** @brief Registers a GET route within this group. */
    void get(const std::string& path, const Handler& handler) const;

    /** @brief Registers a POST route within this group. */
    void post(const std::string& path, const Handler& handler) const;

    void put(const std::string& path, const Handler& handler) const;
    void del(const std::string& path, const Handler& handler) const;

    /**
     * @brief Adds a middleware that runs only for routes registered through
     * this group afterwards.
     */
    RouteGroup& use(Middleware mw);

    RouteGroup group(const std::string& subpath) const;

    const std::string& prefix() const { return prefix_; }

private:
    Handler guarded(const Handler& handler) const;

    std::vector<Middleware> middleware_;
};

/**
 * @brief Exact method + segment router for the gateway's own endpoints.
 *
 * Segments starting with ':' capture one path segment. Routes are tried in
 * registration order, so register static paths before parameterised ones
 * that could shadow them.
 */
class Router {
private:
    struct Route {
        std::string method;
        std::string path;
        std::vector<std::string> segments;
        Handler handler;
    };

    std::vector<Route> routes_;

    static bool matches(const std::vector<std::string>& route_segments,
                        const std::vector<std::string_view>& request_segments,
                        std::unordered_map<std::string, std::string>& params);

public:
    void add_route(const std::string& method, const std::string& path, const Handler& handler);

    [[nodiscard]] std::optional<RouteMatch> match(std::string_view method, std::string_view path) const;

    /** @brief True if @p path matches some route under any method. */
    [[nodiscard]] bool has_path(std::string_view path) const;

    size_t size() const { return routes_.size(); }
};

} // namespace streamgate

#endif // STREAMGATE_ROUTER_H
