#include <streamgate/router.h>
#include <streamgate/util/string.h>
#include <memory>

namespace streamgate {

namespace {

    std::string_view strip_query(std::string_view path) {
        std::string_view pure_path = path.substr(0, path.find('?'));
        if (pure_path.size() > 1 && pure_path.back() == '/') {
            pure_path.remove_suffix(1);
        }
        return pure_path;
    }

    // Chains group middleware in front of a handler, outermost first.
    Async<void> run_chain(std::shared_ptr<const std::vector<Middleware>> chain, size_t index,
                          const Handler& handler, Request& req, Response& res) {
        if (index < chain->size()) {
            co_await (*chain)[index](req, res, [chain, index, &handler, &req, &res]() -> Async<void> {
                co_await run_chain(chain, index + 1, handler, req, res);
            });
        } else {
            co_await handler(req, res);
        }
    }
}

RouteGroup::RouteGroup(Router& router, std::string prefix)
    : router_(router), prefix_(std::move(prefix)) {}

Handler RouteGroup::guarded(const Handler& handler) const {
    if (middleware_.empty()) {
        return handler;
    }
    auto chain = std::make_shared<const std::vector<Middleware>>(middleware_);
    return [chain, handler](Request& req, Response& res) -> Async<void> {
        co_await run_chain(chain, 0, handler, req, res);
    };
}

void RouteGroup::get(const std::string& path, const Handler& handler) const {
    router_.add_route("GET", prefix_ + path, guarded(handler));
}

void RouteGroup::post(const std::string& path, const Handler& handler) const {
    router_.add_route("POST", prefix_ + path, guarded(handler));
}

void RouteGroup::put(const std::string& path, const Handler& handler) const {
    router_.add_route("PUT", prefix_ + path, guarded(handler));
}

void RouteGroup::del(const std::string& path, const Handler& handler) const {
    router_.add_route("DELETE", prefix_ + path, guarded(handler));
}

RouteGroup& RouteGroup::use(Middleware mw) {
    middleware_.push_back(std::move(mw));
    return *this;
}

RouteGroup RouteGroup::group(const std::string& subpath) const {
    RouteGroup nested{router_, prefix_ + subpath};
    nested.middleware_ = middleware_;
    return nested;
}

void Router::add_route(const std::string& method, const std::string& path, const Handler& handler) {
    std::vector<std::string> segments;
    for (auto seg : util::path_segments(path)) {
        segments.emplace_back(seg);
    }
    routes_.push_back({method, path, std::move(segments), handler});
}

std::optional<RouteMatch> Router::match(std::string_view method, std::string_view path) const {
    const auto request_segments = util::path_segments(strip_query(path));

    for (const auto& route : routes_) {
        if (route.method != method) continue;
        if (route.segments.size() != request_segments.size()) continue;

        std::unordered_map<std::string, std::string> params;
        if (matches(route.segments, request_segments, params)) {
            return RouteMatch{route.handler, std::move(params)};
        }
    }

    return std::nullopt;
}

bool Router::has_path(std::string_view path) const {
    const auto request_segments = util::path_segments(strip_query(path));
    std::unordered_map<std::string, std::string> params;
    for (const auto& route : routes_) {
        if (route.segments.size() == request_segments.size() &&
            matches(route.segments, request_segments, params)) {
            return true;
        }
    }
    return false;
}

bool Router::matches(const std::vector<std::string>& route_segments,
                     const std::vector<std::string_view>& request_segments,
                     std::unordered_map<std::string, std::string>& params) {
    for (size_t i = 0; i < route_segments.size(); i++) {
        const std::string& route_seg = route_segments[i];
        const std::string_view request_seg = request_segments[i];

        if (!route_seg.empty() && route_seg[0] == ':') {
            params[route_seg.substr(1)] = util::url_decode(request_seg);
        } else if (route_seg != request_seg) {
            return false;
        }
    }
    return true;
}

} // namespace streamgate
