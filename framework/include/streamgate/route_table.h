#ifndef STREAMGATE_ROUTE_TABLE_H
#define STREAMGATE_ROUTE_TABLE_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <streamgate/config.h>

namespace streamgate {

struct ResolvedRoute {
    const RouteConfig* route = nullptr;
    std::unordered_map<std::string, std::string> params;
};

/**
 * @brief Static route table, fixed after construction.
 *
 * A route matches when its prefix segments match the leading segments of the
 * request path (':name' matches any one segment). Among matching routes the
 * one with the most segments wins; on a tie the one with more literal
 * segments wins, then the one declared first.
 */
class RouteTable {
public:
    /** @throws ValidationError for a route without prefix or service. */
    explicit RouteTable(std::vector<RouteConfig> routes);

    /** @throws ValidationError for a path with '.' or '..' segments. */
    std::optional<ResolvedRoute> resolve(std::string_view path) const;

    /**
     * @brief Upstream target for @p target (path plus optional query): the
     * route's rewrite applied to the path, query carried over unchanged.
     */
    static std::string apply_rewrite(const RouteConfig& route, std::string_view target);

    const std::vector<RouteConfig>& routes() const { return routes_; }

private:
    struct Compiled {
        std::vector<std::string> segments;
        size_t literal_count = 0;
    };

    std::vector<RouteConfig> routes_;
    std::vector<Compiled> compiled_;
};

} // namespace streamgate

#endif // STREAMGATE_ROUTE_TABLE_H
