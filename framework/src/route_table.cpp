#include <streamgate/route_table.h>
#include <streamgate/exceptions.h>
#include <streamgate/util/string.h>

namespace streamgate {

RouteTable::RouteTable(std::vector<RouteConfig> routes) : routes_(std::move(routes)) {
    compiled_.reserve(routes_.size());
    for (const auto& route : routes_) {
        if (route.path_prefix.empty() || route.service.empty()) {
            throw ValidationError("Route requires pathPrefix and service");
        }

        Compiled c;
        for (auto seg : util::path_segments(route.path_prefix)) {
            if (seg.front() != ':') c.literal_count++;
            c.segments.emplace_back(seg);
        }
        compiled_.push_back(std::move(c));
    }
}

std::optional<ResolvedRoute> RouteTable::resolve(std::string_view path) const {
    path = path.substr(0, path.find('?'));
    const auto request_segments = util::path_segments(path);

    // "." and ".." (encoded or not) would let the upstream resolve a different
    // path than the one matched here.
    for (auto seg : request_segments) {
        const auto decoded = util::url_decode(seg);
        if (decoded == "." || decoded == "..") {
            throw ValidationError("Path must not contain '.' or '..' segments");
        }
    }

    const Compiled* best = nullptr;
    std::optional<ResolvedRoute> result;

    for (size_t i = 0; i < routes_.size(); ++i) {
        const Compiled& c = compiled_[i];
        if (c.segments.size() > request_segments.size()) continue;

        std::unordered_map<std::string, std::string> params;
        bool ok = true;
        for (size_t s = 0; s < c.segments.size(); ++s) {
            const std::string& seg = c.segments[s];
            if (seg.front() == ':') {
                params[seg.substr(1)] = util::url_decode(request_segments[s]);
            } else if (seg != request_segments[s]) {
                ok = false;
                break;
            }
        }
        if (!ok) continue;

        const bool better = !best ||
            c.segments.size() > best->segments.size() ||
            (c.segments.size() == best->segments.size() && c.literal_count > best->literal_count);
        if (better) {
            best = &c;
            result = ResolvedRoute{&routes_[i], std::move(params)};
        }
    }

    return result;
}

std::string RouteTable::apply_rewrite(const RouteConfig& route, std::string_view target) {
    const size_t query_pos = target.find('?');
    std::string path(target.substr(0, query_pos));
    const std::string_view query = query_pos == std::string_view::npos ? std::string_view{} : target.substr(query_pos);

    if (route.rewrite) {
        std::string_view from = route.rewrite->from;
        const bool anchored = !from.empty() && from.front() == '^';
        if (anchored) from.remove_prefix(1);

        if (!from.empty()) {
            if (anchored) {
                if (path.compare(0, from.size(), from) == 0) {
                    path.replace(0, from.size(), route.rewrite->to);
                }
            } else if (auto pos = path.find(from); pos != std::string::npos) {
                path.replace(pos, from.size(), route.rewrite->to);
            }
        }
    }

    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    // Collapse doubled slashes left where the replacement meets the remaining path
    while (path.size() > 1 && path.find("//") != std::string::npos) {
        path.replace(path.find("//"), 2, "/");
    }

    path.append(query);
    return path;
}

} // namespace streamgate
