#include <streamgate/request.h>
#include <streamgate/exceptions.h>
#include <streamgate/util/string.h>
#include <boost/json/parse.hpp>

namespace streamgate {

void Request::set_target(std::string_view raw) {
    target = std::string(raw);
    query.clear();

    size_t query_pos = raw.find('?');
    path = std::string(raw.substr(0, query_pos));
    if (path.empty()) {
        path = "/";
    }
    if (query_pos == std::string_view::npos) {
        return;
    }

    std::string_view qs = raw.substr(query_pos + 1);
    size_t pos = 0;
    while (pos < qs.size()) {
        size_t amp_pos = qs.find('&', pos);
        if (amp_pos == std::string_view::npos) amp_pos = qs.size();

        std::string_view pair = qs.substr(pos, amp_pos - pos);
        size_t eq_pos = pair.find('=');
        if (eq_pos != std::string_view::npos) {
            query[util::url_decode(pair.substr(0, eq_pos))] = util::url_decode(pair.substr(eq_pos + 1));
        } else if (!pair.empty()) {
            query[util::url_decode(pair)] = "";
        }

        pos = amp_pos + 1;
    }
}

std::string_view Request::query_string() const {
    size_t query_pos = target.find('?');
    if (query_pos == std::string::npos) return {};
    return std::string_view(target).substr(query_pos + 1);
}

boost::json::value Request::json() const {
    boost::system::error_code ec;
    auto val = boost::json::parse(body, ec);
    if (ec) {
        throw ValidationError("Invalid JSON body: " + ec.message());
    }
    return val;
}

std::string Request::get_query(const std::string& key, const std::string& default_val) const {
    auto it = query.find(key);
    if (it != query.end()) {
        return it->second;
    }
    return default_val;
}

int Request::get_query_int(const std::string& key, int default_val) const {
    auto it = query.find(key);
    if (it == query.end() || it->second.empty()) {
        return default_val;
    }
    return convert_string<int>(it->second);
}

std::string_view Request::get_header(std::string_view key) const {
    auto it = headers.find(key);
    if (it == headers.end()) {
        return {};
    }
    return {it->value().data(), it->value().size()};
}

bool Request::has_header(std::string_view key) const {
    return headers.find(key) != headers.end();
}

std::string Request::caller_key() const {
    if (caller && !caller->id.empty()) {
        return "user:" + caller->id;
    }
    return "ip:" + client_ip;
}

} // namespace streamgate
