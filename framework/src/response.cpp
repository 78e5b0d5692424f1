#include <streamgate/response.h>
#include <boost/json/serialize.hpp>
#include <boost/json/src.hpp>

namespace streamgate {

namespace http = boost::beast::http;

Response::Response() {
    res_.version(11);
    res_.result(http::status::ok);
}

Response& Response::status(int code) {
    res_.result(static_cast<unsigned>(code));
    return *this;
}

Response& Response::header(std::string_view key, std::string_view value) {
    res_.set(key, value);
    return *this;
}

Response& Response::add_header(std::string_view key, std::string_view value) {
    res_.insert(key, value);
    return *this;
}

Response& Response::remove_header(std::string_view key) {
    res_.erase(key);
    return *this;
}

Response& Response::send(std::string text) {
    res_.body() = std::move(text);
    return *this;
}

Response& Response::text(std::string text, std::string_view content_type) {
    header("Content-Type", content_type);
    res_.body() = std::move(text);
    return *this;
}

Response& Response::json(const boost::json::value& data) {
    header("Content-Type", "application/json");
    res_.body() = boost::json::serialize(data);
    return *this;
}

int Response::get_status() const {
    return static_cast<int>(res_.result_int());
}

std::string_view Response::get_header(std::string_view key) const {
    auto it = res_.find(key);
    if (it == res_.end()) return {};
    return {it->value().data(), it->value().size()};
}

Response& Response::no_content() {
    status(204);
    res_.body().clear();
    return *this;
}

} // namespace streamgate
