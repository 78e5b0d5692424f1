#ifndef STREAMGATE_RESPONSE_H
#define STREAMGATE_RESPONSE_H

#include <string>
#include <string_view>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json/value.hpp>

namespace streamgate {

class Response {
private:
    boost::beast::http::response<boost::beast::http::string_body> res_;

public:
    Response();

    Response& status(int code);
    Response& header(std::string_view key, std::string_view value);
    Response& add_header(std::string_view key, std::string_view value);
    Response& remove_header(std::string_view key);

    Response& send(std::string text);
    Response& text(std::string text, std::string_view content_type = "text/plain; charset=utf-8");
    Response& json(const boost::json::value& data);

    int get_status() const;
    std::string_view get_header(std::string_view key) const;
    const std::string& body() const { return res_.body(); }

    const boost::beast::http::response<boost::beast::http::string_body>& get_beast_response() const { return res_; }
    boost::beast::http::response<boost::beast::http::string_body>& get_beast_response() { return res_; }

    Response& no_content();
};

} // namespace streamgate

#endif // STREAMGATE_RESPONSE_H
