#include <streamgate/client.h>
#include <streamgate/exceptions.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace streamgate {

    ParsedUrl parse_url(const std::string& url) {
        ParsedUrl res;
        std::string s = url;

        if (s.substr(0, 8) == "https://") {
            res.is_ssl = true;
            res.port = "443";
            s.erase(0, 8);
        } else if (s.substr(0, 7) == "http://") {
            res.is_ssl = false;
            res.port = "80";
            s.erase(0, 7);
        } else {
            res.is_ssl = false;
            res.port = "80";
        }

        size_t path_pos = s.find('/');
        if (path_pos == std::string::npos) {
            res.host = s;
            res.target = "/";
        } else {
            res.host = s.substr(0, path_pos);
            res.target = s.substr(path_pos);
        }

        size_t port_pos = res.host.find(':');
        if (port_pos != std::string::npos) {
            res.port = res.host.substr(port_pos + 1);
            res.host = res.host.substr(0, port_pos);
        }

        return res;
    }

    TransportError classify_transport_error(const boost::system::error_code& ec, const std::string& where) {
        using Kind = TransportError::Kind;
        const std::string msg = where + ": " + ec.message();

        // operation_aborted comes from the resolve deadline cancelling the resolver.
        if (ec == beast::error::timeout || ec == net::error::timed_out || ec == net::error::operation_aborted) {
            return {Kind::Timeout, where + ": timed out"};
        }
        if (ec == net::error::connection_refused) {
            return {Kind::ConnectionRefused, msg};
        }
        if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again ||
            ec == net::error::no_data || ec == net::error::no_recovery) {
            return {Kind::DnsFailure, msg};
        }
        if (ec == net::error::connection_reset || ec == net::error::connection_aborted ||
            ec == net::error::broken_pipe || ec == net::error::eof ||
            ec == http::error::end_of_stream || ec == http::error::partial_message) {
            return {Kind::Reset, msg};
        }
        return {Kind::Other, msg};
    }

    namespace {

        ssl::context& get_client_ssl_ctx() {
            static ssl::context ctx = [] {
                ssl::context c{ssl::context::tlsv12_client};
                c.set_default_verify_paths();
                return c;
            }();
            return ctx;
        }

        // Joins the endpoint's base path with the request target.
        std::string join_target(const std::string& base, const std::string& target) {
            if (base.empty() || base == "/") {
                return target.empty() ? "/" : target;
            }
            std::string joined = base;
            if (joined.back() == '/') joined.pop_back();
            if (target.empty() || target.front() != '/') joined += '/';
            return joined + target;
        }

        template <typename Stream>
        Async<http::response<http::string_body>> exchange(Stream& stream,
                                                          http::request<http::string_body>& req) {
            beast::flat_buffer b;
            http::response<http::string_body> res_msg;

            auto [wec, wn] = co_await http::async_write(stream, req, net::as_tuple(net::use_awaitable));
            if (wec) throw classify_transport_error(wec, "write");

            auto [rec, rn] = co_await http::async_read(stream, b, res_msg, net::as_tuple(net::use_awaitable));
            if (rec) throw classify_transport_error(rec, "read");

            co_return res_msg;
        }
    }

    Async<UpstreamResponse> BeastHttpClient::send(const std::string& base_url, UpstreamRequest request) {
        const auto parsed = parse_url(base_url);
        auto executor = co_await net::this_coro::executor;
        const auto deadline = std::chrono::steady_clock::now() + request.timeout;

        // The resolver has no deadline of its own; a timer cancels it.
        auto resolver = std::make_shared<tcp::resolver>(executor);
        auto resolve_timer = std::make_shared<net::steady_timer>(executor, deadline);
        resolve_timer->async_wait([resolver](const boost::system::error_code& ec) {
            if (!ec) resolver->cancel();
        });

        auto [resolve_ec, results] = co_await resolver->async_resolve(
            parsed.host, parsed.port, net::as_tuple(net::use_awaitable));
        resolve_timer->cancel();
        if (resolve_ec) throw classify_transport_error(resolve_ec, "resolve " + parsed.host);

        http::request<http::string_body> req;
        req.method_string(request.method);
        req.target(join_target(parsed.target, request.target));
        req.version(11);
        req.set(http::field::host, parsed.host);

        // insert, not set: repeated fields reach the backend with every value.
        for (const auto& [k, v] : request.headers) {
            req.insert(k, v);
        }
        if (req.find(http::field::user_agent) == req.end()) {
            req.set(http::field::user_agent, "StreamGate/1.0");
        }
        req.keep_alive(false);

        if (!request.body.empty()) {
            req.body() = std::move(request.body);
        }
        req.prepare_payload();

        http::response<http::string_body> res_msg;

        if (parsed.is_ssl) {
            beast::ssl_stream<beast::tcp_stream> stream(executor, get_client_ssl_ctx());
            beast::get_lowest_layer(stream).expires_at(deadline);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
                throw TransportError(TransportError::Kind::Other, "TLS SNI setup failed for " + parsed.host);
            }

            auto [cec, ep] = co_await beast::get_lowest_layer(stream).async_connect(results, net::as_tuple(net::use_awaitable));
            if (cec) throw classify_transport_error(cec, "connect " + base_url);

            auto [hec] = co_await stream.async_handshake(ssl::stream_base::client, net::as_tuple(net::use_awaitable));
            if (hec) throw classify_transport_error(hec, "handshake " + base_url);

            res_msg = co_await exchange(stream, req);

            beast::error_code ec;
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            beast::tcp_stream stream(executor);
            stream.expires_at(deadline);

            auto [cec, ep] = co_await stream.async_connect(results, net::as_tuple(net::use_awaitable));
            if (cec) throw classify_transport_error(cec, "connect " + base_url);

            res_msg = co_await exchange(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        UpstreamResponse response;
        response.status = static_cast<int>(res_msg.result_int());
        response.body = std::move(res_msg.body());

        for (const auto& field : res_msg) {
            response.headers.insert({std::string(field.name_string()), std::string(field.value())});
        }

        co_return response;
    }

} // namespace streamgate
