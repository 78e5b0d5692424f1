#include "server.h"
#include <streamgate/app.h>
#include <streamgate/envelope.h>
#include <streamgate/request.h>
#include <streamgate/response.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/json/serialize.hpp>
#include <iostream>

namespace streamgate {

namespace {

    Request from_beast(http::request<http::string_body>&& req, std::string client_ip) {
        Request out;
        out.method = std::string(req.method_string());
        out.set_target(req.target());
        out.body = std::move(req.body());
        for (const auto& field : req) {
            out.headers.insert(field.name_string(), field.value());
        }
        out.client_ip = std::move(client_ip);
        return out;
    }

    Async<void> handle_session(std::shared_ptr<Session> self, App& app, Request req, bool keep_alive) {
        try {
            Response res = co_await app.handle_request(req);

            auto& beast_res = res.get_beast_response();
            beast_res.keep_alive(keep_alive);
            beast_res.prepare_payload();

            co_await http::async_write(self->stream(), beast_res, boost::asio::use_awaitable);

            if (!keep_alive) {
                self->do_close();
            } else {
                self->do_read();
            }

        } catch (const std::exception& e) {
            // Write failures only; handle_request itself does not throw.
            std::cerr << "Async Handler Error: " << e.what() << "\n";
            self->do_close();
        }
    }
}

Session::Session(tcp::socket&& socket, App& app)
    : stream_(std::move(socket)), app_(app) {}

void Session::run() {
    net::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Session::do_read, shared_from_this()));
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(app_.get_config().max_body_size);

    stream_.expires_after(std::chrono::seconds(app_.get_config().timeout_seconds));

    http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&Session::on_read, shared_from_this()));
}

void Session::on_read(beast::error_code ec, const std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        send_error_response(http::status::payload_too_large, "PAYLOAD_TOO_LARGE", "Request body too large");
        return;
    }
    if (ec) {
        if (ec != net::error::connection_reset && ec != net::error::eof && ec != beast::error::timeout) {
            app_.get_logger().warn("read error: " + ec.message());
        }
        return;
    }

    // Handlers may take longer than the read timeout; the proxied call has its own bound.
    stream_.expires_never();

    auto beast_req = parser_->release();
    const bool keep_alive = beast_req.keep_alive();

    boost::asio::co_spawn(
        stream_.get_executor(),
        handle_session(shared_from_this(), app_, from_beast(std::move(beast_req), get_client_ip()), keep_alive),
        boost::asio::detached
    );
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

std::string Session::get_client_ip() {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string();
}

void Session::send_error_response(http::status status, std::string_view code, std::string_view message) {
    auto res = std::make_shared<http::response<http::string_body>>(status, 11);
    res->set(http::field::content_type, "application/json");
    res->keep_alive(false);
    res->body() = boost::json::serialize(
        envelope::error(code, message, "", app_.get_config().version));
    res->prepare_payload();

    http::async_write(stream_, *res,
        [self = shared_from_this(), res](beast::error_code, std::size_t) {
            self->do_close();
        });
}

Listener::Listener(net::io_context& ioc, const tcp::endpoint& endpoint, App& app)
    : ioc_(ioc), acceptor_(ioc), app_(app) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void Listener::run() { do_accept(); }

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(const beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || ec == net::error::bad_descriptor) {
            return;
        }
        app_.get_logger().warn("accept error: " + ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), app_)->run();
    }
    do_accept();
}

void Listener::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

} // namespace streamgate
