#include <streamgate/app.h>
#include <streamgate/envelope.h>
#include <streamgate/exceptions.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include "server.h"

namespace streamgate {

App::App() {
    fallback_ = [](Request& req, Response&) -> Async<void> {
        throw NotFoundError("Route " + req.method + " " + req.path);
        co_return;
    };
}

App::~App() {
    if (!ioc_.stopped()) {
        ioc_.stop();
    }
}

Async<void> delay(std::chrono::milliseconds ms) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, ms);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

void App::spawn(Async<void> task) {
    boost::asio::co_spawn(ioc_.get_executor(), std::move(task), boost::asio::detached);
}

Async<void> App::run_middleware(size_t index, Request& req, Response& res, const Handler& final_handler) {
    if (index < middleware_.size()) {
        const auto& mw = middleware_[index];
        co_await mw(req, res, [this, index, &req, &res, &final_handler]() -> Async<void> {
            co_await run_middleware(index + 1, req, res, final_handler);
        });
    } else {
        co_await final_handler(req, res);
    }
}

Async<Response> App::handle_request(Request& req) {
    const auto start_time = std::chrono::steady_clock::now();
    Response res;

    try {
        Handler handler;
        if (auto match = router_.match(req.method, req.path)) {
            req.params = std::move(match->params);
            handler = std::move(match->handler);
        } else {
            handler = fallback_;
        }

        co_await run_middleware(0, req, res, handler);

    } catch (const HttpError& e) {
        envelope::write_error(res, e, req.request_id, config_.version, config_.production);
        if (e.status() >= 500) {
            logger_.log_error(std::string("Request failed [") + req.request_id + "]: " + e.what());
        }
    } catch (const std::exception& e) {
        envelope::write_internal(res, e, req.request_id, config_.version, config_.production);
        logger_.log_error(std::string("Exception in handle_request [") + req.request_id + "]: " + e.what());
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    logger_.log_access(req.client_ip, req.method, req.path, res.get_status(), duration, req.request_id);

    co_return res;
}

void App::listen(const int port, int num_threads) {
    logger_.configure(config_.log_path);

    if (num_threads <= 0) {
        num_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }

    auto const address = net::ip::make_address("0.0.0.0");
    auto const endpoint = net::ip::tcp::endpoint{address, static_cast<unsigned short>(port)};

    try {
        auto listener = std::make_shared<Listener>(ioc_, endpoint, *this);
        listener->run();
    } catch (const std::exception& e) {
        std::cerr << "[StreamGate] FATAL: Could not start listener: " << e.what() << std::endl;
        throw;
    }

    logger_.info("Gateway listening on port " + std::to_string(port) + " with " +
                 std::to_string(num_threads) + " threads");

    // (Ctrl+C) to stop cleanly
    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](boost::system::error_code const&, int) {
        logger_.info("Shutdown signal received");
        stop();
    });

    // Run the IO Context on n threads
    std::vector<std::thread> v;
    v.reserve(num_threads - 1);
    for (auto i = num_threads - 1; i > 0; --i)
        v.emplace_back([this] {
            ioc_.run();
        });

    // Run on the main thread too
    ioc_.run();

    for (auto& t : v)
        t.join();
}

void App::stop() {
    for (auto& hook : stop_hooks_) {
        hook();
    }
    ioc_.stop();
}

void App::use(const Middleware& mw) {
    middleware_.push_back(mw);
}

RouteGroup App::group(const std::string& prefix) {
    return RouteGroup(router_, prefix);
}

} // namespace streamgate
