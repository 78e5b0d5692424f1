#define BOOST_REDIS_SEPARATE_COMPILATION
#include <streamgate/redis.h>
#include <streamgate/logger.h>
#include <boost/redis/src.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mutex>
#include <queue>
#include <tuple>
#include <vector>

namespace streamgate {

RedisAddress parse_redis_url(const std::string& url) {
    RedisAddress addr;
    std::string s = url;
    if (s.rfind("redis://", 0) == 0) {
        s.erase(0, 8);
    }

    size_t at = s.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = s.substr(0, at);
        size_t colon = userinfo.find(':');
        addr.password = colon == std::string::npos ? userinfo : userinfo.substr(colon + 1);
        s.erase(0, at + 1);
    }

    size_t slash = s.find('/');
    if (slash != std::string::npos) {
        s = s.substr(0, slash);
    }

    size_t colon = s.rfind(':');
    if (colon != std::string::npos) {
        addr.port = s.substr(colon + 1);
        s = s.substr(0, colon);
    }
    if (!s.empty()) {
        addr.host = s;
    }
    return addr;
}

struct Redis::Impl {
    boost::asio::io_context& ioc;
    RedisAddress address;
    int pool_size;
    Logger* logger;

    std::vector<std::unique_ptr<boost::redis::connection>> pool;
    std::queue<boost::redis::connection*> available;
    std::queue<std::shared_ptr<boost::asio::steady_timer>> waiters; // Queue for waiting coroutines
    std::mutex mtx;

    Impl(boost::asio::io_context& ctx, RedisAddress addr, int sz, Logger* log)
        : ioc(ctx), address(std::move(addr)), pool_size(sz), logger(log) {}
};

// RAII Guard to ensure connection is returned to pool
class RedisGuard {
    Redis& parent_;
    boost::redis::connection* conn_;
public:
    RedisGuard(Redis& p, boost::redis::connection* c) : parent_(p), conn_(c) {}
    ~RedisGuard() { parent_.release(conn_); }
    boost::redis::connection* get() { return conn_; }
};

Redis::Redis(boost::asio::io_context& ioc, RedisAddress address, int pool_size, Logger* logger)
    : impl_(std::make_unique<Impl>(ioc, std::move(address), pool_size, logger)) {}

Redis::~Redis() {
    for (auto& conn : impl_->pool) {
        conn->cancel();
    }
}

void Redis::connect() {
    for (int i = 0; i < impl_->pool_size; ++i) {
        auto conn = std::make_unique<boost::redis::connection>(boost::asio::make_strand(impl_->ioc));

        boost::asio::co_spawn(conn->get_executor(), [this, c = conn.get()]() -> boost::asio::awaitable<void> {
            boost::redis::config cfg;
            cfg.addr.host = impl_->address.host;
            cfg.addr.port = impl_->address.port;
            cfg.password = impl_->address.password;

            // async_run reconnects on its own; it only returns on cancellation.
            auto [ec] = co_await c->async_run(cfg, {}, boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec && ec != boost::asio::error::operation_aborted && impl_->logger) {
                impl_->logger->log_error("redis connection stopped: " + ec.message());
            }
        }, boost::asio::detached);

        impl_->available.push(conn.get());
        impl_->pool.push_back(std::move(conn));
    }
}

boost::asio::awaitable<boost::redis::connection*> Redis::acquire() {
    while (true) {
        std::shared_ptr<boost::asio::steady_timer> timer;
        {
            std::lock_guard<std::mutex> lock(impl_->mtx);
            if (!impl_->available.empty()) {
                auto* conn = impl_->available.front();
                impl_->available.pop();
                co_return conn;
            }

            // Pool is empty, add to wait list
            timer = std::make_shared<boost::asio::steady_timer>(
                impl_->ioc, std::chrono::steady_clock::time_point::max()
            );
            impl_->waiters.push(timer);
        }

        auto [ec] = co_await timer->async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
        if (ec && ec != boost::asio::error::operation_aborted) {
            throw boost::system::system_error(ec);
        }
        // Cancelled by release(): loop back and try again
    }
}

void Redis::release(boost::redis::connection* conn) {
    if (!conn) return;
    std::shared_ptr<boost::asio::steady_timer> waiter;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->available.push(conn);
        if (!impl_->waiters.empty()) {
            waiter = impl_->waiters.front();
            impl_->waiters.pop();
        }
    }
    if (waiter) {
        waiter->cancel();
    }
}

boost::asio::awaitable<std::pair<long long, long long>> Redis::incr_with_ttl(std::string_view key) {
    RedisGuard guard(*this, co_await acquire());
    boost::redis::request req;
    req.push("INCR", key);
    req.push("PTTL", key);
    boost::redis::response<long long, long long> res;
    co_await guard.get()->async_exec(req, res, boost::asio::use_awaitable);
    co_return std::make_pair(std::get<0>(res).value(), std::get<1>(res).value());
}

boost::asio::awaitable<void> Redis::pexpire(std::string_view key, std::chrono::milliseconds ttl) {
    RedisGuard guard(*this, co_await acquire());
    boost::redis::request req;
    req.push("PEXPIRE", key, std::to_string(ttl.count()));
    co_await guard.get()->async_exec(req, boost::redis::ignore, boost::asio::use_awaitable);
}

boost::asio::awaitable<long long> Redis::decr(std::string_view key) {
    RedisGuard guard(*this, co_await acquire());
    boost::redis::request req;
    req.push("DECR", key);
    boost::redis::response<long long> res;
    co_await guard.get()->async_exec(req, res, boost::asio::use_awaitable);
    co_return std::get<0>(res).value();
}

boost::asio::awaitable<void> Redis::del(std::string_view key) {
    RedisGuard guard(*this, co_await acquire());
    boost::redis::request req;
    req.push("DEL", key);
    co_await guard.get()->async_exec(req, boost::redis::ignore, boost::asio::use_awaitable);
}

} // namespace streamgate
