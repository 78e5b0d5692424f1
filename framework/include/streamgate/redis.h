#ifndef STREAMGATE_REDIS_H
#define STREAMGATE_REDIS_H

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

namespace boost::redis { class connection; }

namespace streamgate {

class Logger;
class RedisGuard; // Forward declaration

struct RedisAddress {
    std::string host = "127.0.0.1";
    std::string port = "6379";
    std::string password;
};

/** @brief Parses redis://[:password@]host[:port][/db]. */
RedisAddress parse_redis_url(const std::string& url);

/**
 * @brief Small pool of Boost.Redis connections exposing the counter commands
 * the rate limiter needs.
 */
class Redis {
public:
    Redis(boost::asio::io_context& ioc, RedisAddress address, int pool_size = 4, Logger* logger = nullptr);
    ~Redis();

    void connect();

    /** @brief INCR key, then PTTL key, in one round trip. */
    boost::asio::awaitable<std::pair<long long, long long>> incr_with_ttl(std::string_view key);
    boost::asio::awaitable<void> pexpire(std::string_view key, std::chrono::milliseconds ttl);
    boost::asio::awaitable<long long> decr(std::string_view key);
    boost::asio::awaitable<void> del(std::string_view key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    boost::asio::awaitable<boost::redis::connection*> acquire();
    void release(boost::redis::connection* conn);

    friend class RedisGuard; // Allow guard to release connections
};

} // namespace streamgate

#endif // STREAMGATE_REDIS_H
