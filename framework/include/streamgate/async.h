#ifndef STREAMGATE_ASYNC_H
#define STREAMGATE_ASYNC_H

#include <chrono>
#include <boost/asio/awaitable.hpp>

namespace streamgate {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

/**
 * @brief Asynchronously waits for a specified duration.
 * usage: co_await streamgate::delay(std::chrono::milliseconds(1000));
 */
Async<void> delay(std::chrono::milliseconds ms);

} // namespace streamgate

#endif // STREAMGATE_ASYNC_H
