#ifndef STREAMGATE_CIRCUIT_BREAKER_H
#define STREAMGATE_CIRCUIT_BREAKER_H

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <streamgate/async.h>
#include <streamgate/config.h>
#include <streamgate/exceptions.h>

namespace streamgate {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

std::string_view to_string(CircuitState state);

/**
 * @brief Observer for breaker transitions. Invoked synchronously, outside
 * the breaker's lock, once per transition.
 */
class CircuitBreakerListener {
public:
    virtual ~CircuitBreakerListener() = default;
    virtual void on_state_change(const std::string& name, CircuitState from, CircuitState to) = 0;
};

struct CircuitBreakerSnapshot {
    std::string name;
    CircuitState state = CircuitState::Closed;
    int failure_count = 0;
    int success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    // Time left until an OPEN breaker admits its trial call.
    std::optional<std::chrono::milliseconds> retry_in;
    double uptime = 100.0;
};

/**
 * @brief Failure-aware gate around calls to one backend service.
 *
 * CLOSED counts consecutive failures and opens at the threshold. OPEN rejects
 * every call until the reset timeout has passed, then admits exactly one trial
 * call in HALF_OPEN; its outcome closes or reopens the breaker.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    CircuitBreaker(std::string name, CircuitBreakerConfig config,
                   CircuitBreakerListener* listener = nullptr, TimeSource now = {});

    /**
     * @brief Checks if a call may proceed.
     * @return true if allowed. An OPEN breaker whose timeout elapsed moves to
     * HALF_OPEN and grants the single trial to this caller.
     */
    bool allow_request();

    void record_success();

    /**
     * @brief Counts a failure unless @p error matches an expected error, in
     * which case a pending HALF_OPEN trial is simply released.
     */
    void record_failure(std::string_view error);

    /**
     * @brief Runs @p fn through the breaker.
     * @throws BreakerOpenError without invoking @p fn when the call is rejected;
     * otherwise whatever @p fn throws, after it has been recorded.
     */
    template <typename T>
    Async<T> execute(std::function<Async<T>()> fn) {
        if (!allow_request()) {
            throw BreakerOpenError(name_);
        }

        std::exception_ptr error;
        std::string error_text;
        try {
            if constexpr (std::is_void_v<T>) {
                co_await fn();
                record_success();
                co_return;
            } else {
                T result = co_await fn();
                record_success();
                co_return result;
            }
        } catch (const std::exception& e) {
            error = std::current_exception();
            error_text = e.what();
        } catch (...) {
            error = std::current_exception();
            error_text = "unknown error";
        }

        record_failure(error_text);
        std::rethrow_exception(error);
    }

    void force_open();
    void force_close();

    CircuitState state() const;
    CircuitBreakerSnapshot snapshot() const;
    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    using Transition = std::optional<std::pair<CircuitState, CircuitState>>;

    bool is_expected(std::string_view error) const;
    Transition move_to(CircuitState next);
    void notify(const Transition& transition);

    const std::string name_;
    const CircuitBreakerConfig config_;
    CircuitBreakerListener* listener_;
    TimeSource now_;

    mutable std::mutex mtx_;
    CircuitState state_ = CircuitState::Closed;
    int failure_count_ = 0;
    int success_count_ = 0;
    bool trial_in_flight_ = false;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    Clock::time_point next_retry_{};
};

} // namespace streamgate

#endif // STREAMGATE_CIRCUIT_BREAKER_H
