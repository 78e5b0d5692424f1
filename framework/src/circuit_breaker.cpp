#include <streamgate/circuit_breaker.h>
#include <algorithm>

namespace streamgate {

std::string_view to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "CLOSED";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config,
                               CircuitBreakerListener* listener, TimeSource now)
    : name_(std::move(name)),
      config_(std::move(config)),
      listener_(listener),
      now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {}

bool CircuitBreaker::allow_request() {
    Transition transition;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        switch (state_) {
            case CircuitState::Closed:
                allowed = true;
                break;
            case CircuitState::Open:
                if (now_() >= next_retry_) {
                    transition = move_to(CircuitState::HalfOpen);
                    trial_in_flight_ = true;
                    allowed = true;
                }
                break;
            case CircuitState::HalfOpen:
                // Only one trial at a time
                if (!trial_in_flight_) {
                    trial_in_flight_ = true;
                    allowed = true;
                }
                break;
        }
    }
    notify(transition);
    return allowed;
}

void CircuitBreaker::record_success() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        switch (state_) {
            case CircuitState::HalfOpen:
                transition = move_to(CircuitState::Closed);
                failure_count_ = 0;
                success_count_ = 0;
                last_failure_time_.reset();
                trial_in_flight_ = false;
                break;
            case CircuitState::Closed:
                failure_count_ = 0;
                success_count_++;
                break;
            case CircuitState::Open:
                // A call admitted before the breaker opened finished late.
                success_count_++;
                break;
        }
    }
    notify(transition);
}

void CircuitBreaker::record_failure(std::string_view error) {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (is_expected(error)) {
            if (state_ == CircuitState::HalfOpen) {
                trial_in_flight_ = false;
            }
            return;
        }

        failure_count_++;
        last_failure_time_ = std::chrono::system_clock::now();

        switch (state_) {
            case CircuitState::HalfOpen:
                transition = move_to(CircuitState::Open);
                next_retry_ = now_() + config_.reset_timeout;
                trial_in_flight_ = false;
                break;
            case CircuitState::Closed:
                if (failure_count_ >= config_.failure_threshold) {
                    transition = move_to(CircuitState::Open);
                    next_retry_ = now_() + config_.reset_timeout;
                }
                break;
            case CircuitState::Open:
                // Already open; the pending retry time stands.
                break;
        }
    }
    notify(transition);
}

void CircuitBreaker::force_open() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        transition = move_to(CircuitState::Open);
        next_retry_ = now_() + config_.reset_timeout;
        trial_in_flight_ = false;
    }
    notify(transition);
}

void CircuitBreaker::force_close() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        transition = move_to(CircuitState::Closed);
        failure_count_ = 0;
        success_count_ = 0;
        last_failure_time_.reset();
        trial_in_flight_ = false;
    }
    notify(transition);
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    CircuitBreakerSnapshot s;
    s.name = name_;
    s.state = state_;
    s.failure_count = failure_count_;
    s.success_count = success_count_;
    s.last_failure_time = last_failure_time_;

    if (state_ == CircuitState::Open) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(next_retry_ - now_());
        s.retry_in = std::max(left, std::chrono::milliseconds(0));
    }

    const int total = success_count_ + failure_count_;
    s.uptime = total == 0 ? 100.0 : 100.0 * success_count_ / total;
    return s;
}

bool CircuitBreaker::is_expected(std::string_view error) const {
    return std::any_of(config_.expected_errors.begin(), config_.expected_errors.end(),
                       [&](const std::string& expected) {
                           return !expected.empty() && error.find(expected) != std::string_view::npos;
                       });
}

CircuitBreaker::Transition CircuitBreaker::move_to(CircuitState next) {
    if (state_ == next) {
        return std::nullopt;
    }
    Transition transition = std::make_pair(state_, next);
    state_ = next;
    return transition;
}

void CircuitBreaker::notify(const Transition& transition) {
    if (transition && listener_) {
        listener_->on_state_change(name_, transition->first, transition->second);
    }
}

} // namespace streamgate
