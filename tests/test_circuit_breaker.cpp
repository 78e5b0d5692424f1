#include <catch2/catch_test_macros.hpp>
#include <streamgate/circuit_breaker.h>
#include <boost/asio/io_context.hpp>
#include <vector>
#include "test_support.h"

using namespace streamgate;
using namespace std::chrono_literals;

namespace {

    struct RecordingListener : CircuitBreakerListener {
        std::vector<std::pair<CircuitState, CircuitState>> transitions;
        void on_state_change(const std::string&, CircuitState from, CircuitState to) override {
            transitions.emplace_back(from, to);
        }
    };

    CircuitBreakerConfig config(int threshold = 3, std::chrono::milliseconds reset = 1000ms) {
        CircuitBreakerConfig cfg;
        cfg.failure_threshold = threshold;
        cfg.reset_timeout = reset;
        return cfg;
    }
}

TEST_CASE("CircuitBreaker: Opens at the failure threshold", "[breaker]") {
    testing::ManualClock clock;
    RecordingListener listener;
    CircuitBreaker breaker("content", config(3), &listener, clock.source());

    breaker.record_failure("boom");
    breaker.record_failure("boom");
    CHECK(breaker.state() == CircuitState::Closed);

    breaker.record_failure("boom");
    CHECK(breaker.state() == CircuitState::Open);
    CHECK_FALSE(breaker.allow_request());

    REQUIRE(listener.transitions.size() == 1);
    CHECK(listener.transitions[0] == std::make_pair(CircuitState::Closed, CircuitState::Open));
}

TEST_CASE("CircuitBreaker: A success resets the consecutive failure count", "[breaker]") {
    testing::ManualClock clock;
    CircuitBreaker breaker("content", config(3), nullptr, clock.source());

    breaker.record_failure("boom");
    breaker.record_failure("boom");
    breaker.record_success();
    breaker.record_failure("boom");
    breaker.record_failure("boom");

    CHECK(breaker.state() == CircuitState::Closed);
    CHECK(breaker.snapshot().failure_count == 2);
}

TEST_CASE("CircuitBreaker: Half-open admits exactly one trial", "[breaker]") {
    testing::ManualClock clock;
    RecordingListener listener;
    CircuitBreaker breaker("payment", config(1, 1000ms), &listener, clock.source());

    breaker.record_failure("refused");
    REQUIRE(breaker.state() == CircuitState::Open);

    clock.advance(999ms);
    CHECK_FALSE(breaker.allow_request());

    clock.advance(1ms);
    CHECK(breaker.allow_request());
    CHECK(breaker.state() == CircuitState::HalfOpen);
    CHECK_FALSE(breaker.allow_request());

    SECTION("Trial success closes the breaker") {
        REQUIRE(breaker.snapshot().last_failure_time.has_value());
        breaker.record_success();
        CHECK(breaker.state() == CircuitState::Closed);
        CHECK(breaker.snapshot().failure_count == 0);
        CHECK_FALSE(breaker.snapshot().last_failure_time.has_value());
        CHECK(breaker.allow_request());
    }

    SECTION("Trial failure reopens it for another reset period") {
        breaker.record_failure("refused");
        CHECK(breaker.state() == CircuitState::Open);
        CHECK_FALSE(breaker.allow_request());

        auto snapshot = breaker.snapshot();
        REQUIRE(snapshot.retry_in.has_value());
        CHECK(*snapshot.retry_in == 1000ms);

        clock.advance(1000ms);
        CHECK(breaker.allow_request());
        CHECK(listener.transitions.back() == std::make_pair(CircuitState::Open, CircuitState::HalfOpen));
    }
}

TEST_CASE("CircuitBreaker: Expected errors do not count", "[breaker]") {
    testing::ManualClock clock;
    auto cfg = config(1);
    cfg.expected_errors = {"VALIDATION"};
    CircuitBreaker breaker("auth", cfg, nullptr, clock.source());

    breaker.record_failure("VALIDATION_ERROR: email missing");
    CHECK(breaker.state() == CircuitState::Closed);

    breaker.record_failure("socket hang up");
    CHECK(breaker.state() == CircuitState::Open);
}

TEST_CASE("CircuitBreaker: Execute wraps an async call", "[breaker]") {
    boost::asio::io_context ioc;
    testing::ManualClock clock;
    CircuitBreaker breaker("streaming", config(2), nullptr, clock.source());

    SECTION("Success passes the result through") {
        int value = testing::run(ioc, breaker.execute<int>([]() -> Async<int> { co_return 42; }));
        CHECK(value == 42);
        CHECK(breaker.snapshot().success_count == 1);
    }

    SECTION("Failures are recorded and rethrown") {
        auto failing = []() -> Async<int> {
            throw TransportError(TransportError::Kind::Timeout, "timeout of 30000ms exceeded");
            co_return 0;
        };
        CHECK_THROWS_AS(testing::run(ioc, breaker.execute<int>(failing)), TransportError);
        CHECK_THROWS_AS(testing::run(ioc, breaker.execute<int>(failing)), TransportError);
        CHECK(breaker.state() == CircuitState::Open);

        bool invoked = false;
        auto probe = [&invoked]() -> Async<int> { invoked = true; co_return 1; };
        CHECK_THROWS_AS(testing::run(ioc, breaker.execute<int>(probe)), BreakerOpenError);
        CHECK_FALSE(invoked);
    }
}

TEST_CASE("CircuitBreaker: Operator overrides", "[breaker]") {
    testing::ManualClock clock;
    CircuitBreaker breaker("social", config(5), nullptr, clock.source());

    breaker.record_failure("timeout");
    breaker.force_open();
    CHECK(breaker.state() == CircuitState::Open);
    CHECK_FALSE(breaker.allow_request());

    breaker.force_close();
    CHECK(breaker.state() == CircuitState::Closed);
    CHECK(breaker.snapshot().failure_count == 0);
    CHECK_FALSE(breaker.snapshot().last_failure_time.has_value());
    CHECK(breaker.allow_request());
    CHECK(breaker.snapshot().uptime == 100.0);
}
