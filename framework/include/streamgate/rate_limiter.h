#ifndef STREAMGATE_RATE_LIMITER_H
#define STREAMGATE_RATE_LIMITER_H

#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <streamgate/async.h>
#include <streamgate/config.h>
#include <streamgate/request.h>

namespace streamgate {

class Logger;
class Redis;
class Response;

/** @brief Counter value after an increment and the time left in its window. */
struct WindowCount {
    long count = 0;
    std::chrono::milliseconds reset_in{0};
};

/**
 * @brief Fixed-window counter storage. increment() must be atomic per key and
 * start the window on the first hit.
 */
class RateLimitStore {
public:
    virtual ~RateLimitStore() = default;

    virtual Async<WindowCount> increment(const std::string& key, std::chrono::milliseconds window) = 0;
    virtual Async<void> decrement(const std::string& key) = 0;
    virtual Async<void> reset(const std::string& key) = 0;
};

/**
 * @brief In-process store. Keys are spread over independently locked shards.
 */
class MemoryRateLimitStore : public RateLimitStore {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit MemoryRateLimitStore(TimeSource now = {});

    Async<WindowCount> increment(const std::string& key, std::chrono::milliseconds window) override;
    Async<void> decrement(const std::string& key) override;
    Async<void> reset(const std::string& key) override;

    /** @brief Drops expired counters. @return number removed. */
    size_t sweep();
    size_t size() const;

private:
    struct Counter {
        long count = 0;
        Clock::time_point reset_at;
    };

    struct Shard {
        mutable std::mutex mtx;
        std::unordered_map<std::string, Counter> counters;
    };

    static constexpr size_t kShards = 16;

    Shard& shard_for(const std::string& key);

    TimeSource now_;
    std::array<Shard, kShards> shards_;
};

/**
 * @brief Redis-backed store shared by every gateway instance.
 * INCR+PTTL per hit; PEXPIRE when the key has no expiry yet.
 */
class RedisRateLimitStore : public RateLimitStore {
public:
    explicit RedisRateLimitStore(Redis& redis, std::string key_prefix = "ratelimit:");

    Async<WindowCount> increment(const std::string& key, std::chrono::milliseconds window) override;
    Async<void> decrement(const std::string& key) override;
    Async<void> reset(const std::string& key) override;

private:
    Redis& redis_;
    std::string key_prefix_;
};

struct RateLimitDecision {
    bool allowed = true;
    long limit = 0;
    long remaining = 0;
    std::chrono::system_clock::time_point reset_time;
    std::string policy;
    std::string key;
};

/**
 * @brief Named quota policies over a shared counter store.
 */
class RateLimiter {
public:
    RateLimiter(RateLimitStore& store, SubscriptionQuotas quotas = {}, Logger* logger = nullptr);

    void add_policy(RateLimitPolicy policy);
    bool has_policy(const std::string& name) const;

    /** @throws NotFoundError for an unknown policy. */
    const RateLimitPolicy& policy(const std::string& name) const;

    /**
     * @brief Counts one hit for (policy, caller key).
     * @param limit_override replaces the policy's max_requests for this check.
     * @throws NotFoundError for an unknown policy.
     */
    Async<RateLimitDecision> check(const std::string& policy_name, const std::string& caller_key,
                                   std::optional<long> limit_override = std::nullopt);

    /**
     * @brief Resolves the caller key (and the plan quota for the subscription
     * policy) from the request, then checks.
     */
    Async<RateLimitDecision> check_request(const std::string& policy_name, const Request& req);

    /** @brief Quota for a caller's plan; no subscription falls back to the default policy's limit. */
    long subscription_limit(const std::optional<Subscription>& subscription) const;

    /** @brief Gives a hit back, for policies that skip successful requests. */
    Async<void> refund(const RateLimitDecision& decision);

    std::string key_for(const RateLimitPolicy& policy, const Request& req) const;

    /** @brief RateLimit-Limit/Remaining/Reset, plus Retry-After when rejected. */
    static void apply_headers(Response& res, const RateLimitDecision& decision);

private:
    RateLimitStore& store_;
    SubscriptionQuotas quotas_;
    Logger* logger_;
    std::map<std::string, RateLimitPolicy> policies_;
};

} // namespace streamgate

#endif // STREAMGATE_RATE_LIMITER_H
