#include <streamgate/rate_limiter.h>
#include <streamgate/exceptions.h>
#include <streamgate/logger.h>
#include <streamgate/redis.h>
#include <streamgate/response.h>
#include <algorithm>

namespace streamgate {

MemoryRateLimitStore::MemoryRateLimitStore(TimeSource now)
    : now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {}

MemoryRateLimitStore::Shard& MemoryRateLimitStore::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % kShards];
}

Async<WindowCount> MemoryRateLimitStore::increment(const std::string& key, std::chrono::milliseconds window) {
    auto& shard = shard_for(key);
    const auto now = now_();

    WindowCount result;
    {
        std::lock_guard<std::mutex> lock(shard.mtx);
        auto& counter = shard.counters[key];
        if (counter.count == 0 || now >= counter.reset_at) {
            counter.count = 0;
            counter.reset_at = now + window;
        }
        counter.count++;
        result.count = counter.count;
        result.reset_in = std::chrono::duration_cast<std::chrono::milliseconds>(counter.reset_at - now);
    }
    co_return result;
}

Async<void> MemoryRateLimitStore::decrement(const std::string& key) {
    auto& shard = shard_for(key);
    {
        std::lock_guard<std::mutex> lock(shard.mtx);
        auto it = shard.counters.find(key);
        if (it != shard.counters.end() && it->second.count > 0) {
            it->second.count--;
        }
    }
    co_return;
}

Async<void> MemoryRateLimitStore::reset(const std::string& key) {
    auto& shard = shard_for(key);
    {
        std::lock_guard<std::mutex> lock(shard.mtx);
        shard.counters.erase(key);
    }
    co_return;
}

size_t MemoryRateLimitStore::sweep() {
    const auto now = now_();
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mtx);
        removed += std::erase_if(shard.counters, [&](const auto& entry) {
            return now >= entry.second.reset_at;
        });
    }
    return removed;
}

size_t MemoryRateLimitStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mtx);
        total += shard.counters.size();
    }
    return total;
}

RedisRateLimitStore::RedisRateLimitStore(Redis& redis, std::string key_prefix)
    : redis_(redis), key_prefix_(std::move(key_prefix)) {}

Async<WindowCount> RedisRateLimitStore::increment(const std::string& key, std::chrono::milliseconds window) {
    const std::string full_key = key_prefix_ + key;
    auto [count, ttl] = co_await redis_.incr_with_ttl(full_key);

    // -1: no expiry yet (first hit of the window)
    if (ttl < 0) {
        co_await redis_.pexpire(full_key, window);
        ttl = window.count();
    }
    co_return WindowCount{static_cast<long>(count), std::chrono::milliseconds(ttl)};
}

Async<void> RedisRateLimitStore::decrement(const std::string& key) {
    co_await redis_.decr(key_prefix_ + key);
}

Async<void> RedisRateLimitStore::reset(const std::string& key) {
    co_await redis_.del(key_prefix_ + key);
}

RateLimiter::RateLimiter(RateLimitStore& store, SubscriptionQuotas quotas, Logger* logger)
    : store_(store), quotas_(std::move(quotas)), logger_(logger) {}

void RateLimiter::add_policy(RateLimitPolicy policy) {
    if (policy.max_requests < 0 || policy.window.count() <= 0) {
        throw ValidationError("Invalid rate limit policy: " + policy.name);
    }
    auto name = policy.name;
    policies_[name] = std::move(policy);
}

bool RateLimiter::has_policy(const std::string& name) const {
    return policies_.contains(name);
}

const RateLimitPolicy& RateLimiter::policy(const std::string& name) const {
    auto it = policies_.find(name);
    if (it == policies_.end()) {
        throw NotFoundError("Rate limit policy '" + name + "'");
    }
    return it->second;
}

Async<RateLimitDecision> RateLimiter::check(const std::string& policy_name, const std::string& caller_key,
                                            std::optional<long> limit_override) {
    const auto& p = policy(policy_name);
    const long limit = limit_override.value_or(p.max_requests);
    const std::string key = p.name + ":" + caller_key;

    auto window = co_await store_.increment(key, p.window);

    RateLimitDecision decision;
    decision.allowed = window.count <= limit;
    decision.limit = limit;
    decision.remaining = std::max(0L, limit - window.count);
    decision.reset_time = std::chrono::system_clock::now() + window.reset_in;
    decision.policy = p.name;
    decision.key = key;

    if (!decision.allowed && logger_) {
        logger_->log_rate_limit(p.name, caller_key, limit);
    }
    co_return decision;
}

Async<RateLimitDecision> RateLimiter::check_request(const std::string& policy_name, const Request& req) {
    const auto& p = policy(policy_name);
    std::optional<long> limit;
    if (p.name == "subscription") {
        limit = subscription_limit(req.caller ? req.caller->subscription : std::nullopt);
    }
    co_return co_await check(policy_name, key_for(p, req), limit);
}

long RateLimiter::subscription_limit(const std::optional<Subscription>& subscription) const {
    if (!subscription) {
        auto it = policies_.find("default");
        return it != policies_.end() ? it->second.max_requests : RateLimitPolicy{}.max_requests;
    }
    auto it = quotas_.per_plan.find(subscription->plan_type);
    return it != quotas_.per_plan.end() ? it->second : quotas_.unlisted_plan;
}

Async<void> RateLimiter::refund(const RateLimitDecision& decision) {
    co_await store_.decrement(decision.key);
}

std::string RateLimiter::key_for(const RateLimitPolicy& policy, const Request& req) const {
    if (policy.key_by_address) {
        return "ip:" + req.client_ip;
    }
    return req.caller_key();
}

void RateLimiter::apply_headers(Response& res, const RateLimitDecision& decision) {
    const auto now = std::chrono::system_clock::now();
    auto reset_secs = std::chrono::duration_cast<std::chrono::seconds>(decision.reset_time - now).count();
    if (reset_secs < 0) reset_secs = 0;

    res.header("RateLimit-Limit", std::to_string(decision.limit));
    res.header("RateLimit-Remaining", std::to_string(decision.remaining));
    res.header("RateLimit-Reset", std::to_string(reset_secs));
    if (!decision.allowed) {
        res.header("Retry-After", std::to_string(std::max<long long>(1, reset_secs)));
    }
}

} // namespace streamgate
