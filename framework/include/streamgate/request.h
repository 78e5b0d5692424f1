#ifndef STREAMGATE_REQUEST_H
#define STREAMGATE_REQUEST_H

#include <any>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <boost/beast/http/fields.hpp>
#include <boost/json/value.hpp>

namespace streamgate {

struct Subscription {
    std::string plan_type;
    std::string status;

    bool is_active() const { return status == "ACTIVE"; }
};

/**
 * @brief Who is calling, as established by the Authenticator.
 */
struct CallerIdentity {
    std::string id;
    std::string email;
    std::optional<std::string> profile_id;
    std::optional<Subscription> subscription;
};

struct Request {
    std::string method;
    std::string path;
    std::string target;
    std::string body;
    std::unordered_map<std::string, std::string> params;
    std::unordered_map<std::string, std::string> query;

    // Owned copy of Beast headers
    boost::beast::http::fields headers;

    std::string client_ip;
    std::string request_id;
    std::optional<CallerIdentity> caller;

    /** @brief Sets path, raw target and decoded query map from a request target. */
    void set_target(std::string_view target);

    /** @brief Raw query string without the leading '?', empty when absent. */
    std::string_view query_string() const;

    /** @throws ValidationError on malformed JSON. */
    boost::json::value json() const;

    std::string get_query(const std::string& key, const std::string& default_val = "") const;
    int get_query_int(const std::string& key, int default_val = 0) const;

    std::string_view get_header(std::string_view key) const;
    bool has_header(std::string_view key) const;

    // Caller key for quota accounting: user:<id> when authenticated, else ip:<address>.
    std::string caller_key() const;

    template<typename T>
    void set(const std::string& key, T&& value) {
        context_[key] = std::make_any<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    T get(const std::string& key) const {
        auto it = context_.find(key);
        if (it == context_.end()) {
            throw std::runtime_error("Key not found in request context: " + key);
        }
        return std::any_cast<T>(it->second);
    }

    template<typename T>
    std::optional<T> get_opt(const std::string& key) const {
        const auto it = context_.find(key);
        if (it == context_.end()) return std::nullopt;
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

private:
    std::unordered_map<std::string, std::any> context_;
};

} // namespace streamgate

#endif // STREAMGATE_REQUEST_H
