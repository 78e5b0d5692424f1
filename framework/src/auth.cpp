#include <streamgate/auth.h>
#include <streamgate/crypto.h>
#include <streamgate/exceptions.h>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace streamgate {

namespace {

    // Accepts string or numeric claims; user ids are numbers in some token issuers.
    std::string claim_string(const boost::json::object& claims, std::string_view key) {
        const auto* value = claims.if_contains(key);
        if (!value) return {};
        if (value->is_string()) return std::string(value->as_string());
        if (value->is_int64()) return std::to_string(value->as_int64());
        if (value->is_uint64()) return std::to_string(value->as_uint64());
        return {};
    }
}

JwtAuthenticator::JwtAuthenticator(std::string secret) : secret_(std::move(secret)) {}

CallerIdentity JwtAuthenticator::verify(std::string_view token) const {
    if (secret_.empty()) {
        throw AuthenticationError("Authentication failed");
    }

    crypto::JwtError reason = crypto::JwtError::None;
    auto claims = crypto::jwt_verify(token, secret_, &reason);
    if (!claims) {
        if (reason == crypto::JwtError::Expired) {
            throw AuthenticationError("Token has expired");
        }
        throw AuthenticationError("Invalid token");
    }

    CallerIdentity identity;
    identity.id = claim_string(*claims, "id");
    if (identity.id.empty()) {
        throw AuthenticationError("Invalid token");
    }
    identity.email = claim_string(*claims, "email");

    if (auto profile = claim_string(*claims, "profileId"); !profile.empty()) {
        identity.profile_id = std::move(profile);
    }

    if (const auto* sub = claims->if_contains("subscription"); sub && sub->is_object()) {
        const auto& obj = sub->as_object();
        identity.subscription = Subscription{claim_string(obj, "planType"), claim_string(obj, "status")};
    }

    return identity;
}

std::string_view extract_bearer(std::string_view authorization) {
    constexpr std::string_view scheme = "Bearer ";
    if (authorization.substr(0, scheme.size()) == scheme) {
        authorization.remove_prefix(scheme.size());
    }
    while (!authorization.empty() && authorization.front() == ' ') authorization.remove_prefix(1);
    while (!authorization.empty() && authorization.back() == ' ') authorization.remove_suffix(1);
    return authorization;
}

} // namespace streamgate
