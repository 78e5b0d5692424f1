#ifndef STREAMGATE_AUTH_H
#define STREAMGATE_AUTH_H

#include <string>
#include <string_view>
#include <streamgate/request.h>

namespace streamgate {

/**
 * @brief Turns a bearer credential into a caller identity.
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /** @throws AuthenticationError when the credential is not acceptable. */
    virtual CallerIdentity verify(std::string_view token) const = 0;
};

/**
 * @brief HS256 bearer tokens signed with a shared secret.
 *
 * Reads the claims id, email, profileId and subscription {planType, status}.
 * Only verification happens here; tokens are issued by the auth service.
 */
class JwtAuthenticator : public Authenticator {
public:
    explicit JwtAuthenticator(std::string secret);

    CallerIdentity verify(std::string_view token) const override;

private:
    std::string secret_;
};

/**
 * @brief Token from an Authorization header: "Bearer <token>" or the bare token.
 * Empty when the header is absent.
 */
std::string_view extract_bearer(std::string_view authorization);

} // namespace streamgate

#endif // STREAMGATE_AUTH_H
