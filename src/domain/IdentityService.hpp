/**
 * @file IdentityService.hpp
 * @brief Interface to the identity provider's token endpoint.
 */

#pragma once
#include <string>
#include "Credential.hpp"

namespace kindlesender::domain {

/**
 * @class IdentityService
 * @brief Turns an authorization code or a refresh token into a fresh Credential.
 *
 * Implementations make exactly one attempt per call and throw AuthError on any
 * failure. The returned credential has no expiresAt; the caller stamps it.
 */
class IdentityService {
public:
    virtual ~IdentityService() = default;

    /** @brief Authorization-code grant. */
    virtual Credential exchange(const std::string& code, const std::string& redirectUri) = 0;

    /** @brief Refresh-token grant. */
    virtual Credential refresh(const std::string& refreshToken) = 0;
};

} // namespace kindlesender::domain
