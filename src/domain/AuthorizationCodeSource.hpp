/**
 * @file AuthorizationCodeSource.hpp
 * @brief Interface for receiving the authorization code of an interactive login.
 */

#pragma once
#include <string>

namespace kindlesender::domain {

/**
 * @class AuthorizationCodeSource
 * @brief Delivers one authorization code from the browser redirect.
 */
class AuthorizationCodeSource {
public:
    virtual ~AuthorizationCodeSource() = default;

    /**
     * @brief Blocks until the redirect carrying the code arrives.
     * @throws AuthError if no code can be received.
     */
    virtual std::string awaitAuthorizationCode() = 0;
};

} // namespace kindlesender::domain
