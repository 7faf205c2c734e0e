/**
 * @file AccessTokenProvider.hpp
 * @brief Interface for anything that can hand out a usable access token.
 */

#pragma once
#include <string>

namespace kindlesender::domain {

class AccessTokenProvider {
public:
    virtual ~AccessTokenProvider() = default;

    /** @throws AuthError when no token can be obtained. */
    virtual std::string obtainAccessToken() = 0;
};

} // namespace kindlesender::domain
