/**
 * @file IdentityClient.hpp
 * @brief HTTP client for the identity provider's OAuth2 token endpoint.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "domain/DeliverySettings.hpp"
#include "domain/IdentityService.hpp"

namespace kindlesender::infrastructure {

/**
 * @class IdentityClient
 * @brief Implements IdentityService against <authority>/<tenant>/oauth2/v2.0/token.
 */
class IdentityClient : public domain::IdentityService {
public:
    static constexpr const char* kExchangeScope = "Mail.Send";
    static constexpr const char* kRefreshScope = "https://graph.microsoft.com/.default";

    explicit IdentityClient(const domain::DeliverySettings& settings);

    /** @brief grant_type=authorization_code. @see domain::IdentityService::exchange */
    domain::Credential exchange(const std::string& code, const std::string& redirectUri) override;

    /** @brief grant_type=refresh_token. @see domain::IdentityService::refresh */
    domain::Credential refresh(const std::string& refreshToken) override;

    /** @brief Full token endpoint URL, for diagnostics. */
    std::string tokenUrl() const;

private:
    using FormFields = std::vector<std::pair<std::string, std::string>>;

    domain::Credential requestToken(const FormFields& fields, const std::string& failurePrefix);

    domain::AzureSettings m_azure; ///< Client registration.
    std::string m_authorityUrl;    ///< e.g. https://login.microsoftonline.com
    int m_timeoutSeconds;          ///< Connect/read/write timeout, 0 keeps library defaults.
};

} // namespace kindlesender::infrastructure
