#include "infrastructure/IdentityClient.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CredentialJson.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace kindlesender::infrastructure {

using json = nlohmann::json;
using domain::AuthError;

IdentityClient::IdentityClient(const domain::DeliverySettings& settings)
    : m_azure(settings.azure),
      m_authorityUrl(settings.authorityUrl),
      m_timeoutSeconds(settings.httpTimeoutSeconds) {}

std::string IdentityClient::tokenUrl() const {
    auto endpoint = UrlUtils::ParseHttpUrl(m_authorityUrl);
    if (!endpoint) return m_authorityUrl;
    return endpoint->origin() + endpoint->join(m_azure.tenantId + "/oauth2/v2.0/token");
}

domain::Credential IdentityClient::exchange(const std::string& code, const std::string& redirectUri) {
    return requestToken({
        {"client_id", m_azure.clientId},
        {"scope", kExchangeScope},
        {"code", code},
        {"redirect_uri", redirectUri},
        {"grant_type", "authorization_code"},
        {"client_secret", m_azure.clientSecret}
    }, "Error exchanging code for token");
}

domain::Credential IdentityClient::refresh(const std::string& refreshToken) {
    return requestToken({
        {"client_id", m_azure.clientId},
        {"scope", kRefreshScope},
        {"refresh_token", refreshToken},
        {"grant_type", "refresh_token"},
        {"client_secret", m_azure.clientSecret}
    }, "Error refreshing token");
}

domain::Credential IdentityClient::requestToken(const FormFields& fields, const std::string& failurePrefix) {
    auto endpoint = UrlUtils::ParseHttpUrl(m_authorityUrl);
    if (!endpoint) {
        throw AuthError(failurePrefix + ": invalid authority URL " + m_authorityUrl);
    }

    httplib::Client cli(endpoint->origin());
    if (!cli.is_valid()) {
        throw AuthError(failurePrefix + ": cannot open a client for " + endpoint->origin());
    }
    if (m_timeoutSeconds > 0) {
        cli.set_connection_timeout(m_timeoutSeconds);
        cli.set_read_timeout(m_timeoutSeconds);
        cli.set_write_timeout(m_timeoutSeconds);
    }

    httplib::Params params;
    for (const auto& field : fields) {
        params.emplace(field.first, field.second);
    }

    auto res = cli.Post(endpoint->join(m_azure.tenantId + "/oauth2/v2.0/token"), params);
    if (!res) {
        throw AuthError(failurePrefix + ": connection to " + endpoint->origin() + " failed (" +
                        httplib::to_string(res.error()) + ")");
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[IdentityClient] HTTP Error " << res->status << " from token endpoint" << std::endl;
        throw AuthError(failurePrefix + ": HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        return CredentialJson::FromJson(json::parse(res->body));
    } catch (const json::exception& e) {
        throw AuthError(failurePrefix + ": response is not valid JSON: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw AuthError(failurePrefix + ": unexpected token response: " + e.what());
    }
}

} // namespace kindlesender::infrastructure
