/**
 * @file DeliverySettings.hpp
 * @brief Read-only settings for a delivery run.
 */

#pragma once
#include <string>
#include <vector>

namespace kindlesender::domain {

/**
 * @struct AzureSettings
 * @brief Application registration on the identity provider.
 */
struct AzureSettings {
    std::string clientId;
    std::string clientSecret;
    std::string tenantId; ///< Often "common" for multi-tenant apps.
};

/**
 * @struct DeliverySettings
 * @brief Everything a run needs to know, loaded once from config.json.
 */
struct DeliverySettings {
    std::string callbackUri = "http://localhost:8080/callback"; ///< OAuth redirect URI, also where the listener binds.
    std::string sourceDirectory;      ///< E-books waiting to be sent.
    std::string sentDirectory;        ///< E-books are moved here after a successful send.
    std::vector<std::string> receivers; ///< E-reader inbox addresses.
    AzureSettings azure;

    std::string authorityUrl = "https://login.microsoftonline.com";
    std::string graphUrl = "https://graph.microsoft.com";
    int callbackTimeoutSeconds = 300; ///< 0 waits forever for the browser redirect.
    int httpTimeoutSeconds = 30;
};

} // namespace kindlesender::domain
