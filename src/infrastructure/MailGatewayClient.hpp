/**
 * @file MailGatewayClient.hpp
 * @brief Microsoft Graph sendMail client that mails one e-book per call.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/DeliverySettings.hpp"
#include "domain/EmailPayload.hpp"
#include "domain/MailGateway.hpp"

namespace kindlesender::infrastructure {

class MailGatewayClient : public domain::MailGateway {
public:
    explicit MailGatewayClient(const domain::DeliverySettings& settings);

    /** @brief POSTs the file to /v1.0/me/sendMail. @see domain::MailGateway::send */
    void send(const std::string& accessToken, const std::string& filePath) override;

    /**
     * @brief Reads filePath and wraps it into a payload for the configured receivers.
     * @throws domain::SendError if the file cannot be read or has no filename.
     */
    domain::EmailPayload buildPayload(const std::string& filePath) const;

    /** @brief Graph JSON shape of a payload. */
    static nlohmann::json ToJson(const domain::EmailPayload& payload);

private:
    std::vector<std::string> m_receivers; ///< One toRecipients entry each.
    std::string m_graphUrl;               ///< e.g. https://graph.microsoft.com
    int m_timeoutSeconds;
};

} // namespace kindlesender::infrastructure
