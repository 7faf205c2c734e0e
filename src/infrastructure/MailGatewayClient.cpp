#include "infrastructure/MailGatewayClient.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <new>

namespace kindlesender::infrastructure {

using json = nlohmann::json;
using domain::SendError;

namespace {
constexpr const char* kSendMailPath = "v1.0/me/sendMail";
}

MailGatewayClient::MailGatewayClient(const domain::DeliverySettings& settings)
    : m_receivers(settings.receivers),
      m_graphUrl(settings.graphUrl),
      m_timeoutSeconds(settings.httpTimeoutSeconds) {}

domain::EmailPayload MailGatewayClient::buildPayload(const std::string& filePath) const {
    std::string filename = std::filesystem::path(filePath).filename().string();
    if (filename.empty()) {
        throw SendError("Failed to get filename from file path: " + filePath);
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw SendError("Failed to open file: " + filePath);
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw SendError("Failed to read file: " + filePath);
    }

    domain::EmailPayload payload;
    payload.toRecipients = m_receivers;

    domain::FileAttachment attachment;
    attachment.name = filename;
    attachment.contentBytes = Base64::Encode(bytes);
    payload.attachments.push_back(std::move(attachment));
    return payload;
}

json MailGatewayClient::ToJson(const domain::EmailPayload& payload) {
    json recipients = json::array();
    for (const auto& address : payload.toRecipients) {
        recipients.push_back({{"emailAddress", {{"address", address}}}});
    }

    json attachments = json::array();
    for (const auto& a : payload.attachments) {
        attachments.push_back({
            {"@odata.type", domain::FileAttachment::kODataType},
            {"name", a.name},
            {"contentType", a.contentType},
            {"contentBytes", a.contentBytes}
        });
    }

    return {
        {"message", {
            {"subject", payload.subject},
            {"body", {
                {"contentType", payload.bodyContentType},
                {"content", payload.bodyContent}
            }},
            {"toRecipients", recipients},
            {"attachments", attachments}
        }},
        {"saveToSentItems", payload.saveToSentItems}
    };
}

void MailGatewayClient::send(const std::string& accessToken, const std::string& filePath) {
    domain::EmailPayload payload;
    std::string body;
    try {
        payload = buildPayload(filePath);
        // Filenames are arbitrary bytes; invalid UTF-8 is replaced with U+FFFD instead of failing the dump.
        body = ToJson(payload).dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw SendError("Failed to build email for " + filePath + ": " + e.what());
    } catch (const std::bad_alloc&) {
        throw SendError("Failed to build email for " + filePath + ": file too large to load");
    }

    auto endpoint = UrlUtils::ParseHttpUrl(m_graphUrl);
    if (!endpoint) {
        throw SendError("Failed to send email: invalid gateway URL " + m_graphUrl);
    }

    httplib::Client cli(endpoint->origin());
    if (!cli.is_valid()) {
        throw SendError("Failed to send email: cannot open a client for " + endpoint->origin());
    }
    if (m_timeoutSeconds > 0) {
        cli.set_connection_timeout(m_timeoutSeconds);
        cli.set_read_timeout(m_timeoutSeconds);
        cli.set_write_timeout(m_timeoutSeconds);
    }
    cli.set_bearer_token_auth(accessToken);

    auto res = cli.Post(endpoint->join(kSendMailPath), body, "application/json");
    if (!res) {
        throw SendError("Failed to send email: connection to " + endpoint->origin() + " failed (" +
                        httplib::to_string(res.error()) + ")");
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[MailGatewayClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw SendError("Failed to send email: HTTP " + std::to_string(res->status) + " " + res->body,
                        res->status, res->body);
    }

    std::cout << "[MailGatewayClient] Email with attachment " << payload.attachments.front().name
              << " sent successfully." << std::endl;
}

} // namespace kindlesender::infrastructure
