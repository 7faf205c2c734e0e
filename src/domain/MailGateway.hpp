/**
 * @file MailGateway.hpp
 * @brief Interface for delivering one file as an email attachment.
 */

#pragma once
#include <string>

namespace kindlesender::domain {

/**
 * @class MailGateway
 * @brief Sends a single e-book to every configured receiver.
 */
class MailGateway {
public:
    virtual ~MailGateway() = default;

    /**
     * @brief Sends filePath as the only attachment of one email.
     * @param accessToken Bearer token obtained for this batch.
     * @param filePath File to attach.
     * @throws SendError on any failure, including a non-success HTTP status.
     */
    virtual void send(const std::string& accessToken, const std::string& filePath) = 0;
};

} // namespace kindlesender::domain
