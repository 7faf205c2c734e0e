/**
 * @file EmailPayload.hpp
 * @brief Transient email-with-attachment message for the mail gateway.
 */

#pragma once
#include <string>
#include <vector>

namespace kindlesender::domain {

/**
 * @struct FileAttachment
 * @brief A single base64-encoded file attachment.
 */
struct FileAttachment {
    static constexpr const char* kODataType = "#microsoft.graph.fileAttachment";
    static constexpr const char* kOctetStream = "application/octet-stream";

    std::string name;          ///< Final path segment of the source file.
    std::string contentType = kOctetStream;
    std::string contentBytes;  ///< Base64 of the full file content.
};

/**
 * @struct EmailPayload
 * @brief One outbound email. Built per send attempt and never persisted.
 */
struct EmailPayload {
    static constexpr const char* kDefaultSubject = "Your Kindle File";

    std::string subject = kDefaultSubject;
    std::string bodyContentType = "Text";
    std::string bodyContent;              ///< Empty by convention.
    std::vector<std::string> toRecipients;
    std::vector<FileAttachment> attachments;
    bool saveToSentItems = true;
};

} // namespace kindlesender::domain
