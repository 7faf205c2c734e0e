/**
 * @file DeliveryOrchestrator.hpp
 * @brief Application service that mails every pending e-book and files away the sent ones.
 */

#pragma once
#include "domain/AccessTokenProvider.hpp"
#include "domain/BatchOutcome.hpp"
#include "domain/DeliverySettings.hpp"
#include "domain/FileStore.hpp"
#include "domain/MailGateway.hpp"
#include <memory>
#include <string>

namespace kindlesender::application {

/**
 * @class DeliveryOrchestrator
 * @brief Coordinates the flow between the file store, authentication and the mail gateway.
 */
class DeliveryOrchestrator {
public:
    /**
     * @brief Constructor for DeliveryOrchestrator.
     * @param settings Source/destination directories.
     * @param tokens Authentication, asked once per non-empty batch.
     * @param gateway Sends one file per call.
     * @param files Lists and relocates files.
     */
    DeliveryOrchestrator(const domain::DeliverySettings& settings,
                         std::shared_ptr<domain::AccessTokenProvider> tokens,
                         std::shared_ptr<domain::MailGateway> gateway,
                         std::shared_ptr<domain::FileStore> files);

    /**
     * @brief Sends every file in the source directory, in filename order.
     *
     * Per-file failures are recorded in the outcome and never stop the batch.
     * An empty source directory returns {0, 0} without authenticating.
     * @throws domain::OrchestrationError if the source directory cannot be listed or authentication fails.
     */
    domain::BatchOutcome run();

private:
    domain::FileOutcome deliverFile(const std::string& accessToken, const std::string& filePath);

    std::string m_sourceDirectory;
    std::string m_sentDirectory;
    std::shared_ptr<domain::AccessTokenProvider> m_tokens; ///< Token source.
    std::shared_ptr<domain::MailGateway> m_gateway;        ///< Mail delivery.
    std::shared_ptr<domain::FileStore> m_files;            ///< Filesystem capability.
};

} // namespace kindlesender::application
