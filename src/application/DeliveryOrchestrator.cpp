/**
 * @file DeliveryOrchestrator.cpp
 * @brief Implementation of the DeliveryOrchestrator class.
 */
#include "application/DeliveryOrchestrator.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

namespace kindlesender::application {

using domain::FileOutcome;
using domain::FileStatus;

namespace {

std::string DisplayName(const std::string& filePath) {
    std::string name = std::filesystem::path(filePath).filename().string();
    return name.empty() ? std::string("Unknown file") : name;
}

} // namespace

DeliveryOrchestrator::DeliveryOrchestrator(const domain::DeliverySettings& settings,
                                           std::shared_ptr<domain::AccessTokenProvider> tokens,
                                           std::shared_ptr<domain::MailGateway> gateway,
                                           std::shared_ptr<domain::FileStore> files)
    : m_sourceDirectory(settings.sourceDirectory),
      m_sentDirectory(settings.sentDirectory),
      m_tokens(std::move(tokens)),
      m_gateway(std::move(gateway)),
      m_files(std::move(files)) {}

domain::BatchOutcome DeliveryOrchestrator::run() {
    std::cout << "[DeliveryOrchestrator] Starting file sending process..." << std::endl;

    std::vector<std::string> pending;
    try {
        pending = m_files->listFiles(m_sourceDirectory);
    } catch (const std::exception& e) {
        throw domain::OrchestrationError(e.what());
    }

    domain::BatchOutcome outcome;
    if (pending.empty()) {
        std::cout << "[DeliveryOrchestrator] No files found in directory to send." << std::endl;
        return outcome;
    }
    std::cout << "[DeliveryOrchestrator] Found " << pending.size() << " files to send" << std::endl;

    std::string accessToken;
    try {
        accessToken = m_tokens->obtainAccessToken();
    } catch (const domain::AuthError& e) {
        throw domain::OrchestrationError(std::string("Authentication failed: ") + e.what());
    }

    for (const auto& filePath : pending) {
        FileOutcome result = deliverFile(accessToken, filePath);
        if (result.status == FileStatus::Sent) {
            ++outcome.successCount;
        } else {
            ++outcome.failureCount;
        }
        outcome.files.push_back(std::move(result));
    }

    std::cout << "[DeliveryOrchestrator] Sending process completed. Successfully sent: " << outcome.successCount
              << ", Failed: " << outcome.failureCount << std::endl;

    int relocationFailures = outcome.countWithStatus(FileStatus::RelocationFailed);
    if (relocationFailures > 0) {
        std::cerr << "[DeliveryOrchestrator] WARNING: " << relocationFailures
                  << " file(s) were delivered but are still in " << m_sourceDirectory
                  << "; a rerun will send them again." << std::endl;
    }
    return outcome;
}

FileOutcome DeliveryOrchestrator::deliverFile(const std::string& accessToken, const std::string& filePath) {
    FileOutcome result;
    result.path = filePath;
    result.filename = DisplayName(filePath);

    std::cout << "[DeliveryOrchestrator] Sending file: " << result.filename << std::endl;
    try {
        m_gateway->send(accessToken, filePath);
    } catch (const domain::SendError& e) {
        std::cerr << "[DeliveryOrchestrator] Failed to send file " << result.filename << ": " << e.what() << std::endl;
        result.status = FileStatus::SendFailed;
        result.detail = e.what();
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[DeliveryOrchestrator] Unexpected error sending file " << result.filename << ": " << e.what() << std::endl;
        result.status = FileStatus::SendFailed;
        result.detail = e.what();
        return result;
    }
    std::cout << "[DeliveryOrchestrator] Successfully sent file: " << result.filename << std::endl;

    try {
        m_files->moveToDirectory(filePath, m_sentDirectory);
    } catch (const std::exception& e) {
        std::cerr << "[DeliveryOrchestrator] Failed to move file " << result.filename << ": " << e.what() << std::endl;
        result.status = FileStatus::RelocationFailed;
        result.detail = e.what();
        return result;
    }
    std::cout << "[DeliveryOrchestrator] Moved file to sent directory: " << result.filename << std::endl;

    result.status = FileStatus::Sent;
    return result;
}

} // namespace kindlesender::application
