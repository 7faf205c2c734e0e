/**
 * @file KindleSenderApp.cpp
 * @brief Implementation of the KindleSenderApp class.
 */
#include "app/KindleSenderApp.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/AuthenticationManager.hpp"
#include "application/DeliveryOrchestrator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CallbackListener.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileTokenStore.hpp"
#include "infrastructure/IdentityClient.hpp"
#include "infrastructure/LocalFileStore.hpp"
#include "infrastructure/MailGatewayClient.hpp"
#include "infrastructure/PathUtils.hpp"

namespace kindlesender::app {

namespace {

std::string MaskSecret(const std::string& value) {
    if (value.empty()) return "(empty)";
    if (value.size() <= 4) return "****";
    return value.substr(0, 2) + std::string(value.size() - 4, '*') + value.substr(value.size() - 2);
}

} // namespace

int KindleSenderApp::Run(const std::vector<std::string>& args) {
    std::string command;
    std::string configPath = infrastructure::PathUtils::GetDefaultConfigPath().string();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help" || arg == "help") {
            PrintUsage(std::cout);
            return kExitSuccess;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                std::cerr << "[KindleSenderApp] " << arg << " requires a path" << std::endl;
                PrintUsage(std::cerr);
                return kExitUsage;
            }
            configPath = args[++i];
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[KindleSenderApp] Unknown option: " << arg << std::endl;
            PrintUsage(std::cerr);
            return kExitUsage;
        }
        if (!command.empty()) {
            std::cerr << "[KindleSenderApp] Unexpected argument: " << arg << std::endl;
            PrintUsage(std::cerr);
            return kExitUsage;
        }
        command = arg;
    }

    if (command != "send" && command != "config") {
        if (command.empty()) {
            std::cerr << "[KindleSenderApp] Missing command" << std::endl;
        } else {
            std::cerr << "[KindleSenderApp] Unknown command: " << command << std::endl;
        }
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    domain::DeliverySettings settings;
    try {
        settings = infrastructure::ConfigLoader::Load(configPath);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[KindleSenderApp] " << e.what() << std::endl;
        return kExitFailure;
    }

    if (command == "config") {
        return RunShowConfig(settings);
    }
    return RunSend(settings);
}

int KindleSenderApp::RunSend(const domain::DeliverySettings& settings) {
    auto store = std::make_shared<infrastructure::FileTokenStore>(infrastructure::PathUtils::GetCredentialPath());
    auto identity = std::make_shared<infrastructure::IdentityClient>(settings);

    const std::string callbackUri = settings.callbackUri;
    const std::chrono::seconds callbackTimeout(settings.callbackTimeoutSeconds);
    auto listenerFactory = [callbackUri, callbackTimeout]() -> std::unique_ptr<domain::AuthorizationCodeSource> {
        return std::make_unique<infrastructure::CallbackListener>(callbackUri, callbackTimeout);
    };

    auto auth = std::make_shared<application::AuthenticationManager>(settings, store, identity, listenerFactory);
    auto gateway = std::make_shared<infrastructure::MailGatewayClient>(settings);
    auto files = std::make_shared<infrastructure::LocalFileStore>();

    application::DeliveryOrchestrator orchestrator(settings, auth, gateway, files);

    domain::BatchOutcome outcome;
    try {
        outcome = orchestrator.run();
    } catch (const domain::OrchestrationError& e) {
        std::cerr << "[KindleSenderApp] Error sending files: " << e.what() << std::endl;
        return kExitFailure;
    }

    if (!outcome.succeeded()) {
        std::cerr << "[KindleSenderApp] Error sending files: Failed to process " << outcome.failureCount
                  << " files" << std::endl;
        for (const auto& file : outcome.files) {
            if (file.status != domain::FileStatus::Sent) {
                std::cerr << "  " << file.filename << " (" << domain::ToString(file.status) << "): "
                          << file.detail << std::endl;
            }
        }
        return kExitFailure;
    }

    std::cout << "[KindleSenderApp] Files sent successfully!" << std::endl;
    return kExitSuccess;
}

int KindleSenderApp::RunShowConfig(const domain::DeliverySettings& settings) {
    std::cout << DescribeSettings(settings);
    return kExitSuccess;
}

std::string KindleSenderApp::DescribeSettings(const domain::DeliverySettings& settings) {
    std::ostringstream out;
    out << "Configuration:\n"
        << "  Callback URI: " << settings.callbackUri << "\n"
        << "  Ebook to send directory: " << settings.sourceDirectory << "\n"
        << "  Ebook sent directory: " << settings.sentDirectory << "\n"
        << "  Receivers:\n";
    for (size_t i = 0; i < settings.receivers.size(); ++i) {
        out << "    " << (i + 1) << ". " << settings.receivers[i] << "\n";
    }
    out << "  Azure:\n"
        << "    Client ID: " << settings.azure.clientId << "\n"
        << "    Client secret: " << MaskSecret(settings.azure.clientSecret) << "\n"
        << "    Tenant ID: " << settings.azure.tenantId << "\n"
        << "  Authority URL: " << settings.authorityUrl << "\n"
        << "  Graph URL: " << settings.graphUrl << "\n"
        << "  Callback timeout: " << settings.callbackTimeoutSeconds << "s\n"
        << "  HTTP timeout: " << settings.httpTimeoutSeconds << "s\n"
        << "  Credential file: " << infrastructure::PathUtils::GetCredentialPath().string() << "\n";
    return out.str();
}

void KindleSenderApp::PrintUsage(std::ostream& out) {
    out << "Usage: kindle-sender <command> [--config <path>]\n"
        << "\n"
        << "Commands:\n"
        << "  send     Send every e-book in the configured directory to the Kindle addresses\n"
        << "  config   Show the loaded configuration (secrets masked)\n"
        << "  help     Show this message\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config <path>  Configuration file (default: ./config.json)\n";
}

} // namespace kindlesender::app
