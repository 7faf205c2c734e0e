/**
 * @file KindleSenderApp.hpp
 * @brief Command-line front end for Kindle Sender.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include "domain/DeliverySettings.hpp"

namespace kindlesender::app {

/**
 * @class KindleSenderApp
 * @brief Parses the command line, loads configuration and wires the services for one run.
 */
class KindleSenderApp {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    /**
     * @brief Runs one command.
     * @param args Arguments without the program name, e.g. {"send", "--config", "cfg.json"}.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

    /** @brief Settings as printed by the "config" command, secrets masked. */
    static std::string DescribeSettings(const domain::DeliverySettings& settings);

private:
    int RunSend(const domain::DeliverySettings& settings);
    int RunShowConfig(const domain::DeliverySettings& settings);
    static void PrintUsage(std::ostream& out);
};

} // namespace kindlesender::app
