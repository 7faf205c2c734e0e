/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the delivery configuration (config.json).
 *
 * Keeps all JSON parsing of settings in one place; the rest of the code only
 * sees a populated domain::DeliverySettings.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DeliverySettings.hpp"

namespace kindlesender::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a config file.
     * @param configPath Path to config.json.
     * @return Fully populated settings.
     * @throws domain::ConfigError if the file is missing, not JSON, or lacks a required key.
     */
    static domain::DeliverySettings Load(const std::filesystem::path& configPath);

    /**
     * @brief Validates an already parsed document.
     * @throws domain::ConfigError on the first problem found.
     */
    static domain::DeliverySettings FromJson(const nlohmann::json& j);
};

} // namespace kindlesender::infrastructure
