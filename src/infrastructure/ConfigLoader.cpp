/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <fstream>

namespace kindlesender::infrastructure {

using json = nlohmann::json;
using domain::ConfigError;

namespace {

std::string RequireString(const json& j, const char* key, const std::string& scope = "") {
    const std::string name = scope.empty() ? key : scope + "." + key;
    if (!j.contains(key)) {
        throw ConfigError("Missing required key '" + name + "'");
    }
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        throw ConfigError("Key '" + name + "' must be a non-empty string");
    }
    return j[key].get<std::string>();
}

int OptionalSeconds(const json& j, const char* key, int fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (!j[key].is_number_integer() || j[key].get<int>() < 0) {
        throw ConfigError(std::string("Key '") + key + "' must be a non-negative integer");
    }
    return j[key].get<int>();
}

} // namespace

domain::DeliverySettings ConfigLoader::Load(const std::filesystem::path& configPath) {
    std::ifstream f(configPath);
    if (!f.is_open()) {
        throw ConfigError("Error reading configuration file (" + configPath.string() + "): cannot open file");
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Error reading configuration file (" + configPath.string() + "): " + e.what());
    }

    try {
        return FromJson(j);
    } catch (const ConfigError& e) {
        throw ConfigError("Error reading configuration file (" + configPath.string() + "): " + e.what());
    }
}

domain::DeliverySettings ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Top-level value must be an object");
    }

    domain::DeliverySettings s;
    s.callbackUri = RequireString(j, "callback_uri");
    s.sourceDirectory = RequireString(j, "ebook_to_send_directory");
    s.sentDirectory = RequireString(j, "ebook_sent_directory");

    if (!j.contains("receivers") || !j["receivers"].is_array()) {
        throw ConfigError("Key 'receivers' must be an array of email addresses");
    }
    for (const auto& item : j["receivers"]) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            throw ConfigError("Every entry of 'receivers' must be a non-empty string");
        }
        s.receivers.push_back(item.get<std::string>());
    }
    if (s.receivers.empty()) {
        throw ConfigError("Key 'receivers' must list at least one address");
    }

    if (!j.contains("azure") || !j["azure"].is_object()) {
        throw ConfigError("Missing required object 'azure'");
    }
    const auto& azure = j["azure"];
    s.azure.clientId = RequireString(azure, "client_id", "azure");
    s.azure.clientSecret = RequireString(azure, "client_secret", "azure");
    s.azure.tenantId = RequireString(azure, "tenant_id", "azure");

    if (j.contains("authority_url")) s.authorityUrl = RequireString(j, "authority_url");
    if (j.contains("graph_url")) s.graphUrl = RequireString(j, "graph_url");
    s.callbackTimeoutSeconds = OptionalSeconds(j, "callback_timeout_seconds", s.callbackTimeoutSeconds);
    s.httpTimeoutSeconds = OptionalSeconds(j, "http_timeout_seconds", s.httpTimeoutSeconds);

    for (const auto* url : {&s.callbackUri, &s.authorityUrl, &s.graphUrl}) {
        if (!UrlUtils::ParseHttpUrl(*url)) {
            throw ConfigError("'" + *url + "' is not a valid http(s) URL");
        }
    }
    return s;
}

} // namespace kindlesender::infrastructure
