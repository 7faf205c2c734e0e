/**
 * @file Errors.hpp
 * @brief Exception types raised across the delivery pipeline.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace kindlesender::domain {

/**
 * @class AuthError
 * @brief Credential acquisition failed. Fatal to the whole run.
 */
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class SendError
 * @brief A single file could not be delivered.
 *
 * When the mail gateway answered with a non-success status, the status and the
 * raw response body are kept verbatim.
 */
class SendError : public std::runtime_error {
public:
    explicit SendError(const std::string& message) : std::runtime_error(message) {}

    SendError(const std::string& message, int httpStatus, std::string responseBody)
        : std::runtime_error(message), m_httpStatus(httpStatus), m_responseBody(std::move(responseBody)) {}

    const std::optional<int>& httpStatus() const { return m_httpStatus; }
    const std::string& responseBody() const { return m_responseBody; }

private:
    std::optional<int> m_httpStatus;
    std::string m_responseBody;
};

/**
 * @class OrchestrationError
 * @brief The batch could not start: source listing or authentication failed.
 */
class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ConfigError
 * @brief config.json is missing, malformed or incomplete.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace kindlesender::domain
