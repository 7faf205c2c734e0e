/**
 * @file CallbackListener.cpp
 * @brief Implementation of CallbackListener.
 */

#include "infrastructure/CallbackListener.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/UrlUtils.hpp"
#include <httplib.h>
#include <iostream>

namespace kindlesender::infrastructure {

using domain::AuthError;

CallbackListener::CallbackListener(const std::string& redirectUri, std::chrono::seconds timeout)
    : m_server(std::make_unique<httplib::Server>()), m_timeout(timeout) {
    auto endpoint = UrlUtils::ParseHttpUrl(redirectUri);
    if (!endpoint || endpoint->scheme != "http") {
        throw AuthError("Callback URI must be a plain http URL: " + redirectUri);
    }
    m_path = endpoint->path;
    m_port = endpoint->port;

    // The provider redirects the browser to "localhost"; pin it to IPv4 loopback.
    std::string bindHost = endpoint->host == "localhost" ? "127.0.0.1" : endpoint->host;

    m_slot.emplace();
    m_result = m_slot->get_future();

    m_server->Get(m_path, [this](const httplib::Request& req, httplib::Response& res) {
        handleRedirect(req, res);
    });

    if (!m_server->bind_to_port(bindHost, m_port)) {
        throw AuthError("Cannot listen on " + bindHost + ":" + std::to_string(m_port) +
                        " for the authorization redirect (port in use?)");
    }

    m_serverThread = std::thread([this]() { m_server->listen_after_bind(); });
    m_server->wait_until_ready();
    std::cout << "[CallbackListener] Waiting for redirect on http://" << bindHost << ":" << m_port << m_path << std::endl;
}

CallbackListener::~CallbackListener() {
    stop();
}

void CallbackListener::stop() {
    if (m_server) {
        m_server->stop();
    }
    if (m_serverThread.joinable()) {
        m_serverThread.join();
    }
}

void CallbackListener::handleRedirect(const httplib::Request& req, httplib::Response& res) {
    {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        if (m_slot) {
            if (req.has_param("code") && !req.get_param_value("code").empty()) {
                m_slot->set_value(req.get_param_value("code"));
                m_slot.reset();
            } else if (req.has_param("error")) {
                std::string message = "Identity provider returned error '" + req.get_param_value("error") + "'";
                if (req.has_param("error_description")) {
                    message += ": " + req.get_param_value("error_description");
                }
                m_slot->set_exception(std::make_exception_ptr(AuthError(message)));
                m_slot.reset();
            }
        }
    }
    res.status = 200;
    res.set_content(kConfirmationPage, "text/html");
}

std::string CallbackListener::awaitAuthorizationCode() {
    if (m_waiting.exchange(true)) {
        throw AuthError("Authorization code is already being awaited");
    }
    if (!m_result.valid()) {
        m_waiting = false;
        throw AuthError("Authorization code was already delivered");
    }

    if (m_timeout.count() > 0 && m_result.wait_for(m_timeout) != std::future_status::ready) {
        stop();
        m_waiting = false;
        throw AuthError("Failed to receive auth code: no redirect within " +
                        std::to_string(m_timeout.count()) + " seconds");
    }

    try {
        std::string code = m_result.get();
        stop();
        m_waiting = false;
        return code;
    } catch (const AuthError&) {
        stop();
        m_waiting = false;
        throw;
    } catch (const std::future_error& e) {
        stop();
        m_waiting = false;
        throw AuthError(std::string("Failed to receive auth code: ") + e.what());
    }
}

} // namespace kindlesender::infrastructure
