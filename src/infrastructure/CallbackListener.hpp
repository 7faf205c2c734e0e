/**
 * @file CallbackListener.hpp
 * @brief One-shot local HTTP endpoint that captures an OAuth2 authorization code.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "domain/AuthorizationCodeSource.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace kindlesender::infrastructure {

/**
 * @class CallbackListener
 * @brief Serves GET <redirect path> on the redirect URI's host and port until one code arrives.
 *
 * The listener binds in the constructor and stops in the destructor, so its
 * lifetime is exactly the scope of one interactive login. The server thread and
 * the waiting caller share nothing but a promise that is fulfilled at most once.
 */
class CallbackListener : public domain::AuthorizationCodeSource {
public:
    static constexpr const char* kConfirmationPage =
        "<!DOCTYPE html><html><head><title>Kindle Sender</title></head>"
        "<body><p>You can close this tab and return to the CLI.</p></body></html>";

    /**
     * @param redirectUri Where the identity provider sends the browser, e.g. http://localhost:8080/callback.
     * @param timeout Maximum wait in awaitAuthorizationCode(); zero waits forever.
     * @throws domain::AuthError if the URI is invalid or the port cannot be bound.
     */
    CallbackListener(const std::string& redirectUri, std::chrono::seconds timeout);
    ~CallbackListener() override;

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    /**
     * @brief Blocks until the first redirect carrying ?code= arrives.
     * @throws domain::AuthError on error redirect, timeout, or a second/concurrent call.
     */
    std::string awaitAuthorizationCode() override;

    /** @brief Port actually bound. */
    int port() const { return m_port; }

    /** @brief Route served, e.g. "/callback". */
    const std::string& path() const { return m_path; }

private:
    void handleRedirect(const httplib::Request& req, httplib::Response& res);
    void stop();

    std::unique_ptr<httplib::Server> m_server; ///< cpp-httplib server bound to m_port.
    std::thread m_serverThread;                ///< Runs the accept loop.
    std::string m_path;
    int m_port = 0;
    std::chrono::seconds m_timeout;

    std::mutex m_slotMutex;
    std::optional<std::promise<std::string>> m_slot; ///< Taken by the first redirect.
    std::future<std::string> m_result;               ///< Consumed by the single waiter.
    std::atomic<bool> m_waiting{false};
};

} // namespace kindlesender::infrastructure
