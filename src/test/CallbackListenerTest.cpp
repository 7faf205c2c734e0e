#include <httplib.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "domain/Errors.hpp"
#include "infrastructure/CallbackListener.hpp"

using kindlesender::domain::AuthError;
using kindlesender::infrastructure::CallbackListener;

namespace {

// Fixed loopback ports; each test uses its own so a lingering socket cannot interfere.
constexpr int kPortCode = 18471;
constexpr int kPortError = 18472;
constexpr int kPortTimeout = 18473;
constexpr int kPortTwice = 18474;
constexpr int kPortConcurrent = 18475;
constexpr int kPortClash = 18476;

std::string RedirectUri(int port) {
    return "http://localhost:" + std::to_string(port) + "/callback";
}

struct BrowserHit {
    int status = 0;
    std::string body;
};

BrowserHit Hit(int port, const std::string& pathAndQuery) {
    httplib::Client cli("127.0.0.1", port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(5);
    BrowserHit hit;
    if (auto res = cli.Get(pathAndQuery)) {
        hit.status = res->status;
        hit.body = res->body;
    }
    return hit;
}

void TestCapturesCode() {
    CallbackListener listener(RedirectUri(kPortCode), std::chrono::seconds(10));
    assert(listener.port() == kPortCode);
    assert(listener.path() == "/callback");

    BrowserHit hit;
    std::thread browser([&hit]() { hit = Hit(kPortCode, "/callback?code=abc123&session_state=xyz"); });

    std::string code = listener.awaitAuthorizationCode();
    browser.join();

    assert(code == "abc123");
    assert(hit.status == 200);
    assert(hit.body.find("You can close this tab") != std::string::npos);
    std::cout << "[PASS] Listener captures the code and serves the confirmation page." << std::endl;
}

void TestErrorRedirect() {
    CallbackListener listener(RedirectUri(kPortError), std::chrono::seconds(10));

    std::thread browser([]() { Hit(kPortError, "/callback?error=access_denied&error_description=User%20cancelled"); });

    bool threw = false;
    try {
        listener.awaitAuthorizationCode();
    } catch (const AuthError& e) {
        threw = true;
        std::string message = e.what();
        assert(message.find("access_denied") != std::string::npos);
        assert(message.find("User cancelled") != std::string::npos);
    }
    browser.join();
    assert(threw);
    std::cout << "[PASS] Error redirect fails the waiter." << std::endl;
}

void TestTimeout() {
    CallbackListener listener(RedirectUri(kPortTimeout), std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    bool threw = false;
    try {
        listener.awaitAuthorizationCode();
    } catch (const AuthError& e) {
        threw = true;
        assert(std::string(e.what()).find("Failed to receive auth code") != std::string::npos);
    }
    assert(threw);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    std::cout << "[PASS] Bounded wait gives up with AuthError." << std::endl;
}

void TestSecondRedirectAndSecondAwait() {
    CallbackListener listener(RedirectUri(kPortTwice), std::chrono::seconds(10));

    // Two redirects before anyone waits: only the first code is kept.
    BrowserHit first = Hit(kPortTwice, "/callback?code=first");
    BrowserHit second = Hit(kPortTwice, "/callback?code=second");
    assert(first.status == 200);
    assert(second.status == 200);

    assert(listener.awaitAuthorizationCode() == "first");

    bool threw = false;
    try {
        listener.awaitAuthorizationCode();
    } catch (const AuthError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Exactly one code is delivered, exactly once." << std::endl;
}

void TestPortAlreadyBound() {
    // Plain socket without SO_REUSEPORT, so no second listener can share the port.
    int holder = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(holder >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(kPortClash));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    int bound = ::bind(holder, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(bound == 0);
    int listening = ::listen(holder, 1);
    assert(listening == 0);

    bool threw = false;
    try {
        CallbackListener clash(RedirectUri(kPortClash), std::chrono::seconds(10));
    } catch (const AuthError& e) {
        threw = true;
        assert(std::string(e.what()).find(std::to_string(kPortClash)) != std::string::npos);
    }
    ::close(holder);
    assert(threw);
    std::cout << "[PASS] Binding an occupied port is an AuthError." << std::endl;
}

void TestConcurrentAwaitRejected() {
    CallbackListener listener(RedirectUri(kPortConcurrent), std::chrono::seconds(10));

    std::string waiterCode;
    std::atomic<bool> waiterStarted{false};
    std::thread waiter([&]() {
        waiterStarted = true;
        waiterCode = listener.awaitAuthorizationCode();
    });
    while (!waiterStarted) std::this_thread::yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    bool threw = false;
    try {
        listener.awaitAuthorizationCode();
    } catch (const AuthError& e) {
        threw = true;
        assert(std::string(e.what()).find("already being awaited") != std::string::npos);
    }
    assert(threw);

    Hit(kPortConcurrent, "/callback?code=late");
    waiter.join();
    assert(waiterCode == "late");
    std::cout << "[PASS] Concurrent second waiter is rejected." << std::endl;
}

void TestRejectsNonHttpRedirect() {
    bool threw = false;
    try {
        CallbackListener listener("https://localhost:8443/callback", std::chrono::seconds(1));
    } catch (const AuthError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] https redirect URIs are refused for the local listener." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CallbackListener Test..." << std::endl;
    TestCapturesCode();
    TestErrorRedirect();
    TestTimeout();
    TestSecondRedirectAndSecondAwait();
    TestPortAlreadyBound();
    TestConcurrentAwaitRejected();
    TestRejectsNonHttpRedirect();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
