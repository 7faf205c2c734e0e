#include <cassert>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "TestHttpServer.hpp"
#include "app/KindleSenderApp.hpp"

using kindlesender::app::KindleSenderApp;
using kindlesender::test::ScratchDir;

namespace fs = std::filesystem;

namespace {

fs::path WriteConfig(const ScratchDir& dir, const fs::path& inbox) {
    nlohmann::json j = {
        {"callback_uri", "http://localhost:8080/callback"},
        {"ebook_to_send_directory", inbox.string()},
        {"ebook_sent_directory", (dir.path() / "sent").string()},
        {"receivers", {"reader@kindle.com"}},
        {"azure", {{"client_id", "cid"}, {"client_secret", "super-secret-value"}, {"tenant_id", "common"}}}
    };
    fs::path path = dir.path() / "config.json";
    std::ofstream out(path);
    out << j.dump(2);
    return path;
}

void TestUsageErrors() {
    KindleSenderApp app;
    assert(app.Run({}) == KindleSenderApp::kExitUsage);
    assert(app.Run({"deliver"}) == KindleSenderApp::kExitUsage);
    assert(app.Run({"send", "--verbose"}) == KindleSenderApp::kExitUsage);
    assert(app.Run({"send", "--config"}) == KindleSenderApp::kExitUsage);
    assert(app.Run({"send", "config"}) == KindleSenderApp::kExitUsage);
    assert(app.Run({"help"}) == KindleSenderApp::kExitSuccess);
    assert(app.Run({"send", "-h"}) == KindleSenderApp::kExitSuccess);
    std::cout << "[PASS] Bad command lines exit with the usage code." << std::endl;
}

void TestConfigCommand() {
    ScratchDir dir("app_config");
    fs::path config = WriteConfig(dir, dir.path() / "inbox");

    KindleSenderApp app;
    assert(app.Run({"config", "-c", config.string()}) == KindleSenderApp::kExitSuccess);
    assert(app.Run({"config", "--config", (dir.path() / "missing.json").string()}) == KindleSenderApp::kExitFailure);
    std::cout << "[PASS] config command loads the file or fails cleanly." << std::endl;
}

void TestDescribeMasksSecret() {
    kindlesender::domain::DeliverySettings s;
    s.receivers = {"a@kindle.com", "b@kindle.com"};
    s.azure.clientSecret = "super-secret-value";
    std::string text = KindleSenderApp::DescribeSettings(s);
    assert(text.find("super-secret-value") == std::string::npos);
    assert(text.find("1. a@kindle.com") != std::string::npos);
    assert(text.find("2. b@kindle.com") != std::string::npos);
    std::cout << "[PASS] Printed configuration never shows the client secret." << std::endl;
}

void TestSendWithNothingPending() {
    ScratchDir dir("app_send_empty");
    fs::create_directories(dir.path() / "inbox");
    fs::path config = WriteConfig(dir, dir.path() / "inbox");

    KindleSenderApp app;
    assert(app.Run({"send", "-c", config.string()}) == KindleSenderApp::kExitSuccess);
    std::cout << "[PASS] send with an empty directory succeeds without logging in." << std::endl;
}

void TestSendWithMissingSource() {
    ScratchDir dir("app_send_nosource");
    fs::path config = WriteConfig(dir, dir.path() / "not_there");

    KindleSenderApp app;
    assert(app.Run({"send", "-c", config.string()}) == KindleSenderApp::kExitFailure);
    std::cout << "[PASS] send fails when the source directory cannot be read." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting KindleSenderApp Test..." << std::endl;
    TestUsageErrors();
    TestConfigCommand();
    TestDescribeMasksSecret();
    TestSendWithNothingPending();
    TestSendWithMissingSource();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
