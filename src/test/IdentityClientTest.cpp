#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "TestHttpServer.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/IdentityClient.hpp"

using namespace kindlesender;
using infrastructure::IdentityClient;
using test::TestHttpServer;

namespace {

domain::DeliverySettings SettingsFor(const TestHttpServer& server) {
    domain::DeliverySettings s;
    s.azure.clientId = "my-client";
    s.azure.clientSecret = "my-secret";
    s.azure.tenantId = "contoso";
    s.authorityUrl = server.baseUrl();
    s.httpTimeoutSeconds = 5;
    return s;
}

struct RecordedForm {
    std::string grantType;
    std::string scope;
    std::string clientId;
    std::string clientSecret;
    std::string code;
    std::string redirectUri;
    std::string refreshToken;
    std::string contentType;
};

void RecordForm(const httplib::Request& req, RecordedForm& form) {
    form.grantType = req.get_param_value("grant_type");
    form.scope = req.get_param_value("scope");
    form.clientId = req.get_param_value("client_id");
    form.clientSecret = req.get_param_value("client_secret");
    form.code = req.get_param_value("code");
    form.redirectUri = req.get_param_value("redirect_uri");
    form.refreshToken = req.get_param_value("refresh_token");
    form.contentType = req.get_header_value("Content-Type");
}

void TestExchangePostsAuthorizationCodeGrant() {
    TestHttpServer server;
    RecordedForm form;
    server.server().Post("/contoso/oauth2/v2.0/token", [&form](const httplib::Request& req, httplib::Response& res) {
        RecordForm(req, form);
        res.set_content(R"({"token_type":"Bearer","scope":"Mail.Send","expires_in":3599,"ext_expires_in":3599,)"
                        R"("access_token":"at-1","refresh_token":"rt-1","id_token":"idt-1"})",
                        "application/json");
    });
    server.start();

    IdentityClient client(SettingsFor(server));
    domain::Credential c = client.exchange("the-code", "http://localhost:8080/callback");

    assert(form.contentType.find("application/x-www-form-urlencoded") == 0);
    assert(form.grantType == "authorization_code");
    assert(form.scope == "Mail.Send");
    assert(form.clientId == "my-client");
    assert(form.clientSecret == "my-secret");
    assert(form.code == "the-code");
    assert(form.redirectUri == "http://localhost:8080/callback");

    assert(c.accessToken == "at-1");
    assert(c.refreshToken && *c.refreshToken == "rt-1");
    assert(c.idToken && *c.idToken == "idt-1");
    assert(c.tokenType == "Bearer");
    assert(c.expiresIn == 3599);
    assert(!c.expiresAt.has_value());
    std::cout << "[PASS] exchange() sends the authorization_code grant and parses the credential." << std::endl;
}

void TestRefreshPostsRefreshGrant() {
    TestHttpServer server;
    RecordedForm form;
    server.server().Post("/contoso/oauth2/v2.0/token", [&form](const httplib::Request& req, httplib::Response& res) {
        RecordForm(req, form);
        res.set_content(R"({"token_type":"Bearer","expires_in":"4000","access_token":"at-2"})", "application/json");
    });
    server.start();

    IdentityClient client(SettingsFor(server));
    domain::Credential c = client.refresh("rt-old");

    assert(form.grantType == "refresh_token");
    assert(form.scope == "https://graph.microsoft.com/.default");
    assert(form.refreshToken == "rt-old");
    assert(form.code.empty());
    assert(c.accessToken == "at-2");
    assert(c.expiresIn == 4000);
    assert(!c.refreshToken.has_value());
    std::cout << "[PASS] refresh() sends the refresh_token grant." << std::endl;
}

void ExpectAuthError(IdentityClient& client, const std::string& fragment) {
    bool threw = false;
    try {
        client.refresh("rt");
    } catch (const domain::AuthError& e) {
        threw = true;
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cerr << "[FAIL] Unexpected message: " << e.what() << std::endl;
        }
        assert(std::string(e.what()).find(fragment) != std::string::npos);
    }
    assert(threw);
}

void TestNonSuccessStatus() {
    TestHttpServer server;
    server.server().Post("/contoso/oauth2/v2.0/token", [](const httplib::Request&, httplib::Response& res) {
        res.status = 400;
        res.set_content(R"({"error":"invalid_grant"})", "application/json");
    });
    server.start();

    IdentityClient client(SettingsFor(server));
    ExpectAuthError(client, "HTTP 400");
    ExpectAuthError(client, "invalid_grant");
    std::cout << "[PASS] Non-2xx token response is an AuthError with status and body." << std::endl;
}

void TestMalformedBody() {
    TestHttpServer server;
    int calls = 0;
    server.server().Post("/contoso/oauth2/v2.0/token", [&calls](const httplib::Request&, httplib::Response& res) {
        ++calls;
        if (calls == 1) {
            res.set_content("<html>not json</html>", "text/html");
        } else {
            res.set_content(R"({"token_type":"Bearer","expires_in":10})", "application/json");
        }
    });
    server.start();

    IdentityClient client(SettingsFor(server));
    ExpectAuthError(client, "not valid JSON");
    ExpectAuthError(client, "access_token");
    assert(calls == 2);
    std::cout << "[PASS] Unparseable or incomplete bodies are AuthErrors, one attempt each." << std::endl;
}

void TestConnectionFailure() {
    int closedPort = 0;
    {
        TestHttpServer server;
        server.start();
        closedPort = server.port();
    }

    domain::DeliverySettings s;
    s.azure.tenantId = "contoso";
    s.authorityUrl = "http://127.0.0.1:" + std::to_string(closedPort);
    s.httpTimeoutSeconds = 2;
    IdentityClient client(s);
    ExpectAuthError(client, "connection to");
    std::cout << "[PASS] Transport failure is an AuthError." << std::endl;
}

void TestTokenUrl() {
    domain::DeliverySettings s;
    s.azure.tenantId = "common";
    IdentityClient client(s);
    assert(client.tokenUrl() == "https://login.microsoftonline.com:443/common/oauth2/v2.0/token");
    std::cout << "[PASS] Token URL is templated by tenant." << std::endl;
}

void TestOutOfRangeLifetimeRejected() {
    TestHttpServer server;
    int calls = 0;
    server.server().Post("/contoso/oauth2/v2.0/token", [&calls](const httplib::Request&, httplib::Response& res) {
        ++calls;
        if (calls == 1) {
            res.set_content(R"({"token_type":"Bearer","expires_in":1e300,"access_token":"a"})", "application/json");
        } else if (calls == 2) {
            res.set_content(R"({"token_type":"Bearer","expires_in":-60,"access_token":"a"})", "application/json");
        } else if (calls == 3) {
            res.set_content(R"({"token_type":"Bearer","expires_in":"99999999999999999999","access_token":"a"})",
                            "application/json");
        } else {
            res.set_content(R"({"token_type":"Bearer","expires_in":18446744073709551615,"access_token":"a"})",
                            "application/json");
        }
    });
    server.start();

    IdentityClient client(SettingsFor(server));
    ExpectAuthError(client, "expires_in");
    ExpectAuthError(client, "expires_in");
    ExpectAuthError(client, "expires_in");
    ExpectAuthError(client, "expires_in");
    assert(calls == 4);
    std::cout << "[PASS] Non-finite, negative or oversized expires_in is an AuthError." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IdentityClient Test..." << std::endl;
    TestExchangePostsAuthorizationCodeGrant();
    TestRefreshPostsRefreshGrant();
    TestNonSuccessStatus();
    TestMalformedBody();
    TestOutOfRangeLifetimeRejected();
    TestConnectionFailure();
    TestTokenUrl();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
