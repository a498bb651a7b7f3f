/**
 * @file test_endpoint_service.cpp
 * @brief Tests for the HTTP discovery endpoint and client
 *
 * Tests:
 * - Request accessors and JSON error bodies
 * - Hosting agents and card path assignment
 * - Discovery, card, health and CORS routes
 * - Signed card negotiation through Accept
 * - Real requests over loopback with HttpClient
 * - Client timeouts and cancellation against a silent server
 */

#include <gtest/gtest.h>
#include "lad/crypto_utils.hpp"
#include "lad/endpoint_service.hpp"
#include "lad/http_client.hpp"
#include <httplib.h>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace lad;
using json = nlohmann::json;

namespace {

    ServiceRequest get(const std::string& target, const std::string& accept = "") {
        ServiceRequest request;
        request.method = "GET";
        request.target = target;
        if (!accept.empty()) {
            request.headers["accept"] = accept;
        }
        return request;
    }

    // Accepts connections on loopback and never answers
    class SilentServer {
    public:
        SilentServer()
            : acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        {
            accept();
            thread_ = std::thread([this]() { io_context_.run(); });
        }

        ~SilentServer() {
            io_context_.stop();
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        std::string url(const std::string& path) const {
            return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
        }

        bool wait_for_connection(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return accepted_.wait_for(lock, timeout, [this]() { return !connections_.empty(); });
        }

    private:
        void accept() {
            acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
                if (ec) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    connections_.push_back(std::move(socket));
                }
                accepted_.notify_all();
                accept();
            });
        }

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        std::vector<asio::ip::tcp::socket> connections_;
        std::mutex mutex_;
        std::condition_variable accepted_;
        std::thread thread_;
    };

    AgentProfile concierge_profile() {
        AgentProfile profile;
        profile.name = "Hotel Concierge";
        profile.description = "Front desk assistant";
        profile.role = "concierge";
        profile.capabilities = {"spa", "dining"};
        return profile;
    }
}

// Test fixture with an unstarted service on an ephemeral loopback port
class EndpointServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoUtils::initialize());

        options_.bind_address = "127.0.0.1";
        options_.port = 0;
        options_.public_host = "127.0.0.1";
        options_.network.ssid = "Hotel-Guest";
        options_.network.realm = "hotel.example";
    }

    void TearDown() override {
        if (work_guard_) {
            work_guard_.reset();
        }
        io_context_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        service_.reset();
    }

    void create(std::shared_ptr<const CardSigner> signer = nullptr) {
        service_ = std::make_unique<EndpointService>(options_, std::move(signer));
        ASSERT_TRUE(service_->add_agent(concierge_profile()));
    }

    void run_in_background() {
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));
        io_thread_ = std::thread([this]() { io_context_.run(); });
    }

    HttpResponse fetch(HttpClient& client, const std::string& url,
                       const std::map<std::string, std::string>& headers = {}) {
        std::promise<HttpResponse> done;
        auto future = done.get_future();
        client.async_get(url, headers, [&done](HttpResponse response) {
            done.set_value(std::move(response));
        });
        EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        return future.get();
    }

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    EndpointServiceOptions options_;
    std::unique_ptr<EndpointService> service_;
};

// ============================================================================
// Request Tests
// ============================================================================

TEST(ServiceRequestTest, PathAndHeaders) {
    ServiceRequest request = get("/.well-known/agent.json?x=1", "application/jose");

    EXPECT_EQ(request.path(), "/.well-known/agent.json");
    EXPECT_EQ(request.header("ACCEPT"), "application/jose");
    EXPECT_EQ(request.header("x-missing"), "");
}

TEST(ServiceResponseTest, JsonError) {
    ServiceResponse response = ServiceResponse::json_error(404, "not found: /x");

    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.content_type, "application/json");
    EXPECT_EQ(json::parse(response.body)["error"], "not found: /x");
}

// ============================================================================
// Hosting Tests
// ============================================================================

TEST_F(EndpointServiceTest, CardPathAssignment) {
    create();

    AgentProfile spa;
    spa.name = "Spa & Wellness";
    ASSERT_TRUE(service_->add_agent(spa));

    auto agents = service_->agents();
    ASSERT_EQ(agents.size(), 2u);
    EXPECT_EQ(agents[0].card_path, "/.well-known/agent.json");
    EXPECT_EQ(agents[1].card_path, "/agents/spa-wellness/agent.json");
}

TEST_F(EndpointServiceTest, RejectsConflictingOrReservedPaths) {
    create();

    AgentProfile clash = concierge_profile();
    clash.name = "Other";
    clash.card_path = "/.well-known/agent.json";
    EXPECT_FALSE(service_->add_agent(clash));

    clash.card_path = "/health";
    EXPECT_FALSE(service_->add_agent(clash));

    clash.card_path = "/.well-known/lad/agents";
    EXPECT_FALSE(service_->add_agent(clash));

    clash.name = "";
    clash.card_path = "";
    EXPECT_FALSE(service_->add_agent(clash));
}

TEST_F(EndpointServiceTest, TlsRequiresFiles) {
    options_.tls_enabled = true;
    EXPECT_THROW(EndpointService service(options_), std::invalid_argument);
}

// ============================================================================
// Route Tests
// ============================================================================

TEST_F(EndpointServiceTest, DiscoveryDocument) {
    create();

    auto response = service_->handle(get("/.well-known/lad/agents"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "application/json");
    EXPECT_EQ(response.headers["Cache-Control"], "max-age=300, must-revalidate");
    EXPECT_EQ(response.headers["Access-Control-Allow-Origin"], "*");

    std::string error;
    auto document = DiscoveryDocument::parse(response.body, error);
    ASSERT_TRUE(document.has_value()) << error;
    EXPECT_EQ(document->version, "1.0");
    EXPECT_EQ(document->network.realm, "hotel.example");
    ASSERT_EQ(document->agents.size(), 1u);
    EXPECT_EQ(document->agents[0].agent_card_url, service_->base_url() + "/.well-known/agent.json");
    EXPECT_EQ(document->agents[0].capabilities_preview, (std::vector<std::string>{"spa", "dining"}));
}

TEST_F(EndpointServiceTest, UnsignedCard) {
    create();

    auto response = service_->handle(get("/.well-known/agent.json", "application/jose"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "application/json");

    json card = json::parse(response.body);
    EXPECT_EQ(card["name"], "Hotel Concierge");
    EXPECT_EQ(card["url"], service_->base_url());
    EXPECT_EQ(card["provider"]["organization"], "hotel.example");
}

TEST_F(EndpointServiceTest, SignedCardOnRequest) {
    auto key = SigningKeyMaterial::generate("v1");
    ASSERT_TRUE(key.has_value());
    auto material = std::make_shared<const SigningKeyMaterial>(std::move(*key));
    create(std::make_shared<const CardSigner>(material));
    EXPECT_TRUE(service_->signing_enabled());

    auto plain = service_->handle(get("/.well-known/agent.json", "application/json"));
    EXPECT_EQ(plain.content_type, "application/json");

    auto signed_response = service_->handle(get("/.well-known/agent.json", "application/jose, application/json"));
    EXPECT_EQ(signed_response.content_type, "application/jose");
    ASSERT_TRUE(SignedCardEnvelope::looks_like_envelope(signed_response.body));

    auto public_key = material->public_key();
    ASSERT_TRUE(public_key.has_value());
    auto verification = CardVerifier::verify_with_key(signed_response.body, *public_key);
    ASSERT_TRUE(verification.valid) << verification.error;
    EXPECT_EQ((*verification.payload)["name"], "Hotel Concierge");
    EXPECT_EQ(verification.key_id, "v1");
}

TEST_F(EndpointServiceTest, Health) {
    options_.mdns_enabled = true;
    create();

    auto response = service_->handle(get("/health"));
    json health = json::parse(response.body);
    EXPECT_EQ(health["status"], "ok");
    EXPECT_EQ(health["agent"], "Hotel Concierge");
    EXPECT_EQ(health["mdns_enabled"], true);
    EXPECT_EQ(health["tls_enabled"], false);
    EXPECT_EQ(health["signing_enabled"], false);
}

TEST_F(EndpointServiceTest, PreflightAndMethods) {
    create();

    ServiceRequest options_request = get("/.well-known/lad/agents");
    options_request.method = "OPTIONS";
    auto preflight = service_->handle(options_request);
    EXPECT_EQ(preflight.status, 204);
    EXPECT_TRUE(preflight.body.empty());
    EXPECT_EQ(preflight.headers["Access-Control-Allow-Methods"], "GET, OPTIONS");

    ServiceRequest post = get("/.well-known/lad/agents");
    post.method = "POST";
    auto rejected = service_->handle(post);
    EXPECT_EQ(rejected.status, 405);
    EXPECT_EQ(rejected.headers["Allow"], "GET, OPTIONS");

    EXPECT_EQ(service_->handle(get("/missing")).status, 404);
    EXPECT_EQ(service_->get_requests_served(), 3u);
}

// ============================================================================
// Socket Tests
// ============================================================================

TEST_F(EndpointServiceTest, ServesOverLoopback) {
    create();
    ASSERT_TRUE(service_->start());
    ASSERT_NE(service_->bound_port(), 0);
    run_in_background();

    HttpClientOptions client_options;
    client_options.timeout = std::chrono::seconds(3);
    HttpClient client(io_context_, client_options);

    auto document = fetch(client, service_->base_url() + "/.well-known/lad/agents");
    ASSERT_TRUE(document.ok()) << document.error;
    EXPECT_EQ(document.header("Content-Type"), "application/json");
    EXPECT_EQ(document.host, "127.0.0.1");
    EXPECT_FALSE(document.transport_verified);

    std::string error;
    ASSERT_TRUE(DiscoveryDocument::parse(document.body, error).has_value()) << error;

    auto missing = fetch(client, service_->base_url() + "/nope");
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_FALSE(missing.ok());
}

TEST_F(EndpointServiceTest, SignedCardOverLoopback) {
    auto key = SigningKeyMaterial::generate("v1");
    ASSERT_TRUE(key.has_value());
    auto material = std::make_shared<const SigningKeyMaterial>(std::move(*key));
    create(std::make_shared<const CardSigner>(material));
    ASSERT_TRUE(service_->start());
    run_in_background();

    HttpClientOptions client_options;
    client_options.timeout = std::chrono::seconds(3);
    HttpClient client(io_context_, client_options);

    auto response = fetch(client, service_->base_url() + "/.well-known/agent.json",
                          {{"Accept", "application/jose, application/json"}});
    ASSERT_TRUE(response.ok()) << response.error;
    EXPECT_EQ(response.header("Content-Type"), "application/jose");

    auto public_key = material->public_key();
    ASSERT_TRUE(public_key.has_value());
    auto verification = CardVerifier::verify_with_key(response.body, *public_key);
    ASSERT_TRUE(verification.valid) << verification.error;
    EXPECT_EQ((*verification.payload)["name"], "Hotel Concierge");
}

TEST_F(EndpointServiceTest, MethodsOverLoopback) {
    create();
    ASSERT_TRUE(service_->start());

    httplib::Client raw("127.0.0.1", service_->bound_port());
    raw.set_connection_timeout(3, 0);
    raw.set_read_timeout(3, 0);

    auto preflight = raw.Options("/.well-known/lad/agents");
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 204);
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Methods"), "GET, OPTIONS");

    auto post = raw.Post("/.well-known/lad/agents", "{}", "application/json");
    ASSERT_TRUE(post);
    EXPECT_EQ(post->status, 405);
    EXPECT_EQ(post->get_header_value("Allow"), "GET, OPTIONS");

    auto missing = raw.Get("/agents/nobody/agent.json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(json::parse(missing->body)["error"], "not found: /agents/nobody/agent.json");

    EXPECT_EQ(service_->get_requests_served(), 3u);
}

TEST_F(EndpointServiceTest, RestartAfterStop) {
    create();
    ASSERT_TRUE(service_->start());
    service_->stop();
    EXPECT_FALSE(service_->is_running());

    ASSERT_TRUE(service_->start());
    EXPECT_TRUE(service_->is_running());

    httplib::Client raw("127.0.0.1", service_->bound_port());
    raw.set_read_timeout(3, 0);
    auto health = raw.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
}

TEST_F(EndpointServiceTest, ClientReportsConnectionFailure) {
    create();
    ASSERT_TRUE(service_->start());
    uint16_t port = service_->bound_port();
    service_->stop();
    run_in_background();

    HttpClientOptions client_options;
    client_options.timeout = std::chrono::seconds(2);
    HttpClient client(io_context_, client_options);

    auto response = fetch(client, "http://127.0.0.1:" + std::to_string(port) + "/health");
    EXPECT_FALSE(response.ok());
    EXPECT_FALSE(response.error.empty());
}

TEST_F(EndpointServiceTest, ClientTimesOutOnSilentServer) {
    SilentServer silent;
    run_in_background();

    HttpClientOptions client_options;
    client_options.timeout = std::chrono::milliseconds(300);
    HttpClient client(io_context_, client_options);

    auto started = std::chrono::steady_clock::now();
    auto response = fetch(client, silent.url("/.well-known/agent.json"));
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.status_code, 0);
    EXPECT_NE(response.error.find("Request failed"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST_F(EndpointServiceTest, ClientCancelAbortsRequest) {
    SilentServer silent;
    run_in_background();

    HttpClientOptions client_options;
    client_options.timeout = std::chrono::seconds(30);
    HttpClient client(io_context_, client_options);

    std::promise<HttpResponse> done;
    auto future = done.get_future();
    client.async_get(silent.url("/.well-known/agent.json"), {}, [&done](HttpResponse response) {
        done.set_value(std::move(response));
    });

    ASSERT_TRUE(silent.wait_for_connection(std::chrono::seconds(3)));
    client.cancel();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    HttpResponse response = future.get();
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.error, "Request cancelled");
}

TEST_F(EndpointServiceTest, ClientRejectsInvalidUrl) {
    run_in_background();
    HttpClient client(io_context_);

    auto response = fetch(client, "ftp://hotel.example/agents");
    EXPECT_EQ(response.status_code, 0);
    EXPECT_NE(response.error.find("Invalid URL"), std::string::npos);
}

// ============================================================================
// URL Tests
// ============================================================================

TEST(ParsedUrlTest, Components) {
    auto url = ParsedUrl::parse("https://concierge.hotel.example:8443/.well-known/agent.json?v=1");

    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->is_https());
    EXPECT_EQ(url->host, "concierge.hotel.example");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->path, "/.well-known/agent.json");
    EXPECT_EQ(url->query, "?v=1");
    EXPECT_EQ(url->origin(), "https://concierge.hotel.example:8443");
}

TEST(ParsedUrlTest, Defaults) {
    auto url = ParsedUrl::parse("http://hotel.example");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path, "/");
    EXPECT_EQ(url->port_or_default(), "80");
    EXPECT_EQ(ParsedUrl::parse("https://hotel.example")->port_or_default(), "443");
    EXPECT_FALSE(ParsedUrl::parse("hotel.example/agents").has_value());
}
