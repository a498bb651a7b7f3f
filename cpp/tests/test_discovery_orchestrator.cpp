/**
 * @file test_discovery_orchestrator.cpp
 * @brief End-to-end discovery tests against a loopback provider
 *
 * Tests:
 * - Well-known fallback when broadcast is disabled
 * - Broadcast hit without touching the fallback
 * - Merged results deduplicated by card URL
 * - Signed card verification through a trusted key
 * - Timeouts, deadlines and fetch failures reported as errors
 * - Dropping unverified agents on request
 * - Consent filtering of the result
 */

#include <gtest/gtest.h>
#include "lad/advertiser.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/discovery_orchestrator.hpp"
#include "lad/endpoint_service.hpp"
#include <httplib.h>
#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

using namespace lad;

namespace {

    bool has_error_containing(const DiscoveryResult& result, const std::string& text) {
        return std::any_of(result.errors.begin(), result.errors.end(),
            [&text](const std::string& error) { return error.find(text) != std::string::npos; });
    }

    // Serves a fixed discovery document
    class DocumentServer {
    public:
        explicit DocumentServer(const DiscoveryDocument& document)
            : body_(document.to_json())
        {
            server_.Get(protocol::DISCOVERY_PATH, [this](const httplib::Request&, httplib::Response& res) {
                res.set_content(body_, protocol::JSON_MEDIA_TYPE);
            });
            port_ = server_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this]() { server_.listen_after_bind(); });
            while (!server_.is_running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        ~DocumentServer() {
            server_.stop();
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        std::string base_url() const {
            return "http://127.0.0.1:" + std::to_string(port_);
        }

    private:
        std::string body_;
        httplib::Server server_;
        int port_ = -1;
        std::thread thread_;
    };

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

    private:
        void accept() {
            acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
                if (ec) {
                    return;
                }
                connections_.push_back(std::move(socket));
                accept();
            });
        }

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        std::vector<asio::ip::tcp::socket> connections_;
        std::thread thread_;
    };

    AgentDescriptor descriptor_at(const std::string& name, const std::string& card_url) {
        AgentDescriptor descriptor;
        descriptor.name = name;
        descriptor.description = name + " desk";
        descriptor.role = "concierge";
        descriptor.agent_card_url = card_url;
        return descriptor;
    }

    AgentProfile concierge_profile() {
        AgentProfile profile;
        profile.name = "Hotel Concierge";
        profile.description = "Front desk assistant";
        profile.role = "concierge";
        profile.capabilities = {"spa", "dining"};
        return profile;
    }
}

// Test fixture hosting a provider on loopback
class DiscoveryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoUtils::initialize());
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_context_));
    }

    void TearDown() override {
        work_guard_.reset();
        io_context_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        advertiser_.reset();
        service_.reset();
    }

    void start_provider(std::shared_ptr<const CardSigner> signer = nullptr,
                        const std::string& public_host = "127.0.0.1") {
        EndpointServiceOptions options;
        options.bind_address = "127.0.0.1";
        options.port = 0;
        options.public_host = public_host;
        options.network.ssid = "Hotel-Guest";
        options.network.realm = "hotel.example";

        service_ = std::make_unique<EndpointService>(options, std::move(signer));
        ASSERT_TRUE(service_->add_agent(concierge_profile()));
        ASSERT_TRUE(service_->start());
        start_io();
    }

    /// Unicast advertiser; advertises the hosted agent when advertise is true
    void start_advertiser(bool advertise) {
        AdvertiserOptions options;
        options.join_multicast = false;
        options.bind_address = "127.0.0.1";
        options.port = 0;
        options.host_name = "concierge-host";
        options.addresses = {"127.0.0.1"};
        advertiser_ = std::make_unique<Advertiser>(io_context_, options);

        if (advertise) {
            auto document = service_->discovery_document();
            ASSERT_TRUE(advertiser_->advertise(document.agents.front(), service_->bound_port(),
                                               document.network).has_value());
        } else {
            ASSERT_TRUE(advertiser_->start());
        }
        start_io();
    }

    void start_io() {
        if (!io_thread_.joinable()) {
            io_thread_ = std::thread([this]() { io_context_.run(); });
        }
    }

    OrchestratorOptions options() const {
        OrchestratorOptions options;
        options.broadcast_enabled = false;
        options.broadcast_timeout = std::chrono::milliseconds(2000);
        options.browse.query_address = "127.0.0.1";
        options.browse.query_port = advertiser_ ? advertiser_->bound_port() : protocol::MDNS_PORT;
        options.http.timeout = std::chrono::seconds(3);
        options.deadline = std::chrono::seconds(10);
        return options;
    }

    std::string card_url() const {
        return service_->base_url() + protocol::AGENT_CARD_PATH;
    }

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::unique_ptr<EndpointService> service_;
    std::unique_ptr<Advertiser> advertiser_;
};

// ============================================================================
// Well-Known Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, WellKnownFallback) {
    start_provider();

    auto opts = options();
    opts.fallback_url = service_->base_url();
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_EQ(result.discovery_method, DiscoveryMethod::WELLKNOWN);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.agents.size(), 1u);

    const auto& agent = result.agents.front();
    EXPECT_EQ(agent.descriptor.name, "Hotel Concierge");
    EXPECT_EQ(agent.descriptor.capabilities_preview, (std::vector<std::string>{"spa", "dining"}));
    EXPECT_EQ(agent.source, DiscoverySource::WELLKNOWN);
    EXPECT_EQ(agent.descriptor.agent_card_url, card_url());

    // Plain HTTP and no expected realm: nothing vouches for the card
    ASSERT_TRUE(agent.card.has_value());
    EXPECT_EQ((*agent.card)["name"], "Hotel Concierge");
    EXPECT_FALSE(agent.verified);
    EXPECT_FALSE(agent.verification_method.has_value());
    EXPECT_TRUE(agent.verification_error.has_value());

    EXPECT_EQ(result.network_context.ssid, "Hotel-Guest");
    EXPECT_EQ(result.network_context.realm, "hotel.example");
}

TEST_F(DiscoveryOrchestratorTest, FallbackAcceptsFullDiscoveryUrl) {
    start_provider();

    auto opts = options();
    opts.fallback_url = service_->base_url() + "/.well-known/lad/agents";
    opts.fetch_cards = false;
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_FALSE(result.agents.front().card.has_value());
    EXPECT_FALSE(result.agents.front().verification_error.has_value());
}

TEST_F(DiscoveryOrchestratorTest, ExpectedRealmVerifiesByDomain) {
    start_provider();

    auto opts = options();
    opts.fallback_url = service_->base_url();
    opts.network.realm = "hotel.example";
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_TRUE(result.agents.front().verified);
    EXPECT_EQ(result.agents.front().verification_method, VerificationMethod::DOMAIN);
}

TEST_F(DiscoveryOrchestratorTest, UnreachableFallbackRecordsError) {
    start_provider();
    uint16_t port = service_->bound_port();
    service_->stop();

    auto opts = options();
    opts.fallback_url = "http://127.0.0.1:" + std::to_string(port);
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_TRUE(result.agents.empty());
    EXPECT_EQ(result.discovery_method, DiscoveryMethod::NONE);
    EXPECT_TRUE(has_error_containing(result, "Well-known discovery failed"));
}

TEST_F(DiscoveryOrchestratorTest, CardFetchFailureMarksAgent) {
    // Card URLs point at an address nothing listens on
    start_provider(nullptr, "127.0.0.2");

    auto opts = options();
    opts.fallback_url = "http://127.0.0.1:" + std::to_string(service_->bound_port());
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_EQ(result.discovery_method, DiscoveryMethod::WELLKNOWN);
    const auto& agent = result.agents.front();
    EXPECT_FALSE(agent.verified);
    ASSERT_TRUE(agent.verification_error.has_value());
    EXPECT_EQ(agent.verification_error->rfind("card fetch failed", 0), 0u);
    EXPECT_TRUE(has_error_containing(result, "Failed to fetch agent card for Hotel Concierge"));
}

// ============================================================================
// Broadcast Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, BroadcastHitSkipsFallback) {
    start_provider();
    start_advertiser(true);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.fallback_url = "http://127.0.0.1:9";
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_EQ(result.discovery_method, DiscoveryMethod::BROADCAST);
    EXPECT_FALSE(has_error_containing(result, "Well-known"));
    ASSERT_EQ(result.agents.size(), 1u);

    const auto& agent = result.agents.front();
    EXPECT_EQ(agent.descriptor.name, "Hotel Concierge");
    EXPECT_EQ(agent.source, DiscoverySource::BROADCAST);
    EXPECT_EQ(agent.descriptor.agent_card_url, card_url());
    EXPECT_TRUE(agent.card.has_value());
}

TEST_F(DiscoveryOrchestratorTest, MergedResultsKeepBroadcastEntry) {
    start_provider();
    start_advertiser(true);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.fallback_url = service_->base_url();
    opts.merge_fallback_results = true;
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_EQ(result.discovery_method, DiscoveryMethod::BROADCAST);
    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_EQ(result.agents.front().source, DiscoverySource::BROADCAST);
    EXPECT_EQ(result.network_context.realm, "hotel.example");
}

TEST_F(DiscoveryOrchestratorTest, BroadcastTimeoutWithoutAgents) {
    start_provider();
    start_advertiser(false);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.broadcast_timeout = std::chrono::milliseconds(300);
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_TRUE(result.agents.empty());
    EXPECT_EQ(result.discovery_method, DiscoveryMethod::NONE);
    EXPECT_TRUE(has_error_containing(result, "Broadcast discovery found no agents within 300ms"));
}

TEST_F(DiscoveryOrchestratorTest, BroadcastMissFallsBack) {
    start_provider();
    start_advertiser(false);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.broadcast_timeout = std::chrono::milliseconds(300);
    opts.fallback_url = service_->base_url();
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_EQ(result.discovery_method, DiscoveryMethod::WELLKNOWN);
    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_EQ(result.agents.front().source, DiscoverySource::WELLKNOWN);
}

TEST_F(DiscoveryOrchestratorTest, DeadlineAbandonsBroadcast) {
    start_provider();
    start_advertiser(false);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.broadcast_timeout = std::chrono::seconds(10);
    opts.deadline = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(result.agents.empty());
    EXPECT_TRUE(has_error_containing(result, "Discovery deadline of 200ms expired; abandoned broadcast browse"));
}

TEST_F(DiscoveryOrchestratorTest, BroadcastCollectsUntilTimeout) {
    start_provider();
    start_advertiser(true);

    auto opts = options();
    opts.broadcast_enabled = true;
    opts.stop_at_first_result = false;
    opts.broadcast_timeout = std::chrono::milliseconds(300);
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_EQ(result.discovery_method, DiscoveryMethod::BROADCAST);
    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_TRUE(result.agents.front().card.has_value());
}

// ============================================================================
// Deadline Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, DeadlineAbandonsHungCardFetch) {
    start_provider();
    SilentServer silent;

    DiscoveryDocument document = service_->discovery_document();
    document.agents.push_back(descriptor_at("Spa Attendant", silent.url("/.well-known/agent.json")));
    DocumentServer documents(document);

    auto opts = options();
    opts.fallback_url = documents.base_url();
    opts.network.realm = "hotel.example";
    opts.http.timeout = std::chrono::seconds(20);
    opts.deadline = std::chrono::milliseconds(1500);

    auto started = std::chrono::steady_clock::now();
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(10));
    ASSERT_EQ(result.agents.size(), 2u);

    const auto& served = result.agents[0];
    EXPECT_EQ(served.descriptor.name, "Hotel Concierge");
    EXPECT_TRUE(served.card.has_value());
    EXPECT_TRUE(served.verified);
    EXPECT_EQ(served.verification_method, VerificationMethod::DOMAIN);

    const auto& hung = result.agents[1];
    EXPECT_EQ(hung.descriptor.name, "Spa Attendant");
    EXPECT_FALSE(hung.card.has_value());
    EXPECT_FALSE(hung.verified);
    EXPECT_EQ(hung.verification_error, std::string("card fetch abandoned at deadline"));

    EXPECT_TRUE(has_error_containing(result, "abandoned card fetches for Spa Attendant"));
    EXPECT_FALSE(has_error_containing(result, "Hotel Concierge"));
}

// ============================================================================
// Verification Filter Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, RequireVerifiedDropsUnverified) {
    start_provider();

    DiscoveryDocument document = service_->discovery_document();
    document.agents.push_back(descriptor_at("Spa Attendant", "http://127.0.0.1:9/.well-known/agent.json"));
    DocumentServer documents(document);

    auto opts = options();
    opts.fallback_url = documents.base_url();
    opts.network.realm = "hotel.example";

    DiscoveryResult everything = DiscoveryOrchestrator(opts).discover();
    ASSERT_EQ(everything.agents.size(), 2u);
    EXPECT_FALSE(everything.agents[1].verified);

    opts.require_verified = true;
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();
    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_EQ(result.agents.front().descriptor.name, "Hotel Concierge");
    EXPECT_TRUE(result.agents.front().verified);
    EXPECT_TRUE(has_error_containing(result, "Failed to fetch agent card for Spa Attendant"));
}

TEST_F(DiscoveryOrchestratorTest, RequireVerifiedWithoutTrustLeavesNothing) {
    start_provider();

    auto opts = options();
    opts.fallback_url = service_->base_url();
    opts.require_verified = true;
    DiscoveryResult result = DiscoveryOrchestrator(opts).discover();

    EXPECT_TRUE(result.agents.empty());
    EXPECT_EQ(result.discovery_method, DiscoveryMethod::WELLKNOWN);
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, SignedCardVerified) {
    auto key = SigningKeyMaterial::generate("v1");
    ASSERT_TRUE(key.has_value());
    auto material = std::make_shared<const SigningKeyMaterial>(std::move(*key));
    start_provider(std::make_shared<const CardSigner>(material));

    auto store = std::make_shared<TrustedKeyStore>();
    ASSERT_TRUE(store->add_key_pem("v1", material->public_key_pem()));
    auto verifier = std::make_shared<const IdentityVerifier>(store, nullptr);

    auto opts = options();
    opts.fallback_url = service_->base_url();
    DiscoveryResult result = DiscoveryOrchestrator(opts, verifier).discover();

    ASSERT_EQ(result.agents.size(), 1u);
    const auto& agent = result.agents.front();
    EXPECT_TRUE(agent.verified);
    EXPECT_EQ(agent.verification_method, VerificationMethod::SIGNATURE);
    ASSERT_TRUE(agent.card.has_value());
    EXPECT_EQ((*agent.card)["name"], "Hotel Concierge");
}

TEST_F(DiscoveryOrchestratorTest, UnsignedCardFailsSignatureCheck) {
    start_provider();

    auto key = SigningKeyMaterial::generate("v1");
    ASSERT_TRUE(key.has_value());
    auto store = std::make_shared<TrustedKeyStore>();
    ASSERT_TRUE(store->add_key_pem("v1", key->public_key_pem()));
    auto verifier = std::make_shared<const IdentityVerifier>(store, nullptr);

    auto opts = options();
    opts.fallback_url = service_->base_url();
    DiscoveryResult result = DiscoveryOrchestrator(opts, verifier).discover();

    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_FALSE(result.agents.front().verified);
    EXPECT_NE(result.agents.front().verification_error->find("signature: card is not signed"), std::string::npos);
}

// ============================================================================
// Consent Tests
// ============================================================================

TEST_F(DiscoveryOrchestratorTest, ConsentFiltersResult) {
    start_provider();

    auto opts = options();
    opts.fallback_url = service_->base_url();
    DiscoveryOrchestrator orchestrator(opts);

    ConsentGate strict(ConsentGate::default_policy());
    EXPECT_TRUE(orchestrator.discover_with_consent(strict).agents.empty());

    ConsentGate permissive([](const ConsentRequest&) { return ConsentDecision::APPROVED; });
    auto result = orchestrator.discover_with_consent(permissive);
    ASSERT_EQ(result.agents.size(), 1u);
    EXPECT_EQ(result.agents.front().descriptor.name, "Hotel Concierge");
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(OrchestratorOptionsTest, FromClientConfig) {
    ClientConfig config;
    config.try_mdns = false;
    config.mdns_timeout = 1.5;
    config.http_timeout = 4.0;
    config.deadline = 0.0;
    config.fallback_url = "https://hotel.example";
    config.verify_tls = false;
    config.expected_realm = "hotel.example";
    config.mdns_port = 5454;
    config.require_verified = true;

    auto options = OrchestratorOptions::from_config(config);
    EXPECT_FALSE(options.broadcast_enabled);
    EXPECT_EQ(options.broadcast_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(options.http.timeout, std::chrono::milliseconds(4000));
    EXPECT_EQ(options.deadline, std::chrono::milliseconds(0));
    EXPECT_EQ(options.fallback_url, "https://hotel.example");
    EXPECT_FALSE(options.http.verify_tls);
    EXPECT_EQ(options.network.realm, "hotel.example");
    EXPECT_EQ(options.browse.query_port, 5454);
    EXPECT_TRUE(options.require_verified);
}

TEST(OrchestratorOptionsTest, MissingTrustedKeyThrows) {
    ClientConfig config;
    config.signing_public_key = "/nonexistent/lad/public.pem";
    EXPECT_THROW(make_identity_verifier(config), std::runtime_error);

    config.signing_public_key.reset();
    auto verifier = make_identity_verifier(config);
    ASSERT_NE(verifier, nullptr);
    EXPECT_FALSE(verifier->wants_signed_cards());
}
