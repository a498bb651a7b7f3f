/**
 * @file test_agent_card.cpp
 * @brief Unit tests for agent card construction
 *
 * Tests:
 * - A2A card shape and skill generation
 * - Provider organization from the network realm
 * - Authentication requirements per scheme
 * - Discovery descriptor for a hosted agent
 */

#include <gtest/gtest.h>
#include "lad/agent_card.hpp"
#include "lad/protocol_constants.hpp"

using namespace lad;
using json = nlohmann::json;

// Test fixture for card construction
class AgentCardTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile_.name = "Hotel Concierge";
        profile_.description = "Front desk assistant";
        profile_.role = "concierge";
        profile_.capabilities = {"room-service", "spa"};
        profile_.version = "2.1.0";
    }

    AgentProfile profile_;
    const std::string base_url_ = "http://192.168.1.20:8080";
};

// ============================================================================
// Card Tests
// ============================================================================

TEST_F(AgentCardTest, CardCoreFields) {
    json card = build_agent_card(profile_, base_url_, NetworkContext{});

    EXPECT_EQ(card["name"], "Hotel Concierge");
    EXPECT_EQ(card["description"], "Front desk assistant");
    EXPECT_EQ(card["url"], base_url_);
    EXPECT_EQ(card["version"], "2.1.0");
    EXPECT_EQ(card["protocolVersions"], json::array({"1.0"}));
    EXPECT_EQ(card["defaultInputModes"], json::array({"text"}));
    EXPECT_EQ(card["defaultOutputModes"], json::array({"text"}));
    EXPECT_EQ(card["capabilities"]["streaming"], false);
    EXPECT_EQ(card["capabilities"]["pushNotifications"], false);
}

TEST_F(AgentCardTest, SkillPerCapability) {
    json card = build_agent_card(profile_, base_url_, NetworkContext{});

    ASSERT_EQ(card["skills"].size(), 2u);
    const auto& skill = card["skills"][0];
    EXPECT_EQ(skill["id"], "room-service");
    EXPECT_EQ(skill["name"], "Room Service");
    EXPECT_EQ(skill["description"], "Provides room-service functionality");
    EXPECT_EQ(skill["tags"], json::array({"room-service"}));
}

TEST_F(AgentCardTest, OrganizationFromRealm) {
    NetworkContext network;
    network.realm = "hotel.example";

    json card = build_agent_card(profile_, base_url_, network);
    EXPECT_EQ(card_organization(card), "hotel.example");
}

TEST_F(AgentCardTest, OrganizationFallsBackToName) {
    json card = build_agent_card(profile_, base_url_, NetworkContext{});
    EXPECT_EQ(card_organization(card), "Hotel Concierge");
}

TEST_F(AgentCardTest, IdentityReference) {
    json card = build_agent_card(profile_, base_url_, NetworkContext{});
    EXPECT_FALSE(card.contains("did"));
    EXPECT_FALSE(card_identity_reference(card).has_value());

    profile_.identity_reference = "did:web:hotel.example";
    card = build_agent_card(profile_, base_url_, NetworkContext{});
    EXPECT_EQ(card_identity_reference(card), "did:web:hotel.example");
}

TEST(AgentCardFieldsTest, NestedIdentityReference) {
    json card = {{"name", "x"}, {"identity", {{"did", "did:web:spa.example"}}}};
    EXPECT_EQ(card_identity_reference(card), "did:web:spa.example");
    EXPECT_FALSE(card_identity_reference(json::array()).has_value());
    EXPECT_FALSE(card_organization(json{{"provider", "hotel"}}).has_value());
}

// ============================================================================
// Authentication Tests
// ============================================================================

TEST_F(AgentCardTest, NoAuthenticationField) {
    json card = build_agent_card(profile_, base_url_, NetworkContext{});
    EXPECT_FALSE(card.contains("authentication"));
}

TEST_F(AgentCardTest, OidcAuthentication) {
    profile_.auth.method = AuthMethod::OIDC;
    profile_.auth.authorization_url = "https://idp.hotel.example/authorize";
    profile_.auth.token_url = "https://idp.hotel.example/token";
    profile_.auth.scopes = {"openid", "profile"};
    profile_.auth.issuer = "https://idp.hotel.example";
    profile_.auth.jwks_uri = "https://idp.hotel.example/jwks";
    profile_.auth.documentation_url = "https://hotel.example/docs";

    json auth = build_agent_card(profile_, base_url_, NetworkContext{})["authentication"];
    EXPECT_EQ(auth["type"], "oidc");
    EXPECT_EQ(auth["authorizationUrl"], "https://idp.hotel.example/authorize");
    EXPECT_EQ(auth["tokenUrl"], "https://idp.hotel.example/token");
    EXPECT_EQ(auth["scopes"], json::array({"openid", "profile"}));
    EXPECT_EQ(auth["issuer"], "https://idp.hotel.example");
    EXPECT_EQ(auth["jwksUri"], "https://idp.hotel.example/jwks");
    EXPECT_EQ(auth["documentationUrl"], "https://hotel.example/docs");
}

TEST_F(AgentCardTest, OAuth2OmitsOidcFields) {
    profile_.auth.method = AuthMethod::OAUTH2;
    profile_.auth.token_url = "https://idp.hotel.example/token";
    profile_.auth.issuer = "https://idp.hotel.example";

    json auth = build_agent_card(profile_, base_url_, NetworkContext{})["authentication"];
    EXPECT_EQ(auth["type"], "oauth2");
    EXPECT_FALSE(auth.contains("issuer"));
    EXPECT_FALSE(auth.contains("authorizationUrl"));
}

TEST_F(AgentCardTest, ApiKeyAuthentication) {
    profile_.auth.method = AuthMethod::API_KEY;
    json auth = build_agent_card(profile_, base_url_, NetworkContext{})["authentication"];
    EXPECT_EQ(auth["headerName"], "X-API-Key");

    profile_.auth.api_key_header = "X-Hotel-Key";
    auth = build_agent_card(profile_, base_url_, NetworkContext{})["authentication"];
    EXPECT_EQ(auth["headerName"], "X-Hotel-Key");
}

TEST_F(AgentCardTest, BearerAuthentication) {
    profile_.auth.method = AuthMethod::BEARER;
    json auth = build_agent_card(profile_, base_url_, NetworkContext{})["authentication"];
    EXPECT_EQ(auth["type"], "bearer");
    EXPECT_EQ(auth["headerName"], "Authorization");
    EXPECT_EQ(auth["scheme"], "Bearer");
}

TEST(AuthMethodTest, ParseNames) {
    EXPECT_EQ(auth_method_from_string(""), AuthMethod::NONE);
    EXPECT_EQ(auth_method_from_string("OIDC"), AuthMethod::OIDC);
    EXPECT_EQ(auth_method_from_string(" api_key "), AuthMethod::API_KEY);
    EXPECT_FALSE(auth_method_from_string("kerberos").has_value());
    EXPECT_EQ(to_string(AuthMethod::OAUTH2), "oauth2");
}

// ============================================================================
// Descriptor Tests
// ============================================================================

TEST_F(AgentCardTest, DescriptorUsesDefaultCardPath) {
    AgentDescriptor descriptor = build_descriptor(profile_, base_url_);

    EXPECT_EQ(descriptor.name, "Hotel Concierge");
    EXPECT_EQ(descriptor.role, "concierge");
    EXPECT_EQ(descriptor.agent_card_url, base_url_ + protocol::AGENT_CARD_PATH);
    EXPECT_EQ(descriptor.capabilities_preview, profile_.capabilities);
}

TEST_F(AgentCardTest, DescriptorUsesCustomCardPath) {
    profile_.card_path = "/agents/concierge/agent.json";
    AgentDescriptor descriptor = build_descriptor(profile_, base_url_);
    EXPECT_EQ(descriptor.agent_card_url, "http://192.168.1.20:8080/agents/concierge/agent.json");
}
