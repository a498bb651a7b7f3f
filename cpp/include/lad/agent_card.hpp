/**
 * @file agent_card.hpp
 * @brief A2A agent card construction for hosted agents
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Builds the card served at the card resource and the descriptor listed in
 * the discovery resource from one agent profile.
 */

#pragma once

#include "lad/descriptor.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <optional>

namespace lad {

/**
 * @brief Authentication scheme a hosted agent requires
 */
enum class AuthMethod {
    NONE,
    OAUTH2,
    OIDC,
    API_KEY,
    BEARER
};

std::string to_string(AuthMethod method);
std::optional<AuthMethod> auth_method_from_string(const std::string& value);

/**
 * @brief Authentication requirements declared in the card
 */
struct AuthRequirements {
    AuthMethod method = AuthMethod::NONE;
    std::optional<std::string> authorization_url;   ///< OAuth2/OIDC authorization endpoint
    std::optional<std::string> token_url;           ///< OAuth2/OIDC token endpoint
    std::vector<std::string> scopes;
    std::optional<std::string> client_id;           ///< Public client id
    std::optional<std::string> issuer;              ///< OIDC only
    std::optional<std::string> jwks_uri;            ///< OIDC only
    std::optional<std::string> api_key_header;      ///< Defaults to X-API-Key
    std::optional<std::string> documentation_url;

    /**
     * @brief Card "authentication" field
     * @return Field object, or std::nullopt when no authentication is required
     */
    std::optional<nlohmann::json> to_card_field() const;
};

/**
 * @brief Everything a provider knows about one hosted agent
 */
struct AgentProfile {
    std::string name;
    std::string description;
    std::string role = "generic";
    std::vector<std::string> capabilities;
    std::string version = "1.0.0";
    std::string card_path;                          ///< Resource path of the card
    std::optional<std::string> identity_reference;  ///< Resolvable identity (e.g. DID)
    AuthRequirements auth;
};

/**
 * @brief Build the A2A card for a hosted agent
 * @param profile Agent profile
 * @param base_url Scheme, host and port the agent is reachable at
 * @param network Provider network (realm becomes provider.organization)
 * @return Card JSON
 */
nlohmann::json build_agent_card(
    const AgentProfile& profile,
    const std::string& base_url,
    const NetworkContext& network
);

/**
 * @brief Build the discovery resource entry for a hosted agent
 */
AgentDescriptor build_descriptor(const AgentProfile& profile, const std::string& base_url);

/**
 * @brief Identity reference declared by a card ("did" or "identity.did")
 */
std::optional<std::string> card_identity_reference(const nlohmann::json& card);

/**
 * @brief Organization declared by a card (provider.organization)
 */
std::optional<std::string> card_organization(const nlohmann::json& card);

} // namespace lad
