/**
 * @file agent_card.cpp
 * @brief Implementation of A2A agent card construction
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/agent_card.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"

using json = nlohmann::json;

namespace lad {

std::string to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::NONE:    return "none";
        case AuthMethod::OAUTH2:  return "oauth2";
        case AuthMethod::OIDC:    return "oidc";
        case AuthMethod::API_KEY: return "api_key";
        case AuthMethod::BEARER:  return "bearer";
    }
    return "none";
}

std::optional<AuthMethod> auth_method_from_string(const std::string& value) {
    std::string lower = utilities::to_lowercase(utilities::trim_string(value));
    if (lower.empty() || lower == "none") return AuthMethod::NONE;
    if (lower == "oauth2") return AuthMethod::OAUTH2;
    if (lower == "oidc") return AuthMethod::OIDC;
    if (lower == "api_key") return AuthMethod::API_KEY;
    if (lower == "bearer") return AuthMethod::BEARER;
    return std::nullopt;
}

// ============================================================================
// AuthRequirements
// ============================================================================

std::optional<json> AuthRequirements::to_card_field() const {
    if (method == AuthMethod::NONE) {
        return std::nullopt;
    }

    json auth;
    auth["type"] = to_string(method);

    switch (method) {
        case AuthMethod::OAUTH2:
        case AuthMethod::OIDC:
            if (authorization_url) auth["authorizationUrl"] = *authorization_url;
            if (token_url) auth["tokenUrl"] = *token_url;
            if (!scopes.empty()) auth["scopes"] = scopes;
            if (client_id) auth["clientId"] = *client_id;
            if (method == AuthMethod::OIDC) {
                if (issuer) auth["issuer"] = *issuer;
                if (jwks_uri) auth["jwksUri"] = *jwks_uri;
            }
            break;
        case AuthMethod::API_KEY:
            auth["headerName"] = api_key_header.value_or("X-API-Key");
            break;
        case AuthMethod::BEARER:
            auth["headerName"] = "Authorization";
            auth["scheme"] = "Bearer";
            break;
        case AuthMethod::NONE:
            break;
    }

    if (documentation_url) {
        auth["documentationUrl"] = *documentation_url;
    }

    return auth;
}

// ============================================================================
// Card Construction
// ============================================================================

json build_agent_card(const AgentProfile& profile, const std::string& base_url, const NetworkContext& network) {
    json card;
    card["name"] = profile.name;
    card["description"] = profile.description;
    card["url"] = base_url;
    card["version"] = profile.version;
    card["protocolVersions"] = json::array({protocol::A2A_PROTOCOL_VERSION});
    card["capabilities"] = {
        {"streaming", false},
        {"pushNotifications", false},
        {"stateTransitionHistory", false}
    };
    card["defaultInputModes"] = json::array({"text"});
    card["defaultOutputModes"] = json::array({"text"});

    card["skills"] = json::array();
    for (const auto& capability : profile.capabilities) {
        card["skills"].push_back({
            {"id", capability},
            {"name", utilities::title_case(capability)},
            {"description", "Provides " + capability + " functionality"},
            {"tags", json::array({capability})}
        });
    }

    card["provider"] = {
        {"organization", network.realm.value_or(profile.name)}
    };

    if (profile.identity_reference) {
        card["did"] = *profile.identity_reference;
    }

    if (auto auth = profile.auth.to_card_field()) {
        card["authentication"] = *auth;
    }

    return card;
}

AgentDescriptor build_descriptor(const AgentProfile& profile, const std::string& base_url) {
    AgentDescriptor descriptor;
    descriptor.name = profile.name;
    descriptor.description = profile.description;
    descriptor.role = profile.role;
    descriptor.agent_card_url = base_url
        + (profile.card_path.empty() ? std::string(protocol::AGENT_CARD_PATH) : profile.card_path);
    descriptor.capabilities_preview = profile.capabilities;
    return descriptor;
}

std::optional<std::string> card_identity_reference(const json& card) {
    if (!card.is_object()) {
        return std::nullopt;
    }
    if (card.contains("did") && card["did"].is_string()) {
        return card["did"].get<std::string>();
    }
    if (card.contains("identity") && card["identity"].is_object()) {
        const auto& identity = card["identity"];
        if (identity.contains("did") && identity["did"].is_string()) {
            return identity["did"].get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<std::string> card_organization(const json& card) {
    if (!card.is_object() || !card.contains("provider") || !card["provider"].is_object()) {
        return std::nullopt;
    }
    const auto& provider = card["provider"];
    if (provider.contains("organization") && provider["organization"].is_string()) {
        return provider["organization"].get<std::string>();
    }
    return std::nullopt;
}

} // namespace lad
