/**
 * @file descriptor.cpp
 * @brief Descriptor model serialization and deduplication
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/descriptor.hpp"
#include "lad/protocol_constants.hpp"

#include <regex>

using json = nlohmann::json;

namespace lad {

// ============================================================================
// Enum Conversions
// ============================================================================

std::string to_string(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::BROADCAST: return "broadcast";
        case DiscoverySource::WELLKNOWN: return "wellknown";
    }
    return "unknown";
}

std::string to_string(VerificationMethod method) {
    switch (method) {
        case VerificationMethod::TRANSPORT:        return "transport";
        case VerificationMethod::DOMAIN:           return "domain";
        case VerificationMethod::SIGNATURE:        return "signature";
        case VerificationMethod::IDENTITY_BINDING: return "identity-binding";
    }
    return "unknown";
}

std::string to_string(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::BROADCAST: return "broadcast";
        case DiscoveryMethod::WELLKNOWN: return "wellknown";
        case DiscoveryMethod::NONE:      return "none";
    }
    return "none";
}

std::string to_string(ConsentDecision decision) {
    switch (decision) {
        case ConsentDecision::APPROVED: return "approved";
        case ConsentDecision::DENIED:   return "denied";
        case ConsentDecision::DEFERRED: return "deferred";
    }
    return "deferred";
}

std::optional<DiscoverySource> discovery_source_from_string(const std::string& value) {
    if (value == "broadcast") return DiscoverySource::BROADCAST;
    if (value == "wellknown") return DiscoverySource::WELLKNOWN;
    return std::nullopt;
}

std::optional<VerificationMethod> verification_method_from_string(const std::string& value) {
    if (value == "transport") return VerificationMethod::TRANSPORT;
    if (value == "domain") return VerificationMethod::DOMAIN;
    if (value == "signature") return VerificationMethod::SIGNATURE;
    if (value == "identity-binding") return VerificationMethod::IDENTITY_BINDING;
    return std::nullopt;
}

std::optional<ConsentDecision> consent_decision_from_string(const std::string& value) {
    if (value == "approved") return ConsentDecision::APPROVED;
    if (value == "denied") return ConsentDecision::DENIED;
    if (value == "deferred") return ConsentDecision::DEFERRED;
    return std::nullopt;
}

// ============================================================================
// NetworkContext
// ============================================================================

json NetworkContext::to_json() const {
    json j = json::object();
    if (ssid) {
        j["ssid"] = *ssid;
    }
    if (realm) {
        j["realm"] = *realm;
    }
    return j;
}

NetworkContext NetworkContext::from_json(const json& j) {
    NetworkContext context;
    if (!j.is_object()) {
        return context;
    }
    if (j.contains("ssid") && j["ssid"].is_string()) {
        context.ssid = j["ssid"].get<std::string>();
    }
    if (j.contains("realm") && j["realm"].is_string()) {
        context.realm = j["realm"].get<std::string>();
    }
    return context;
}

// ============================================================================
// AgentDescriptor
// ============================================================================

json AgentDescriptor::to_json() const {
    json j;
    j["name"] = name;
    j["description"] = description;
    j["role"] = role;
    j["agent_card_url"] = agent_card_url;
    j["capabilities_preview"] = capabilities_preview;
    return j;
}

std::optional<AgentDescriptor> AgentDescriptor::from_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "agent entry is not an object";
        return std::nullopt;
    }

    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
        error = "agent entry has no name";
        return std::nullopt;
    }

    AgentDescriptor descriptor;
    descriptor.name = j["name"].get<std::string>();

    if (!j.contains("agent_card_url") || !j["agent_card_url"].is_string()) {
        error = "agent '" + descriptor.name + "' has no agent_card_url";
        return std::nullopt;
    }
    descriptor.agent_card_url = j["agent_card_url"].get<std::string>();
    if (!protocol::is_absolute_http_url(descriptor.agent_card_url)) {
        error = "agent '" + descriptor.name + "' has a non-absolute agent_card_url: "
            + descriptor.agent_card_url;
        return std::nullopt;
    }

    for (const char* field : {"description", "role"}) {
        if (!j.contains(field) || j[field].is_null()) {
            continue;
        }
        if (!j[field].is_string()) {
            error = "agent '" + descriptor.name + "' has a non-string " + field;
            return std::nullopt;
        }
    }
    descriptor.description = j.value("description", "");
    descriptor.role = j.value("role", "");

    if (j.contains("capabilities_preview") && !j["capabilities_preview"].is_null()) {
        const auto& caps = j["capabilities_preview"];
        if (!caps.is_array()) {
            error = "agent '" + descriptor.name + "' has a non-array capabilities_preview";
            return std::nullopt;
        }
        for (const auto& cap : caps) {
            if (!cap.is_string()) {
                error = "agent '" + descriptor.name + "' has a non-string capability";
                return std::nullopt;
            }
            descriptor.capabilities_preview.push_back(cap.get<std::string>());
        }
    }

    return descriptor;
}

// ============================================================================
// DiscoveryDocument
// ============================================================================

std::string DiscoveryDocument::to_json() const {
    json j;
    j["version"] = version;
    j["network"] = network.to_json();
    j["agents"] = json::array();
    for (const auto& agent : agents) {
        j["agents"].push_back(agent.to_json());
    }
    return j.dump();
}

std::optional<DiscoveryDocument> DiscoveryDocument::parse(const std::string& body, std::string& error) {
    if (body.size() > protocol::MAX_JSON_SIZE) {
        error = "discovery document exceeds " + std::to_string(protocol::MAX_JSON_SIZE) + " bytes";
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        error = std::string("malformed discovery JSON: ") + e.what();
        return std::nullopt;
    }

    if (!j.is_object()) {
        error = "discovery document is not an object";
        return std::nullopt;
    }

    static const std::regex version_regex(R"(^\d+\.\d+$)");
    if (!j.contains("version") || !j["version"].is_string()
        || !std::regex_match(j["version"].get<std::string>(), version_regex)) {
        error = "discovery document has no major.minor version";
        return std::nullopt;
    }

    if (!j.contains("agents") || !j["agents"].is_array()) {
        error = "discovery document has no agents array";
        return std::nullopt;
    }

    DiscoveryDocument document;
    document.version = j["version"].get<std::string>();
    if (j.contains("network")) {
        document.network = NetworkContext::from_json(j["network"]);
    }

    for (const auto& entry : j["agents"]) {
        auto descriptor = AgentDescriptor::from_json(entry, error);
        if (!descriptor) {
            return std::nullopt;
        }
        document.agents.push_back(std::move(*descriptor));
    }

    return document;
}

// ============================================================================
// DiscoveredAgent
// ============================================================================

void DiscoveredAgent::mark_verified(VerificationMethod method) {
    verified = true;
    verification_method = method;
    verification_error.reset();
}

void DiscoveredAgent::mark_unverified(const std::string& reason) {
    verified = false;
    verification_method.reset();
    verification_error = reason;
}

json DiscoveredAgent::to_display() const {
    json j;
    j["name"] = descriptor.name;
    j["description"] = descriptor.description;
    j["role"] = descriptor.role;
    j["agent_card_url"] = descriptor.agent_card_url;
    j["capabilities"] = descriptor.capabilities_preview;
    j["source"] = to_string(source);
    j["verified"] = verified;
    j["verification_method"] = verification_method ? json(to_string(*verification_method)) : json(nullptr);
    j["verification_error"] = verification_error ? json(*verification_error) : json(nullptr);
    j["card_fetched"] = card.has_value();
    return j;
}

ConsentRequest ConsentRequest::for_agent(const DiscoveredAgent& agent) {
    ConsentRequest request;
    request.agent = agent;
    request.verified = agent.verified;
    request.verification_method = agent.verification_method;
    request.capabilities = agent.descriptor.capabilities_preview;
    return request;
}

// ============================================================================
// AgentSet
// ============================================================================

bool AgentSet::add(DiscoveredAgent agent) {
    auto it = index_.find(agent.descriptor.agent_card_url);
    if (it == index_.end()) {
        index_[agent.descriptor.agent_card_url] = agents_.size();
        agents_.push_back(std::move(agent));
        return true;
    }

    auto& existing = agents_[it->second];
    if (existing.source == DiscoverySource::WELLKNOWN && agent.source == DiscoverySource::BROADCAST) {
        existing = std::move(agent);
        return true;
    }

    return false;
}

bool AgentSet::contains(const std::string& agent_card_url) const {
    return index_.count(agent_card_url) > 0;
}

std::vector<DiscoveredAgent> AgentSet::release() {
    index_.clear();
    std::vector<DiscoveredAgent> released = std::move(agents_);
    agents_.clear();
    return released;
}

} // namespace lad
