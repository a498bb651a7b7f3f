/**
 * @file descriptor.hpp
 * @brief Agent descriptors, discovery documents and result records
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Plain data records shared by the provider and client paths:
 * - Agent descriptors and the well-known discovery document
 * - Network context
 * - Discovered agents with provenance and verification state
 * - Consent requests and decisions
 * - Discovery results with deduplication
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace lad {

/**
 * @brief Mechanism that produced a discovered agent
 */
enum class DiscoverySource {
    BROADCAST,      ///< mDNS/DNS-SD browse
    WELLKNOWN       ///< HTTP well-known discovery resource
};

/**
 * @brief Method that established an agent's identity
 */
enum class VerificationMethod {
    TRANSPORT,          ///< Verified TLS channel with matching hostname
    DOMAIN,             ///< Card origin matches fetch host or expected realm
    SIGNATURE,          ///< Signed envelope checked against a trusted key
    IDENTITY_BINDING    ///< Identity reference resolved to the signing key
};

/**
 * @brief Mechanism reported for a whole discovery run
 */
enum class DiscoveryMethod {
    BROADCAST,
    WELLKNOWN,
    NONE
};

/**
 * @brief Outcome of a consent request
 */
enum class ConsentDecision {
    APPROVED,
    DENIED,
    DEFERRED
};

std::string to_string(DiscoverySource source);
std::string to_string(VerificationMethod method);
std::string to_string(DiscoveryMethod method);
std::string to_string(ConsentDecision decision);

std::optional<DiscoverySource> discovery_source_from_string(const std::string& value);
std::optional<VerificationMethod> verification_method_from_string(const std::string& value);
std::optional<ConsentDecision> consent_decision_from_string(const std::string& value);

/**
 * @brief Network the client or provider is attached to
 */
struct NetworkContext {
    std::optional<std::string> ssid;    ///< Wireless network name
    std::optional<std::string> realm;   ///< Administrative trust domain

    bool empty() const { return !ssid && !realm; }

    nlohmann::json to_json() const;
    static NetworkContext from_json(const nlohmann::json& j);
};

/**
 * @brief Summary of an agent as announced by discovery
 *
 * Identity key for deduplication is agent_card_url.
 */
struct AgentDescriptor {
    std::string name;
    std::string description;
    std::string role;
    std::string agent_card_url;                     ///< Absolute URI of the card
    std::vector<std::string> capabilities_preview;  ///< Ordered capability hints

    /**
     * @brief Serialize to the discovery document entry form
     */
    nlohmann::json to_json() const;

    /**
     * @brief Parse a discovery document entry
     * @param j Entry object
     * @param error Receives the schema violation when parsing fails
     * @return Descriptor, or std::nullopt on schema violation
     */
    static std::optional<AgentDescriptor> from_json(const nlohmann::json& j, std::string& error);
};

/**
 * @brief Body of GET /.well-known/lad/agents
 */
struct DiscoveryDocument {
    std::string version;
    NetworkContext network;
    std::vector<AgentDescriptor> agents;

    std::string to_json() const;

    /**
     * @brief Parse and validate a discovery document
     *
     * Any schema violation rejects the whole document.
     *
     * @param body Response body
     * @param error Receives the reason when parsing fails
     * @return Document, or std::nullopt if malformed
     */
    static std::optional<DiscoveryDocument> parse(const std::string& body, std::string& error);
};

/**
 * @brief An agent found during one discovery run
 */
struct DiscoveredAgent {
    AgentDescriptor descriptor;
    DiscoverySource source = DiscoverySource::WELLKNOWN;
    std::optional<nlohmann::json> card;                     ///< Parsed card after fetch
    bool verified = false;
    std::optional<VerificationMethod> verification_method;
    std::optional<std::string> verification_error;

    /**
     * @brief Record a successful verification
     */
    void mark_verified(VerificationMethod method);

    /**
     * @brief Record a failed verification with its reason
     */
    void mark_unverified(const std::string& reason);

    /**
     * @brief Flat representation for UI display
     */
    nlohmann::json to_display() const;
};

/**
 * @brief Input to a consent decision function
 */
struct ConsentRequest {
    DiscoveredAgent agent;
    bool verified = false;
    std::optional<VerificationMethod> verification_method;
    std::vector<std::string> capabilities;

    static ConsentRequest for_agent(const DiscoveredAgent& agent);
};

/**
 * @brief Outcome of one discovery run
 */
struct DiscoveryResult {
    std::vector<DiscoveredAgent> agents;            ///< First-seen order
    NetworkContext network_context;
    DiscoveryMethod discovery_method = DiscoveryMethod::NONE;
    std::vector<std::string> errors;                ///< Non-fatal diagnostics
};

/**
 * @brief Ordered agent collection deduplicated by card URL
 *
 * A broadcast-sourced entry replaces a well-known one for the same URL in
 * place; every other duplicate is dropped.
 */
class AgentSet {
public:
    /**
     * @brief Add an agent
     * @return true if the set changed, false if the agent was a duplicate
     */
    bool add(DiscoveredAgent agent);

    bool contains(const std::string& agent_card_url) const;
    size_t size() const { return agents_.size(); }
    bool empty() const { return agents_.empty(); }

    const std::vector<DiscoveredAgent>& agents() const { return agents_; }
    std::vector<DiscoveredAgent>& agents() { return agents_; }

    /**
     * @brief Move the collected agents out
     */
    std::vector<DiscoveredAgent> release();

private:
    std::vector<DiscoveredAgent> agents_;
    std::map<std::string, size_t> index_;   ///< Card URL -> position in agents_
};

} // namespace lad
