/**
 * @file discovery_orchestrator.hpp
 * @brief Ordered agent discovery: broadcast first, HTTP fallback second
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One discover() call:
 * 1. Browse _a2a._tcp.local. until the first answer or the broadcast timeout
 * 2. If that produced nothing, fetch <fallback>/.well-known/lad/agents
 * 3. Fetch and verify each agent card, a bounded number at a time
 *
 * Each call runs its own io_context on the calling thread and returns when
 * all work is done or the deadline expires.
 */

#pragma once

#include "lad/broadcast_browser.hpp"
#include "lad/config.hpp"
#include "lad/consent_gate.hpp"
#include "lad/descriptor.hpp"
#include "lad/http_client.hpp"
#include "lad/identity_verifier.hpp"

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lad {

/**
 * @brief Discovery run settings
 */
struct OrchestratorOptions {
    bool broadcast_enabled = true;
    std::chrono::milliseconds broadcast_timeout = protocol::DEFAULT_BROADCAST_TIMEOUT;
    bool stop_at_first_result = true;
    BrowseOptions browse;

    std::optional<std::string> fallback_url;    ///< Base URL of a discovery resource
    bool merge_fallback_results = false;        ///< Also query the fallback after a broadcast hit

    bool fetch_cards = true;
    bool prefer_https = false;                  ///< Scheme for broadcast card URLs
    size_t max_concurrent_fetches = protocol::MAX_CONCURRENT_CARD_FETCHES;
    bool require_verified = false;              ///< Leave unverified agents out of the result

    std::chrono::milliseconds deadline = protocol::DEFAULT_DISCOVERY_DEADLINE;  ///< Zero for none
    HttpClientOptions http;
    NetworkContext network;                     ///< Reported in results; realm seeds domain checks

    /**
     * @brief Options described by a client configuration
     */
    static OrchestratorOptions from_config(const ClientConfig& config);
};

/**
 * @brief Verifier described by a client configuration
 *
 * Loads signing_public_key (if set) as trusted key signing_key_id.
 *
 * @param config Client configuration
 * @param resolver Optional identity resolver
 * @throws std::runtime_error if the configured public key cannot be loaded
 */
std::shared_ptr<const IdentityVerifier> make_identity_verifier(
    const ClientConfig& config,
    std::shared_ptr<const IdentityResolver> resolver = nullptr
);

/**
 * @brief DiscoveryOrchestrator - Resolves the agents available on this network
 */
class DiscoveryOrchestrator {
public:
    /**
     * @brief Construct DiscoveryOrchestrator
     * @param options Run settings
     * @param verifier Card verifier; nullptr for domain and transport checks only
     * @throws std::runtime_error if libsodium cannot be initialized
     */
    explicit DiscoveryOrchestrator(
        OrchestratorOptions options,
        std::shared_ptr<const IdentityVerifier> verifier = nullptr
    );

    /**
     * @brief Run discovery
     *
     * Never throws for network or data problems; they end up in
     * DiscoveryResult::errors or in the agent's verification error.
     *
     * @return Agents in first-seen order, deduplicated by card URL
     */
    DiscoveryResult discover() const;

    /**
     * @brief Run discovery and keep only agents the gate approves
     */
    DiscoveryResult discover_with_consent(ConsentGate& gate) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    OrchestratorOptions options_;
    std::shared_ptr<const IdentityVerifier> verifier_;
};

} // namespace lad
