/**
 * @file provider_node.hpp
 * @brief Provider node - hosts an agent's discovery endpoint and advertisement
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Ties together:
 * - Agent card and descriptor built from ServerConfig
 * - Optional card signing key
 * - EndpointService (discovery, card and health resources)
 * - Advertiser (mDNS record pointing at the card)
 * - Worker threads running the io_context that drives mDNS
 */

#pragma once

#include "lad/advertiser.hpp"
#include "lad/card_signer.hpp"
#include "lad/config.hpp"
#include "lad/endpoint_service.hpp"
#include "lad/signing_keys.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lad {

/**
 * @brief Provider node statistics
 */
struct ProviderNodeStats {
    size_t hosted_agents;               ///< Agents served by the endpoint
    size_t advertisements;              ///< Active mDNS advertisements
    uint64_t requests_served;           ///< HTTP requests answered
    uint64_t queries_answered;          ///< mDNS queries answered
    uint64_t uptime_seconds;            ///< Node uptime in seconds
};

/**
 * @brief ProviderNode - One hosted agent, served and advertised
 */
class ProviderNode {
public:
    /**
     * @brief Construct ProviderNode
     *
     * Loads the signing key when signing is enabled. A key that cannot be
     * loaded disables signing, unless require_signing is set.
     *
     * @param config Provider configuration
     * @param advertiser_options mDNS socket settings (used when enable_mdns is set)
     * @param worker_threads I/O threads (0 = hardware concurrency)
     * @throws std::invalid_argument on invalid agent or TLS settings
     * @throws std::runtime_error if signing is required and the key cannot be loaded
     */
    explicit ProviderNode(
        ServerConfig config,
        AdvertiserOptions advertiser_options = {},
        size_t worker_threads = 0
    );

    /**
     * @brief Destructor - stops the node if running
     */
    ~ProviderNode();

    // Disable copy and move
    ProviderNode(const ProviderNode&) = delete;
    ProviderNode& operator=(const ProviderNode&) = delete;
    ProviderNode(ProviderNode&&) = delete;
    ProviderNode& operator=(ProviderNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Start serving and advertising
     *
     * An advertisement failure is logged; the endpoint keeps serving.
     *
     * @return true if the endpoint is listening, false otherwise
     */
    bool start();

    /**
     * @brief Withdraw, stop listening and join worker threads
     */
    void stop();

    bool is_running() const;

    // ========================================================================
    // Accessors
    // ========================================================================

    const ServerConfig& config() const { return config_; }

    /**
     * @brief Hosted agent as registered with the endpoint
     */
    AgentProfile profile() const;

    /**
     * @brief Descriptor listed in the discovery resource
     */
    AgentDescriptor descriptor() const;

    std::string base_url() const;
    uint16_t bound_port() const;
    bool signing_enabled() const { return signer_ != nullptr; }
    bool is_advertised() const;

    /**
     * @brief Public half of the signing key, for out-of-band distribution
     * @return PEM, or std::nullopt when signing is disabled
     */
    std::optional<std::string> signing_public_key_pem() const;

    const EndpointService& endpoint() const { return *endpoint_; }

    // ========================================================================
    // Statistics
    // ========================================================================

    ProviderNodeStats get_stats() const;
    uint64_t get_uptime() const;
    void print_status() const;

private:
    void load_signing_key();
    bool advertise();

    ServerConfig config_;
    AdvertiserOptions advertiser_options_;
    size_t worker_count_;

    std::shared_ptr<const SigningKeyMaterial> signing_key_;
    std::shared_ptr<const CardSigner> signer_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> worker_threads_;

    std::unique_ptr<EndpointService> endpoint_;
    std::unique_ptr<Advertiser> advertiser_;
    std::optional<AdvertisementHandle> advertisement_;
    mutable std::mutex advertisement_mutex_;

    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace lad
