/**
 * @file endpoint_service.hpp
 * @brief HTTP discovery endpoint for hosted A2A agents
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Serves the read-only discovery resources:
 * - GET /.well-known/lad/agents  discovery document (all hosted agents)
 * - GET <card path>              agent card, or signed envelope on request
 * - GET /health                  liveness and feature flags
 * - OPTIONS on known paths       CORS preflight
 *
 * Served by cpp-httplib over plain HTTP or HTTPS on its own listener thread.
 */

#pragma once

#include "lad/agent_card.hpp"
#include "lad/card_signer.hpp"
#include "lad/descriptor.hpp"
#include "lad/protocol_constants.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <thread>

// Forward declaration
namespace httplib { class Server; }

namespace lad {

/**
 * @brief Parsed HTTP request as seen by the route handler
 */
struct ServiceRequest {
    std::string method;
    std::string target;                         ///< Path and query as received
    std::map<std::string, std::string> headers; ///< Lowercased names

    /**
     * @brief Target without query string or fragment
     */
    std::string path() const;

    std::string header(const std::string& name) const;
};

/**
 * @brief Response produced by the route handler
 */
struct ServiceResponse {
    int status = 200;
    std::string content_type = protocol::JSON_MEDIA_TYPE;
    std::map<std::string, std::string> headers;
    std::string body;

    static ServiceResponse json_error(int status, const std::string& message);
};

/**
 * @brief Listener and feature settings
 */
struct EndpointServiceOptions {
    std::string bind_address = "0.0.0.0";
    uint16_t port = protocol::DEFAULT_HTTP_PORT;    ///< 0 picks an ephemeral port
    std::string public_host;                        ///< Host used in card URLs (default: first local IPv4)
    NetworkContext network;

    bool tls_enabled = false;
    std::string tls_certfile;                       ///< PEM certificate chain
    std::string tls_keyfile;                        ///< PEM private key

    bool mdns_enabled = false;                      ///< Reported by /health only
};

/**
 * @brief EndpointService - Discovery, card and health resources
 */
class EndpointService {
public:
    /**
     * @brief Construct EndpointService
     * @param options Listener and feature settings
     * @param signer Card signer, or nullptr to serve unsigned cards only
     * @throws std::invalid_argument if TLS is enabled without certificate and key files
     */
    explicit EndpointService(
        EndpointServiceOptions options,
        std::shared_ptr<const CardSigner> signer = nullptr
    );

    ~EndpointService();

    // Disable copy and move
    EndpointService(const EndpointService&) = delete;
    EndpointService& operator=(const EndpointService&) = delete;
    EndpointService(EndpointService&&) = delete;
    EndpointService& operator=(EndpointService&&) = delete;

    // ========================================================================
    // Hosted Agents
    // ========================================================================

    /**
     * @brief Host an agent
     *
     * An empty card path takes the well-known card path if it is free,
     * otherwise /agents/<name>/agent.json.
     *
     * @param profile Agent profile
     * @return true if added, false on invalid name or conflicting path
     */
    bool add_agent(AgentProfile profile);

    std::vector<AgentProfile> agents() const;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Bind, listen and start the listener thread
     * @return true if listening, false on bind or TLS setup failure
     */
    bool start();

    /**
     * @brief Stop the listener and join its thread
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Listening port (the configured port before start)
     */
    uint16_t bound_port() const;

    /**
     * @brief scheme://public_host:port
     */
    std::string base_url() const;

    bool signing_enabled() const { return signer_ != nullptr; }

    // ========================================================================
    // Routes
    // ========================================================================

    /**
     * @brief Route one request
     */
    ServiceResponse handle(const ServiceRequest& request) const;

    DiscoveryDocument discovery_document() const;

    /**
     * @brief Card for a hosted card path
     * @return Card, or std::nullopt if no agent is hosted at that path
     */
    std::optional<nlohmann::json> card_for_path(const std::string& path) const;

    uint64_t get_requests_served() const;

private:
    bool is_known_path(const std::string& path) const;
    void apply_cors(ServiceResponse& response) const;

    ServiceResponse serve_discovery() const;
    ServiceResponse serve_card(const ServiceRequest& request, const nlohmann::json& card) const;
    ServiceResponse serve_health() const;

    EndpointServiceOptions options_;
    std::shared_ptr<const CardSigner> signer_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listener_thread_;
    std::atomic<uint16_t> bound_port_;

    std::vector<AgentProfile> agents_;
    mutable std::mutex agents_mutex_;

    std::atomic<bool> running_;
    mutable std::atomic<uint64_t> requests_served_;
};

} // namespace lad
