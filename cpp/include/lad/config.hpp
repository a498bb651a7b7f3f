/**
 * @file config.hpp
 * @brief Provider and client configuration
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Configuration is read from a YAML file (a nested "server:" or "client:"
 * section is used when present) and then overridden from the environment.
 * Every key has an override named <prefix><KEY>, e.g. LAD_PORT=9000 or
 * LAD_CAPABILITIES=spa,dining.
 */

#pragma once

#include "lad/agent_card.hpp"
#include "lad/endpoint_service.hpp"
#include "lad/utilities.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace lad {

/// Environment override prefix
constexpr const char* DEFAULT_ENV_PREFIX = "LAD_";

/// File written by generate_example_config() when no path is given
constexpr const char* DEFAULT_CONFIG_FILE = "lad-config.yaml";

/**
 * @brief Provider settings
 */
struct ServerConfig {
    // Agent identity
    std::string name = "LAD-A2A Agent";
    std::string description = "LAD-A2A discovery agent";
    std::string role = "generic";
    std::vector<std::string> capabilities = {"info"};
    std::string version = "1.0.0";
    std::optional<std::string> did;

    // Network
    std::string host = "0.0.0.0";
    uint16_t port = protocol::DEFAULT_HTTP_PORT;
    std::optional<std::string> public_host;         ///< Host placed in card URLs
    std::optional<std::string> network_ssid;
    std::optional<std::string> network_realm;

    bool enable_mdns = true;

    // TLS
    bool tls_enabled = false;
    std::string tls_certfile;
    std::string tls_keyfile;

    // Card signing
    bool signing_enabled = false;
    std::string signing_key;                        ///< Private key PEM file
    std::string signing_key_id = "key-v1";
    bool require_signing = false;                   ///< Key errors are fatal

    // Authentication
    std::string auth_method = "none";
    std::optional<std::string> auth_token_url;
    std::optional<std::string> auth_authorization_url;
    std::vector<std::string> auth_scopes;
    std::optional<std::string> auth_issuer;
    std::optional<std::string> auth_jwks_uri;
    std::optional<std::string> auth_client_id;
    std::optional<std::string> auth_api_key_header;
    std::optional<std::string> auth_docs_url;

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

    /**
     * @brief Hosted agent profile described by this configuration
     * @throws std::invalid_argument if auth_method is unknown
     */
    AgentProfile to_agent_profile() const;

    /**
     * @brief Endpoint listener settings described by this configuration
     */
    EndpointServiceOptions to_endpoint_options() const;

    NetworkContext network() const;
    utilities::LogLevel level() const { return utilities::parse_log_level(log_level); }
};

/**
 * @brief Discovery client settings
 */
struct ClientConfig {
    // Discovery
    double mdns_timeout = 3.0;                      ///< Seconds
    double http_timeout = 10.0;                     ///< Seconds
    double deadline = 30.0;                         ///< Seconds for a whole run, 0 for none
    std::optional<std::string> fallback_url;
    bool try_mdns = true;
    bool stop_at_first_result = true;
    std::string mdns_address = protocol::MDNS_MULTICAST_ADDRESS;
    uint16_t mdns_port = protocol::MDNS_PORT;
    bool prefer_https = false;
    bool fetch_cards = true;
    bool merge_fallback_results = false;

    // Trust
    bool verify_tls = true;
    std::optional<std::string> ca_bundle;
    std::optional<std::string> signing_public_key;  ///< Trusted public key PEM file
    std::string signing_key_id = "key-v1";
    std::optional<std::string> expected_realm;
    bool require_verified = false;

    // Consent
    bool remember_consent = false;
    std::optional<std::string> consent_db;          ///< Default under the data directory

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

    utilities::LogLevel level() const { return utilities::parse_log_level(log_level); }
};

/**
 * @brief Load provider settings
 *
 * A missing file yields defaults (with a warning); environment overrides
 * are applied in either case.
 *
 * @param path YAML file, empty for defaults plus environment only
 * @param env_prefix Prefix of override variables
 * @return Settings
 * @throws std::runtime_error if the file is malformed or a value has the wrong type
 */
ServerConfig load_server_config(const std::string& path = "", const std::string& env_prefix = DEFAULT_ENV_PREFIX);

/**
 * @brief Load discovery client settings
 * @throws std::runtime_error if the file is malformed or a value has the wrong type
 */
ClientConfig load_client_config(const std::string& path = "", const std::string& env_prefix = DEFAULT_ENV_PREFIX);

/**
 * @brief Commented configuration template with "server:" and "client:" sections
 */
std::string example_config();

/**
 * @brief Write example_config() to a file
 * @return true if written
 */
bool generate_example_config(const std::string& path = DEFAULT_CONFIG_FILE);

} // namespace lad
