/**
 * @file protocol_constants.hpp
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace lad {
namespace protocol {

// ============================================================================
// Protocol Identifiers
// ============================================================================

/// Discovery document version
constexpr const char* PROTOCOL_VERSION = "1.0";

/// Version advertised in the "v" TXT field
constexpr const char* TXT_RECORD_VERSION = "1";

/// A2A protocol versions declared in generated cards
constexpr const char* A2A_PROTOCOL_VERSION = "1.0";

/// DNS-SD service type for A2A-capable agents
constexpr const char* SERVICE_TYPE = "_a2a._tcp.local.";

/// Well-known discovery resource
constexpr const char* DISCOVERY_PATH = "/.well-known/lad/agents";

/// Default card resource
constexpr const char* AGENT_CARD_PATH = "/.well-known/agent.json";

/// Liveness resource
constexpr const char* HEALTH_PATH = "/health";

/// Media type of a signed card envelope
constexpr const char* SIGNED_CARD_MEDIA_TYPE = "application/jose";

/// Media type of plain JSON
constexpr const char* JSON_MEDIA_TYPE = "application/json";

/// Cache directive attached to discovery responses
constexpr const char* DISCOVERY_CACHE_CONTROL = "max-age=300, must-revalidate";

/// JWS algorithm used for card signatures
constexpr const char* SIGNING_ALGORITHM = "ES256";

// ============================================================================
// Network Configuration
// ============================================================================

/// mDNS multicast group
constexpr const char* MDNS_MULTICAST_ADDRESS = "224.0.0.251";

/// mDNS port
constexpr uint16_t MDNS_PORT = 5353;

/// Default HTTP port of a provider
constexpr uint16_t DEFAULT_HTTP_PORT = 8080;

/// TTL of advertised mDNS records (seconds)
constexpr uint32_t MDNS_RECORD_TTL = 120;

/// Maximum mDNS packet size
constexpr size_t MAX_MDNS_PACKET_SIZE = 9000;

// ============================================================================
// Timeouts
// ============================================================================

/// Default broadcast discovery window
constexpr auto DEFAULT_BROADCAST_TIMEOUT = std::chrono::milliseconds(3000);

/// Default per-request HTTP timeout
constexpr auto DEFAULT_HTTP_TIMEOUT = std::chrono::milliseconds(10000);

/// Default overall discovery deadline
constexpr auto DEFAULT_DISCOVERY_DEADLINE = std::chrono::milliseconds(30000);

/// Idle timeout for a server-side HTTP connection
constexpr auto HTTP_SESSION_TIMEOUT = std::chrono::seconds(30);

// ============================================================================
// Resource Limits
// ============================================================================

/// Maximum JSON document size accepted from a remote peer (1MB)
constexpr size_t MAX_JSON_SIZE = 1024 * 1024;

/// Maximum request body the endpoint service reads
constexpr size_t MAX_HTTP_REQUEST_BODY = 16 * 1024;

/// Maximum card fetches in flight during one discovery run
constexpr size_t MAX_CONCURRENT_CARD_FETCHES = 4;

/// Maximum agent name length
constexpr size_t MAX_AGENT_NAME_LENGTH = 63;

// ============================================================================
// Data Directories
// ============================================================================

/**
 * @brief Get LAD data directory from LAD_DATA_DIR or use default
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Directory holding signing keys
 */
std::filesystem::path get_key_directory();

/**
 * @brief Default path of the consent database
 */
std::filesystem::path get_consent_database_path();

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate an agent name usable as a DNS-SD instance label
 * @param name Name to validate (printable, no dots, bounded length)
 * @return true if valid, false otherwise
 */
bool validate_agent_name(const std::string& name);

/**
 * @brief Validate a resource path ("/..." without whitespace or "..")
 */
bool validate_resource_path(const std::string& path);

/**
 * @brief Check for an absolute http or https URL with a host
 */
bool is_absolute_http_url(const std::string& url);

/**
 * @brief Normalize an organization or realm for comparison
 *
 * Lowercases and removes whitespace and a trailing dot.
 */
std::string normalize_domain(const std::string& domain);

} // namespace protocol
} // namespace lad
