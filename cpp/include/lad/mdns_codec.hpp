/**
 * @file mdns_codec.hpp
 * @brief Minimal DNS message codec for mDNS/DNS-SD service records
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Covers what A2A service advertisement needs (RFC 6762/6763):
 * - PTR queries for a service type
 * - Announcements carrying PTR, SRV, TXT and A records
 * - Decoding with name compression
 * - Grouping decoded records into service instances
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <optional>

namespace lad {
namespace mdns {

constexpr uint16_t TYPE_A = 1;
constexpr uint16_t TYPE_PTR = 12;
constexpr uint16_t TYPE_TXT = 16;
constexpr uint16_t TYPE_SRV = 33;
constexpr uint16_t TYPE_ANY = 255;

constexpr uint16_t CLASS_IN = 1;

/// Top bit of a question class: unicast response requested
constexpr uint16_t UNICAST_RESPONSE_BIT = 0x8000;

/// Top bit of a record class: cache flush
constexpr uint16_t CACHE_FLUSH_BIT = 0x8000;

/// Response flags: QR + AA
constexpr uint16_t RESPONSE_FLAGS = 0x8400;

/**
 * @brief Question section entry
 */
struct Question {
    std::string name;
    uint16_t type = TYPE_PTR;
    uint16_t klass = CLASS_IN;
    bool unicast_response = false;
};

/**
 * @brief Resource record with type-specific fields decoded
 */
struct ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t klass = CLASS_IN;
    uint32_t ttl = 0;

    std::string target;                         ///< PTR domain or SRV target
    uint16_t priority = 0;                      ///< SRV
    uint16_t weight = 0;                        ///< SRV
    uint16_t port = 0;                          ///< SRV
    std::map<std::string, std::string> txt;     ///< TXT key/value pairs
    std::string address;                        ///< A record, dotted quad
};

/**
 * @brief Decoded DNS message
 */
struct Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> answers;
    std::vector<ResourceRecord> authorities;
    std::vector<ResourceRecord> additionals;

    bool is_response() const { return (flags & 0x8000) != 0; }
};

/**
 * @brief One advertised service instance
 */
struct ServiceInstance {
    std::string instance_name;                  ///< "<name>._a2a._tcp.local."
    std::string service_type;                   ///< "_a2a._tcp.local."
    std::string host_target;                    ///< "<host>.local."
    uint16_t port = 0;
    std::vector<std::string> addresses;         ///< IPv4 addresses of host_target
    std::map<std::string, std::string> txt;
    uint32_t ttl = 0;                           ///< 0 marks a goodbye

    /**
     * @brief Instance label without the service type suffix
     */
    std::string display_name() const;
};

/**
 * @brief Canonical form of a domain name for comparisons
 *
 * Lowercase, with a single trailing dot.
 */
std::string canonical_name(const std::string& name);

/**
 * @brief Encode a PTR query for a service type
 * @param service_type e.g. "_a2a._tcp.local."
 * @param unicast_response Set the QU bit
 * @param id Message id (0 for multicast queries)
 * @return Wire bytes
 */
std::vector<uint8_t> encode_query(const std::string& service_type, bool unicast_response, uint16_t id = 0);

/**
 * @brief Encode an announcement (or goodbye when ttl == 0) for one instance
 * @param instance Instance to announce
 * @param ttl Record TTL in seconds
 * @param id Message id (echo the query id for unicast replies)
 * @return Wire bytes, or std::nullopt if a name or TXT entry cannot be encoded
 */
std::optional<std::vector<uint8_t>> encode_announcement(
    const ServiceInstance& instance,
    uint32_t ttl,
    uint16_t id = 0
);

/**
 * @brief Decode a DNS message
 * @return Message, or std::nullopt if truncated or malformed
 */
std::optional<Message> decode_message(const uint8_t* data, size_t size);

/**
 * @brief Check whether a query asks for a service type (PTR or ANY)
 */
bool asks_for_service(const Message& message, const std::string& service_type);

/**
 * @brief Group the records of a response into service instances
 *
 * Instances without an SRV record are skipped.
 */
std::vector<ServiceInstance> extract_instances(const Message& message, const std::string& service_type);

/**
 * @brief Encode TXT key/value pairs as character strings
 */
std::optional<std::vector<uint8_t>> encode_txt(const std::map<std::string, std::string>& entries);

} // namespace mdns
} // namespace lad
