/**
 * @file advertiser.hpp
 * @brief mDNS/DNS-SD advertisement of hosted A2A agents
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Publishes one `_a2a._tcp.local.` instance per hosted agent:
 * - Unsolicited announcement on advertise, goodbye on withdraw
 * - Answers PTR queries for the service type
 * - Unicast replies to one-shot queriers (source port other than 5353)
 * - Thread-safe registration
 */

#pragma once

#include "lad/descriptor.hpp"
#include "lad/mdns_codec.hpp"
#include "lad/protocol_constants.hpp"

#include <asio.hpp>

#include <string>
#include <vector>
#include <map>
#include <array>
#include <mutex>
#include <atomic>
#include <optional>

namespace lad {

/**
 * @brief Socket and record settings for an Advertiser
 */
struct AdvertiserOptions {
    std::string multicast_address = protocol::MDNS_MULTICAST_ADDRESS;
    uint16_t port = protocol::MDNS_PORT;

    /// Join the multicast group and send announcements. When false the
    /// advertiser binds bind_address:port and only answers queries.
    bool join_multicast = true;
    std::string bind_address = "0.0.0.0";

    std::string host_name;                  ///< SRV target label (default: system hostname)
    std::vector<std::string> addresses;     ///< A records (default: local IPv4 addresses)
    uint32_t ttl = protocol::MDNS_RECORD_TTL;
};

/**
 * @brief Token returned by advertise(), required to withdraw
 */
struct AdvertisementHandle {
    uint64_t id = 0;
    std::string instance_name;
};

/**
 * @brief Advertiser - Announces agents on the local link
 */
class Advertiser {
public:
    /**
     * @brief Construct Advertiser
     * @param io_context ASIO I/O context driving the receive loop
     * @param options Socket and record settings
     */
    explicit Advertiser(asio::io_context& io_context, AdvertiserOptions options = {});

    /**
     * @brief Destructor - withdraws nothing, closes the socket
     */
    ~Advertiser();

    // Disable copy and move
    Advertiser(const Advertiser&) = delete;
    Advertiser& operator=(const Advertiser&) = delete;
    Advertiser(Advertiser&&) = delete;
    Advertiser& operator=(Advertiser&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open and bind the socket and start answering queries
     * @return true if listening, false on socket failure
     */
    bool start();

    /**
     * @brief Stop answering queries and close the socket
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Local UDP port (useful when bound to port 0)
     */
    uint16_t bound_port() const;

    // ========================================================================
    // Advertisement
    // ========================================================================

    /**
     * @brief Advertise an agent
     *
     * The TXT path is taken from the descriptor's card URL. Starts the
     * socket if needed.
     *
     * @param descriptor Agent descriptor (name becomes the instance label)
     * @param port HTTP port of the discovery endpoint
     * @param network Provider network (realm becomes TXT "org")
     * @param identity_reference Optional identity reference (TXT "id")
     * @return Handle, or std::nullopt on invalid name, duplicate instance or socket failure
     */
    std::optional<AdvertisementHandle> advertise(
        const AgentDescriptor& descriptor,
        uint16_t port,
        const NetworkContext& network,
        const std::optional<std::string>& identity_reference = std::nullopt
    );

    /**
     * @brief Withdraw an advertisement and send a goodbye
     * @return true if the handle was registered
     */
    bool withdraw(const AdvertisementHandle& handle);

    size_t advertisement_count() const;
    uint64_t get_queries_answered() const;

private:
    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    void answer_query(const mdns::Message& query, const asio::ip::udp::endpoint& sender);

    bool send_instance(const mdns::ServiceInstance& instance, uint32_t ttl,
                       const asio::ip::udp::endpoint& destination, uint16_t id = 0);

    /// Host target for SRV records ("<host>.local.")
    std::string host_target() const;

    AdvertiserOptions options_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint multicast_endpoint_;

    std::array<uint8_t, protocol::MAX_MDNS_PACKET_SIZE> recv_buffer_;
    asio::ip::udp::endpoint sender_endpoint_;

    /// Registered instances keyed by handle id
    std::map<uint64_t, mdns::ServiceInstance> registrations_;
    mutable std::mutex registrations_mutex_;
    uint64_t next_handle_id_;

    /// Serializes synchronous sends against each other
    std::mutex send_mutex_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> queries_answered_;
};

} // namespace lad
