/**
 * @file broadcast_browser.hpp
 * @brief One-shot mDNS browse for A2A agents
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Sends a PTR query for `_a2a._tcp.local.` from an ephemeral port and
 * collects the unicast answers. Results are appended under a mutex and
 * read as a snapshot once the caller stops waiting.
 */

#pragma once

#include "lad/descriptor.hpp"
#include "lad/mdns_codec.hpp"
#include "lad/protocol_constants.hpp"

#include <asio.hpp>

#include <string>
#include <vector>
#include <array>
#include <mutex>
#include <atomic>
#include <functional>

namespace lad {

/**
 * @brief Where to send the browse query
 */
struct BrowseOptions {
    std::string query_address = protocol::MDNS_MULTICAST_ADDRESS;
    uint16_t query_port = protocol::MDNS_PORT;
    std::string service_type = protocol::SERVICE_TYPE;
};

/**
 * @brief One resolved service answer
 */
struct BrowsedService {
    mdns::ServiceInstance instance;
    std::string host;           ///< Address to connect to
    std::string sender;         ///< Address the answer came from

    std::string path() const;
    std::optional<std::string> organization() const;
    std::optional<std::string> identity_reference() const;

    /**
     * @brief Descriptor for the orchestrator
     *
     * Card URL is scheme://host:port/path; description names the
     * advertised organization.
     *
     * @param use_https Use https instead of http
     */
    AgentDescriptor to_descriptor(bool use_https) const;
};

using BrowseResultCallback = std::function<void(const BrowsedService& service)>;

/**
 * @brief BroadcastBrowser - Collects answers to one browse query
 */
class BroadcastBrowser {
public:
    explicit BroadcastBrowser(asio::io_context& io_context, BrowseOptions options = {});
    ~BroadcastBrowser();

    // Disable copy and move
    BroadcastBrowser(const BroadcastBrowser&) = delete;
    BroadcastBrowser& operator=(const BroadcastBrowser&) = delete;
    BroadcastBrowser(BroadcastBrowser&&) = delete;
    BroadcastBrowser& operator=(BroadcastBrowser&&) = delete;

    /**
     * @brief Open an ephemeral socket, send the query and start listening
     * @return true if the query was sent
     */
    bool start();

    /**
     * @brief Stop listening; collected results stay available
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Called from the I/O thread for each new service
     */
    void set_result_callback(BrowseResultCallback callback);

    /**
     * @brief Copy of the services collected so far, in arrival order
     */
    std::vector<BrowsedService> snapshot() const;

    size_t result_count() const;

private:
    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    void record(BrowsedService service);
    void forget(const std::string& instance_name);

    BrowseOptions options_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint query_endpoint_;

    std::array<uint8_t, protocol::MAX_MDNS_PACKET_SIZE> recv_buffer_;
    asio::ip::udp::endpoint sender_endpoint_;

    std::vector<BrowsedService> results_;
    mutable std::mutex results_mutex_;

    BrowseResultCallback result_callback_;
    std::mutex callback_mutex_;

    std::atomic<bool> running_;
};

} // namespace lad
