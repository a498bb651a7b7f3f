/**
 * @file broadcast_browser.cpp
 * @brief Implementation of the one-shot mDNS browse
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/broadcast_browser.hpp"
#include "lad/utilities.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace lad {

// ============================================================================
// BrowsedService
// ============================================================================

std::string BrowsedService::path() const {
    auto it = instance.txt.find("path");
    if (it == instance.txt.end() || it->second.empty()) {
        return protocol::AGENT_CARD_PATH;
    }
    return utilities::starts_with(it->second, "/") ? it->second : "/" + it->second;
}

std::optional<std::string> BrowsedService::organization() const {
    auto it = instance.txt.find("org");
    if (it == instance.txt.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> BrowsedService::identity_reference() const {
    auto it = instance.txt.find("id");
    if (it == instance.txt.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

AgentDescriptor BrowsedService::to_descriptor(bool use_https) const {
    AgentDescriptor descriptor;
    descriptor.name = instance.display_name();
    descriptor.agent_card_url = std::string(use_https ? "https" : "http") + "://" + host
        + ":" + std::to_string(instance.port) + path();
    descriptor.description = "Discovered via mDNS from " + organization().value_or("unknown");
    descriptor.role = "generic";
    return descriptor;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

BroadcastBrowser::BroadcastBrowser(asio::io_context& io_context, BrowseOptions options)
    : options_(std::move(options))
    , socket_(io_context)
    , running_(false)
{
    asio::error_code ec;
    auto address = asio::ip::make_address(options_.query_address, ec);
    if (ec || options_.query_port == 0) {
        throw std::invalid_argument("BroadcastBrowser: invalid query endpoint: "
            + options_.query_address + ":" + std::to_string(options_.query_port));
    }
    query_endpoint_ = asio::ip::udp::endpoint(address, options_.query_port);
}

BroadcastBrowser::~BroadcastBrowser() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BroadcastBrowser::start() {
    if (running_.load()) {
        return true;
    }

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
        if (query_endpoint_.address().is_multicast()) {
            socket_.set_option(asio::ip::multicast::enable_loopback(true));
        }

        std::random_device rd;
        auto id = static_cast<uint16_t>(std::uniform_int_distribution<int>(1, 0xFFFF)(rd));
        auto query = mdns::encode_query(options_.service_type, true, id);

        running_.store(true);
        start_receive();

        socket_.send_to(asio::buffer(query), query_endpoint_);
        utilities::log_debug("Browser: Sent query for " + options_.service_type + " to "
            + query_endpoint_.address().to_string() + ":" + std::to_string(query_endpoint_.port()));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Browser: Failed to send query: " + std::string(e.what()));
        running_.store(false);
        asio::error_code ignored;
        socket_.close(ignored);
        return false;
    }
}

void BroadcastBrowser::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        utilities::log_error("Browser: Error closing socket: " + ec.message());
    }
}

bool BroadcastBrowser::is_running() const {
    return running_.load();
}

void BroadcastBrowser::set_result_callback(BrowseResultCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    result_callback_ = std::move(callback);
}

std::vector<BrowsedService> BroadcastBrowser::snapshot() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}

size_t BroadcastBrowser::result_count() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_.size();
}

// ============================================================================
// Private Methods
// ============================================================================

void BroadcastBrowser::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        }
    );
}

void BroadcastBrowser::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error) {
        if (error != asio::error::operation_aborted) {
            utilities::log_error("Browser: Receive error: " + error.message());
        }
        return;
    }

    auto message = mdns::decode_message(recv_buffer_.data(), bytes_transferred);
    if (message && message->is_response()) {
        std::string sender = sender_endpoint_.address().to_string();
        for (auto& instance : mdns::extract_instances(*message, options_.service_type)) {
            if (instance.ttl == 0) {
                forget(instance.instance_name);
                continue;
            }
            BrowsedService service;
            service.sender = sender;
            service.host = instance.addresses.empty() ? sender : instance.addresses.front();
            service.instance = std::move(instance);
            record(std::move(service));
        }
    }

    if (running_.load()) {
        start_receive();
    }
}

void BroadcastBrowser::forget(const std::string& instance_name) {
    std::string key = mdns::canonical_name(instance_name);
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = std::remove_if(results_.begin(), results_.end(), [&key](const BrowsedService& s) {
        return mdns::canonical_name(s.instance.instance_name) == key;
    });
    if (it != results_.end()) {
        results_.erase(it, results_.end());
        utilities::log_info("Browser: Withdrawn " + instance_name);
    }
}

void BroadcastBrowser::record(BrowsedService service) {
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        std::string key = mdns::canonical_name(service.instance.instance_name);
        bool duplicate = std::any_of(results_.begin(), results_.end(), [&key](const BrowsedService& s) {
            return mdns::canonical_name(s.instance.instance_name) == key;
        });
        if (duplicate) {
            return;
        }
        results_.push_back(service);
    }

    utilities::log_info("Browser: Found " + service.instance.display_name() + " at "
        + service.host + ":" + std::to_string(service.instance.port));

    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (result_callback_) {
        try {
            result_callback_(service);
        } catch (const std::exception& e) {
            utilities::log_error("Browser: Callback error: " + std::string(e.what()));
        }
    }
}

} // namespace lad
