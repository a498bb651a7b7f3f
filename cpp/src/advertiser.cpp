/**
 * @file advertiser.cpp
 * @brief Implementation of mDNS/DNS-SD agent advertisement
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/advertiser.hpp"
#include "lad/utilities.hpp"

#include <algorithm>
#include <stdexcept>

namespace lad {

namespace {

    /// Path component of an absolute URL ("/" if none)
    std::string url_path(const std::string& url) {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos) {
            return protocol::AGENT_CARD_PATH;
        }
        auto path_start = url.find('/', scheme_end + 3);
        if (path_start == std::string::npos) {
            return "/";
        }
        return url.substr(path_start);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

Advertiser::Advertiser(asio::io_context& io_context, AdvertiserOptions options)
    : options_(std::move(options))
    , socket_(io_context)
    , next_handle_id_(1)
    , running_(false)
    , queries_answered_(0)
{
    asio::error_code ec;
    auto group = asio::ip::make_address(options_.multicast_address, ec);
    if (ec) {
        throw std::invalid_argument("Advertiser: invalid multicast address: " + options_.multicast_address);
    }
    multicast_endpoint_ = asio::ip::udp::endpoint(group, options_.port);

    if (options_.addresses.empty()) {
        options_.addresses = utilities::get_local_ipv4_addresses();
        if (options_.addresses.empty()) {
            options_.addresses.push_back("127.0.0.1");
        }
    }
}

Advertiser::~Advertiser() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Advertiser::start() {
    if (running_.load()) {
        return true;
    }

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::reuse_address(true));

        if (options_.join_multicast) {
            socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), options_.port));
            socket_.set_option(asio::ip::multicast::join_group(multicast_endpoint_.address()));
            socket_.set_option(asio::ip::multicast::enable_loopback(true));
            socket_.set_option(asio::ip::multicast::hops(255));
        } else {
            socket_.bind(asio::ip::udp::endpoint(asio::ip::make_address(options_.bind_address), options_.port));
        }

        running_.store(true);
        start_receive();

        utilities::log_info("Advertiser: Listening on port " + std::to_string(bound_port())
            + (options_.join_multicast ? " (multicast " + options_.multicast_address + ")" : " (unicast only)"));
        return true;

    } catch (const std::exception& e) {
        utilities::log_error("Advertiser: Failed to start: " + std::string(e.what()));
        asio::error_code ignored;
        socket_.close(ignored);
        running_.store(false);
        return false;
    }
}

void Advertiser::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        utilities::log_error("Advertiser: Error closing socket: " + ec.message());
        return;
    }
    utilities::log_info("Advertiser: Stopped");
}

bool Advertiser::is_running() const {
    return running_.load();
}

uint16_t Advertiser::bound_port() const {
    asio::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

// ============================================================================
// Advertisement
// ============================================================================

std::optional<AdvertisementHandle> Advertiser::advertise(
    const AgentDescriptor& descriptor,
    uint16_t port,
    const NetworkContext& network,
    const std::optional<std::string>& identity_reference
) {
    if (!protocol::validate_agent_name(descriptor.name)) {
        utilities::log_error("Advertiser: Agent name cannot be used as an instance label: " + descriptor.name);
        return std::nullopt;
    }

    if (!start()) {
        return std::nullopt;
    }

    mdns::ServiceInstance instance;
    instance.service_type = protocol::SERVICE_TYPE;
    instance.instance_name = descriptor.name + "." + protocol::SERVICE_TYPE;
    instance.host_target = host_target();
    instance.port = port;
    instance.addresses = options_.addresses;
    instance.ttl = options_.ttl;
    instance.txt["path"] = url_path(descriptor.agent_card_url);
    instance.txt["v"] = protocol::TXT_RECORD_VERSION;
    if (network.realm) {
        instance.txt["org"] = *network.realm;
    }
    if (identity_reference) {
        instance.txt["id"] = *identity_reference;
    }

    if (!mdns::encode_announcement(instance, instance.ttl)) {
        utilities::log_error("Advertiser: Records for " + descriptor.name + " cannot be encoded");
        return std::nullopt;
    }

    AdvertisementHandle handle;
    {
        std::lock_guard<std::mutex> lock(registrations_mutex_);
        std::string key = mdns::canonical_name(instance.instance_name);
        for (const auto& [id, existing] : registrations_) {
            if (mdns::canonical_name(existing.instance_name) == key) {
                utilities::log_error("Advertiser: Instance already advertised: " + instance.instance_name);
                return std::nullopt;
            }
        }
        handle.id = next_handle_id_++;
        handle.instance_name = instance.instance_name;
        registrations_[handle.id] = instance;
    }

    if (options_.join_multicast && !send_instance(instance, instance.ttl, multicast_endpoint_)) {
        std::lock_guard<std::mutex> lock(registrations_mutex_);
        registrations_.erase(handle.id);
        return std::nullopt;
    }

    utilities::log_info("Advertiser: Advertising " + instance.instance_name + " on port " + std::to_string(port));
    return handle;
}

bool Advertiser::withdraw(const AdvertisementHandle& handle) {
    mdns::ServiceInstance instance;
    {
        std::lock_guard<std::mutex> lock(registrations_mutex_);
        auto it = registrations_.find(handle.id);
        if (it == registrations_.end()) {
            utilities::log_warn("Advertiser: Unknown advertisement handle " + std::to_string(handle.id));
            return false;
        }
        instance = it->second;
        registrations_.erase(it);
    }

    if (options_.join_multicast && running_.load() && !send_instance(instance, 0, multicast_endpoint_)) {
        utilities::log_warn("Advertiser: Goodbye not sent for " + instance.instance_name);
    }

    utilities::log_info("Advertiser: Withdrew " + instance.instance_name);
    return true;
}

size_t Advertiser::advertisement_count() const {
    std::lock_guard<std::mutex> lock(registrations_mutex_);
    return registrations_.size();
}

uint64_t Advertiser::get_queries_answered() const {
    return queries_answered_.load();
}

// ============================================================================
// Private Methods - Network Operations
// ============================================================================

void Advertiser::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        }
    );
}

void Advertiser::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error) {
        if (error != asio::error::operation_aborted) {
            utilities::log_error("Advertiser: Receive error: " + error.message());
        }
        return;
    }

    auto message = mdns::decode_message(recv_buffer_.data(), bytes_transferred);
    if (!message) {
        utilities::log_debug("Advertiser: Dropping malformed packet from "
            + sender_endpoint_.address().to_string());
    } else if (mdns::asks_for_service(*message, protocol::SERVICE_TYPE)) {
        answer_query(*message, sender_endpoint_);
    }

    if (running_.load()) {
        start_receive();
    }
}

void Advertiser::answer_query(const mdns::Message& query, const asio::ip::udp::endpoint& sender) {
    std::vector<mdns::ServiceInstance> instances;
    {
        std::lock_guard<std::mutex> lock(registrations_mutex_);
        for (const auto& [id, instance] : registrations_) {
            instances.push_back(instance);
        }
    }
    if (instances.empty()) {
        return;
    }

    bool wants_unicast = std::any_of(query.questions.begin(), query.questions.end(),
        [](const mdns::Question& q) { return q.unicast_response; });

    // One-shot queriers (RFC 6762 section 5.1) only hear unicast replies
    bool legacy_querier = sender.port() != protocol::MDNS_PORT;
    bool unicast = legacy_querier || wants_unicast || !options_.join_multicast;
    const auto& destination = unicast ? sender : multicast_endpoint_;
    uint16_t id = legacy_querier ? query.id : 0;

    for (const auto& instance : instances) {
        if (send_instance(instance, instance.ttl, destination, id)) {
            queries_answered_++;
        }
    }

    utilities::log_debug("Advertiser: Answered query from " + sender.address().to_string()
        + ":" + std::to_string(sender.port()) + " with " + std::to_string(instances.size()) + " instance(s)");
}

bool Advertiser::send_instance(
    const mdns::ServiceInstance& instance,
    uint32_t ttl,
    const asio::ip::udp::endpoint& destination,
    uint16_t id
) {
    auto packet = mdns::encode_announcement(instance, ttl, id);
    if (!packet) {
        utilities::log_error("Advertiser: Failed to encode records for " + instance.instance_name);
        return false;
    }
    if (packet->size() > protocol::MAX_MDNS_PACKET_SIZE) {
        utilities::log_error("Advertiser: Records too large to send for " + instance.instance_name);
        return false;
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    asio::error_code ec;
    socket_.send_to(asio::buffer(*packet), destination, 0, ec);
    if (ec) {
        utilities::log_error("Advertiser: Failed to send to " + destination.address().to_string()
            + ": " + ec.message());
        return false;
    }
    return true;
}

std::string Advertiser::host_target() const {
    std::string host = options_.host_name.empty() ? utilities::get_hostname() : options_.host_name;
    auto dot = host.find('.');
    if (dot != std::string::npos) {
        host = host.substr(0, dot);
    }
    if (host.empty()) {
        host = "lad-host";
    }
    return host + ".local.";
}

} // namespace lad
