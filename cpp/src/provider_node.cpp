/**
 * @file provider_node.cpp
 * @brief Implementation of the provider node
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/provider_node.hpp"
#include "lad/agent_card.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace lad {

using namespace lad::utilities;

// ============================================================================
// Constructor / Destructor
// ============================================================================

ProviderNode::ProviderNode(
    ServerConfig config,
    AdvertiserOptions advertiser_options,
    size_t worker_threads
)
    : config_(std::move(config))
    , advertiser_options_(std::move(advertiser_options))
    , worker_count_(worker_threads)
    , running_(false)
{
    log_info("ProviderNode: Initializing agent '" + config_.name + "'");

    if (!CryptoUtils::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    load_signing_key();

    endpoint_ = std::make_unique<EndpointService>(config_.to_endpoint_options(), signer_);
    if (!endpoint_->add_agent(config_.to_agent_profile())) {
        throw std::invalid_argument("Invalid agent configuration: " + config_.name);
    }

    if (config_.enable_mdns) {
        advertiser_ = std::make_unique<Advertiser>(io_context_, advertiser_options_);
    }
}

ProviderNode::~ProviderNode() {
    if (running_) {
        log_warn("ProviderNode: Destructor called while still running, forcing stop");
        stop();
    }
}

void ProviderNode::load_signing_key() {
    if (!config_.signing_enabled && !config_.require_signing) {
        return;
    }

    std::filesystem::path key_path = config_.signing_key.empty()
        ? protocol::get_key_directory() / DEFAULT_PRIVATE_KEY_FILE
        : std::filesystem::path(config_.signing_key);

    auto material = SigningKeyMaterial::load(key_path, config_.signing_key_id);
    if (!material) {
        if (config_.require_signing) {
            throw std::runtime_error("Signing required but key could not be loaded: " + key_path.string());
        }
        log_warn("ProviderNode: Could not load signing key " + key_path.string() + ", serving unsigned cards");
        return;
    }

    signing_key_ = std::make_shared<const SigningKeyMaterial>(std::move(*material));
    signer_ = std::make_shared<const CardSigner>(signing_key_);
    log_info("ProviderNode: Signing cards with key " + signing_key_->key_id());
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool ProviderNode::start() {
    if (running_) {
        log_warn("ProviderNode: Already running");
        return false;
    }

    log_info("ProviderNode: Starting provider node...");

    if (!endpoint_->start()) {
        log_error("ProviderNode: Failed to start endpoint service");
        return false;
    }

    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    size_t num_threads = worker_count_;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0) num_threads = 2;

    log_info("ProviderNode: Starting " + std::to_string(num_threads) + " worker threads");
    for (size_t i = 0; i < num_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("ProviderNode: Worker thread exception: " + std::string(e.what()));
            }
        });
    }

    running_ = true;
    start_time_ = std::chrono::steady_clock::now();

    if (advertiser_ && !advertise()) {
        log_warn("ProviderNode: mDNS advertisement failed, discovery resource still served at " + base_url());
    }

    log_info("ProviderNode: Started successfully at " + base_url());
    return true;
}

bool ProviderNode::advertise() {
    if (!advertiser_->start()) {
        return false;
    }

    AgentProfile hosted = profile();
    auto handle = advertiser_->advertise(
        descriptor(),
        endpoint_->bound_port(),
        config_.network(),
        hosted.identity_reference
    );
    if (!handle) {
        return false;
    }

    std::lock_guard<std::mutex> lock(advertisement_mutex_);
    advertisement_ = std::move(handle);
    return true;
}

void ProviderNode::stop() {
    if (!running_) {
        log_warn("ProviderNode: Not running");
        return;
    }

    log_info("ProviderNode: Stopping provider node...");
    running_ = false;

    if (advertiser_) {
        std::optional<AdvertisementHandle> handle;
        {
            std::lock_guard<std::mutex> lock(advertisement_mutex_);
            handle.swap(advertisement_);
        }
        if (handle && !advertiser_->withdraw(*handle)) {
            log_warn("ProviderNode: Advertisement " + handle->instance_name + " was not registered");
        }
        advertiser_->stop();
    }

    endpoint_->stop();

    work_guard_.reset();
    io_context_.stop();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
    io_context_.restart();

    log_info("ProviderNode: Stopped successfully");
}

bool ProviderNode::is_running() const {
    return running_.load();
}

// ============================================================================
// Accessors
// ============================================================================

AgentProfile ProviderNode::profile() const {
    auto agents = endpoint_->agents();
    return agents.empty() ? config_.to_agent_profile() : agents.front();
}

AgentDescriptor ProviderNode::descriptor() const {
    return build_descriptor(profile(), endpoint_->base_url());
}

std::string ProviderNode::base_url() const {
    return endpoint_->base_url();
}

uint16_t ProviderNode::bound_port() const {
    return endpoint_->bound_port();
}

bool ProviderNode::is_advertised() const {
    std::lock_guard<std::mutex> lock(advertisement_mutex_);
    return advertisement_.has_value();
}

std::optional<std::string> ProviderNode::signing_public_key_pem() const {
    if (!signing_key_) {
        return std::nullopt;
    }
    return signing_key_->public_key_pem();
}

// ============================================================================
// Statistics
// ============================================================================

ProviderNodeStats ProviderNode::get_stats() const {
    ProviderNodeStats stats;
    stats.hosted_agents = endpoint_->agents().size();
    stats.advertisements = advertiser_ ? advertiser_->advertisement_count() : 0;
    stats.requests_served = endpoint_->get_requests_served();
    stats.queries_answered = advertiser_ ? advertiser_->get_queries_answered() : 0;
    stats.uptime_seconds = get_uptime();
    return stats;
}

uint64_t ProviderNode::get_uptime() const {
    if (!running_) {
        return 0;
    }

    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
    return static_cast<uint64_t>(duration.count());
}

void ProviderNode::print_status() const {
    auto stats = get_stats();

    std::cout << "\n================ LAD-A2A Provider Status ================\n";
    std::cout << "  Agent:             " << config_.name << "\n";
    std::cout << "  Base URL:          " << base_url() << "\n";
    std::cout << "  Status:            " << (running_ ? "RUNNING" : "STOPPED") << "\n";
    std::cout << "  Uptime:            " << format_duration(stats.uptime_seconds) << "\n";
    std::cout << "  Signing:           " << (signer_ ? signing_key_->key_id() : std::string("disabled")) << "\n";
    std::cout << "  mDNS:              " << (is_advertised() ? "advertised" : "off") << "\n";
    std::cout << "---------------------------------------------------------\n";
    std::cout << "  Requests served:   " << stats.requests_served << "\n";
    std::cout << "  Queries answered:  " << stats.queries_answered << "\n";
    std::cout << "=========================================================\n\n";
}

} // namespace lad
