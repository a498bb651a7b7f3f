/**
 * @file endpoint_service.cpp
 * @brief Implementation of the HTTP discovery endpoint
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/endpoint_service.hpp"
#include "lad/utilities.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace lad {

namespace {

    std::string slugify(const std::string& name) {
        std::string slug;
        for (char c : utilities::to_lowercase(name)) {
            if (std::isalnum(static_cast<unsigned char>(c))) {
                slug.push_back(c);
            } else if (!slug.empty() && slug.back() != '-') {
                slug.push_back('-');
            }
        }
        while (!slug.empty() && slug.back() == '-') {
            slug.pop_back();
        }
        return slug.empty() ? "agent" : slug;
    }

    ServiceRequest to_service_request(const httplib::Request& req) {
        ServiceRequest request;
        request.method = req.method;
        request.target = req.path;
        for (const auto& [name, value] : req.headers) {
            request.headers[utilities::to_lowercase(name)] = value;
        }
        return request;
    }

    void write_response(const ServiceResponse& response, httplib::Response& res) {
        res.status = response.status;
        for (const auto& [name, value] : response.headers) {
            res.set_header(name, value);
        }
        if (!response.body.empty()) {
            res.set_content(response.body, response.content_type);
        }
    }
}

// ============================================================================
// ServiceRequest / ServiceResponse
// ============================================================================

std::string ServiceRequest::path() const {
    auto end = target.find_first_of("?#");
    return end == std::string::npos ? target : target.substr(0, end);
}

std::string ServiceRequest::header(const std::string& name) const {
    auto it = headers.find(utilities::to_lowercase(name));
    return it == headers.end() ? "" : it->second;
}

ServiceResponse ServiceResponse::json_error(int status, const std::string& message) {
    ServiceResponse response;
    response.status = status;
    response.body = json{{"error", message}}.dump();
    return response;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

EndpointService::EndpointService(
    EndpointServiceOptions options,
    std::shared_ptr<const CardSigner> signer
)
    : options_(std::move(options))
    , signer_(std::move(signer))
    , bound_port_(options_.port)
    , running_(false)
    , requests_served_(0)
{
    if (options_.tls_enabled && (options_.tls_certfile.empty() || options_.tls_keyfile.empty())) {
        throw std::invalid_argument("EndpointService: TLS requires a certificate and key file");
    }
    if (options_.public_host.empty()) {
        auto addresses = utilities::get_local_ipv4_addresses();
        options_.public_host = addresses.empty() ? "127.0.0.1" : addresses.front();
    }
}

EndpointService::~EndpointService() {
    stop();
}

// ============================================================================
// Hosted Agents
// ============================================================================

bool EndpointService::add_agent(AgentProfile profile) {
    if (!protocol::validate_agent_name(profile.name)) {
        utilities::log_error("EndpointService: Invalid agent name: " + profile.name);
        return false;
    }

    std::lock_guard<std::mutex> lock(agents_mutex_);

    auto path_taken = [this](const std::string& path) {
        return std::any_of(agents_.begin(), agents_.end(),
            [&path](const AgentProfile& a) { return a.card_path == path; });
    };

    if (profile.card_path.empty()) {
        profile.card_path = path_taken(protocol::AGENT_CARD_PATH)
            ? "/agents/" + slugify(profile.name) + "/agent.json"
            : std::string(protocol::AGENT_CARD_PATH);
    }

    if (!protocol::validate_resource_path(profile.card_path) ||
        profile.card_path == protocol::DISCOVERY_PATH || profile.card_path == protocol::HEALTH_PATH) {
        utilities::log_error("EndpointService: Invalid card path for " + profile.name + ": " + profile.card_path);
        return false;
    }
    if (path_taken(profile.card_path)) {
        utilities::log_error("EndpointService: Card path already hosted: " + profile.card_path);
        return false;
    }

    utilities::log_info("EndpointService: Hosting " + profile.name + " at " + profile.card_path);
    agents_.push_back(std::move(profile));
    return true;
}

std::vector<AgentProfile> EndpointService::agents() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    return agents_;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool EndpointService::start() {
    if (running_.load()) {
        return true;
    }

    std::unique_ptr<httplib::Server> server;
    if (options_.tls_enabled) {
        server = std::make_unique<httplib::SSLServer>(options_.tls_certfile.c_str(), options_.tls_keyfile.c_str());
    } else {
        server = std::make_unique<httplib::Server>();
    }
    if (!server->is_valid()) {
        utilities::log_error("EndpointService: Failed to load TLS certificate " + options_.tls_certfile
            + " or key " + options_.tls_keyfile);
        return false;
    }

    auto session_timeout = std::chrono::duration_cast<std::chrono::seconds>(protocol::HTTP_SESSION_TIMEOUT);
    server->set_read_timeout(session_timeout.count(), 0);
    server->set_write_timeout(session_timeout.count(), 0);
    server->set_payload_max_length(protocol::MAX_HTTP_REQUEST_BODY);

    // Every request goes through handle(), including unknown paths and methods
    server->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        try {
            write_response(handle(to_service_request(req)), res);
        } catch (const std::exception& e) {
            utilities::log_error("EndpointService: Handler error: " + std::string(e.what()));
            write_response(ServiceResponse::json_error(500, "internal error"), res);
        }
        return httplib::Server::HandlerResponse::Handled;
    });

    server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utilities::log_debug("EndpointService: " + req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    if (options_.port == 0) {
        int port = server->bind_to_any_port(options_.bind_address);
        if (port < 0) {
            utilities::log_error("EndpointService: Failed to bind " + options_.bind_address);
            return false;
        }
        bound_port_.store(static_cast<uint16_t>(port));
    } else {
        if (!server->bind_to_port(options_.bind_address, options_.port)) {
            utilities::log_error("EndpointService: Failed to bind " + options_.bind_address + ":"
                + std::to_string(options_.port));
            return false;
        }
        bound_port_.store(options_.port);
    }

    server_ = std::move(server);
    running_.store(true);

    listener_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            utilities::log_error("EndpointService: Listener stopped with an error");
        }
    });

    // stop() is a no-op on a server that has not entered its accept loop yet
    auto ready_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!server_->is_running()) {
        if (std::chrono::steady_clock::now() > ready_deadline) {
            utilities::log_error("EndpointService: Listener did not start");
            running_.store(false);
            server_->stop();
            listener_thread_.join();
            server_.reset();
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    utilities::log_info("EndpointService: Listening on " + options_.bind_address + ":"
        + std::to_string(bound_port()) + (options_.tls_enabled ? " (TLS)" : ""));
    return true;
}

void EndpointService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    server_->stop();
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
    server_.reset();
    utilities::log_info("EndpointService: Stopped");
}

bool EndpointService::is_running() const {
    return running_.load();
}

uint16_t EndpointService::bound_port() const {
    return bound_port_.load();
}

std::string EndpointService::base_url() const {
    return std::string(options_.tls_enabled ? "https" : "http") + "://" + options_.public_host
        + ":" + std::to_string(bound_port());
}

uint64_t EndpointService::get_requests_served() const {
    return requests_served_.load();
}

// ============================================================================
// Routes
// ============================================================================

ServiceResponse EndpointService::handle(const ServiceRequest& request) const {
    requests_served_++;
    std::string path = request.path();

    if (!is_known_path(path)) {
        auto response = ServiceResponse::json_error(404, "not found: " + path);
        apply_cors(response);
        return response;
    }

    if (request.method == "OPTIONS") {
        ServiceResponse response;
        response.status = 204;
        apply_cors(response);
        return response;
    }

    if (request.method != "GET") {
        auto response = ServiceResponse::json_error(405, "method not allowed: " + request.method);
        response.headers["Allow"] = "GET, OPTIONS";
        apply_cors(response);
        return response;
    }

    if (path == protocol::DISCOVERY_PATH) {
        return serve_discovery();
    }
    if (path == protocol::HEALTH_PATH) {
        return serve_health();
    }

    auto card = card_for_path(path);
    if (!card) {
        return ServiceResponse::json_error(404, "not found: " + path);
    }
    return serve_card(request, *card);
}

DiscoveryDocument EndpointService::discovery_document() const {
    DiscoveryDocument document;
    document.version = protocol::PROTOCOL_VERSION;
    document.network = options_.network;

    std::string base = base_url();
    std::lock_guard<std::mutex> lock(agents_mutex_);
    for (const auto& profile : agents_) {
        document.agents.push_back(build_descriptor(profile, base));
    }
    return document;
}

std::optional<json> EndpointService::card_for_path(const std::string& path) const {
    std::string base = base_url();
    std::lock_guard<std::mutex> lock(agents_mutex_);
    for (const auto& profile : agents_) {
        if (profile.card_path == path) {
            return build_agent_card(profile, base, options_.network);
        }
    }
    return std::nullopt;
}

bool EndpointService::is_known_path(const std::string& path) const {
    if (path == protocol::DISCOVERY_PATH || path == protocol::HEALTH_PATH) {
        return true;
    }
    std::lock_guard<std::mutex> lock(agents_mutex_);
    return std::any_of(agents_.begin(), agents_.end(),
        [&path](const AgentProfile& a) { return a.card_path == path; });
}

void EndpointService::apply_cors(ServiceResponse& response) const {
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type, Accept";
}

ServiceResponse EndpointService::serve_discovery() const {
    ServiceResponse response;
    response.body = discovery_document().to_json();
    response.headers["Cache-Control"] = protocol::DISCOVERY_CACHE_CONTROL;
    apply_cors(response);
    return response;
}

ServiceResponse EndpointService::serve_card(const ServiceRequest& request, const json& card) const {
    std::string accept = utilities::to_lowercase(request.header("Accept"));
    bool wants_envelope = accept.find(protocol::SIGNED_CARD_MEDIA_TYPE) != std::string::npos
        || accept.find("text/plain") != std::string::npos;

    ServiceResponse response;
    apply_cors(response);

    if (wants_envelope && signer_) {
        auto envelope = signer_->sign(card);
        if (envelope) {
            response.content_type = protocol::SIGNED_CARD_MEDIA_TYPE;
            response.body = envelope->token;
            return response;
        }
        utilities::log_error("EndpointService: Signing failed, serving unsigned card");
    }

    response.body = card.dump(2);
    return response;
}

ServiceResponse EndpointService::serve_health() const {
    json health;
    health["status"] = "ok";

    json names = json::array();
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        for (const auto& profile : agents_) {
            names.push_back(profile.name);
        }
    }
    health["agent"] = names.empty() ? json(nullptr) : names.front();
    health["agents"] = names;
    health["mdns_enabled"] = options_.mdns_enabled;
    health["tls_enabled"] = options_.tls_enabled;
    health["signing_enabled"] = signing_enabled();

    ServiceResponse response;
    response.body = health.dump();
    apply_cors(response);
    return response;
}

} // namespace lad
