/**
 * @file http_client.cpp
 * @brief Implementation of the asynchronous HTTP GET client
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/http_client.hpp"
#include "lad/utilities.hpp"

#include <httplib.h>

#include <algorithm>
#include <filesystem>
#include <regex>
#include <stdexcept>

namespace lad {

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    static const std::regex url_regex(R"(^(https?)://([^:/\s?#]+)(?::(\d+))?(/[^?\s#]*)?(\?[^\s#]*)?$)",
        std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return std::nullopt;
    }

    ParsedUrl result;
    result.scheme = utilities::to_lowercase(match[1].str());
    result.host = match[2].str();
    result.port = match[3].str();
    result.path = match[4].str().empty() ? "/" : match[4].str();
    result.query = match[5].str();
    return result;
}

std::string ParsedUrl::port_or_default() const {
    if (!port.empty()) {
        return port;
    }
    return is_https() ? "443" : "80";
}

std::string ParsedUrl::origin() const {
    return scheme + "://" + host + (port.empty() ? "" : ":" + port);
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(utilities::to_lowercase(name));
    return it == headers.end() ? "" : it->second;
}

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(asio::io_context& io_context, HttpClientOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , workers_(protocol::MAX_CONCURRENT_CARD_FETCHES)
    , cancel_generation_(0)
{
    if (options_.verify_tls && !options_.ca_bundle.empty() && !std::filesystem::exists(options_.ca_bundle)) {
        throw std::runtime_error("HttpClient: CA bundle not found: " + options_.ca_bundle);
    }
}

HttpClient::~HttpClient() {
    cancel();
    workers_.join();
}

void HttpClient::async_get(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    HttpCallback callback
) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
        HttpResponse response;
        response.error = "Invalid URL: " + url;
        asio::post(io_context_, [callback = std::move(callback), response = std::move(response)]() mutable {
            callback(std::move(response));
        });
        return;
    }

    utilities::log_debug("HttpClient: GET " + url);

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        generation = cancel_generation_;
    }

    asio::post(workers_, [this, url = std::move(*parsed), headers, generation, callback = std::move(callback)]() mutable {
        HttpResponse response = fetch(url, headers, generation);
        asio::post(io_context_, [callback = std::move(callback), response = std::move(response)]() mutable {
            try {
                callback(std::move(response));
            } catch (const std::exception& e) {
                utilities::log_error("HttpClient: Callback error: " + std::string(e.what()));
            }
        });
    });
}

void HttpClient::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    ++cancel_generation_;
    for (auto& client : active_) {
        client->stop();
    }
}

std::shared_ptr<httplib::Client> HttpClient::make_client(const ParsedUrl& url) const {
    auto client = std::make_shared<httplib::Client>(url.origin());

    auto millis = options_.timeout.count();
    time_t seconds = static_cast<time_t>(millis / 1000);
    time_t micros = static_cast<time_t>((millis % 1000) * 1000);
    client->set_connection_timeout(seconds, micros);
    client->set_read_timeout(seconds, micros);
    client->set_write_timeout(seconds, micros);
    client->set_follow_location(false);

    client->enable_server_certificate_verification(options_.verify_tls);
    if (options_.verify_tls && !options_.ca_bundle.empty()) {
        client->set_ca_cert_path(options_.ca_bundle.c_str());
    }
    return client;
}

HttpResponse HttpClient::fetch(
    const ParsedUrl& url,
    const std::map<std::string, std::string>& headers,
    uint64_t generation
) {
    HttpResponse response;
    response.host = url.host;

    auto client = make_client(url);
    if (!client->is_valid()) {
        response.error = "Unsupported URL: " + url.origin();
        return response;
    }

    httplib::Headers request_headers;
    request_headers.emplace("User-Agent", std::string("lad-a2a/") + protocol::PROTOCOL_VERSION);
    for (const auto& [name, value] : headers) {
        request_headers.emplace(name, value);
    }

    {
        // A request queued before cancel() never starts
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (generation != cancel_generation_) {
            response.error = "Request cancelled";
            return response;
        }
        active_.push_back(client);
    }

    std::string body;
    bool oversized = false;
    auto result = client->Get(url.path + url.query, request_headers,
        [this, &body, &oversized](const char* data, size_t length) {
            body.append(data, length);
            oversized = body.size() > options_.max_body_size;
            return !oversized;
        });

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        cancelled = generation != cancel_generation_;
        active_.erase(std::remove(active_.begin(), active_.end(), client), active_.end());
    }

    if (cancelled) {
        response.error = "Request cancelled";
        return response;
    }
    if (oversized) {
        response.error = "Response exceeds size limit";
        return response;
    }
    if (!result) {
        response.error = "Request failed: " + httplib::to_string(result.error());
        return response;
    }

    response.status_code = result->status;
    for (const auto& [name, value] : result->headers) {
        response.headers[utilities::to_lowercase(name)] = value;
    }
    response.body = std::move(body);
    response.transport_verified = url.is_https() && options_.verify_tls;
    return response;
}

} // namespace lad
