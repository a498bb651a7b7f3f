/**
 * @file http_client.hpp
 * @brief Asynchronous HTTP GET client with optional TLS
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Used for discovery documents and agent cards:
 * - cpp-httplib requests on a small worker pool
 * - Completions delivered on the caller's io_context
 * - Connect and read timeouts per request
 * - TLS with peer and hostname verification, optional CA bundle
 * - Bounded body size
 */

#pragma once

#include "lad/protocol_constants.hpp"

#include <asio.hpp>

#include <string>
#include <map>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Forward declaration
namespace httplib { class Client; }

namespace lad {

/**
 * @brief Components of an http(s) URL
 */
struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;       ///< Empty when not given
    std::string path;       ///< "/" when not given
    std::string query;      ///< Including the leading '?'

    bool is_https() const { return scheme == "https"; }
    std::string port_or_default() const;

    /**
     * @brief scheme://host[:port]
     */
    std::string origin() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

/**
 * @brief Result of one request
 */
struct HttpResponse {
    int status_code = 0;                        ///< 0 when no response was read
    std::map<std::string, std::string> headers; ///< Lowercased names
    std::string body;
    std::string error;                          ///< Transport or protocol failure
    std::string host;                           ///< Host the request was sent to
    bool transport_verified = false;            ///< TLS chain and hostname verified

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    /**
     * @brief Header value by case-insensitive name ("" if absent)
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief Client-wide settings
 */
struct HttpClientOptions {
    std::chrono::milliseconds timeout = protocol::DEFAULT_HTTP_TIMEOUT;
    bool verify_tls = true;
    std::string ca_bundle;                      ///< PEM file, system paths when empty
    size_t max_body_size = protocol::MAX_JSON_SIZE;
};

using HttpCallback = std::function<void(HttpResponse response)>;

/**
 * @brief HttpClient - GET requests completing on a caller-owned io_context
 */
class HttpClient {
public:
    /**
     * @brief Construct HttpClient
     * @param io_context I/O context the callbacks run on
     * @param options Timeout and TLS settings
     * @throws std::runtime_error if the CA bundle does not exist
     */
    explicit HttpClient(asio::io_context& io_context, HttpClientOptions options = {});

    /**
     * @brief Destructor - cancels in-flight requests and joins the workers
     */
    ~HttpClient();

    // Disable copy and move
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    /**
     * @brief Start a GET request
     *
     * The callback is posted exactly once to the io_context, also on
     * timeout, cancellation or invalid URL.
     *
     * @param url Absolute http(s) URL
     * @param headers Extra request headers
     * @param callback Completion handler
     */
    void async_get(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        HttpCallback callback
    );

    /**
     * @brief Abort in-flight and queued requests
     *
     * Their callbacks report "Request cancelled". Later requests run normally.
     */
    void cancel();

    const HttpClientOptions& options() const { return options_; }

private:
    HttpResponse fetch(const ParsedUrl& url, const std::map<std::string, std::string>& headers, uint64_t generation);
    std::shared_ptr<httplib::Client> make_client(const ParsedUrl& url) const;

    asio::io_context& io_context_;
    HttpClientOptions options_;
    asio::thread_pool workers_;

    std::vector<std::shared_ptr<httplib::Client>> active_;
    uint64_t cancel_generation_;
    std::mutex active_mutex_;
};

} // namespace lad
