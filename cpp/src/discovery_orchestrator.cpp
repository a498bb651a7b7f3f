/**
 * @file discovery_orchestrator.cpp
 * @brief Implementation of the discovery orchestrator
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/discovery_orchestrator.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/signing_keys.hpp"
#include "lad/utilities.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace lad {

using namespace lad::utilities;

namespace {

    std::chrono::milliseconds seconds_to_ms(double seconds) {
        if (seconds <= 0.0) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
    }

    std::string format_ms(std::chrono::milliseconds duration) {
        return std::to_string(duration.count()) + "ms";
    }

    std::string discovery_url_for(const std::string& base_url) {
        std::string url = trim_string(base_url);
        if (ends_with(url, protocol::DISCOVERY_PATH)) {
            return url;
        }
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url + protocol::DISCOVERY_PATH;
    }

    std::string describe_failure(const HttpResponse& response) {
        if (!response.error.empty()) {
            return response.error;
        }
        return "HTTP " + std::to_string(response.status_code);
    }

    void drop_unverified(std::vector<DiscoveredAgent>& agents) {
        size_t before = agents.size();
        agents.erase(std::remove_if(agents.begin(), agents.end(),
            [](const DiscoveredAgent& agent) { return !agent.verified; }), agents.end());
        if (agents.size() != before) {
            log_info("Orchestrator: Dropped " + std::to_string(before - agents.size()) + " unverified agent(s)");
        }
    }

    // ========================================================================
    // DiscoveryRun - state of one discover() call
    // ========================================================================

    class DiscoveryRun {
    public:
        DiscoveryRun(const OrchestratorOptions& options, const IdentityVerifier& verifier)
            : options_(options)
            , verifier_(verifier)
            , http_client_(io_context_, options.http)
            , broadcast_timer_(io_context_)
            , deadline_timer_(io_context_)
            , phase_(Phase::BROADCAST)
            , broadcast_found_(false)
            , next_fetch_(0)
        {
            result_.network_context = options_.network;
        }

        DiscoveryResult run() {
            if (options_.deadline.count() > 0) {
                deadline_timer_.expires_after(options_.deadline);
                deadline_timer_.async_wait([this](const asio::error_code& ec) {
                    if (!ec) {
                        on_deadline();
                    }
                });
            }

            if (options_.broadcast_enabled) {
                start_broadcast();
            } else {
                log_debug("Orchestrator: Broadcast discovery disabled");
                start_fallback();
            }

            io_context_.run();
            browser_.reset();

            result_.agents = agents_.release();
            if (options_.require_verified) {
                drop_unverified(result_.agents);
            }
            return std::move(result_);
        }

    private:
        enum class Phase {
            BROADCAST,
            FALLBACK,
            CARDS,
            DONE
        };

        // --------------------------------------------------------------------
        // Broadcast
        // --------------------------------------------------------------------

        void start_broadcast() {
            try {
                browser_ = std::make_unique<BroadcastBrowser>(io_context_, options_.browse);
            } catch (const std::invalid_argument& e) {
                record_error(std::string("Broadcast discovery failed: ") + e.what());
                start_fallback();
                return;
            }

            if (options_.stop_at_first_result) {
                browser_->set_result_callback([this](const BrowsedService&) {
                    asio::post(io_context_, [this]() { end_broadcast(); });
                });
            }

            if (!browser_->start()) {
                record_error("Broadcast discovery failed: could not send query");
                end_broadcast();
                return;
            }

            log_info("Orchestrator: Browsing " + options_.browse.service_type
                + " for " + format_ms(options_.broadcast_timeout));

            broadcast_timer_.expires_after(options_.broadcast_timeout);
            broadcast_timer_.async_wait([this](const asio::error_code& ec) {
                if (!ec) {
                    end_broadcast();
                }
            });
        }

        /// Collect browse results once; later calls are no-ops
        void end_broadcast() {
            if (phase_ != Phase::BROADCAST) {
                return;
            }
            collect_broadcast();
            start_fallback();
        }

        void collect_broadcast() {
            broadcast_timer_.cancel();
            if (!browser_) {
                return;
            }
            browser_->stop();

            bool use_https = options_.prefer_https
                || (options_.fallback_url && starts_with(to_lowercase(*options_.fallback_url), "https://"));

            size_t found = 0;
            for (const auto& service : browser_->snapshot()) {
                DiscoveredAgent agent;
                agent.descriptor = service.to_descriptor(use_https);
                agent.source = DiscoverySource::BROADCAST;
                if (agents_.add(std::move(agent))) {
                    ++found;
                }
            }

            if (found == 0) {
                record_error("Broadcast discovery found no agents within " + format_ms(options_.broadcast_timeout));
                return;
            }
            broadcast_found_ = true;
            result_.discovery_method = DiscoveryMethod::BROADCAST;
            log_info("Orchestrator: Broadcast discovery found " + std::to_string(found) + " agent(s)");
        }

        // --------------------------------------------------------------------
        // Fallback
        // --------------------------------------------------------------------

        void start_fallback() {
            phase_ = Phase::FALLBACK;

            bool wanted = !broadcast_found_ || options_.merge_fallback_results;
            if (!wanted || !options_.fallback_url || trim_string(*options_.fallback_url).empty()) {
                start_cards();
                return;
            }

            std::string url = discovery_url_for(*options_.fallback_url);
            log_info("Orchestrator: Fetching discovery resource " + url);

            std::map<std::string, std::string> headers = {{"Accept", protocol::JSON_MEDIA_TYPE}};
            http_client_.async_get(url, headers, [this](HttpResponse response) {
                if (phase_ != Phase::FALLBACK) {
                    return;
                }
                handle_fallback(response);
                start_cards();
            });
        }

        void handle_fallback(const HttpResponse& response) {
            if (!response.ok()) {
                record_error("Well-known discovery failed: " + describe_failure(response));
                return;
            }

            std::string error;
            auto document = DiscoveryDocument::parse(response.body, error);
            if (!document) {
                record_error("Well-known discovery failed: malformed discovery document: " + error);
                return;
            }

            if (!result_.network_context.ssid) {
                result_.network_context.ssid = document->network.ssid;
            }
            if (!result_.network_context.realm) {
                result_.network_context.realm = document->network.realm;
            }

            size_t found = 0;
            for (auto& descriptor : document->agents) {
                DiscoveredAgent agent;
                agent.descriptor = std::move(descriptor);
                agent.source = DiscoverySource::WELLKNOWN;
                if (agents_.add(std::move(agent))) {
                    ++found;
                }
            }

            if (found > 0 && !broadcast_found_) {
                result_.discovery_method = DiscoveryMethod::WELLKNOWN;
            }
            log_info("Orchestrator: Well-known discovery found " + std::to_string(found) + " agent(s)");
        }

        // --------------------------------------------------------------------
        // Card fetches
        // --------------------------------------------------------------------

        void start_cards() {
            phase_ = Phase::CARDS;
            if (!options_.fetch_cards || agents_.empty()) {
                finish();
                return;
            }
            log_info("Orchestrator: Fetching " + std::to_string(agents_.size()) + " agent card(s)");
            launch_fetches();
        }

        void launch_fetches() {
            size_t limit = std::max<size_t>(1, options_.max_concurrent_fetches);
            while (in_flight_.size() < limit && next_fetch_ < agents_.size()) {
                fetch_card(next_fetch_++);
            }
            if (in_flight_.empty() && next_fetch_ >= agents_.size()) {
                finish();
            }
        }

        void fetch_card(size_t index) {
            const auto& descriptor = agents_.agents()[index].descriptor;
            in_flight_[index] = descriptor.name;

            std::map<std::string, std::string> headers;
            if (verifier_.wants_signed_cards()) {
                headers["Accept"] = std::string(protocol::SIGNED_CARD_MEDIA_TYPE) + ", " + protocol::JSON_MEDIA_TYPE;
            } else {
                headers["Accept"] = protocol::JSON_MEDIA_TYPE;
            }

            http_client_.async_get(descriptor.agent_card_url, headers, [this, index](HttpResponse response) {
                if (phase_ != Phase::CARDS) {
                    return;
                }
                in_flight_.erase(index);
                handle_card(index, response);
                launch_fetches();
            });
        }

        void handle_card(size_t index, const HttpResponse& response) {
            auto& agent = agents_.agents()[index];

            if (!response.ok()) {
                std::string reason = describe_failure(response);
                agent.mark_unverified("card fetch failed: " + reason);
                record_error("Failed to fetch agent card for " + agent.descriptor.name + ": " + reason);
                return;
            }

            FetchedCard fetched;
            fetched.url = agent.descriptor.agent_card_url;
            fetched.host = response.host;
            fetched.body = response.body;
            fetched.content_type = response.header("content-type");
            fetched.transport_verified = response.transport_verified;
            verifier_.apply(agent, fetched);
        }

        // --------------------------------------------------------------------
        // Completion
        // --------------------------------------------------------------------

        void finish() {
            phase_ = Phase::DONE;
            deadline_timer_.cancel();
            log_info("Orchestrator: Discovery complete: " + std::to_string(agents_.size()) + " agent(s), "
                + std::to_string(result_.errors.size()) + " error(s), method=" + to_string(result_.discovery_method));
        }

        void on_deadline() {
            std::string abandoned;
            switch (phase_) {
                case Phase::BROADCAST:
                    collect_broadcast();
                    abandoned = "broadcast browse";
                    break;
                case Phase::FALLBACK:
                    abandoned = "discovery resource fetch";
                    http_client_.cancel();
                    break;
                case Phase::CARDS: {
                    std::vector<std::string> names;
                    for (const auto& entry : in_flight_) {
                        names.push_back(entry.second);
                        agents_.agents()[entry.first].mark_unverified("card fetch abandoned at deadline");
                    }
                    for (size_t i = next_fetch_; i < agents_.size(); ++i) {
                        names.push_back(agents_.agents()[i].descriptor.name);
                        agents_.agents()[i].mark_unverified("card fetch abandoned at deadline");
                    }
                    abandoned = "card fetches for " + join_strings(names, ", ");
                    http_client_.cancel();
                    break;
                }
                case Phase::DONE:
                    return;
            }

            phase_ = Phase::DONE;
            record_error("Discovery deadline of " + format_ms(options_.deadline) + " expired; abandoned " + abandoned);
            io_context_.stop();
        }

        void record_error(const std::string& message) {
            log_warn("Orchestrator: " + message);
            result_.errors.push_back(message);
        }

        // io_context_ is declared first so pending handlers are destroyed last
        asio::io_context io_context_;
        const OrchestratorOptions& options_;
        const IdentityVerifier& verifier_;
        HttpClient http_client_;
        std::unique_ptr<BroadcastBrowser> browser_;
        asio::steady_timer broadcast_timer_;
        asio::steady_timer deadline_timer_;

        Phase phase_;
        bool broadcast_found_;
        AgentSet agents_;
        DiscoveryResult result_;

        size_t next_fetch_;
        std::map<size_t, std::string> in_flight_;   ///< Agent index -> name
    };
}

// ============================================================================
// Options
// ============================================================================

OrchestratorOptions OrchestratorOptions::from_config(const ClientConfig& config) {
    OrchestratorOptions options;
    options.broadcast_enabled = config.try_mdns;
    options.broadcast_timeout = seconds_to_ms(config.mdns_timeout);
    options.stop_at_first_result = config.stop_at_first_result;
    options.browse.query_address = config.mdns_address;
    options.browse.query_port = config.mdns_port;
    options.fallback_url = config.fallback_url;
    options.merge_fallback_results = config.merge_fallback_results;
    options.fetch_cards = config.fetch_cards;
    options.prefer_https = config.prefer_https;
    options.deadline = seconds_to_ms(config.deadline);
    options.http.timeout = seconds_to_ms(config.http_timeout);
    options.http.verify_tls = config.verify_tls;
    options.http.ca_bundle = config.ca_bundle.value_or("");
    options.network.realm = config.expected_realm;
    options.require_verified = config.require_verified;
    return options;
}

std::shared_ptr<const IdentityVerifier> make_identity_verifier(
    const ClientConfig& config,
    std::shared_ptr<const IdentityResolver> resolver
) {
    auto keys = std::make_shared<TrustedKeyStore>();
    if (config.signing_public_key && !config.signing_public_key->empty()) {
        if (!keys->load_key_file(config.signing_key_id, *config.signing_public_key)) {
            throw std::runtime_error("Failed to load trusted public key: " + *config.signing_public_key);
        }
        log_info("Orchestrator: Trusting key " + config.signing_key_id + " from " + *config.signing_public_key);
    }

    IdentityVerifierOptions options;
    options.expected_realm = config.expected_realm;
    options.verify_tls = config.verify_tls;
    return std::make_shared<IdentityVerifier>(std::move(keys), std::move(resolver), options);
}

// ============================================================================
// DiscoveryOrchestrator
// ============================================================================

DiscoveryOrchestrator::DiscoveryOrchestrator(
    OrchestratorOptions options,
    std::shared_ptr<const IdentityVerifier> verifier
)
    : options_(std::move(options))
    , verifier_(std::move(verifier))
{
    if (!CryptoUtils::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    if (!verifier_) {
        IdentityVerifierOptions verifier_options;
        verifier_options.expected_realm = options_.network.realm;
        verifier_options.verify_tls = options_.http.verify_tls;
        verifier_ = std::make_shared<IdentityVerifier>(nullptr, nullptr, verifier_options);
    }
}

DiscoveryResult DiscoveryOrchestrator::discover() const {
    log_info("Orchestrator: Starting discovery");
    try {
        DiscoveryRun run(options_, *verifier_);
        return run.run();
    } catch (const std::runtime_error& e) {
        // Socket or TLS setup failure before any mechanism could run
        log_error("Orchestrator: Discovery failed: " + std::string(e.what()));
        DiscoveryResult result;
        result.network_context = options_.network;
        result.errors.push_back(std::string("Discovery failed: ") + e.what());
        return result;
    }
}

DiscoveryResult DiscoveryOrchestrator::discover_with_consent(ConsentGate& gate) const {
    DiscoveryResult result = discover();

    size_t offered = result.agents.size();
    result.agents = gate.filter(result.agents);
    log_info("Orchestrator: " + std::to_string(result.agents.size()) + " of "
        + std::to_string(offered) + " agent(s) approved");
    return result;
}

} // namespace lad
