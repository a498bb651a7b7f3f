/**
 * @file identity_verifier.cpp
 * @brief Implementation of card trust checks
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/identity_verifier.hpp"
#include "lad/agent_card.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"

using json = nlohmann::json;

namespace lad {

using namespace lad::utilities;

namespace {

    /// Payload of an envelope without checking its signature
    std::optional<json> unverified_payload(const std::string& token) {
        auto parts = split_string(trim_string(token), '.');
        if (parts.size() != 3) {
            return std::nullopt;
        }
        auto text = CryptoUtils::base64url_decode_string(parts[1]);
        if (!text) {
            return std::nullopt;
        }
        try {
            auto payload = json::parse(*text);
            if (payload.is_object() && payload.contains("agent_card") && payload["agent_card"].is_object()) {
                return payload["agent_card"];
            }
        } catch (const json::parse_error&) {
            return std::nullopt;
        }
        return std::nullopt;
    }
}

// ============================================================================
// StaticIdentityResolver
// ============================================================================

bool StaticIdentityResolver::add_identity(const std::string& identity_reference, const PublicKey& key) {
    if (identity_reference.empty()) {
        log_error("IdentityResolver: Refusing empty identity reference");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    identities_.insert_or_assign(identity_reference, key);
    log_debug("IdentityResolver: Bound " + identity_reference + " to key " + key.fingerprint());
    return true;
}

bool StaticIdentityResolver::add_identity_pem(const std::string& identity_reference, const std::string& pem) {
    auto key = PublicKey::from_pem(pem);
    if (!key) {
        return false;
    }
    return add_identity(identity_reference, *key);
}

std::optional<PublicKey> StaticIdentityResolver::resolve(const std::string& identity_reference) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(identity_reference);
    if (it == identities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t StaticIdentityResolver::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_.size();
}

// ============================================================================
// FetchedCard / VerificationOutcome
// ============================================================================

bool FetchedCard::is_envelope() const {
    if (to_lowercase(content_type).find(protocol::SIGNED_CARD_MEDIA_TYPE) != std::string::npos) {
        return true;
    }
    std::string trimmed = trim_string(body);
    return !trimmed.empty() && trimmed.front() != '{' && SignedCardEnvelope::looks_like_envelope(trimmed);
}

std::string VerificationOutcome::error() const {
    return join_strings(failures, "; ");
}

// ============================================================================
// IdentityVerifier
// ============================================================================

IdentityVerifier::IdentityVerifier(
    std::shared_ptr<const TrustedKeyStore> keys,
    std::shared_ptr<const IdentityResolver> resolver,
    IdentityVerifierOptions options
)
    : keys_(std::move(keys))
    , resolver_(std::move(resolver))
    , options_(std::move(options))
{
    if (keys_ && !keys_->empty()) {
        card_verifier_ = std::make_unique<CardVerifier>(keys_);
    }
}

bool IdentityVerifier::wants_signed_cards() const {
    return card_verifier_ != nullptr || resolver_ != nullptr;
}

bool IdentityVerifier::domain_matches(const std::string& organization, const std::string& host) const {
    std::string org = protocol::normalize_domain(organization);
    if (org.empty()) {
        return false;
    }

    std::string normalized_host = protocol::normalize_domain(host);
    if (!normalized_host.empty() && (org == normalized_host || ends_with(normalized_host, "." + org))) {
        return true;
    }

    return options_.expected_realm && org == protocol::normalize_domain(*options_.expected_realm);
}

VerificationOutcome IdentityVerifier::verify(const FetchedCard& fetched) const {
    VerificationOutcome outcome;

    // ------------------------------------------------------------------------
    // Envelope checks: signature, then identity binding
    // ------------------------------------------------------------------------

    if (fetched.is_envelope()) {
        std::string token = trim_string(fetched.body);
        outcome.card = unverified_payload(token);
        bool attempted = false;

        if (card_verifier_) {
            attempted = true;
            auto result = card_verifier_->verify(token);
            if (result.valid) {
                outcome.verified = true;
                outcome.method = VerificationMethod::SIGNATURE;
                outcome.card = result.payload;
                outcome.failures.clear();
                return outcome;
            }
            outcome.failures.push_back("signature: " + result.error);
        }

        auto identity = outcome.card ? card_identity_reference(*outcome.card) : std::nullopt;
        if (identity && resolver_) {
            attempted = true;
            auto key = resolver_->resolve(*identity);
            if (!key) {
                outcome.failures.push_back("identity-binding: " + resolver_->name()
                    + " resolver does not know " + *identity);
            } else {
                auto result = CardVerifier::verify_with_key(token, *key);
                if (result.valid) {
                    outcome.verified = true;
                    outcome.method = VerificationMethod::IDENTITY_BINDING;
                    outcome.card = result.payload;
                    outcome.failures.clear();
                    return outcome;
                }
                outcome.failures.push_back("identity-binding: " + result.error);
            }
        }

        if (attempted) {
            // A rejected envelope is not trusted for the weaker checks
            return outcome;
        }
        if (!outcome.card) {
            outcome.failures.push_back("malformed envelope: no agent_card payload");
            return outcome;
        }
    } else {
        try {
            auto card = json::parse(fetched.body);
            if (!card.is_object()) {
                outcome.failures.push_back("card is not a JSON object");
                return outcome;
            }
            outcome.card = std::move(card);
        } catch (const json::parse_error& e) {
            outcome.failures.push_back("card is not valid JSON: " + std::string(e.what()));
            return outcome;
        }

        if (card_verifier_) {
            outcome.failures.push_back("signature: card is not signed");
        }
        auto identity = card_identity_reference(*outcome.card);
        if (identity && resolver_) {
            outcome.failures.push_back("identity-binding: card declares " + *identity + " but is not signed");
        }
    }

    // ------------------------------------------------------------------------
    // Domain
    // ------------------------------------------------------------------------

    auto organization = card_organization(*outcome.card);
    if (!organization) {
        outcome.failures.push_back("domain: card declares no provider organization");
    } else if (domain_matches(*organization, fetched.host)) {
        outcome.verified = true;
        outcome.method = VerificationMethod::DOMAIN;
        outcome.failures.clear();
        return outcome;
    } else {
        outcome.failures.push_back("domain: organization '" + *organization
            + "' does not match host '" + fetched.host + "'");
    }

    // ------------------------------------------------------------------------
    // Transport
    // ------------------------------------------------------------------------

    bool https = starts_with(to_lowercase(fetched.url), "https://");
    if (https && options_.verify_tls && fetched.transport_verified) {
        outcome.verified = true;
        outcome.method = VerificationMethod::TRANSPORT;
        outcome.failures.clear();
        return outcome;
    }
    outcome.failures.push_back(https ? "transport: TLS verification disabled or failed"
                                     : "transport: card not fetched over HTTPS");
    return outcome;
}

void IdentityVerifier::apply(DiscoveredAgent& agent, const FetchedCard& fetched) const {
    auto outcome = verify(fetched);
    if (outcome.card) {
        agent.card = std::move(outcome.card);
    }

    if (outcome.verified && outcome.method) {
        agent.mark_verified(*outcome.method);
        log_info("IdentityVerifier: " + agent.descriptor.name + " verified by " + to_string(*outcome.method));
    } else {
        agent.mark_unverified(outcome.error());
        log_info("IdentityVerifier: " + agent.descriptor.name + " unverified (" + outcome.error() + ")");
    }
}

} // namespace lad
