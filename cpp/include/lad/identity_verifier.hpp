/**
 * @file identity_verifier.hpp
 * @brief Establishes whether a fetched agent card can be trusted
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Checks run in priority order and the first success wins:
 * 1. signature         envelope verified against a trusted key
 * 2. identity-binding  declared identity resolves to the envelope key
 * 3. domain            provider organization matches host or expected realm
 * 4. transport         fetched over verified TLS
 */

#pragma once

#include "lad/card_signer.hpp"
#include "lad/descriptor.hpp"
#include "lad/signing_keys.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace lad {

/**
 * @brief Interface for identity reference resolution
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    /**
     * @brief Resolve an identity reference to its signing key
     * @param identity_reference e.g. "did:web:hotel.example"
     * @return Key, or std::nullopt if the reference is unknown
     */
    virtual std::optional<PublicKey> resolve(const std::string& identity_reference) const = 0;

    /**
     * @brief Resolver name for diagnostics
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Resolver backed by a fixed reference -> key table
 */
class StaticIdentityResolver : public IdentityResolver {
public:
    bool add_identity(const std::string& identity_reference, const PublicKey& key);
    bool add_identity_pem(const std::string& identity_reference, const std::string& pem);

    std::optional<PublicKey> resolve(const std::string& identity_reference) const override;
    std::string name() const override { return "static"; }

    size_t size() const;

private:
    std::map<std::string, PublicKey> identities_;
    mutable std::mutex mutex_;
};

/**
 * @brief Card response as received by the client
 */
struct FetchedCard {
    std::string url;
    std::string host;                   ///< Host the card was fetched from
    std::string body;
    std::string content_type;
    bool transport_verified = false;    ///< TLS chain and hostname checked

    /**
     * @brief Whether the body is a signed envelope
     */
    bool is_envelope() const;
};

/**
 * @brief Client-side verification settings
 */
struct IdentityVerifierOptions {
    std::optional<std::string> expected_realm;  ///< Organization the client expects on this network
    bool verify_tls = true;
};

/**
 * @brief Result of verifying one card
 */
struct VerificationOutcome {
    bool verified = false;
    std::optional<VerificationMethod> method;
    std::optional<nlohmann::json> card;     ///< Verified payload or parsed card
    std::vector<std::string> failures;      ///< One entry per failed check

    std::string error() const;
};

/**
 * @brief IdentityVerifier - Runs the trust checks over fetched cards
 */
class IdentityVerifier {
public:
    /**
     * @brief Construct IdentityVerifier
     * @param keys Trusted signing keys (nullptr or empty disables the signature check)
     * @param resolver Identity resolver (nullptr disables identity binding)
     * @param options Realm and TLS settings
     */
    IdentityVerifier(
        std::shared_ptr<const TrustedKeyStore> keys,
        std::shared_ptr<const IdentityResolver> resolver,
        IdentityVerifierOptions options = {}
    );

    /**
     * @brief Whether the client should ask for signed envelopes
     */
    bool wants_signed_cards() const;

    VerificationOutcome verify(const FetchedCard& fetched) const;

    /**
     * @brief Verify and record the outcome on the agent
     */
    void apply(DiscoveredAgent& agent, const FetchedCard& fetched) const;

    /**
     * @brief Domain check alone
     * @return true if the organization matches the host or the expected realm
     */
    bool domain_matches(const std::string& organization, const std::string& host) const;

private:
    std::shared_ptr<const TrustedKeyStore> keys_;
    std::shared_ptr<const IdentityResolver> resolver_;
    std::unique_ptr<CardVerifier> card_verifier_;
    IdentityVerifierOptions options_;
};

} // namespace lad
