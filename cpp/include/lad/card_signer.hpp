/**
 * @file card_signer.hpp
 * @brief ES256 signed envelopes over agent cards
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Compact JWS (header.payload.signature) with payload {agent_card, iat}.
 * Verification fails closed and always reports a reason.
 */

#pragma once

#include "lad/signing_keys.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <memory>
#include <optional>
#include <cstdint>

namespace lad {

/**
 * @brief Compact three-part signed token wrapping a card
 */
struct SignedCardEnvelope {
    std::string token;

    /**
     * @brief Key id from the header without verifying anything
     * @return Key id, or std::nullopt if absent or header unreadable
     */
    std::optional<std::string> key_id() const;

    /**
     * @brief Check whether text has the shape of a compact JWS
     *
     * Three non-empty dot-separated base64url segments.
     */
    static bool looks_like_envelope(const std::string& text);
};

/**
 * @brief Outcome of verifying an envelope
 */
struct EnvelopeVerification {
    bool valid = false;
    std::string key_id;                         ///< Key id from the header (may be empty)
    std::optional<nlohmann::json> payload;      ///< Verified agent card
    std::optional<uint64_t> signed_at;          ///< iat claim (Unix seconds)
    std::string error;                          ///< Reason when valid == false
};

/**
 * @brief CardSigner - Produces signed envelopes with one key
 */
class CardSigner {
public:
    /**
     * @brief Construct signer over loaded key material
     * @param key Key material (must not be null)
     */
    explicit CardSigner(std::shared_ptr<const SigningKeyMaterial> key);

    /**
     * @brief Sign a card
     * @param card Card JSON
     * @return Envelope, or std::nullopt if OpenSSL signing fails
     */
    std::optional<SignedCardEnvelope> sign(const nlohmann::json& card) const;

    /**
     * @brief Sign a serialized card
     * @param card_bytes Card JSON text
     * @return Envelope, or std::nullopt if the text is not a JSON object or signing fails
     */
    std::optional<SignedCardEnvelope> sign_bytes(const std::string& card_bytes) const;

    const std::string& key_id() const { return key_->key_id(); }

private:
    std::shared_ptr<const SigningKeyMaterial> key_;
};

/**
 * @brief CardVerifier - Validates envelopes against a trusted key store
 */
class CardVerifier {
public:
    /**
     * @brief Construct verifier over a key store
     * @param keys Trusted keys (must not be null)
     */
    explicit CardVerifier(std::shared_ptr<const TrustedKeyStore> keys);

    /**
     * @brief Verify an envelope
     *
     * The header key id selects the key. An envelope without key id is
     * checked against the store's only key when it holds exactly one.
     *
     * @param token Compact JWS
     * @return Verification outcome
     */
    EnvelopeVerification verify(const std::string& token) const;

    /**
     * @brief Verify an envelope against one explicit key
     */
    static EnvelopeVerification verify_with_key(const std::string& token, const PublicKey& key);

private:
    std::shared_ptr<const TrustedKeyStore> keys_;
};

} // namespace lad
