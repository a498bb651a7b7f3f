/**
 * @file card_signer.cpp
 * @brief Implementation of ES256 card envelopes
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/card_signer.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"

#include <openssl/bn.h>
#include <openssl/ecdsa.h>

#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace lad {

using namespace lad::utilities;

namespace {

    /// P-256 coordinate size; a JWS ES256 signature is R||S
    constexpr size_t ES256_COORDINATE_SIZE = 32;

    struct TokenParts {
        std::string header_b64;
        std::string payload_b64;
        std::string signature_b64;
    };

    std::optional<TokenParts> split_token(const std::string& token) {
        auto first = token.find('.');
        if (first == std::string::npos) {
            return std::nullopt;
        }
        auto second = token.find('.', first + 1);
        if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
            return std::nullopt;
        }

        TokenParts parts{
            token.substr(0, first),
            token.substr(first + 1, second - first - 1),
            token.substr(second + 1)
        };
        if (parts.header_b64.empty() || parts.payload_b64.empty() || parts.signature_b64.empty()) {
            return std::nullopt;
        }
        return parts;
    }

    std::optional<json> decode_json_segment(const std::string& segment) {
        auto text = CryptoUtils::base64url_decode_string(segment);
        if (!text) {
            return std::nullopt;
        }
        try {
            auto j = json::parse(*text);
            if (!j.is_object()) {
                return std::nullopt;
            }
            return j;
        } catch (const json::parse_error&) {
            return std::nullopt;
        }
    }

    std::optional<std::vector<uint8_t>> der_to_raw_signature(const std::vector<uint8_t>& der) {
        const unsigned char* cursor = der.data();
        std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(
            d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())), &ECDSA_SIG_free);
        if (!sig) {
            return std::nullopt;
        }

        const BIGNUM* r = nullptr;
        const BIGNUM* s = nullptr;
        ECDSA_SIG_get0(sig.get(), &r, &s);

        std::vector<uint8_t> raw(ES256_COORDINATE_SIZE * 2);
        if (BN_bn2binpad(r, raw.data(), ES256_COORDINATE_SIZE) != static_cast<int>(ES256_COORDINATE_SIZE) ||
            BN_bn2binpad(s, raw.data() + ES256_COORDINATE_SIZE, ES256_COORDINATE_SIZE) != static_cast<int>(ES256_COORDINATE_SIZE)) {
            return std::nullopt;
        }
        return raw;
    }

    std::optional<std::vector<uint8_t>> raw_to_der_signature(const std::vector<uint8_t>& raw) {
        if (raw.size() != ES256_COORDINATE_SIZE * 2) {
            return std::nullopt;
        }

        std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
        BIGNUM* r = BN_bin2bn(raw.data(), ES256_COORDINATE_SIZE, nullptr);
        BIGNUM* s = BN_bin2bn(raw.data() + ES256_COORDINATE_SIZE, ES256_COORDINATE_SIZE, nullptr);
        if (!sig || r == nullptr || s == nullptr || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
            BN_free(r);
            BN_free(s);
            return std::nullopt;
        }

        int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
        if (der_len <= 0) {
            return std::nullopt;
        }
        std::vector<uint8_t> der(static_cast<size_t>(der_len));
        unsigned char* out = der.data();
        i2d_ECDSA_SIG(sig.get(), &out);
        return der;
    }

    EnvelopeVerification failure(const std::string& key_id, const std::string& reason) {
        EnvelopeVerification result;
        result.valid = false;
        result.key_id = key_id;
        result.error = reason;
        return result;
    }
}

// ============================================================================
// SignedCardEnvelope
// ============================================================================

std::optional<std::string> SignedCardEnvelope::key_id() const {
    auto parts = split_token(token);
    if (!parts) {
        return std::nullopt;
    }
    auto header = decode_json_segment(parts->header_b64);
    if (!header || !header->contains("kid") || !(*header)["kid"].is_string()) {
        return std::nullopt;
    }
    return (*header)["kid"].get<std::string>();
}

bool SignedCardEnvelope::looks_like_envelope(const std::string& text) {
    std::string trimmed = trim_string(text);
    if (!split_token(trimmed)) {
        return false;
    }
    for (char c : trimmed) {
        bool urlsafe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        if (!urlsafe) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// CardSigner
// ============================================================================

CardSigner::CardSigner(std::shared_ptr<const SigningKeyMaterial> key)
    : key_(std::move(key))
{
    if (!key_) {
        throw std::invalid_argument("CardSigner: key material cannot be null");
    }
}

std::optional<SignedCardEnvelope> CardSigner::sign(const json& card) const {
    try {
        json header;
        header["alg"] = protocol::SIGNING_ALGORITHM;
        header["typ"] = "JWT";
        if (!key_->key_id().empty()) {
            header["kid"] = key_->key_id();
        }

        json payload;
        payload["agent_card"] = card;
        payload["iat"] = current_unix_time();

        std::string signing_input = CryptoUtils::base64url_encode(header.dump())
            + "." + CryptoUtils::base64url_encode(payload.dump());

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_->native_handle()) != 1) {
            log_error("CardSigner: Failed to initialize signing: " + openssl_error_string());
            return std::nullopt;
        }

        size_t der_len = 0;
        const auto* input = reinterpret_cast<const unsigned char*>(signing_input.data());
        if (EVP_DigestSign(ctx.get(), nullptr, &der_len, input, signing_input.size()) != 1) {
            log_error("CardSigner: Failed to size signature: " + openssl_error_string());
            return std::nullopt;
        }

        std::vector<uint8_t> der(der_len);
        if (EVP_DigestSign(ctx.get(), der.data(), &der_len, input, signing_input.size()) != 1) {
            log_error("CardSigner: Signing failed: " + openssl_error_string());
            return std::nullopt;
        }
        der.resize(der_len);

        auto raw = der_to_raw_signature(der);
        if (!raw) {
            log_error("CardSigner: Failed to convert DER signature");
            return std::nullopt;
        }

        log_debug("CardSigner: Signed card for " + card.value("name", std::string("unknown"))
            + " with key '" + key_->key_id() + "'");
        return SignedCardEnvelope{signing_input + "." + CryptoUtils::base64url_encode(*raw)};

    } catch (const json::exception& e) {
        log_error("CardSigner: Failed to serialize card: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<SignedCardEnvelope> CardSigner::sign_bytes(const std::string& card_bytes) const {
    try {
        auto card = json::parse(card_bytes);
        if (!card.is_object()) {
            log_error("CardSigner: Card is not a JSON object");
            return std::nullopt;
        }
        return sign(card);
    } catch (const json::parse_error& e) {
        log_error("CardSigner: Card is not valid JSON: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// CardVerifier
// ============================================================================

CardVerifier::CardVerifier(std::shared_ptr<const TrustedKeyStore> keys)
    : keys_(std::move(keys))
{
    if (!keys_) {
        throw std::invalid_argument("CardVerifier: key store cannot be null");
    }
}

EnvelopeVerification CardVerifier::verify(const std::string& token) const {
    std::string trimmed = trim_string(token);
    auto parts = split_token(trimmed);
    if (!parts) {
        return failure("", "malformed envelope: expected three non-empty segments");
    }

    auto header = decode_json_segment(parts->header_b64);
    if (!header) {
        return failure("", "malformed envelope: unreadable header");
    }

    std::string key_id;
    if (header->contains("kid")) {
        if (!(*header)["kid"].is_string()) {
            return failure("", "malformed envelope: non-string kid");
        }
        key_id = (*header)["kid"].get<std::string>();
    }

    std::optional<PublicKey> key;
    if (key_id.empty()) {
        key = keys_->sole_key();
        if (!key) {
            return failure("", "envelope has no key id and no single trusted key applies");
        }
    } else {
        key = keys_->find(key_id);
        if (!key) {
            return failure(key_id, "unknown key id '" + key_id + "'");
        }
    }

    auto result = verify_with_key(trimmed, *key);
    result.key_id = key_id;
    return result;
}

EnvelopeVerification CardVerifier::verify_with_key(const std::string& token, const PublicKey& key) {
    std::string trimmed = trim_string(token);
    auto parts = split_token(trimmed);
    if (!parts) {
        return failure("", "malformed envelope: expected three non-empty segments");
    }

    auto header = decode_json_segment(parts->header_b64);
    if (!header) {
        return failure("", "malformed envelope: unreadable header");
    }
    std::string key_id;
    if (header->contains("kid") && (*header)["kid"].is_string()) {
        key_id = (*header)["kid"].get<std::string>();
    }

    if (!header->contains("alg") || !(*header)["alg"].is_string()
        || (*header)["alg"].get<std::string>() != protocol::SIGNING_ALGORITHM) {
        return failure(key_id, "unsupported algorithm, expected ES256");
    }

    auto raw_signature = CryptoUtils::base64url_decode(parts->signature_b64);
    if (!raw_signature) {
        return failure(key_id, "malformed envelope: signature is not base64url");
    }
    auto der = raw_to_der_signature(*raw_signature);
    if (!der) {
        return failure(key_id, "malformed envelope: signature has wrong length");
    }

    std::string signing_input = parts->header_b64 + "." + parts->payload_b64;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.native_handle()) != 1) {
        return failure(key_id, "verification setup failed: " + openssl_error_string());
    }

    int rc = EVP_DigestVerify(ctx.get(), der->data(), der->size(),
        reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size());
    if (rc != 1) {
        // Clear the queue so later diagnostics are not polluted
        openssl_error_string();
        return failure(key_id, "invalid signature");
    }

    auto payload = decode_json_segment(parts->payload_b64);
    if (!payload) {
        return failure(key_id, "malformed envelope: unreadable payload");
    }
    if (!payload->contains("agent_card") || !(*payload)["agent_card"].is_object()) {
        return failure(key_id, "signed payload carries no agent_card");
    }

    EnvelopeVerification result;
    result.valid = true;
    result.key_id = key_id;
    result.payload = (*payload)["agent_card"];
    if (payload->contains("iat") && (*payload)["iat"].is_number_unsigned()) {
        result.signed_at = (*payload)["iat"].get<uint64_t>();
    }
    return result;
}

} // namespace lad
