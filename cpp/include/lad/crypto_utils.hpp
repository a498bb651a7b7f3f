/**
 * @file crypto_utils.hpp
 * @brief Encoding and hashing primitives for LAD-A2A
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides base64url (JWS) encoding, constant-time comparison and SHA-256.
 */

#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace lad {

/**
 * @brief CryptoUtils - Stateless encoding helpers
 *
 * Thread-safe; uses libsodium for encoding and comparison and OpenSSL for
 * digests.
 */
class CryptoUtils {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Base64url (RFC 4648 section 5, no padding)
    // ========================================================================

    /**
     * @brief Encode bytes as unpadded base64url
     * @param bytes Input bytes
     * @return Encoded string
     */
    static std::string base64url_encode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Encode a string's bytes as unpadded base64url
     */
    static std::string base64url_encode(const std::string& text);

    /**
     * @brief Decode unpadded base64url
     * @param encoded Encoded string
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64url_decode(const std::string& encoded);

    /**
     * @brief Decode unpadded base64url into a string
     */
    static std::optional<std::string> base64url_decode_string(const std::string& encoded);

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Constant-time comparison of byte arrays
     * @return true if arrays are equal, false otherwise
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    /**
     * @brief SHA-256 digest as lowercase hex
     * @param data Input bytes
     * @return Hex digest, or std::nullopt on OpenSSL failure
     */
    static std::optional<std::string> sha256_hex(const std::string& data);

    /**
     * @brief Convert bytes to hexadecimal string
     */
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Securely zero memory
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace lad
