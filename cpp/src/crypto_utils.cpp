/**
 * @file crypto_utils.cpp
 * @brief Implementation of encoding and hashing primitives
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/crypto_utils.hpp"

#include <sodium.h>
#include <openssl/evp.h>

#include <sstream>
#include <iomanip>

namespace lad {

// ============================================================================
// Initialization
// ============================================================================

bool CryptoUtils::initialize() {
    // Safe to call multiple times
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Base64url
// ============================================================================

std::string CryptoUtils::base64url_encode(const std::vector<uint8_t>& bytes) {
    size_t encoded_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    std::vector<char> encoded(encoded_len);

    sodium_bin2base64(
        encoded.data(),
        encoded.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    return std::string(encoded.data());
}

std::string CryptoUtils::base64url_encode(const std::string& text) {
    return base64url_encode(std::vector<uint8_t>(text.begin(), text.end()));
}

std::optional<std::vector<uint8_t>> CryptoUtils::base64url_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }

    std::vector<uint8_t> bytes(encoded.length());
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        encoded.c_str(),
        encoded.length(),
        nullptr,
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING
    );

    // Trailing garbage is rejected as well
    if (result != 0 || end_ptr != encoded.c_str() + encoded.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::optional<std::string> CryptoUtils::base64url_decode_string(const std::string& encoded) {
    auto bytes = base64url_decode(encoded);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// ============================================================================
// Utility Functions
// ============================================================================

bool CryptoUtils::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<std::string> CryptoUtils::sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    return bytes_to_hex(std::vector<uint8_t>(digest, digest + digest_len));
}

std::string CryptoUtils::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

void CryptoUtils::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace lad
