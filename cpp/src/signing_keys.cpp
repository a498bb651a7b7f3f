/**
 * @file signing_keys.cpp
 * @brief Implementation of P-256 key material handling
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Secure key management with PEM storage
 */

#include "lad/signing_keys.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/utilities.hpp"

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>

namespace lad {

using namespace lad::utilities;

namespace {

    struct BioDeleter {
        void operator()(BIO* bio) const { BIO_free(bio); }
    };
    using BioPtr = std::unique_ptr<BIO, BioDeleter>;

    std::string bio_to_string(BIO* bio) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len <= 0 || data == nullptr) {
            return "";
        }
        return std::string(data, static_cast<size_t>(len));
    }

    // Only prime256v1 keys are usable with ES256
    bool is_p256_key(EVP_PKEY* key) {
        if (key == nullptr || EVP_PKEY_base_id(key) != EVP_PKEY_EC) {
            return false;
        }
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
        char group_name[64] = {0};
        size_t group_len = 0;
        if (EVP_PKEY_get_group_name(key, group_name, sizeof(group_name), &group_len) != 1) {
            return false;
        }
        return std::string(group_name, group_len) == SN_X9_62_prime256v1;
#else
        const EC_KEY* ec_key = EVP_PKEY_get0_EC_KEY(key);
        if (ec_key == nullptr) {
            return false;
        }
        return EC_GROUP_get_curve_name(EC_KEY_get0_group(ec_key)) == NID_X9_62_prime256v1;
#endif
    }
}

void EvpPkeyDeleter::operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
}

std::string openssl_error_string() {
    std::string result;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!result.empty()) {
            result += "; ";
        }
        result += buffer;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(EvpPkeyPtr key)
    : key_(std::move(key))
{
}

std::optional<PublicKey> PublicKey::from_pem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        log_error("PublicKey: Failed to allocate BIO: " + openssl_error_string());
        return std::nullopt;
    }

    EvpPkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        log_error("PublicKey: Failed to parse public key PEM: " + openssl_error_string());
        return std::nullopt;
    }

    if (!is_p256_key(key.get())) {
        log_error("PublicKey: Key is not an ECDSA P-256 key");
        return std::nullopt;
    }

    return PublicKey(std::move(key));
}

std::optional<PublicKey> PublicKey::load(const std::filesystem::path& path) {
    auto pem = read_file(path.string());
    if (!pem) {
        return std::nullopt;
    }
    return from_pem(*pem);
}

std::string PublicKey::to_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        log_error("PublicKey: Failed to serialize public key: " + openssl_error_string());
        return "";
    }
    return bio_to_string(bio.get());
}

std::string PublicKey::fingerprint() const {
    auto digest = CryptoUtils::sha256_hex(to_pem());
    return digest ? digest->substr(0, 16) : "unknown";
}

// ============================================================================
// SigningKeyMaterial
// ============================================================================

SigningKeyMaterial::SigningKeyMaterial(EvpPkeyPtr key, std::string key_id)
    : key_(std::move(key))
    , key_id_(std::move(key_id))
{
}

std::optional<SigningKeyMaterial> SigningKeyMaterial::generate(const std::string& key_id) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);

    if (!ctx) {
        log_error("SigningKeyMaterial: Failed to create key context: " + openssl_error_string());
        return std::nullopt;
    }

    if (EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1) {
        log_error("SigningKeyMaterial: Failed to configure P-256 keygen: " + openssl_error_string());
        return std::nullopt;
    }

    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw_key) != 1) {
        log_error("SigningKeyMaterial: Key generation failed: " + openssl_error_string());
        return std::nullopt;
    }

    log_debug("SigningKeyMaterial: Generated P-256 key pair '" + key_id + "'");
    return SigningKeyMaterial(EvpPkeyPtr(raw_key), key_id);
}

std::optional<SigningKeyMaterial> SigningKeyMaterial::from_private_pem(
    const std::string& pem,
    const std::string& key_id
) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        log_error("SigningKeyMaterial: Failed to allocate BIO: " + openssl_error_string());
        return std::nullopt;
    }

    EvpPkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        log_error("SigningKeyMaterial: Failed to parse private key PEM: " + openssl_error_string());
        return std::nullopt;
    }

    if (!is_p256_key(key.get())) {
        log_error("SigningKeyMaterial: Private key is not an ECDSA P-256 key");
        return std::nullopt;
    }

    return SigningKeyMaterial(std::move(key), key_id);
}

std::optional<SigningKeyMaterial> SigningKeyMaterial::load(
    const std::filesystem::path& private_key_path,
    const std::string& key_id
) {
    std::error_code ec;
    if (!std::filesystem::exists(private_key_path, ec)) {
        log_error("SigningKeyMaterial: Private key file not found: " + private_key_path.string());
        return std::nullopt;
    }

    auto pem = read_file(private_key_path.string());
    if (!pem) {
        return std::nullopt;
    }

    auto material = from_private_pem(*pem, key_id);
    CryptoUtils::secure_zero(pem->data(), pem->size());
    return material;
}

bool SigningKeyMaterial::save(
    const std::filesystem::path& directory,
    const std::string& private_name,
    const std::string& public_name
) const {
    auto private_pem = private_key_pem();
    if (!private_pem) {
        return false;
    }

    auto private_path = directory / private_name;
    auto public_path = directory / public_name;

    bool written = write_file(private_path.string(), *private_pem, true);
    CryptoUtils::secure_zero(private_pem->data(), private_pem->size());
    if (!written) {
        return false;
    }

    if (!write_file(public_path.string(), public_key_pem())) {
        return false;
    }

    log_info("SigningKeyMaterial: Wrote signing keys " + private_path.string()
        + ", " + public_path.string());
    return true;
}

std::optional<std::string> SigningKeyMaterial::private_key_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio ||
        PEM_write_bio_PKCS8PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        log_error("SigningKeyMaterial: Failed to serialize private key: " + openssl_error_string());
        return std::nullopt;
    }
    return bio_to_string(bio.get());
}

std::string SigningKeyMaterial::public_key_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        log_error("SigningKeyMaterial: Failed to serialize public key: " + openssl_error_string());
        return "";
    }
    return bio_to_string(bio.get());
}

std::optional<PublicKey> SigningKeyMaterial::public_key() const {
    return PublicKey::from_pem(public_key_pem());
}

// ============================================================================
// TrustedKeyStore
// ============================================================================

bool TrustedKeyStore::add_key(const std::string& key_id, const PublicKey& key) {
    if (key_id.empty()) {
        log_error("TrustedKeyStore: Refusing key with empty id");
        return false;
    }

    auto [it, inserted] = keys_.emplace(key_id, key);
    if (!inserted) {
        log_warn("TrustedKeyStore: Key id already present: " + key_id);
        return false;
    }

    log_debug("TrustedKeyStore: Trusting key '" + key_id + "' (" + it->second.fingerprint() + ")");
    return true;
}

bool TrustedKeyStore::add_key_pem(const std::string& key_id, const std::string& pem) {
    auto key = PublicKey::from_pem(pem);
    if (!key) {
        return false;
    }
    return add_key(key_id, *key);
}

bool TrustedKeyStore::load_key_file(const std::string& key_id, const std::filesystem::path& path) {
    auto key = PublicKey::load(path);
    if (!key) {
        log_error("TrustedKeyStore: Failed to load public key file: " + path.string());
        return false;
    }
    return add_key(key_id, *key);
}

std::optional<PublicKey> TrustedKeyStore::find(const std::string& key_id) const {
    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PublicKey> TrustedKeyStore::sole_key() const {
    if (keys_.size() != 1) {
        return std::nullopt;
    }
    return keys_.begin()->second;
}

std::vector<std::string> TrustedKeyStore::key_ids() const {
    std::vector<std::string> ids;
    ids.reserve(keys_.size());
    for (const auto& [id, key] : keys_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace lad
