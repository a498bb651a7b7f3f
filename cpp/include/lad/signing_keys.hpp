/**
 * @file signing_keys.hpp
 * @brief P-256 key material for card signing and verification
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Key handling for signed agent cards:
 * - Key pair generation (ECDSA P-256)
 * - PEM persistence with owner-only private key permissions
 * - Trusted public key store keyed by key id
 */

#pragma once

#include <openssl/evp.h>

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <filesystem>

namespace lad {

/**
 * @brief Deleter for OpenSSL EVP_PKEY handles
 */
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const;
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * @brief Drain the OpenSSL error queue into a readable string
 */
std::string openssl_error_string();

/**
 * @brief Default file names written by SigningKeyMaterial::save
 */
constexpr const char* DEFAULT_PRIVATE_KEY_FILE = "private.pem";
constexpr const char* DEFAULT_PUBLIC_KEY_FILE = "public.pem";

/**
 * @brief Public half of a signing key
 */
class PublicKey {
public:
    /**
     * @brief Parse a SubjectPublicKeyInfo PEM
     * @param pem PEM text
     * @return Key, or std::nullopt if unparsable or not P-256
     */
    static std::optional<PublicKey> from_pem(const std::string& pem);

    /**
     * @brief Load a SubjectPublicKeyInfo PEM file
     */
    static std::optional<PublicKey> load(const std::filesystem::path& path);

    /**
     * @brief Serialize back to PEM
     */
    std::string to_pem() const;

    /**
     * @brief SHA-256 fingerprint of the PEM, for logs
     */
    std::string fingerprint() const;

    EVP_PKEY* native_handle() const { return key_.get(); }

private:
    explicit PublicKey(EvpPkeyPtr key);

    std::shared_ptr<EVP_PKEY> key_;
};

/**
 * @brief SigningKeyMaterial - P-256 key pair identified by a key id
 *
 * Loaded once at provider startup and shared read-only afterwards.
 */
class SigningKeyMaterial {
public:
    /**
     * @brief Generate a fresh P-256 key pair
     * @param key_id Identifier carried in envelope headers
     * @return Key material, or std::nullopt on OpenSSL failure
     */
    static std::optional<SigningKeyMaterial> generate(const std::string& key_id);

    /**
     * @brief Parse a PKCS#8 (or traditional EC) private key PEM
     * @param pem PEM text
     * @param key_id Identifier carried in envelope headers
     * @return Key material, or std::nullopt if unparsable or not P-256
     */
    static std::optional<SigningKeyMaterial> from_private_pem(
        const std::string& pem,
        const std::string& key_id
    );

    /**
     * @brief Load a private key PEM file
     */
    static std::optional<SigningKeyMaterial> load(
        const std::filesystem::path& private_key_path,
        const std::string& key_id
    );

    /**
     * @brief Persist the key pair as PEM files
     *
     * The private key is written as unencrypted PKCS#8 with owner-only
     * permissions; the public key as SubjectPublicKeyInfo.
     *
     * @param directory Target directory (created if missing)
     * @param private_name Private key file name
     * @param public_name Public key file name
     * @return true if both files were written, false otherwise
     */
    bool save(
        const std::filesystem::path& directory,
        const std::string& private_name = DEFAULT_PRIVATE_KEY_FILE,
        const std::string& public_name = DEFAULT_PUBLIC_KEY_FILE
    ) const;

    const std::string& key_id() const { return key_id_; }

    /**
     * @brief Public half as PEM
     */
    std::string public_key_pem() const;

    /**
     * @brief Public half as a verification key
     */
    std::optional<PublicKey> public_key() const;

    EVP_PKEY* native_handle() const { return key_.get(); }

private:
    SigningKeyMaterial(EvpPkeyPtr key, std::string key_id);

    std::optional<std::string> private_key_pem() const;

    std::shared_ptr<EVP_PKEY> key_;
    std::string key_id_;
};

/**
 * @brief TrustedKeyStore - Public keys a verifier accepts, keyed by key id
 *
 * Populated before use and read-only afterwards, so one store may be shared
 * across concurrent verifications.
 */
class TrustedKeyStore {
public:
    /**
     * @brief Add a key under an id
     * @return false if the id is empty or already present
     */
    bool add_key(const std::string& key_id, const PublicKey& key);

    /**
     * @brief Parse and add a PEM public key
     */
    bool add_key_pem(const std::string& key_id, const std::string& pem);

    /**
     * @brief Load and add a PEM public key file
     */
    bool load_key_file(const std::string& key_id, const std::filesystem::path& path);

    /**
     * @brief Look up a key by id
     * @return Key, or std::nullopt if unknown
     */
    std::optional<PublicKey> find(const std::string& key_id) const;

    /**
     * @brief The only key in the store, used for envelopes without a key id
     * @return Key, or std::nullopt unless exactly one key is present
     */
    std::optional<PublicKey> sole_key() const;

    std::vector<std::string> key_ids() const;
    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

private:
    std::map<std::string, PublicKey> keys_;
};

} // namespace lad
