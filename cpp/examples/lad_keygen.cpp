/**
 * @file lad_keygen.cpp
 * @brief Generates an agent card signing key pair
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Writes private.pem (owner-only) and public.pem into the key directory.
 * The public key is distributed to clients out of band and configured as
 * client.signing_public_key.
 */

#include "lad/config.hpp"
#include "lad/crypto_utils.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/signing_keys.hpp"
#include "lad/utilities.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

using namespace lad;
using namespace lad::utilities;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--dir <directory>] [--key-id <id>] [--force]\n";
    std::cout << "       " << program_name << " --example-config [path]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --dir <directory>   Key directory (default: $LAD_DATA_DIR/keys)\n";
    std::cout << "  --key-id <id>       Key id placed in envelope headers (default: key-v1)\n";
    std::cout << "  --force             Overwrite an existing key pair\n";
    std::cout << "  --example-config    Write a commented configuration template\n\n";
}

int main(int argc, char* argv[]) {
    std::string directory;
    std::string key_id = "key-v1";
    bool force = false;

    initialize_logging("", LogLevel::INFO);

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--example-config") == 0) {
            std::string path = (i + 1 < argc) ? argv[i + 1] : DEFAULT_CONFIG_FILE;
            if (!generate_example_config(path)) {
                return 1;
            }
            std::cout << "Wrote example configuration to " << path << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            directory = argv[++i];
        } else if (std::strcmp(argv[i], "--key-id") == 0 && i + 1 < argc) {
            key_id = argv[++i];
        } else if (std::strcmp(argv[i], "--force") == 0) {
            force = true;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        if (!CryptoUtils::initialize()) {
            std::cerr << "Failed to initialize crypto library\n";
            return 1;
        }

        std::filesystem::path key_dir = directory.empty() ? protocol::get_key_directory() : std::filesystem::path(directory);
        std::filesystem::path private_path = key_dir / DEFAULT_PRIVATE_KEY_FILE;

        std::error_code ec;
        if (!force && std::filesystem::exists(private_path, ec)) {
            std::cerr << "Key already exists at " << private_path.string() << " (use --force to replace)\n";
            return 1;
        }

        auto key = SigningKeyMaterial::generate(key_id);
        if (!key) {
            std::cerr << "Key generation failed\n";
            return 1;
        }
        if (!key->save(key_dir)) {
            std::cerr << "Failed to write key pair to " << key_dir.string() << "\n";
            return 1;
        }

        auto public_key = key->public_key();
        std::cout << "Generated signing key '" << key->key_id() << "'\n";
        std::cout << "  Private key: " << private_path.string() << "\n";
        std::cout << "  Public key:  " << (key_dir / DEFAULT_PUBLIC_KEY_FILE).string() << "\n";
        if (public_key) {
            std::cout << "  Fingerprint: " << public_key->fingerprint() << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
