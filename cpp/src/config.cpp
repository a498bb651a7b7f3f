/**
 * @file config.cpp
 * @brief Implementation of YAML and environment configuration loading
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/config.hpp"
#include "lad/utilities.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <limits>
#include <set>
#include <stdexcept>

namespace lad {

using namespace lad::utilities;

namespace {

    // ========================================================================
    // Field tables
    // ========================================================================

    template<typename Visitor>
    void visit_fields(ServerConfig& c, Visitor&& v) {
        v("name", c.name);
        v("description", c.description);
        v("role", c.role);
        v("capabilities", c.capabilities);
        v("version", c.version);
        v("did", c.did);
        v("host", c.host);
        v("port", c.port);
        v("public_host", c.public_host);
        v("network_ssid", c.network_ssid);
        v("network_realm", c.network_realm);
        v("enable_mdns", c.enable_mdns);
        v("tls_enabled", c.tls_enabled);
        v("tls_certfile", c.tls_certfile);
        v("tls_keyfile", c.tls_keyfile);
        v("signing_enabled", c.signing_enabled);
        v("signing_key", c.signing_key);
        v("signing_key_id", c.signing_key_id);
        v("require_signing", c.require_signing);
        v("auth_method", c.auth_method);
        v("auth_token_url", c.auth_token_url);
        v("auth_authorization_url", c.auth_authorization_url);
        v("auth_scopes", c.auth_scopes);
        v("auth_issuer", c.auth_issuer);
        v("auth_jwks_uri", c.auth_jwks_uri);
        v("auth_client_id", c.auth_client_id);
        v("auth_api_key_header", c.auth_api_key_header);
        v("auth_docs_url", c.auth_docs_url);
        v("log_level", c.log_level);
        v("log_file", c.log_file);
    }

    template<typename Visitor>
    void visit_fields(ClientConfig& c, Visitor&& v) {
        v("mdns_timeout", c.mdns_timeout);
        v("http_timeout", c.http_timeout);
        v("deadline", c.deadline);
        v("fallback_url", c.fallback_url);
        v("try_mdns", c.try_mdns);
        v("stop_at_first_result", c.stop_at_first_result);
        v("mdns_address", c.mdns_address);
        v("mdns_port", c.mdns_port);
        v("prefer_https", c.prefer_https);
        v("fetch_cards", c.fetch_cards);
        v("merge_fallback_results", c.merge_fallback_results);
        v("verify_tls", c.verify_tls);
        v("ca_bundle", c.ca_bundle);
        v("signing_public_key", c.signing_public_key);
        v("signing_key_id", c.signing_key_id);
        v("expected_realm", c.expected_realm);
        v("require_verified", c.require_verified);
        v("remember_consent", c.remember_consent);
        v("consent_db", c.consent_db);
        v("log_level", c.log_level);
        v("log_file", c.log_file);
    }

    // ========================================================================
    // YAML values
    // ========================================================================

    std::vector<std::string> split_list(const std::string& text) {
        std::vector<std::string> items;
        for (const auto& part : split_string(text, ',')) {
            std::string item = trim_string(part);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    void assign_yaml(const YAML::Node& node, std::string& field) {
        field = node.IsNull() ? "" : node.as<std::string>();
    }

    void assign_yaml(const YAML::Node& node, std::optional<std::string>& field) {
        if (node.IsNull()) {
            field.reset();
        } else {
            field = node.as<std::string>();
        }
    }

    void assign_yaml(const YAML::Node& node, bool& field) {
        field = node.as<bool>();
    }

    void assign_yaml(const YAML::Node& node, uint16_t& field) {
        int value = node.as<int>();
        if (value < 0 || value > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("port out of range: " + std::to_string(value));
        }
        field = static_cast<uint16_t>(value);
    }

    void assign_yaml(const YAML::Node& node, double& field) {
        field = node.as<double>();
    }

    void assign_yaml(const YAML::Node& node, std::vector<std::string>& field) {
        if (node.IsNull()) {
            field.clear();
        } else if (node.IsSequence()) {
            field = node.as<std::vector<std::string>>();
        } else {
            field = split_list(node.as<std::string>());
        }
    }

    // ========================================================================
    // Environment values
    // ========================================================================

    void assign_env(const std::string& value, std::string& field) {
        field = value;
    }

    void assign_env(const std::string& value, std::optional<std::string>& field) {
        if (value.empty()) {
            field.reset();
        } else {
            field = value;
        }
    }

    void assign_env(const std::string& value, bool& field) {
        std::string lowered = to_lowercase(trim_string(value));
        field = lowered == "true" || lowered == "1" || lowered == "yes";
    }

    void assign_env(const std::string& value, uint16_t& field) {
        unsigned long parsed = std::stoul(value);
        if (parsed > std::numeric_limits<uint16_t>::max()) {
            throw std::out_of_range("port out of range");
        }
        field = static_cast<uint16_t>(parsed);
    }

    void assign_env(const std::string& value, double& field) {
        field = std::stod(value);
    }

    void assign_env(const std::string& value, std::vector<std::string>& field) {
        field = split_list(value);
    }

    std::string to_uppercase(const std::string& str) {
        std::string result = str;
        for (auto& c : result) {
            if (c >= 'a' && c <= 'z') {
                c = static_cast<char>(c - 'a' + 'A');
            }
        }
        return result;
    }

    // ========================================================================
    // Loading
    // ========================================================================

    /// Mapping holding the settings, or a null node when there is no file
    YAML::Node load_section(const std::string& path, const std::string& section) {
        if (path.empty()) {
            return YAML::Node();
        }

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            log_warn("Config: File not found: " + path + ", using defaults");
            return YAML::Node();
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Malformed configuration file " + path + ": " + e.what());
        }

        if (root.IsNull()) {
            return root;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("Configuration file " + path + " is not a mapping");
        }

        YAML::Node nested = root[section];
        if (nested && nested.IsMap()) {
            return nested;
        }
        return root;
    }

    template<typename Config>
    Config load_config(const std::string& path, const std::string& env_prefix, const std::string& section) {
        Config config;

        YAML::Node node = load_section(path, section);
        if (node && node.IsMap()) {
            std::set<std::string> known;
            visit_fields(config, [&](const char* key, auto& field) {
                known.insert(key);
                YAML::Node value = node[key];
                if (!value) {
                    return;
                }
                try {
                    assign_yaml(value, field);
                } catch (const YAML::Exception& e) {
                    throw std::runtime_error("Invalid value for '" + std::string(key) + "' in " + path + ": " + e.what());
                }
            });

            for (const auto& entry : node) {
                std::string key = entry.first.as<std::string>();
                if (known.count(key) == 0 && key != "server" && key != "client") {
                    log_debug("Config: Ignoring unknown key '" + key + "'");
                }
            }
            log_info("Config: Loaded " + section + " settings from " + path);
        }

        visit_fields(config, [&](const char* key, auto& field) {
            std::string variable = env_prefix + to_uppercase(key);
            if (!has_env(variable)) {
                return;
            }
            try {
                assign_env(get_env(variable), field);
            } catch (const std::logic_error&) {
                // std::stoul / std::stod report bad input as invalid_argument or out_of_range
                throw std::runtime_error("Invalid value for " + variable + ": " + get_env(variable));
            }
            log_debug("Config: " + variable + " overrides " + key);
        });

        return config;
    }

    std::optional<std::string> non_empty(const std::optional<std::string>& value) {
        if (value && !trim_string(*value).empty()) {
            return value;
        }
        return std::nullopt;
    }
}

// ============================================================================
// ServerConfig
// ============================================================================

NetworkContext ServerConfig::network() const {
    NetworkContext network;
    network.ssid = non_empty(network_ssid);
    network.realm = non_empty(network_realm);
    return network;
}

AgentProfile ServerConfig::to_agent_profile() const {
    auto method = auth_method_from_string(auth_method);
    if (!method) {
        throw std::invalid_argument("Unknown auth_method: " + auth_method);
    }

    AgentProfile profile;
    profile.name = name;
    profile.description = description;
    profile.role = role;
    profile.capabilities = capabilities;
    profile.version = version;
    profile.identity_reference = non_empty(did);

    profile.auth.method = *method;
    profile.auth.authorization_url = non_empty(auth_authorization_url);
    profile.auth.token_url = non_empty(auth_token_url);
    profile.auth.scopes = auth_scopes;
    profile.auth.client_id = non_empty(auth_client_id);
    profile.auth.issuer = non_empty(auth_issuer);
    profile.auth.jwks_uri = non_empty(auth_jwks_uri);
    profile.auth.api_key_header = non_empty(auth_api_key_header);
    profile.auth.documentation_url = non_empty(auth_docs_url);
    return profile;
}

EndpointServiceOptions ServerConfig::to_endpoint_options() const {
    EndpointServiceOptions options;
    options.bind_address = host;
    options.port = port;
    if (auto configured = non_empty(public_host)) {
        options.public_host = *configured;
    }
    options.network = network();
    options.tls_enabled = tls_enabled;
    options.tls_certfile = tls_certfile;
    options.tls_keyfile = tls_keyfile;
    options.mdns_enabled = enable_mdns;
    return options;
}

// ============================================================================
// Loading
// ============================================================================

ServerConfig load_server_config(const std::string& path, const std::string& env_prefix) {
    return load_config<ServerConfig>(path, env_prefix, "server");
}

ClientConfig load_client_config(const std::string& path, const std::string& env_prefix) {
    return load_config<ClientConfig>(path, env_prefix, "client");
}

// ============================================================================
// Example File
// ============================================================================

std::string example_config() {
    return R"(# LAD-A2A configuration
# Every key can be overridden from the environment as LAD_<KEY>,
# e.g. LAD_PORT=9000 or LAD_CAPABILITIES=info,booking

server:
  # Agent identity
  name: "My Agent"
  description: "LAD-A2A discovery agent"
  role: "service"
  capabilities:
    - info
    - service
  version: "1.0.0"
  # did: "did:web:agent.example.com"

  # Network
  host: "0.0.0.0"
  port: 8080
  # public_host: "192.168.1.20"
  network_ssid: "MyNetwork-Guest"
  network_realm: "example.com"

  # mDNS advertisement
  enable_mdns: true

  # TLS
  tls_enabled: false
  tls_certfile: "/path/to/cert.pem"
  tls_keyfile: "/path/to/key.pem"

  # Agent card signing
  signing_enabled: false
  signing_key: "/path/to/private.pem"
  signing_key_id: "key-v1"
  require_signing: false

  # Authentication: none, oauth2, oidc, api_key, bearer
  auth_method: "none"
  # auth_token_url: "https://auth.example.com/oauth/token"
  # auth_authorization_url: "https://auth.example.com/oauth/authorize"
  # auth_scopes:
  #   - "agent:read"
  #   - "agent:write"
  # auth_issuer: "https://auth.example.com"
  # auth_jwks_uri: "https://auth.example.com/.well-known/jwks.json"
  # auth_client_id: "public-client-id"
  # auth_api_key_header: "X-API-Key"
  # auth_docs_url: "https://docs.example.com/auth"

  # Logging
  log_level: "INFO"
  # log_file: "/var/log/lad/provider.log"

client:
  # Discovery
  mdns_timeout: 3.0
  http_timeout: 10.0
  deadline: 30.0
  fallback_url: "https://agent.example.com"
  try_mdns: true
  stop_at_first_result: true
  prefer_https: false
  fetch_cards: true

  # TLS verification
  verify_tls: true
  ca_bundle: null

  # Signature verification
  signing_public_key: "/path/to/public.pem"
  signing_key_id: "key-v1"
  # expected_realm: "example.com"

  # Behavior
  require_verified: false
  remember_consent: false
  # consent_db: "/path/to/consent.db"

  # Logging
  log_level: "INFO"
)";
}

bool generate_example_config(const std::string& path) {
    if (!write_file(path, example_config())) {
        log_error("Config: Failed to write example config to " + path);
        return false;
    }
    log_info("Config: Generated example config at " + path);
    return true;
}

} // namespace lad
