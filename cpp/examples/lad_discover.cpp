/**
 * @file lad_discover.cpp
 * @brief Discovers agents on the local network and asks for consent
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Runs one discovery (mDNS first, well-known fallback second), verifies
 * each fetched card and passes the agents through a consent gate. Without
 * --interactive the default policy approves verified agents only.
 */

#include "lad/config.hpp"
#include "lad/consent_gate.hpp"
#include "lad/consent_ledger.hpp"
#include "lad/discovery_orchestrator.hpp"
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace lad;
using namespace lad::utilities;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [config.yaml]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --url <base-url>      Well-known fallback base URL\n";
    std::cout << "  --no-mdns             Skip mDNS discovery\n";
    std::cout << "  --timeout <seconds>   mDNS timeout\n";
    std::cout << "  --require-verified    Drop unverified agents before consent\n";
    std::cout << "  --interactive         Ask before connecting to each agent\n";
    std::cout << "  --no-consent          Print all discovered agents\n";
    std::cout << "  --json                Print agents as JSON\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " --no-mdns --url http://192.168.1.20:8080\n\n";
}

// Interactive consent prompt
ConsentDecision prompt_for_consent(const ConsentRequest& request) {
    const auto& agent = request.agent;
    std::cout << "\n==================================================\n";
    std::cout << "AGENT DISCOVERED: " << agent.descriptor.name << "\n";
    std::cout << "==================================================\n";
    std::cout << "  Description:  " << agent.descriptor.description << "\n";
    std::cout << "  Role:         " << agent.descriptor.role << "\n";
    std::cout << "  Verified:     " << (request.verified ? "Yes" : "No") << " ("
              << (request.verification_method ? to_string(*request.verification_method) : "none") << ")\n";
    std::cout << "  Capabilities: " << join_strings(request.capabilities, ", ") << "\n";
    std::cout << "  Source:       " << to_string(agent.source) << "\n";

    if (!request.verified) {
        std::cout << "\n  WARNING: This agent is NOT verified!\n";
    }

    std::string line;
    while (std::cout << "\n  Connect to this agent? [y/n/skip]: " && std::getline(std::cin, line)) {
        std::string answer = to_lowercase(trim_string(line));
        if (answer == "y" || answer == "yes") return ConsentDecision::APPROVED;
        if (answer == "n" || answer == "no") return ConsentDecision::DENIED;
        if (answer == "s" || answer == "skip") return ConsentDecision::DEFERRED;
        std::cout << "  Please enter 'y' (yes), 'n' (no), or 'skip'\n";
    }
    return ConsentDecision::DEFERRED;
}

void print_result(const DiscoveryResult& result, bool as_json) {
    if (as_json) {
        nlohmann::json agents = nlohmann::json::array();
        for (const auto& agent : result.agents) {
            agents.push_back(agent.to_display());
        }
        nlohmann::json output;
        output["discovery_method"] = to_string(result.discovery_method);
        output["network"] = result.network_context.to_json();
        output["agents"] = agents;
        output["errors"] = result.errors;
        std::cout << output.dump(2) << "\n";
        return;
    }

    std::cout << "\n[Discovery Method] " << to_string(result.discovery_method) << "\n";
    std::cout << "[Agents Found] " << result.agents.size() << "\n";

    for (const auto& agent : result.agents) {
        std::cout << "\n  Agent: " << agent.descriptor.name << "\n";
        std::cout << "    Description: " << agent.descriptor.description << "\n";
        std::cout << "    Role: " << agent.descriptor.role << "\n";
        std::cout << "    AgentCard URL: " << agent.descriptor.agent_card_url << "\n";
        std::cout << "    Capabilities: " << join_strings(agent.descriptor.capabilities_preview, ", ") << "\n";
        std::cout << "    Source: " << to_string(agent.source) << "\n";
        std::cout << "    Verified: " << (agent.verified ? "true" : "false") << " ("
                  << (agent.verification_method ? to_string(*agent.verification_method) : "none") << ")\n";
        if (agent.verification_error) {
            std::cout << "    Verification Error: " << *agent.verification_error << "\n";
        }
        if (agent.card && agent.card->contains("skills") && (*agent.card)["skills"].is_array()) {
            std::vector<std::string> skills;
            for (const auto& skill : (*agent.card)["skills"]) {
                if (skill.is_object() && skill.contains("id") && skill["id"].is_string()) {
                    skills.push_back(skill["id"].get<std::string>());
                }
            }
            std::cout << "    Skills: " << join_strings(skills, ", ") << "\n";
        }
    }

    if (!result.errors.empty()) {
        std::cout << "\n[Errors]\n";
        for (const auto& error : result.errors) {
            std::cout << "  - " << error << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string fallback_url;
    bool no_mdns = false;
    double timeout = -1.0;
    bool require_verified = false;
    bool interactive = false;
    bool with_consent = true;
    bool as_json = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            fallback_url = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-mdns") == 0) {
            no_mdns = true;
        } else if (std::strcmp(argv[i], "--require-verified") == 0) {
            require_verified = true;
        } else if (std::strcmp(argv[i], "--interactive") == 0) {
            interactive = true;
        } else if (std::strcmp(argv[i], "--no-consent") == 0) {
            with_consent = false;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            as_json = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            config_path = argv[i];
        }
    }

    initialize_logging("", LogLevel::WARN);

    try {
        ClientConfig config = load_client_config(config_path);
        if (!fallback_url.empty()) config.fallback_url = fallback_url;
        if (no_mdns) config.try_mdns = false;
        if (timeout > 0.0) config.mdns_timeout = timeout;
        if (require_verified) config.require_verified = true;

        initialize_logging(config.log_file, config.level());

        DiscoveryOrchestrator orchestrator(OrchestratorOptions::from_config(config), make_identity_verifier(config));

        if (!with_consent) {
            print_result(orchestrator.discover(), as_json);
            return 0;
        }

        std::shared_ptr<ConsentLedger> ledger;
        if (config.remember_consent) {
            ledger = std::make_shared<ConsentLedger>(
                config.consent_db.value_or(protocol::get_consent_database_path().string()));
        }

        ConsentGateOptions gate_options;
        gate_options.require_verified = config.require_verified;
        ConsentGate gate(interactive ? ConsentFunction(prompt_for_consent) : ConsentGate::default_policy(),
                         gate_options, ledger);

        print_result(orchestrator.discover_with_consent(gate), as_json);

    } catch (const std::exception& e) {
        log_critical(std::string("Fatal error: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
