/**
 * @file lad_provider.cpp
 * @brief Runs a LAD-A2A provider from a configuration file
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Serves the discovery resource, agent card and health resource, and
 * advertises the agent over mDNS until interrupted. Settings come from
 * the "server:" section of a YAML file plus LAD_* environment overrides.
 */

#include "lad/config.hpp"
#include "lad/provider_node.hpp"
#include "lad/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

using namespace lad;
using namespace lad::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config.yaml] [--status-interval <seconds>]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  config.yaml   Configuration file (optional, defaults plus LAD_* environment)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " lad-config.yaml\n";
    std::cout << "  LAD_NAME=\"Hotel Concierge\" LAD_CAPABILITIES=spa,dining " << program_name << "\n\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    int status_interval = 300;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--status-interval") == 0 && i + 1 < argc) {
            status_interval = std::atoi(argv[++i]);
        } else {
            config_path = argv[i];
        }
    }

    initialize_logging("", LogLevel::INFO);

    try {
        ServerConfig config = load_server_config(config_path);
        initialize_logging(config.log_file, config.level());

        ProviderNode node(config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (!node.start()) {
            std::cerr << "Failed to start provider\n";
            return 1;
        }

        std::cout << "Serving " << config.name << " at " << node.base_url()
                  << protocol::DISCOVERY_PATH << " (Ctrl+C to stop)\n";
        node.print_status();

        auto last_status = std::chrono::steady_clock::now();
        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (status_interval > 0 && now - last_status >= std::chrono::seconds(status_interval)) {
                node.print_status();
                last_status = now;
            }
        }

        std::cout << "\nShutting down provider...\n";
        node.stop();

    } catch (const std::exception& e) {
        log_critical(std::string("Fatal error: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
