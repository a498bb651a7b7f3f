/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for LAD-A2A
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <unistd.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <ifaddrs.h>

namespace lad {
namespace utilities {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> active_logger() {
        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            if (g_logger) {
                return g_logger;
            }
        }
        initialize_logging();
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // Rotating file sink, 10MB per file, 3 files max
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("lad", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;
        spdlog::set_default_logger(g_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void log(LogLevel level, const std::string& message) {
    auto logger = active_logger();
    if (!logger) {
        fprintf(stderr, "%s\n", message.c_str());
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    logger->debug(message); break;
        case LogLevel::INFO:     logger->info(message); break;
        case LogLevel::WARN:     logger->warn(message); break;
        case LogLevel::ERROR:    logger->error(message); break;
        case LogLevel::CRITICAL: logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_duration(uint64_t seconds) {
    std::ostringstream oss;
    if (seconds >= 3600) {
        oss << seconds / 3600 << "h ";
    }
    if (seconds >= 60) {
        oss << (seconds % 3600) / 60 << "m ";
    }
    oss << seconds % 60 << "s";
    return oss.str();
}

uint64_t current_unix_time() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            log_error("Failed to open file for reading: " + file_path);
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file(const std::string& file_path, const std::string& content, bool owner_only) {
    try {
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        {
            std::ofstream file(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                log_error("Failed to open file for writing: " + file_path);
                return false;
            }
            file << content;
            if (!file.good()) {
                log_error("Failed to write file: " + file_path);
                return false;
            }
        }

        if (owner_only) {
            std::filesystem::permissions(path,
                std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                std::filesystem::perm_options::replace);
        }
        return true;

    } catch (const std::exception& ex) {
        log_error("Exception writing file " + file_path + ": " + ex.what());
        return false;
    }
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.length() > str.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

std::string title_case(const std::string& token) {
    std::string result;
    result.reserve(token.size());
    bool word_start = true;

    for (char c : token) {
        if (c == '-' || c == '_') {
            result.push_back(' ');
            word_start = true;
            continue;
        }
        if (c == ' ') {
            result.push_back(c);
            word_start = true;
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        result.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
        word_start = false;
    }

    return result;
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

// ============================================================================
// ENVIRONMENT/NETWORK FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

bool has_env(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}

std::string get_hostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        return "unknown";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
}

std::vector<std::string> get_local_ipv4_addresses() {
    std::vector<std::string> addresses;

    struct ifaddrs *ifaddr, *ifa;
    if (getifaddrs(&ifaddr) == -1) {
        return addresses;
    }

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        char host[NI_MAXHOST];
        int result = getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in),
            host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);

        if (result == 0 && !starts_with(host, "127.")) {
            addresses.push_back(std::string(host));
        }
    }

    freeifaddrs(ifaddr);
    return addresses;
}

} // namespace utilities
} // namespace lad
