/**
 * @file protocol_constants.cpp
 * @brief Data directories and validation helpers for LAD-A2A
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lad/protocol_constants.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>

namespace lad {
namespace protocol {

// ============================================================================
// Data Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("LAD_DATA_DIR");

    std::filesystem::path data_dir;
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        data_dir = env_data_dir;
    } else {
        const char* home = std::getenv("HOME");
        data_dir = (home != nullptr && std::strlen(home) > 0)
            ? std::filesystem::path(home) / ".lad"
            : std::filesystem::temp_directory_path() / "lad";
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::filesystem::path get_key_directory() {
    std::filesystem::path key_dir = get_data_directory() / "keys";

    if (!std::filesystem::exists(key_dir)) {
        std::filesystem::create_directories(key_dir);
    }

    return key_dir;
}

std::filesystem::path get_consent_database_path() {
    return get_data_directory() / "consent.db";
}

// ============================================================================
// Validation
// ============================================================================

bool validate_agent_name(const std::string& name) {
    if (name.empty() || name.length() > MAX_AGENT_NAME_LENGTH) {
        return false;
    }

    // Instance labels may carry spaces and punctuation but no dots or control bytes
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '.' || std::iscntrl(uc)) {
            return false;
        }
    }

    return true;
}

bool validate_resource_path(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        return false;
    }
    if (path.find("..") != std::string::npos) {
        return false;
    }
    return std::none_of(path.begin(), path.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c)); });
}

bool is_absolute_http_url(const std::string& url) {
    static const std::regex url_regex(R"(^(https?)://([^/:?#\s]+|\[[0-9a-fA-F:.]+\])(:\d{1,5})?([/?#][^\s]*)?$)",
        std::regex::icase);
    return std::regex_match(url, url_regex);
}

std::string normalize_domain(const std::string& domain) {
    std::string result;
    result.reserve(domain.size());

    for (char c : domain) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    while (!result.empty() && result.back() == '.') {
        result.pop_back();
    }

    return result;
}

} // namespace protocol
} // namespace lad
