/**
 * @file utilities.hpp
 * @brief Common utility functions for LAD-A2A
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout LAD-A2A:
 * - Logging and error reporting
 * - Time formatting
 * - String manipulation
 * - File I/O helpers
 * - Network helpers
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace lad {
namespace utilities {

/**
 * @brief Log levels for LAD-A2A logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a configured level name ("DEBUG", "INFO", "WARNING", ...)
 * @param name Level name, case-insensitive
 * @return Parsed level, LogLevel::INFO for unknown names
 */
LogLevel parse_log_level(const std::string& name);

void log(LogLevel level, const std::string& message);
void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Format an uptime (e.g., "1h 2m 3s", "45s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Current Unix time in seconds
 */
uint64_t current_unix_time();

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @param owner_only Restrict permissions to the owner (0600)
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content, bool owner_only = false);

std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim_string(const std::string& str);
std::string to_lowercase(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Title-case a capability token ("room-service" -> "Room Service")
 */
std::string title_case(const std::string& token);

/**
 * @brief Join strings with a separator
 */
std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Check whether an environment variable is set
 */
bool has_env(const std::string& name);

/**
 * @brief Get hostname of current machine
 * @return Hostname or "unknown" if unable to determine
 */
std::string get_hostname();

/**
 * @brief Get non-loopback IPv4 addresses of current machine
 * @return Vector of dotted-quad strings
 */
std::vector<std::string> get_local_ipv4_addresses();

} // namespace utilities
} // namespace lad
