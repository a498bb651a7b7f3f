/**
 * @file test_protocol_constants.cpp
 * @brief Unit tests for protocol constants, validation and utilities
 *
 * Tests:
 * - Well-known paths, service type and defaults
 * - Agent name and resource path validation
 * - Absolute URL checks and domain normalization
 * - Data directory selection through LAD_DATA_DIR
 * - String and formatting helpers
 */

#include <gtest/gtest.h>
#include "lad/protocol_constants.hpp"
#include "lad/utilities.hpp"
#include <cstdlib>
#include <filesystem>

using namespace lad;
using namespace lad::protocol;
namespace fs = std::filesystem;

// ============================================================================
// Constant Tests
// ============================================================================

TEST(ProtocolConstantsTest, WellKnownPaths) {
    EXPECT_STREQ(DISCOVERY_PATH, "/.well-known/lad/agents");
    EXPECT_STREQ(AGENT_CARD_PATH, "/.well-known/agent.json");
    EXPECT_STREQ(SERVICE_TYPE, "_a2a._tcp.local.");
}

TEST(ProtocolConstantsTest, DefaultTimeouts) {
    EXPECT_EQ(DEFAULT_BROADCAST_TIMEOUT, std::chrono::seconds(3));
    EXPECT_EQ(DEFAULT_HTTP_TIMEOUT, std::chrono::seconds(10));
    EXPECT_EQ(MAX_CONCURRENT_CARD_FETCHES, 4u);
}

TEST(ProtocolConstantsTest, MdnsEndpoint) {
    EXPECT_STREQ(MDNS_MULTICAST_ADDRESS, "224.0.0.251");
    EXPECT_EQ(MDNS_PORT, 5353);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(ProtocolValidationTest, ValidAgentNames) {
    EXPECT_TRUE(validate_agent_name("Hotel Concierge"));
    EXPECT_TRUE(validate_agent_name("printer-2F"));
    EXPECT_TRUE(validate_agent_name(std::string(MAX_AGENT_NAME_LENGTH, 'a')));
}

TEST(ProtocolValidationTest, InvalidAgentNames) {
    EXPECT_FALSE(validate_agent_name(""));
    EXPECT_FALSE(validate_agent_name("hotel.concierge"));
    EXPECT_FALSE(validate_agent_name("tab\there"));
    EXPECT_FALSE(validate_agent_name(std::string(MAX_AGENT_NAME_LENGTH + 1, 'a')));
}

TEST(ProtocolValidationTest, ResourcePaths) {
    EXPECT_TRUE(validate_resource_path("/.well-known/agent.json"));
    EXPECT_TRUE(validate_resource_path("/agents/spa/agent.json"));

    EXPECT_FALSE(validate_resource_path(""));
    EXPECT_FALSE(validate_resource_path("agent.json"));
    EXPECT_FALSE(validate_resource_path("/../etc/passwd"));
    EXPECT_FALSE(validate_resource_path("/with space"));
}

TEST(ProtocolValidationTest, AbsoluteHttpUrls) {
    EXPECT_TRUE(is_absolute_http_url("http://192.168.1.20:8080/.well-known/agent.json"));
    EXPECT_TRUE(is_absolute_http_url("https://concierge.hotel.example"));
    EXPECT_TRUE(is_absolute_http_url("HTTPS://hotel.example/agent.json"));

    EXPECT_FALSE(is_absolute_http_url("/.well-known/agent.json"));
    EXPECT_FALSE(is_absolute_http_url("ftp://hotel.example/agent.json"));
    EXPECT_FALSE(is_absolute_http_url("http://"));
    EXPECT_FALSE(is_absolute_http_url("http://host with space/"));
}

TEST(ProtocolValidationTest, NormalizeDomain) {
    EXPECT_EQ(normalize_domain("Hotel.Example."), "hotel.example");
    EXPECT_EQ(normalize_domain(" hotel.example "), "hotel.example");
    EXPECT_EQ(normalize_domain(""), "");
}

// ============================================================================
// Data Directory Tests
// ============================================================================

TEST(ProtocolDataDirectoryTest, UsesEnvironmentOverride) {
    fs::path dir = fs::temp_directory_path() / "lad_data_dir_test";
    fs::remove_all(dir);
    setenv("LAD_DATA_DIR", dir.c_str(), 1);

    EXPECT_EQ(get_data_directory(), dir);
    EXPECT_TRUE(fs::exists(dir));
    EXPECT_EQ(get_key_directory(), dir / "keys");
    EXPECT_TRUE(fs::exists(dir / "keys"));
    EXPECT_EQ(get_consent_database_path(), dir / "consent.db");

    unsetenv("LAD_DATA_DIR");
    fs::remove_all(dir);
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST(UtilitiesTest, TitleCase) {
    EXPECT_EQ(utilities::title_case("room-service"), "Room Service");
    EXPECT_EQ(utilities::title_case("spa"), "Spa");
    EXPECT_EQ(utilities::title_case("late_checkout"), "Late Checkout");
}

TEST(UtilitiesTest, SplitAndJoin) {
    auto parts = utilities::split_string("spa,dining,,pool", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[1], "dining");
    EXPECT_EQ(parts[2], "");

    EXPECT_EQ(utilities::join_strings({"a", "b", "c"}, "; "), "a; b; c");
    EXPECT_EQ(utilities::join_strings({}, ", "), "");
}

TEST(UtilitiesTest, TrimAndCase) {
    EXPECT_EQ(utilities::trim_string("  token \n"), "token");
    EXPECT_EQ(utilities::trim_string("   "), "");
    EXPECT_EQ(utilities::to_lowercase("Application/JOSE"), "application/jose");
    EXPECT_TRUE(utilities::starts_with("https://x", "https://"));
    EXPECT_TRUE(utilities::ends_with("lobby.hotel.example", ".hotel.example"));
    EXPECT_FALSE(utilities::ends_with("a", "abc"));
}

TEST(UtilitiesTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("DEBUG"), utilities::LogLevel::DEBUG);
    EXPECT_EQ(utilities::parse_log_level("warning"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level("WARN"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level("Error"), utilities::LogLevel::ERROR);
    EXPECT_EQ(utilities::parse_log_level("CRITICAL"), utilities::LogLevel::CRITICAL);
    EXPECT_EQ(utilities::parse_log_level("verbose"), utilities::LogLevel::INFO);
}

TEST(UtilitiesTest, FormatDuration) {
    EXPECT_EQ(utilities::format_duration(0), "0s");
    EXPECT_EQ(utilities::format_duration(45), "45s");
    EXPECT_EQ(utilities::format_duration(125), "2m 5s");
    EXPECT_EQ(utilities::format_duration(3723), "1h 2m 3s");
}

TEST(UtilitiesTest, FormatTimestamp) {
    EXPECT_EQ(utilities::format_timestamp(0), "1970-01-01T00:00:00Z");
}

TEST(UtilitiesTest, WriteAndReadFile) {
    fs::path path = fs::temp_directory_path() / "lad_utilities_test.txt";
    ASSERT_TRUE(utilities::write_file(path.string(), "hello", true));

    auto content = utilities::read_file(path.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "hello");

    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & fs::perms::group_read, fs::perms::none);

    fs::remove(path);
    EXPECT_FALSE(utilities::read_file(path.string()).has_value());
}
