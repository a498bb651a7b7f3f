/**
 * @file test_mdns_codec.cpp
 * @brief Unit tests for the mDNS/DNS-SD codec
 *
 * Tests:
 * - PTR query encoding and recognition
 * - Announcement encoding into service instances
 * - TXT record limits
 * - Name compression and malformed input
 */

#include <gtest/gtest.h>
#include "lad/mdns_codec.hpp"
#include "lad/protocol_constants.hpp"

using namespace lad;
using namespace lad::mdns;

namespace {

    ServiceInstance make_instance() {
        ServiceInstance instance;
        instance.instance_name = "Hotel Concierge._a2a._tcp.local.";
        instance.service_type = protocol::SERVICE_TYPE;
        instance.host_target = "concierge-host.local.";
        instance.port = 8080;
        instance.addresses = {"192.168.1.20"};
        instance.txt = {
            {"path", "/.well-known/agent.json"},
            {"v", "1"},
            {"org", "hotel.example"}
        };
        return instance;
    }
}

// ============================================================================
// Name Tests
// ============================================================================

TEST(MdnsNameTest, CanonicalName) {
    EXPECT_EQ(canonical_name("_A2A._TCP.Local"), "_a2a._tcp.local.");
    EXPECT_EQ(canonical_name("_a2a._tcp.local.."), "_a2a._tcp.local.");
}

TEST(MdnsNameTest, DisplayName) {
    ServiceInstance instance = make_instance();
    EXPECT_EQ(instance.display_name(), "Hotel Concierge");

    instance.instance_name = "unrelated.local.";
    EXPECT_EQ(instance.display_name(), "unrelated.local.");
}

// ============================================================================
// Query Tests
// ============================================================================

TEST(MdnsQueryTest, EncodeAndRecognize) {
    auto bytes = encode_query(protocol::SERVICE_TYPE, true, 42);
    auto message = decode_message(bytes.data(), bytes.size());

    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->id, 42);
    EXPECT_FALSE(message->is_response());
    ASSERT_EQ(message->questions.size(), 1u);
    EXPECT_EQ(message->questions[0].name, "_a2a._tcp.local.");
    EXPECT_EQ(message->questions[0].type, TYPE_PTR);
    EXPECT_TRUE(message->questions[0].unicast_response);
    EXPECT_EQ(message->questions[0].klass, CLASS_IN);

    EXPECT_TRUE(asks_for_service(*message, protocol::SERVICE_TYPE));
    EXPECT_FALSE(asks_for_service(*message, "_http._tcp.local."));
}

// ============================================================================
// Announcement Tests
// ============================================================================

TEST(MdnsAnnouncementTest, ExtractsInstance) {
    auto bytes = encode_announcement(make_instance(), 120, 7);
    ASSERT_TRUE(bytes.has_value());

    auto message = decode_message(bytes->data(), bytes->size());
    ASSERT_TRUE(message.has_value());
    EXPECT_TRUE(message->is_response());
    EXPECT_EQ(message->id, 7);
    EXPECT_FALSE(asks_for_service(*message, protocol::SERVICE_TYPE));

    auto instances = extract_instances(*message, protocol::SERVICE_TYPE);
    ASSERT_EQ(instances.size(), 1u);

    const auto& instance = instances.front();
    EXPECT_EQ(instance.display_name(), "Hotel Concierge");
    EXPECT_EQ(instance.host_target, "concierge-host.local.");
    EXPECT_EQ(instance.port, 8080);
    EXPECT_EQ(instance.addresses, (std::vector<std::string>{"192.168.1.20"}));
    EXPECT_EQ(instance.txt.at("path"), "/.well-known/agent.json");
    EXPECT_EQ(instance.txt.at("org"), "hotel.example");
    EXPECT_EQ(instance.ttl, 120u);
}

TEST(MdnsAnnouncementTest, GoodbyeHasZeroTtl) {
    auto bytes = encode_announcement(make_instance(), 0);
    ASSERT_TRUE(bytes.has_value());

    auto message = decode_message(bytes->data(), bytes->size());
    ASSERT_TRUE(message.has_value());
    auto instances = extract_instances(*message, protocol::SERVICE_TYPE);
    ASSERT_EQ(instances.size(), 1u);
    EXPECT_EQ(instances.front().ttl, 0u);
}

TEST(MdnsAnnouncementTest, OtherServiceTypeIgnored) {
    auto bytes = encode_announcement(make_instance(), 120);
    ASSERT_TRUE(bytes.has_value());

    auto message = decode_message(bytes->data(), bytes->size());
    ASSERT_TRUE(message.has_value());
    EXPECT_TRUE(extract_instances(*message, "_ipp._tcp.local.").empty());
}

TEST(MdnsAnnouncementTest, RejectsOversizedLabel) {
    ServiceInstance instance = make_instance();
    instance.instance_name = std::string(64, 'a') + "._a2a._tcp.local.";
    EXPECT_FALSE(encode_announcement(instance, 120).has_value());
}

// ============================================================================
// TXT Tests
// ============================================================================

TEST(MdnsTxtTest, EmptyMapIsSingleZeroByte) {
    auto rdata = encode_txt({});
    ASSERT_TRUE(rdata.has_value());
    EXPECT_EQ(*rdata, (std::vector<uint8_t>{0}));
}

TEST(MdnsTxtTest, EntryLayout) {
    auto rdata = encode_txt({{"v", "1"}});
    ASSERT_TRUE(rdata.has_value());
    EXPECT_EQ(*rdata, (std::vector<uint8_t>{3, 'v', '=', '1'}));
}

TEST(MdnsTxtTest, RejectsInvalidEntries) {
    EXPECT_FALSE(encode_txt({{"", "value"}}).has_value());
    EXPECT_FALSE(encode_txt({{"k", std::string(254, 'x')}}).has_value());
    EXPECT_TRUE(encode_txt({{"k", std::string(253, 'x')}}).has_value());
}

// ============================================================================
// Decoding Tests
// ============================================================================

TEST(MdnsDecodeTest, RejectsTruncatedInput) {
    auto bytes = encode_query(protocol::SERVICE_TYPE, false);
    EXPECT_FALSE(decode_message(bytes.data(), 5).has_value());
    EXPECT_FALSE(decode_message(bytes.data(), bytes.size() - 1).has_value());
    EXPECT_FALSE(decode_message(nullptr, 0).has_value());
}

TEST(MdnsDecodeTest, FollowsCompressionPointer) {
    // One question "_a2a._tcp.local." and a second one pointing at offset 12
    std::vector<uint8_t> bytes = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        4, '_', 'a', '2', 'a', 4, '_', 't', 'c', 'p', 5, 'l', 'o', 'c', 'a', 'l', 0,
        0x00, 0x0C, 0x00, 0x01,
        0xC0, 0x0C,
        0x00, 0xFF, 0x00, 0x01
    };

    auto message = decode_message(bytes.data(), bytes.size());
    ASSERT_TRUE(message.has_value());
    ASSERT_EQ(message->questions.size(), 2u);
    EXPECT_EQ(message->questions[1].name, "_a2a._tcp.local.");
    EXPECT_EQ(message->questions[1].type, TYPE_ANY);
}

TEST(MdnsDecodeTest, RejectsPointerLoop) {
    std::vector<uint8_t> bytes = {
        0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xC0, 0x0C,
        0x00, 0x0C, 0x00, 0x01
    };
    EXPECT_FALSE(decode_message(bytes.data(), bytes.size()).has_value());
}
