/**
 * @file mdns_codec.cpp
 * @brief Implementation of the mDNS/DNS-SD message codec
 *
 * LAD-A2A - Local Agent Discovery for A2A
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lad/mdns_codec.hpp"
#include "lad/utilities.hpp"

#include <algorithm>
#include <set>

namespace lad {
namespace mdns {

namespace {

    constexpr size_t HEADER_SIZE = 12;
    constexpr size_t MAX_LABEL_LENGTH = 63;
    constexpr size_t MAX_NAME_LENGTH = 255;
    constexpr int MAX_COMPRESSION_JUMPS = 16;

    // ========================================================================
    // Writer
    // ========================================================================

    void put_u16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    void put_u32(std::vector<uint8_t>& out, uint32_t value) {
        put_u16(out, static_cast<uint16_t>(value >> 16));
        put_u16(out, static_cast<uint16_t>(value & 0xFFFF));
    }

    bool put_name(std::vector<uint8_t>& out, const std::string& name) {
        std::string trimmed = name;
        while (!trimmed.empty() && trimmed.back() == '.') {
            trimmed.pop_back();
        }
        if (trimmed.size() > MAX_NAME_LENGTH) {
            return false;
        }

        // Instance labels carry no dots, so splitting on '.' is exact
        for (const auto& label : utilities::split_string(trimmed, '.')) {
            if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
                return false;
            }
            out.push_back(static_cast<uint8_t>(label.size()));
            out.insert(out.end(), label.begin(), label.end());
        }
        out.push_back(0);
        return true;
    }

    void put_header(std::vector<uint8_t>& out, uint16_t id, uint16_t flags,
                    uint16_t questions, uint16_t answers, uint16_t additionals) {
        put_u16(out, id);
        put_u16(out, flags);
        put_u16(out, questions);
        put_u16(out, answers);
        put_u16(out, 0);
        put_u16(out, additionals);
    }

    bool put_record(std::vector<uint8_t>& out, const std::string& name, uint16_t type,
                    uint16_t klass, uint32_t ttl, const std::vector<uint8_t>& rdata) {
        if (!put_name(out, name) || rdata.size() > 0xFFFF) {
            return false;
        }
        put_u16(out, type);
        put_u16(out, klass);
        put_u32(out, ttl);
        put_u16(out, static_cast<uint16_t>(rdata.size()));
        out.insert(out.end(), rdata.begin(), rdata.end());
        return true;
    }

    std::optional<std::vector<uint8_t>> ipv4_rdata(const std::string& address) {
        auto octets = utilities::split_string(address, '.');
        if (octets.size() != 4) {
            return std::nullopt;
        }
        std::vector<uint8_t> rdata;
        for (const auto& octet : octets) {
            if (octet.empty() || octet.size() > 3 ||
                !std::all_of(octet.begin(), octet.end(), [](char c) { return c >= '0' && c <= '9'; })) {
                return std::nullopt;
            }
            int value = std::stoi(octet);
            if (value > 255) {
                return std::nullopt;
            }
            rdata.push_back(static_cast<uint8_t>(value));
        }
        return rdata;
    }

    // ========================================================================
    // Reader
    // ========================================================================

    class Reader {
    public:
        Reader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

        bool u16(uint16_t& value) {
            if (pos_ + 2 > size_) return false;
            value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
            pos_ += 2;
            return true;
        }

        bool u32(uint32_t& value) {
            uint16_t high = 0, low = 0;
            if (!u16(high) || !u16(low)) return false;
            value = (static_cast<uint32_t>(high) << 16) | low;
            return true;
        }

        bool name(std::string& result) {
            return read_name_at(pos_, result, true);
        }

        /// Read a name at an absolute offset without moving the cursor
        bool name_at(size_t offset, std::string& result) {
            size_t cursor = offset;
            return read_name_at(cursor, result, false);
        }

        bool skip(size_t count) {
            if (pos_ + count > size_) return false;
            pos_ += count;
            return true;
        }

        size_t position() const { return pos_; }
        const uint8_t* data() const { return data_; }

    private:
        bool read_name_at(size_t& cursor, std::string& result, bool advance_cursor) {
            result.clear();
            size_t pos = cursor;
            size_t resume = 0;
            bool jumped = false;
            int jumps = 0;

            while (true) {
                if (pos >= size_) return false;
                uint8_t len = data_[pos];

                if ((len & 0xC0) == 0xC0) {
                    if (pos + 1 >= size_ || ++jumps > MAX_COMPRESSION_JUMPS) return false;
                    size_t target = (static_cast<size_t>(len & 0x3F) << 8) | data_[pos + 1];
                    if (!jumped) {
                        resume = pos + 2;
                        jumped = true;
                    }
                    pos = target;
                    continue;
                }
                if ((len & 0xC0) != 0) {
                    return false;
                }

                pos += 1;
                if (len == 0) break;
                if (pos + len > size_) return false;
                result.append(reinterpret_cast<const char*>(data_ + pos), len);
                result.push_back('.');
                if (result.size() > MAX_NAME_LENGTH + 1) return false;
                pos += len;
            }

            if (result.empty()) {
                result = ".";
            }
            if (advance_cursor) {
                cursor = jumped ? resume : pos;
            }
            return true;
        }

        const uint8_t* data_;
        size_t size_;
        size_t pos_;
    };

    bool read_record(Reader& reader, ResourceRecord& record) {
        uint16_t klass = 0, rdlength = 0;
        if (!reader.name(record.name) || !reader.u16(record.type) || !reader.u16(klass) ||
            !reader.u32(record.ttl) || !reader.u16(rdlength)) {
            return false;
        }
        record.klass = static_cast<uint16_t>(klass & ~CACHE_FLUSH_BIT);

        size_t rdata_start = reader.position();
        const uint8_t* rdata = reader.data() + rdata_start;
        if (!reader.skip(rdlength)) {
            return false;
        }

        switch (record.type) {
            case TYPE_PTR:
                return reader.name_at(rdata_start, record.target);

            case TYPE_SRV: {
                if (rdlength < 7) return false;
                record.priority = static_cast<uint16_t>((rdata[0] << 8) | rdata[1]);
                record.weight = static_cast<uint16_t>((rdata[2] << 8) | rdata[3]);
                record.port = static_cast<uint16_t>((rdata[4] << 8) | rdata[5]);
                return reader.name_at(rdata_start + 6, record.target);
            }

            case TYPE_TXT: {
                size_t offset = 0;
                while (offset < rdlength) {
                    uint8_t len = rdata[offset++];
                    if (offset + len > rdlength) return false;
                    std::string entry(reinterpret_cast<const char*>(rdata + offset), len);
                    offset += len;
                    if (entry.empty()) continue;
                    auto eq = entry.find('=');
                    std::string key = utilities::to_lowercase(entry.substr(0, eq));
                    // First occurrence of a key wins (RFC 6763 section 6.4)
                    if (!key.empty() && record.txt.count(key) == 0) {
                        record.txt[key] = (eq == std::string::npos) ? "" : entry.substr(eq + 1);
                    }
                }
                return true;
            }

            case TYPE_A: {
                if (rdlength != 4) return false;
                record.address = std::to_string(rdata[0]) + "." + std::to_string(rdata[1]) + "."
                    + std::to_string(rdata[2]) + "." + std::to_string(rdata[3]);
                return true;
            }

            default:
                return true;
        }
    }

    bool read_records(Reader& reader, uint16_t count, std::vector<ResourceRecord>& out) {
        for (uint16_t i = 0; i < count; ++i) {
            ResourceRecord record;
            if (!read_record(reader, record)) {
                return false;
            }
            out.push_back(std::move(record));
        }
        return true;
    }
}

// ============================================================================
// Names
// ============================================================================

std::string canonical_name(const std::string& name) {
    std::string result = utilities::to_lowercase(name);
    while (!result.empty() && result.back() == '.') {
        result.pop_back();
    }
    result.push_back('.');
    return result;
}

std::string ServiceInstance::display_name() const {
    std::string instance = canonical_name(instance_name);
    std::string suffix = "." + canonical_name(service_type);
    if (instance.size() > suffix.size() && utilities::ends_with(instance, suffix)) {
        // canonical form only lowercases, so lengths line up with the original
        return instance_name.substr(0, instance.size() - suffix.size());
    }
    return instance_name;
}

// ============================================================================
// Encoding
// ============================================================================

std::optional<std::vector<uint8_t>> encode_txt(const std::map<std::string, std::string>& entries) {
    std::vector<uint8_t> rdata;
    for (const auto& [key, value] : entries) {
        std::string entry = key + "=" + value;
        if (key.empty() || entry.size() > 255) {
            return std::nullopt;
        }
        rdata.push_back(static_cast<uint8_t>(entry.size()));
        rdata.insert(rdata.end(), entry.begin(), entry.end());
    }
    if (rdata.empty()) {
        rdata.push_back(0);
    }
    return rdata;
}

std::vector<uint8_t> encode_query(const std::string& service_type, bool unicast_response, uint16_t id) {
    std::vector<uint8_t> out;
    out.reserve(64);
    put_header(out, id, 0, 1, 0, 0);
    put_name(out, service_type);
    put_u16(out, TYPE_PTR);
    put_u16(out, static_cast<uint16_t>(CLASS_IN | (unicast_response ? UNICAST_RESPONSE_BIT : 0)));
    return out;
}

std::optional<std::vector<uint8_t>> encode_announcement(const ServiceInstance& instance, uint32_t ttl, uint16_t id) {
    auto txt = encode_txt(instance.txt);
    if (!txt) {
        return std::nullopt;
    }

    std::vector<uint8_t> ptr_rdata;
    if (!put_name(ptr_rdata, instance.instance_name)) {
        return std::nullopt;
    }

    std::vector<uint8_t> srv_rdata;
    put_u16(srv_rdata, 0);
    put_u16(srv_rdata, 0);
    put_u16(srv_rdata, instance.port);
    if (!put_name(srv_rdata, instance.host_target)) {
        return std::nullopt;
    }

    std::vector<std::vector<uint8_t>> a_records;
    for (const auto& address : instance.addresses) {
        auto rdata = ipv4_rdata(address);
        if (rdata) {
            a_records.push_back(std::move(*rdata));
        }
    }

    const uint16_t unique_class = CLASS_IN | CACHE_FLUSH_BIT;
    std::vector<uint8_t> out;
    out.reserve(512);
    put_header(out, id, RESPONSE_FLAGS, 0, 3, static_cast<uint16_t>(a_records.size()));

    if (!put_record(out, instance.service_type, TYPE_PTR, CLASS_IN, ttl, ptr_rdata) ||
        !put_record(out, instance.instance_name, TYPE_SRV, unique_class, ttl, srv_rdata) ||
        !put_record(out, instance.instance_name, TYPE_TXT, unique_class, ttl, *txt)) {
        return std::nullopt;
    }
    for (const auto& rdata : a_records) {
        if (!put_record(out, instance.host_target, TYPE_A, unique_class, ttl, rdata)) {
            return std::nullopt;
        }
    }

    return out;
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<Message> decode_message(const uint8_t* data, size_t size) {
    if (data == nullptr || size < HEADER_SIZE) {
        return std::nullopt;
    }

    Reader reader(data, size);
    Message message;
    uint16_t qdcount = 0, ancount = 0, nscount = 0, arcount = 0;
    if (!reader.u16(message.id) || !reader.u16(message.flags) || !reader.u16(qdcount) ||
        !reader.u16(ancount) || !reader.u16(nscount) || !reader.u16(arcount)) {
        return std::nullopt;
    }

    for (uint16_t i = 0; i < qdcount; ++i) {
        Question question;
        uint16_t klass = 0;
        if (!reader.name(question.name) || !reader.u16(question.type) || !reader.u16(klass)) {
            return std::nullopt;
        }
        question.unicast_response = (klass & UNICAST_RESPONSE_BIT) != 0;
        question.klass = static_cast<uint16_t>(klass & ~UNICAST_RESPONSE_BIT);
        message.questions.push_back(std::move(question));
    }

    if (!read_records(reader, ancount, message.answers) ||
        !read_records(reader, nscount, message.authorities) ||
        !read_records(reader, arcount, message.additionals)) {
        return std::nullopt;
    }

    return message;
}

bool asks_for_service(const Message& message, const std::string& service_type) {
    if (message.is_response()) {
        return false;
    }
    std::string wanted = canonical_name(service_type);
    return std::any_of(message.questions.begin(), message.questions.end(),
        [&wanted](const Question& q) {
            return (q.type == TYPE_PTR || q.type == TYPE_ANY) && canonical_name(q.name) == wanted;
        });
}

std::vector<ServiceInstance> extract_instances(const Message& message, const std::string& service_type) {
    std::vector<const ResourceRecord*> records;
    for (const auto* section : {&message.answers, &message.additionals}) {
        for (const auto& record : *section) {
            records.push_back(&record);
        }
    }

    std::string wanted = canonical_name(service_type);
    std::vector<ServiceInstance> instances;
    std::set<std::string> seen;

    for (const auto* ptr : records) {
        if (ptr->type != TYPE_PTR || canonical_name(ptr->name) != wanted) {
            continue;
        }
        std::string instance_key = canonical_name(ptr->target);
        if (!seen.insert(instance_key).second) {
            continue;
        }

        ServiceInstance instance;
        instance.instance_name = ptr->target;
        instance.service_type = service_type;
        instance.ttl = ptr->ttl;

        bool has_srv = false;
        for (const auto* record : records) {
            if (canonical_name(record->name) != instance_key) {
                continue;
            }
            if (record->type == TYPE_SRV && !has_srv) {
                instance.host_target = record->target;
                instance.port = record->port;
                has_srv = true;
            } else if (record->type == TYPE_TXT && instance.txt.empty()) {
                instance.txt = record->txt;
            }
        }
        if (!has_srv) {
            continue;
        }

        std::string host_key = canonical_name(instance.host_target);
        for (const auto* record : records) {
            if (record->type == TYPE_A && canonical_name(record->name) == host_key &&
                std::find(instance.addresses.begin(), instance.addresses.end(), record->address) == instance.addresses.end()) {
                instance.addresses.push_back(record->address);
            }
        }

        instances.push_back(std::move(instance));
    }

    return instances;
}

} // namespace mdns
} // namespace lad
