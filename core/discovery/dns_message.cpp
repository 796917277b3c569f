#include "dns_message.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace keylight {
namespace discovery {

namespace {

constexpr size_t kHeaderSize = 12;
constexpr size_t kMaxNameLength = 255;
constexpr int kMaxPointerHops = 64;

std::string normalize_name(const std::string &name) {
    std::string out = name;
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with_label_suffix(const std::string &name, const std::string &suffix) {
    if (name.size() <= suffix.size() + 1) {
        return false;
    }
    return name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           name[name.size() - suffix.size() - 1] == '.';
}

class Reader {
public:
    Reader(const uint8_t *data, size_t len) : data_(data), len_(len) {}

    size_t offset() const { return offset_; }
    void seek(size_t offset) { offset_ = offset; }

    bool read_u8(uint8_t &out) {
        if (offset_ + 1 > len_) return false;
        out = data_[offset_++];
        return true;
    }

    bool read_u16(uint16_t &out) {
        if (offset_ + 2 > len_) return false;
        out = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return true;
    }

    bool read_u32(uint32_t &out) {
        if (offset_ + 4 > len_) return false;
        out = (static_cast<uint32_t>(data_[offset_]) << 24) | (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
              (static_cast<uint32_t>(data_[offset_ + 2]) << 8) | static_cast<uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return true;
    }

    // Reads a possibly-compressed name starting at the current offset
    bool read_name(std::string &out, std::string &error) {
        out.clear();
        size_t pos = offset_;
        bool jumped = false;
        int hops = 0;

        while (true) {
            if (pos >= len_) {
                error = "name runs past end of message";
                return false;
            }
            uint8_t label_len = data_[pos];

            if ((label_len & 0xC0) == 0xC0) {
                if (pos + 1 >= len_) {
                    error = "truncated compression pointer";
                    return false;
                }
                size_t target = (static_cast<size_t>(label_len & 0x3F) << 8) | data_[pos + 1];
                if (!jumped) {
                    offset_ = pos + 2;
                    jumped = true;
                }
                if (++hops > kMaxPointerHops || target >= len_) {
                    error = "invalid compression pointer";
                    return false;
                }
                pos = target;
                continue;
            }
            if ((label_len & 0xC0) != 0) {
                error = "unsupported label type";
                return false;
            }

            if (label_len == 0) {
                if (!jumped) {
                    offset_ = pos + 1;
                }
                return true;
            }

            if (pos + 1 + label_len > len_) {
                error = "label runs past end of message";
                return false;
            }
            if (!out.empty()) {
                out += '.';
            }
            out.append(reinterpret_cast<const char *>(data_ + pos + 1), label_len);
            if (out.size() > kMaxNameLength) {
                error = "name exceeds 255 bytes";
                return false;
            }
            pos += 1 + label_len;
        }
    }

private:
    const uint8_t *data_;
    size_t len_;
    size_t offset_ = 0;
};

void append_u16(std::vector<uint8_t> &out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

bool parse_record(Reader &reader, DnsRecord &record, std::string &error) {
    if (!reader.read_name(record.name, error)) {
        return false;
    }

    uint16_t rdlength = 0;
    if (!reader.read_u16(record.type) || !reader.read_u16(record.rrclass) || !reader.read_u32(record.ttl) ||
        !reader.read_u16(rdlength)) {
        error = "truncated resource record header";
        return false;
    }
    record.rrclass &= 0x7FFF;

    const size_t rdata_start = reader.offset();
    const size_t rdata_end = rdata_start + rdlength;

    switch (record.type) {
        case kDnsTypePtr:
            if (!reader.read_name(record.target, error)) {
                return false;
            }
            break;
        case kDnsTypeSrv: {
            uint16_t priority = 0;
            uint16_t weight = 0;
            if (!reader.read_u16(priority) || !reader.read_u16(weight) || !reader.read_u16(record.port)) {
                error = "truncated SRV record";
                return false;
            }
            if (!reader.read_name(record.target, error)) {
                return false;
            }
            break;
        }
        case kDnsTypeA: {
            if (rdlength != 4) {
                error = "A record with rdlength " + std::to_string(rdlength);
                return false;
            }
            std::string address;
            for (int i = 0; i < 4; ++i) {
                uint8_t octet = 0;
                if (!reader.read_u8(octet)) {
                    error = "truncated A record";
                    return false;
                }
                if (i > 0) {
                    address += '.';
                }
                address += std::to_string(octet);
            }
            record.address = address;
            break;
        }
        default:
            break;
    }

    if (reader.offset() > rdata_end) {
        error = "record data overruns rdlength";
        return false;
    }
    reader.seek(rdata_end);
    return true;
}

}  // namespace

bool dns_name_equals(const std::string &a, const std::string &b) { return normalize_name(a) == normalize_name(b); }

std::vector<uint8_t> build_ptr_query(const std::string &service_name) {
    std::vector<uint8_t> packet;
    packet.reserve(kHeaderSize + service_name.size() + 6);

    append_u16(packet, 0);  // id (always 0 for mDNS)
    append_u16(packet, 0);  // flags: standard query
    append_u16(packet, 1);  // qdcount
    append_u16(packet, 0);  // ancount
    append_u16(packet, 0);  // nscount
    append_u16(packet, 0);  // arcount

    size_t start = 0;
    std::string name = normalize_name(service_name);
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        size_t label_len = std::min<size_t>(dot - start, 63);
        if (label_len > 0) {
            packet.push_back(static_cast<uint8_t>(label_len));
            packet.insert(packet.end(), name.begin() + static_cast<std::ptrdiff_t>(start),
                          name.begin() + static_cast<std::ptrdiff_t>(start + label_len));
        }
        start = dot + 1;
    }
    packet.push_back(0);

    append_u16(packet, kDnsTypePtr);
    append_u16(packet, kDnsClassIn);
    return packet;
}

bool parse_dns_message(const uint8_t *data, size_t len, DnsMessage &message, std::string &error) {
    if (data == nullptr || len < kHeaderSize) {
        error = "message shorter than DNS header";
        return false;
    }

    Reader reader(data, len);
    uint16_t qdcount = 0, ancount = 0, nscount = 0, arcount = 0;
    DnsMessage parsed;
    // Header length was checked above
    reader.read_u16(parsed.id);
    reader.read_u16(parsed.flags);
    reader.read_u16(qdcount);
    reader.read_u16(ancount);
    reader.read_u16(nscount);
    reader.read_u16(arcount);

    for (uint16_t i = 0; i < qdcount; ++i) {
        std::string qname;
        uint16_t qtype = 0, qclass = 0;
        if (!reader.read_name(qname, error)) {
            return false;
        }
        if (!reader.read_u16(qtype) || !reader.read_u16(qclass)) {
            error = "truncated question";
            return false;
        }
    }

    const size_t record_count = static_cast<size_t>(ancount) + nscount + arcount;
    parsed.records.reserve(record_count);
    for (size_t i = 0; i < record_count; ++i) {
        DnsRecord record;
        if (!parse_record(reader, record, error)) {
            return false;
        }
        parsed.records.push_back(std::move(record));
    }

    message = std::move(parsed);
    return true;
}

std::vector<ServiceInstance> extract_service_instances(const DnsMessage &message, const std::string &service_name) {
    const std::string service = normalize_name(service_name);

    // Instance names in first-seen order
    std::vector<std::string> order;
    std::map<std::string, ServiceInstance> instances;
    std::map<std::string, std::string> host_addresses;

    auto note_instance = [&](const std::string &instance_name) {
        std::string key = normalize_name(instance_name);
        if (instances.find(key) == instances.end()) {
            ServiceInstance instance;
            instance.instance_name = instance_name;
            instances.emplace(key, instance);
            order.push_back(key);
        }
        return key;
    };

    for (const auto &record : message.records) {
        if (record.type == kDnsTypePtr && normalize_name(record.name) == service) {
            note_instance(record.target);
        } else if (record.type == kDnsTypeA) {
            host_addresses.emplace(normalize_name(record.name), record.address);
        }
    }

    std::map<std::string, bool> has_srv;
    for (const auto &record : message.records) {
        if (record.type != kDnsTypeSrv) {
            continue;
        }
        std::string key = normalize_name(record.name);
        if (instances.find(key) == instances.end()) {
            if (!ends_with_label_suffix(key, service)) {
                continue;
            }
            note_instance(record.name);
        }
        ServiceInstance &instance = instances[key];
        instance.host = record.target;
        instance.port = record.port;
        has_srv[key] = true;
    }

    std::vector<ServiceInstance> result;
    for (const auto &key : order) {
        if (!has_srv[key]) {
            continue;
        }
        ServiceInstance instance = instances[key];
        auto addr = host_addresses.find(normalize_name(instance.host));
        if (addr != host_addresses.end()) {
            instance.address = addr->second;
        }
        result.push_back(instance);
    }
    return result;
}

}  // namespace discovery
}  // namespace keylight
