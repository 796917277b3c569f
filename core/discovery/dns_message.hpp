#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keylight {
namespace discovery {

// Resource record types used by DNS-SD browsing
constexpr uint16_t kDnsTypeA = 1;
constexpr uint16_t kDnsTypePtr = 12;
constexpr uint16_t kDnsTypeTxt = 16;
constexpr uint16_t kDnsTypeAaaa = 28;
constexpr uint16_t kDnsTypeSrv = 33;
constexpr uint16_t kDnsClassIn = 1;

// Header flag marking a response (QR bit)
constexpr uint16_t kDnsFlagResponse = 0x8000;

// Decoded resource record. Only the fields relevant to the record type are set.
struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rrclass = 0;  // cache-flush bit already masked off
    uint32_t ttl = 0;

    std::string target;   // PTR: instance name, SRV: host name
    uint16_t port = 0;    // SRV
    std::string address;  // A: dotted quad
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsRecord> records;  // answer + authority + additional sections

    bool is_response() const { return (flags & kDnsFlagResponse) != 0; }
};

// One resolved service instance from a response
struct ServiceInstance {
    std::string instance_name;  // e.g. "Elgato Key Light 1A2B._elg._tcp.local"
    std::string host;           // SRV target, e.g. "elgato-key-light-1a2b.local"
    uint16_t port = 0;          // SRV port
    std::string address;        // A record for host, empty if not included
};

// Builds a one-question PTR query for service_name (e.g. "_elg._tcp.local")
std::vector<uint8_t> build_ptr_query(const std::string &service_name);

// Parses a DNS message. Questions are skipped; unknown record types are kept with only the common fields.
bool parse_dns_message(const uint8_t *data, size_t len, DnsMessage &message, std::string &error);

// Joins PTR/SRV/A records for service_name into instances. Instances without an SRV record are omitted.
std::vector<ServiceInstance> extract_service_instances(const DnsMessage &message, const std::string &service_name);

// Case-insensitive DNS name comparison (trailing dots ignored)
bool dns_name_equals(const std::string &a, const std::string &b);

}  // namespace discovery
}  // namespace keylight
