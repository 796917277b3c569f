#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace keylight {
namespace discovery {

// One service instance seen on the network
struct ServiceAnnouncement {
    std::string instance_name;
    std::string source_address;  // Address the announcement was received from
    uint16_t port = 0;           // Advertised service port
    std::string host;            // Advertised host name (informational)
    std::string address;         // A record advertised for host, empty if none was included
};

using AnnouncementCallback = std::function<void(const ServiceAnnouncement &)>;

// Interface for the multicast service browser to enable mocking
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    // Begin browsing for service_type (e.g. "_elg._tcp"). The callback runs on the browser's own thread.
    virtual bool start(const std::string &service_type, AnnouncementCallback callback, std::string &error) = 0;

    // Idempotent. No callback runs after stop() returns. Must not be called from inside the callback.
    virtual void stop() = 0;

    virtual bool is_running() const = 0;
};

}  // namespace discovery
}  // namespace keylight
