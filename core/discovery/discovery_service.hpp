#ifndef KEYLIGHT_DISCOVERY_DISCOVERY_SERVICE_HPP
#define KEYLIGHT_DISCOVERY_DISCOVERY_SERVICE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "device/light_types.hpp"
#include "discovery/i_service_browser.hpp"
#include "registry/device_registry.hpp"

namespace keylight {
namespace discovery {

// What to do when the timer fires with 1..N-1 lights found
enum class PartialPolicy { ACCEPT, FAIL };

struct DiscoveryConfig {
    std::string addresses;                // Comma-separated static list; non-empty bypasses multicast
    int device_count = 1;                 // Target count for multicast discovery
    std::string service_type = "_elg._tcp";
    int timeout_ms = 5000;
    PartialPolicy partial_policy = PartialPolicy::ACCEPT;
};

struct DiscoveryResult {
    bool success = false;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;
    std::vector<device::DeviceEndpoint> endpoints;
};

// Splits "a, b,c" into trimmed entries. Fails if any entry is empty after trimming.
bool parse_address_list(const std::string &list, std::vector<std::string> &addresses, std::string &error);

std::optional<PartialPolicy> parse_partial_policy(const std::string &policy_str);
std::string partial_policy_to_string(PartialPolicy policy);

/**
 * DiscoveryService - resolves the set of light endpoints into a DeviceRegistry
 *
 * Static strategy: one endpoint per configured address on kDefaultLightPort, no network I/O.
 *
 * Multicast strategy: registry is cleared, then each usable announcement is
 * appended as it arrives. Completes when device_count endpoints are registered
 * or timeout_ms elapses. The browser is stopped on every terminal path and no
 * announcement mutates the registry after discover() returns.
 *
 * Single in-flight discovery per service; discover() is serialized internally.
 */
class DiscoveryService {
public:
    DiscoveryService(const DiscoveryConfig &config, registry::DeviceRegistry &registry,
                     std::shared_ptr<IServiceBrowser> browser);

    DiscoveryResult discover();

    const DiscoveryConfig &config() const { return config_; }

private:
    DiscoveryResult discover_static();
    DiscoveryResult discover_multicast();

    DiscoveryConfig config_;
    registry::DeviceRegistry &registry_;
    std::shared_ptr<IServiceBrowser> browser_;
    std::mutex discover_mutex_;
};

}  // namespace discovery
}  // namespace keylight

#endif  // KEYLIGHT_DISCOVERY_DISCOVERY_SERVICE_HPP
