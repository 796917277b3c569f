#ifndef KEYLIGHT_REGISTRY_DEVICE_REGISTRY_HPP
#define KEYLIGHT_REGISTRY_DEVICE_REGISTRY_HPP

#include <shared_mutex>
#include <vector>

#include "device/light_types.hpp"

namespace keylight {
namespace registry {

// Device Registry - ordered endpoint list, replaced wholesale by each discovery
/**
 * Thread Safety:
 * - All read methods use shared_lock (concurrent reads safe)
 * - All write methods use unique_lock (exclusive access)
 * - snapshot() returns by value; control operations iterate the copy taken at start
 *
 * Appends made during an in-progress discovery are visible to readers immediately.
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    // Replace contents with endpoints (old contents discarded)
    void replace(std::vector<device::DeviceEndpoint> endpoints);

    // Append one endpoint, returns the new size
    size_t append(const device::DeviceEndpoint &endpoint);

    void clear();

    std::vector<device::DeviceEndpoint> snapshot() const;
    size_t device_count() const;
    bool empty() const;

private:
    std::vector<device::DeviceEndpoint> endpoints_;
    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace keylight

#endif  // KEYLIGHT_REGISTRY_DEVICE_REGISTRY_HPP
