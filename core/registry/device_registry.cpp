#include "device_registry.hpp"

#include <mutex>
#include <utility>

#include "logging/logger.hpp"

namespace keylight {
namespace registry {

void DeviceRegistry::replace(std::vector<device::DeviceEndpoint> endpoints) {
    size_t count = endpoints.size();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        endpoints_ = std::move(endpoints);
    }
    LOG_DEBUG("[Registry] Replaced contents with " << count << " endpoints");
}

size_t DeviceRegistry::append(const device::DeviceEndpoint &endpoint) {
    size_t count = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        endpoints_.push_back(endpoint);
        count = endpoints_.size();
    }
    LOG_INFO("[Registry] Registered: " << endpoint.to_string() << " (" << count << " total)");
    return count;
}

void DeviceRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    endpoints_.clear();
}

std::vector<device::DeviceEndpoint> DeviceRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return endpoints_;
}

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return endpoints_.size();
}

bool DeviceRegistry::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return endpoints_.empty();
}

}  // namespace registry
}  // namespace keylight
