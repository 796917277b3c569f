#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "control/light_controller.hpp"
#include "device/i_light_client.hpp"
#include "discovery/discovery_service.hpp"
#include "discovery/i_service_browser.hpp"
#include "registry/device_registry.hpp"

namespace keylight {
namespace runtime {

// Session - owns one registry and the components that share it
class Session {
public:
    explicit Session(const KeylightConfig &config);

    // For tests: inject the browser and light client seams
    Session(const KeylightConfig &config, std::shared_ptr<discovery::IServiceBrowser> browser,
            std::shared_ptr<device::ILightClient> client);

    // Populates the registry
    discovery::DiscoveryResult discover();

    // Discovery followed by one control operation (the CLI flow)
    control::ControlResult discover_and_execute(control::Operation operation);

    registry::DeviceRegistry &get_registry() { return *registry_; }
    control::LightController &get_controller() { return *controller_; }
    discovery::DiscoveryService &get_discovery() { return *discovery_; }

private:
    KeylightConfig config_;

    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::shared_ptr<discovery::IServiceBrowser> browser_;
    std::shared_ptr<device::ILightClient> client_;
    std::unique_ptr<discovery::DiscoveryService> discovery_;
    std::unique_ptr<control::LightController> controller_;
};

}  // namespace runtime
}  // namespace keylight
