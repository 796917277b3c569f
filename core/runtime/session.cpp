#include "session.hpp"

#include <utility>

#include "device/http_light_client.hpp"
#include "discovery/mdns_browser.hpp"
#include "logging/logger.hpp"

namespace keylight {
namespace runtime {

Session::Session(const KeylightConfig &config)
    : Session(config, std::make_shared<discovery::MdnsBrowser>(),
              std::make_shared<device::HttpLightClient>(config.client)) {}

Session::Session(const KeylightConfig &config, std::shared_ptr<discovery::IServiceBrowser> browser,
                 std::shared_ptr<device::ILightClient> client)
    : config_(config), browser_(std::move(browser)), client_(std::move(client)) {
    registry_ = std::make_unique<registry::DeviceRegistry>();
    discovery_ = std::make_unique<discovery::DiscoveryService>(config_.discovery, *registry_, browser_);
    controller_ = std::make_unique<control::LightController>(*registry_, *client_);
}

discovery::DiscoveryResult Session::discover() { return discovery_->discover(); }

control::ControlResult Session::discover_and_execute(control::Operation operation) {
    auto discovered = discover();
    if (!discovered.success) {
        control::ControlResult result;
        result.operation = operation;
        result.code = discovered.code;
        result.error_message = discovered.error_message;
        return result;
    }

    LOG_DEBUG("[Session] Running " << control::operation_to_string(operation) << " on "
                                   << discovered.endpoints.size() << " light(s)");
    return controller_->execute(operation);
}

}  // namespace runtime
}  // namespace keylight
