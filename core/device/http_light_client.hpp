#pragma once

#include <string>

#include "device/i_light_client.hpp"

namespace keylight {
namespace device {

// REST path served by the light firmware
constexpr const char *kLightsPath = "/elgato/lights";

struct LightClientConfig {
    int timeout_ms = 2000;  // Connection/read/write timeout per request
};

/**
 * @brief cpp-httplib client for the light REST protocol
 *
 * One short-lived httplib::Client per request; lights drop idle keep-alive
 * connections quickly, so connections are not reused.
 * Any transport error or non-2xx status is reported as unreachable.
 */
class HttpLightClient : public ILightClient {
public:
    explicit HttpLightClient(const LightClientConfig &config = LightClientConfig()) : config_(config) {}

    bool fetch_state(const DeviceEndpoint &endpoint, LightState &state, std::string &error) override;
    bool push_state(const DeviceEndpoint &endpoint, const LightStateUpdate &update, std::string &error) override;

private:
    LightClientConfig config_;
};

// "Device unreachable at <url>: <cause>"
std::string make_unreachable_error(const DeviceEndpoint &endpoint, const std::string &cause);

}  // namespace device
}  // namespace keylight
