#pragma once

#include <string>

#include "device/light_types.hpp"

namespace keylight {
namespace device {

// Interface for the light REST primitives to enable mocking
class ILightClient {
public:
    virtual ~ILightClient() = default;

    // Read the first light's state. On failure, error names the endpoint and the transport/protocol cause.
    virtual bool fetch_state(const DeviceEndpoint &endpoint, LightState &state, std::string &error) = 0;

    // Write only the engaged fields of update. No retries.
    virtual bool push_state(const DeviceEndpoint &endpoint, const LightStateUpdate &update, std::string &error) = 0;
};

}  // namespace device
}  // namespace keylight
