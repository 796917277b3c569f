#ifndef KEYLIGHT_CONTROL_LIGHT_CONTROLLER_HPP
#define KEYLIGHT_CONTROL_LIGHT_CONTROLLER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "common/errors.hpp"
#include "device/i_light_client.hpp"
#include "registry/device_registry.hpp"

namespace keylight {
namespace control {

enum class Operation {
    TOGGLE,
    INCREASE_BRIGHTNESS,
    DECREASE_BRIGHTNESS,
    INCREASE_TEMPERATURE,
    DECREASE_TEMPERATURE
};

// "toggle", "brightness-up", "brightness-down", "temperature-up", "temperature-down"
std::string operation_to_string(Operation operation);
std::optional<Operation> parse_operation(const std::string &name);

// Result of one control operation across the registry
struct ControlResult {
    Operation operation = Operation::TOGGLE;
    bool success = false;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;

    // Value computed for the last endpoint processed (power as 0/1 for toggle).
    // Empty when the registry had no endpoints.
    std::optional<int> value;
    size_t devices_updated = 0;

    // Set on OPERATION_FAILED
    ErrorCode cause = ErrorCode::OK;  // DEVICE_UNREACHABLE from the light client
    std::string failed_endpoint;
    std::string failed_phase;  // "fetch" or "push"
};

// Pure value arithmetic, clamped to the device domains
bool toggled_power(bool current);
int adjusted_brightness(int current, int delta);
int adjusted_temperature(int current, double delta);

// User-facing summary, e.g. "Key Light turned on", "Brightness: 45%", "Temperature: 4000K"
std::string describe_result(const ControlResult &result);

/**
 * LightController - read-modify-write of every registered light
 *
 * Endpoints are processed sequentially in registry order (snapshot taken at
 * start). Each endpoint is fetched, the new value computed and only the
 * changed field pushed. The first fetch or push failure aborts the operation;
 * later endpoints are not attempted.
 *
 * Concurrent operations against the same endpoint are serialized.
 */
class LightController {
public:
    LightController(const registry::DeviceRegistry &registry, device::ILightClient &client);

    ControlResult toggle() { return execute(Operation::TOGGLE); }
    ControlResult increase_brightness() { return execute(Operation::INCREASE_BRIGHTNESS); }
    ControlResult decrease_brightness() { return execute(Operation::DECREASE_BRIGHTNESS); }
    ControlResult increase_temperature() { return execute(Operation::INCREASE_TEMPERATURE); }
    ControlResult decrease_temperature() { return execute(Operation::DECREASE_TEMPERATURE); }

    ControlResult execute(Operation operation);

private:
    // Computes the update for one light, returns the new value
    int compute_update(Operation operation, const device::LightState &state, device::LightStateUpdate &update) const;

    std::mutex &endpoint_lock(const device::DeviceEndpoint &endpoint);

    const registry::DeviceRegistry &registry_;
    device::ILightClient &client_;

    // Per-endpoint mutexes for serialized read-modify-write
    std::map<std::string, std::mutex> endpoint_locks_;
    std::mutex map_mutex_;  // Protects endpoint_locks_ map access
};

}  // namespace control
}  // namespace keylight

#endif  // KEYLIGHT_CONTROL_LIGHT_CONTROLLER_HPP
