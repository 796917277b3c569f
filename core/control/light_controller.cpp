#include "light_controller.hpp"

#include <cmath>

#include "logging/logger.hpp"

namespace keylight {
namespace control {

namespace {

// Verb phrase used in "Failed <verb> at <host>" messages
std::string failure_verb(Operation operation) {
    switch (operation) {
        case Operation::TOGGLE:
            return "toggling Key Light";
        case Operation::INCREASE_BRIGHTNESS:
            return "increasing brightness for Key Light";
        case Operation::DECREASE_BRIGHTNESS:
            return "decreasing brightness for Key Light";
        case Operation::INCREASE_TEMPERATURE:
            return "increasing temperature for Key Light";
        case Operation::DECREASE_TEMPERATURE:
            return "decreasing temperature for Key Light";
        default:
            return "updating Key Light";
    }
}

}  // namespace

std::string operation_to_string(Operation operation) {
    switch (operation) {
        case Operation::TOGGLE:
            return "toggle";
        case Operation::INCREASE_BRIGHTNESS:
            return "brightness-up";
        case Operation::DECREASE_BRIGHTNESS:
            return "brightness-down";
        case Operation::INCREASE_TEMPERATURE:
            return "temperature-up";
        case Operation::DECREASE_TEMPERATURE:
            return "temperature-down";
        default:
            return "unknown";
    }
}

std::optional<Operation> parse_operation(const std::string &name) {
    if (name == "toggle") return Operation::TOGGLE;
    if (name == "brightness-up") return Operation::INCREASE_BRIGHTNESS;
    if (name == "brightness-down") return Operation::DECREASE_BRIGHTNESS;
    if (name == "temperature-up") return Operation::INCREASE_TEMPERATURE;
    if (name == "temperature-down") return Operation::DECREASE_TEMPERATURE;
    return std::nullopt;
}

bool toggled_power(bool current) { return !current; }

int adjusted_brightness(int current, int delta) {
    // Widened so that a corrupt reading near INT_MAX/INT_MIN still clamps to the right bound
    long long next = static_cast<long long>(current) + delta;
    return static_cast<int>(device::clamp_value<long long>(next, device::kMinBrightness, device::kMaxBrightness));
}

int adjusted_temperature(int current, double delta) {
    double next = device::clamp_value(static_cast<double>(current) + delta,
                                      static_cast<double>(device::kColdTemperature),
                                      static_cast<double>(device::kWarmTemperature));
    // Rounded to whole mireds after every step, so a full sweep of the range takes 21 steps instead of 20.
    // Bounds are integral, so rounding cannot leave the domain.
    return static_cast<int>(std::lround(next));
}

std::string describe_result(const ControlResult &result) {
    if (!result.success) {
        return result.error_message;
    }
    if (!result.value) {
        return "No Key Lights to update";
    }

    switch (result.operation) {
        case Operation::TOGGLE:
            return *result.value != 0 ? "Key Light turned on" : "Key Light turned off";
        case Operation::INCREASE_BRIGHTNESS:
        case Operation::DECREASE_BRIGHTNESS:
            return "Brightness: " + std::to_string(*result.value) + "%";
        case Operation::INCREASE_TEMPERATURE:
        case Operation::DECREASE_TEMPERATURE:
            return "Temperature: " + std::to_string(device::temperature_to_kelvin(*result.value)) + "K";
        default:
            return "Done";
    }
}

LightController::LightController(const registry::DeviceRegistry &registry, device::ILightClient &client)
    : registry_(registry), client_(client) {}

ControlResult LightController::execute(Operation operation) {
    ControlResult result;
    result.operation = operation;

    const auto endpoints = registry_.snapshot();
    LOG_DEBUG("[Control] " << operation_to_string(operation) << " on " << endpoints.size() << " light(s)");

    for (const auto &endpoint : endpoints) {
        std::lock_guard<std::mutex> lock(endpoint_lock(endpoint));

        device::LightState state;
        std::string error;
        if (!client_.fetch_state(endpoint, state, error)) {
            result.code = ErrorCode::OPERATION_FAILED;
            result.cause = ErrorCode::DEVICE_UNREACHABLE;
            result.failed_endpoint = endpoint.to_string();
            result.failed_phase = "fetch";
            result.error_message = "Failed " + failure_verb(operation) + " at " + endpoint.host() + " (fetch): " + error;
            LOG_ERROR("[Control] " << result.error_message);
            return result;
        }

        device::LightStateUpdate update;
        int value = compute_update(operation, state, update);

        if (!client_.push_state(endpoint, update, error)) {
            result.code = ErrorCode::OPERATION_FAILED;
            result.cause = ErrorCode::DEVICE_UNREACHABLE;
            result.failed_endpoint = endpoint.to_string();
            result.failed_phase = "push";
            result.error_message = "Failed " + failure_verb(operation) + " at " + endpoint.host() + " (push): " + error;
            LOG_ERROR("[Control] " << result.error_message);
            return result;
        }

        result.value = value;
        ++result.devices_updated;
        LOG_INFO("[Control] " << operation_to_string(operation) << " " << endpoint.to_string() << " -> " << value);
    }

    result.success = true;
    return result;
}

int LightController::compute_update(Operation operation, const device::LightState &state,
                                    device::LightStateUpdate &update) const {
    switch (operation) {
        case Operation::TOGGLE: {
            bool on = toggled_power(state.on);
            update.on = on;
            return on ? 1 : 0;
        }
        case Operation::INCREASE_BRIGHTNESS:
            update.brightness = adjusted_brightness(state.brightness, device::kBrightnessStep);
            return *update.brightness;
        case Operation::DECREASE_BRIGHTNESS:
            update.brightness = adjusted_brightness(state.brightness, -device::kBrightnessStep);
            return *update.brightness;
        case Operation::INCREASE_TEMPERATURE:
            update.temperature = adjusted_temperature(state.temperature, device::kTemperatureStep);
            return *update.temperature;
        case Operation::DECREASE_TEMPERATURE:
            update.temperature = adjusted_temperature(state.temperature, -device::kTemperatureStep);
            return *update.temperature;
    }
    return 0;
}

std::mutex &LightController::endpoint_lock(const device::DeviceEndpoint &endpoint) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return endpoint_locks_[endpoint.to_string()];
}

}  // namespace control
}  // namespace keylight
