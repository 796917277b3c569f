#ifndef KEYLIGHT_DEVICE_LIGHT_TYPES_HPP
#define KEYLIGHT_DEVICE_LIGHT_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace keylight {
namespace device {

// Port the light firmware serves its REST API on
constexpr uint16_t kDefaultLightPort = 9123;

// Color temperature is expressed in mireds by the firmware
constexpr int kWarmTemperature = 344;  // ~2900K
constexpr int kColdTemperature = 143;  // ~7000K
constexpr double kTemperatureStep = (kWarmTemperature - kColdTemperature) / 20.0;

constexpr int kMinBrightness = 0;
constexpr int kMaxBrightness = 100;
constexpr int kBrightnessStep = 5;

template <typename T>
constexpr T clamp_value(T value, T low, T high) {
    return value < low ? low : (high < value ? high : value);
}

// Network location of one light. Immutable once constructed.
class DeviceEndpoint {
public:
    DeviceEndpoint(std::string host, uint16_t port) : host_(std::move(host)), port_(port) {}

    const std::string &host() const { return host_; }
    uint16_t port() const { return port_; }

    // "host:port", used as the endpoint identity in logs and errors
    std::string to_string() const { return host_ + ":" + std::to_string(port_); }

    bool operator==(const DeviceEndpoint &other) const { return host_ == other.host_ && port_ == other.port_; }
    bool operator!=(const DeviceEndpoint &other) const { return !(*this == other); }

private:
    std::string host_;
    uint16_t port_;
};

// Snapshot of the first light reported by a device
struct LightState {
    bool on = false;
    int brightness = 0;
    int temperature = kColdTemperature;
};

// Partial update: only engaged fields are written, the device merges the rest
struct LightStateUpdate {
    std::optional<bool> on;
    std::optional<int> brightness;
    std::optional<int> temperature;

    bool empty() const { return !on && !brightness && !temperature; }
};

// Mireds -> Kelvin as shown to users (143 -> 6993K, 344 -> 2907K)
inline int temperature_to_kelvin(int mireds) {
    if (mireds <= 0) {
        return 0;
    }
    return static_cast<int>(1000000.0 / mireds + 0.5);
}

}  // namespace device
}  // namespace keylight

#endif  // KEYLIGHT_DEVICE_LIGHT_TYPES_HPP
