#include "light_json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace keylight {
namespace device {

namespace {

bool decode_power(const nlohmann::json &value, bool &on, std::string &error) {
    if (value.is_boolean()) {
        on = value.get<bool>();
        return true;
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        on = value.get<int64_t>() != 0;
        return true;
    }
    error = "'on' must be a boolean or an integer";
    return false;
}

bool decode_int(const nlohmann::json &value, const char *field, int &out, std::string &error) {
    const auto out_of_range = [&]() {
        error = std::string("'") + field + "' is out of range";
        return false;
    };

    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return out_of_range();
        }
        out = static_cast<int>(raw);
        return true;
    }
    if (value.is_number_integer()) {
        int64_t raw = value.get<int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
            return out_of_range();
        }
        out = static_cast<int>(raw);
        return true;
    }
    if (value.is_number_float()) {
        // Older firmware echoes back fractional temperatures
        double raw = std::round(value.get<double>());
        if (!std::isfinite(raw) || raw < static_cast<double>(std::numeric_limits<int>::min()) ||
            raw > static_cast<double>(std::numeric_limits<int>::max())) {
            return out_of_range();
        }
        out = static_cast<int>(raw);
        return true;
    }
    error = std::string("'") + field + "' must be a number";
    return false;
}

const nlohmann::json *first_light(const nlohmann::json &json, std::string &error) {
    if (!json.is_object()) {
        error = "expected JSON object";
        return nullptr;
    }
    auto it = json.find("lights");
    if (it == json.end() || !it->is_array()) {
        error = "missing 'lights' array";
        return nullptr;
    }
    if (it->empty()) {
        error = "'lights' array is empty";
        return nullptr;
    }
    const nlohmann::json &light = it->front();
    if (!light.is_object()) {
        error = "'lights[0]' must be an object";
        return nullptr;
    }
    return &light;
}

}  // namespace

nlohmann::json encode_state_update(const LightStateUpdate &update) {
    nlohmann::json light = nlohmann::json::object();
    if (update.on) {
        light["on"] = *update.on ? 1 : 0;
    }
    if (update.brightness) {
        light["brightness"] = *update.brightness;
    }
    if (update.temperature) {
        light["temperature"] = *update.temperature;
    }
    return {{"lights", nlohmann::json::array({light})}};
}

nlohmann::json encode_light_state(const LightState &state) {
    nlohmann::json light = {
        {"on", state.on ? 1 : 0}, {"brightness", state.brightness}, {"temperature", state.temperature}};
    return {{"numberOfLights", 1}, {"lights", nlohmann::json::array({light})}};
}

bool decode_light_state(const nlohmann::json &json, LightState &state, std::string &error) {
    const nlohmann::json *light = first_light(json, error);
    if (light == nullptr) {
        return false;
    }

    for (const char *field : {"on", "brightness", "temperature"}) {
        if (!light->contains(field)) {
            error = std::string("lights[0] missing '") + field + "'";
            return false;
        }
    }

    LightState decoded;
    if (!decode_power(light->at("on"), decoded.on, error)) {
        return false;
    }
    if (!decode_int(light->at("brightness"), "brightness", decoded.brightness, error)) {
        return false;
    }
    if (!decode_int(light->at("temperature"), "temperature", decoded.temperature, error)) {
        return false;
    }

    state = decoded;
    return true;
}

bool apply_state_update(const nlohmann::json &json, LightState &state, std::string &error) {
    const nlohmann::json *light = first_light(json, error);
    if (light == nullptr) {
        return false;
    }

    LightState merged = state;
    if (light->contains("on") && !decode_power(light->at("on"), merged.on, error)) {
        return false;
    }
    if (light->contains("brightness") &&
        !decode_int(light->at("brightness"), "brightness", merged.brightness, error)) {
        return false;
    }
    if (light->contains("temperature") &&
        !decode_int(light->at("temperature"), "temperature", merged.temperature, error)) {
        return false;
    }

    state = merged;
    return true;
}

}  // namespace device
}  // namespace keylight
