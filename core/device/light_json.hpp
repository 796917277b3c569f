#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "device/light_types.hpp"

namespace keylight {
namespace device {

/**
 * @brief JSON encoding for the light REST protocol
 *
 * GET /elgato/lights returns:
 *   {"numberOfLights":1,"lights":[{"on":1,"brightness":20,"temperature":213}]}
 *
 * PUT /elgato/lights accepts the same envelope with only the fields to change.
 * Firmware reports "on" as 0/1; booleans are accepted on decode as well.
 */

// Encode a partial update as a PUT body
nlohmann::json encode_state_update(const LightStateUpdate &update);

// Encode a full state as a GET response body
nlohmann::json encode_light_state(const LightState &state);

// Decode the first light of a GET response
bool decode_light_state(const nlohmann::json &json, LightState &state, std::string &error);

// Merge the first light of a PUT body into state. Fields not present are left untouched.
bool apply_state_update(const nlohmann::json &json, LightState &state, std::string &error);

}  // namespace device
}  // namespace keylight
