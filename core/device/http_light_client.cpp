#include "http_light_client.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

#include "device/light_json.hpp"
#include "logging/logger.hpp"

namespace keylight {
namespace device {

namespace {

std::unique_ptr<httplib::Client> make_client(const DeviceEndpoint &endpoint, const LightClientConfig &config) {
    auto client = std::make_unique<httplib::Client>(endpoint.host(), endpoint.port());
    client->set_connection_timeout(std::chrono::milliseconds(config.timeout_ms));
    client->set_read_timeout(std::chrono::milliseconds(config.timeout_ms));
    client->set_write_timeout(std::chrono::milliseconds(config.timeout_ms));
    return client;
}

std::string url_for(const DeviceEndpoint &endpoint) {
    return "http://" + endpoint.to_string() + kLightsPath;
}

}  // namespace

std::string make_unreachable_error(const DeviceEndpoint &endpoint, const std::string &cause) {
    return "Device unreachable at " + url_for(endpoint) + ": " + cause;
}

bool HttpLightClient::fetch_state(const DeviceEndpoint &endpoint, LightState &state, std::string &error) {
    auto client = make_client(endpoint, config_);

    auto result = client->Get(kLightsPath);
    if (!result) {
        error = make_unreachable_error(endpoint, httplib::to_string(result.error()));
        LOG_WARN("[LightClient] " << error);
        return false;
    }
    if (result->status < 200 || result->status >= 300) {
        error = make_unreachable_error(endpoint, "HTTP " + std::to_string(result->status));
        LOG_WARN("[LightClient] " << error);
        return false;
    }

    nlohmann::json body = nlohmann::json::parse(result->body, nullptr, false);
    if (body.is_discarded()) {
        error = make_unreachable_error(endpoint, "response is not valid JSON");
        LOG_WARN("[LightClient] " << error);
        return false;
    }

    std::string decode_error;
    if (!decode_light_state(body, state, decode_error)) {
        error = make_unreachable_error(endpoint, "malformed state: " + decode_error);
        LOG_WARN("[LightClient] " << error);
        return false;
    }

    LOG_DEBUG("[LightClient] " << endpoint.to_string() << " on=" << state.on << " brightness=" << state.brightness
                               << " temperature=" << state.temperature);
    return true;
}

bool HttpLightClient::push_state(const DeviceEndpoint &endpoint, const LightStateUpdate &update,
                                 std::string &error) {
    auto client = make_client(endpoint, config_);

    const std::string body = encode_state_update(update).dump();
    LOG_DEBUG("[LightClient] PUT " << url_for(endpoint) << " " << body);

    auto result = client->Put(kLightsPath, body, "application/json");
    if (!result) {
        error = make_unreachable_error(endpoint, httplib::to_string(result.error()));
        LOG_WARN("[LightClient] " << error);
        return false;
    }
    if (result->status < 200 || result->status >= 300) {
        error = make_unreachable_error(endpoint, "HTTP " + std::to_string(result->status));
        LOG_WARN("[LightClient] " << error);
        return false;
    }

    return true;
}

}  // namespace device
}  // namespace keylight
