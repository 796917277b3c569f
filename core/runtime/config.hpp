#pragma once

#include <string>

#include "device/http_light_client.hpp"
#include "discovery/discovery_service.hpp"

namespace keylight {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct KeylightConfig {
    discovery::DiscoveryConfig discovery;
    device::LightClientConfig client;
    LoggingConfig logging;
};

// Parses a string-encoded device count ("2"). Rejects trailing garbage and values < 1.
bool parse_device_count(const std::string &text, int &count, std::string &error);

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, KeylightConfig &config, std::string &error);

// Applies KEYLIGHT_ADDRESSES / KEYLIGHT_COUNT over the loaded values
bool apply_environment(KeylightConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const KeylightConfig &config, std::string &error);

}  // namespace runtime
}  // namespace keylight
