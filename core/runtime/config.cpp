#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>

#include "logging/logger.hpp"

namespace keylight {
namespace runtime {

namespace {

// Accepts a scalar string or a sequence of addresses; sequences are joined with ","
std::string read_address_list(const YAML::Node &node) {
    if (node.IsSequence()) {
        std::string joined;
        for (const auto &entry : node) {
            if (!joined.empty()) {
                joined += ",";
            }
            joined += entry.as<std::string>();
        }
        return joined;
    }
    return node.as<std::string>();
}

}  // namespace

bool parse_device_count(const std::string &text, int &count, std::string &error) {
    if (text.empty()) {
        error = "device count is empty";
        return false;
    }

    errno = 0;
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    while (end != nullptr && (*end == ' ' || *end == '\t')) {
        ++end;
    }
    if (errno != 0 || end == text.c_str() || *end != '\0' || value > INT_MAX) {
        error = "device count is not an integer: '" + text + "'";
        return false;
    }
    if (value < 1) {
        error = "device count must be at least 1, got " + std::to_string(value);
        return false;
    }

    count = static_cast<int>(value);
    return true;
}

bool validate_config(const KeylightConfig &config, std::string &error) {
    const auto &disc = config.discovery;

    if (!disc.addresses.empty()) {
        std::vector<std::string> addresses;
        std::string list_error;
        if (!discovery::parse_address_list(disc.addresses, addresses, list_error)) {
            error = "discovery.addresses: " + list_error;
            return false;
        }
    } else {
        if (disc.device_count < 1) {
            error = "discovery.device_count must be at least 1";
            return false;
        }
        if (disc.service_type.empty()) {
            error = "discovery.service_type must not be empty";
            return false;
        }
    }

    if (disc.timeout_ms < 100 || disc.timeout_ms > 60000) {
        error = "discovery.timeout_ms must be between 100 and 60000";
        return false;
    }

    if (config.client.timeout_ms < 100) {
        error = "client.timeout_ms must be >= 100ms";
        return false;
    }

    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, KeylightConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        const std::vector<std::string> valid_keys = {"discovery", "client", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["discovery"]) {
            const auto &disc = yaml["discovery"];

            if (disc["device_count"]) {
                // Usually a quoted string; plain integers are accepted too
                if (!parse_device_count(disc["device_count"].as<std::string>(), config.discovery.device_count,
                                        error)) {
                    error = "discovery.device_count: " + error;
                    return false;
                }
            }
            if (disc["addresses"]) {
                config.discovery.addresses = read_address_list(disc["addresses"]);
            }
            if (disc["service_type"]) {
                config.discovery.service_type = disc["service_type"].as<std::string>();
            }
            if (disc["timeout_ms"]) {
                config.discovery.timeout_ms = disc["timeout_ms"].as<int>();
            }
            if (disc["partial_policy"]) {
                auto policy_str = disc["partial_policy"].as<std::string>();
                auto policy = discovery::parse_partial_policy(policy_str);
                if (!policy) {
                    error = "Invalid discovery.partial_policy '" + policy_str + "': must be accept or fail";
                    return false;
                }
                config.discovery.partial_policy = *policy;
            }
        }

        if (yaml["client"]) {
            if (yaml["client"]["timeout_ms"]) {
                config.client.timeout_ms = yaml["client"]["timeout_ms"].as<int>();
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        return true;
    } catch (const YAML::Exception &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    }
}

bool apply_environment(KeylightConfig &config, std::string &error) {
    if (const char *addresses = std::getenv("KEYLIGHT_ADDRESSES")) {
        config.discovery.addresses = addresses;
        LOG_DEBUG("[Config] discovery.addresses overridden from KEYLIGHT_ADDRESSES");
    }

    if (const char *count = std::getenv("KEYLIGHT_COUNT")) {
        if (!parse_device_count(count, config.discovery.device_count, error)) {
            error = "KEYLIGHT_COUNT: " + error;
            return false;
        }
        LOG_DEBUG("[Config] discovery.device_count overridden from KEYLIGHT_COUNT");
    }

    return true;
}

}  // namespace runtime
}  // namespace keylight
