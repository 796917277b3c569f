#include "discovery_service.hpp"

#include <chrono>
#include <condition_variable>
#include <utility>

#include "logging/logger.hpp"

namespace keylight {
namespace discovery {

namespace {

std::string trim(const std::string &s) {
    const char *whitespace = " \t\r\n";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

// Shared between discover_multicast() and the browser callback
struct BrowseState {
    std::mutex mutex;
    std::condition_variable cv;
    bool target_reached = false;
    bool settled = false;  // No further registry mutation once set
};

}  // namespace

bool parse_address_list(const std::string &list, std::vector<std::string> &addresses, std::string &error) {
    std::vector<std::string> parsed;
    size_t start = 0;
    while (true) {
        size_t comma = list.find(',', start);
        std::string entry = trim(list.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (entry.empty()) {
            error = "address list contains an empty entry: '" + list + "'";
            return false;
        }
        parsed.push_back(entry);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    addresses = std::move(parsed);
    return true;
}

std::optional<PartialPolicy> parse_partial_policy(const std::string &policy_str) {
    if (policy_str == "accept") {
        return PartialPolicy::ACCEPT;
    }
    if (policy_str == "fail") {
        return PartialPolicy::FAIL;
    }
    return std::nullopt;
}

std::string partial_policy_to_string(PartialPolicy policy) {
    switch (policy) {
        case PartialPolicy::ACCEPT:
            return "accept";
        case PartialPolicy::FAIL:
            return "fail";
        default:
            return "unknown";
    }
}

DiscoveryService::DiscoveryService(const DiscoveryConfig &config, registry::DeviceRegistry &registry,
                                   std::shared_ptr<IServiceBrowser> browser)
    : config_(config), registry_(registry), browser_(std::move(browser)) {}

DiscoveryResult DiscoveryService::discover() {
    std::lock_guard<std::mutex> lock(discover_mutex_);

    if (!config_.addresses.empty()) {
        return discover_static();
    }
    return discover_multicast();
}

DiscoveryResult DiscoveryService::discover_static() {
    DiscoveryResult result;

    std::vector<std::string> addresses;
    std::string error;
    if (!parse_address_list(config_.addresses, addresses, error)) {
        result.code = ErrorCode::INVALID_CONFIG;
        result.error_message = "Invalid static address list: " + error;
        LOG_ERROR("[Discovery] " << result.error_message);
        return result;
    }

    std::vector<device::DeviceEndpoint> endpoints;
    endpoints.reserve(addresses.size());
    for (const auto &address : addresses) {
        endpoints.emplace_back(address, device::kDefaultLightPort);
    }

    LOG_INFO("[Discovery] Using " << endpoints.size() << " static address(es): " << config_.addresses);

    registry_.replace(endpoints);
    result.success = true;
    result.endpoints = std::move(endpoints);
    return result;
}

DiscoveryResult DiscoveryService::discover_multicast() {
    DiscoveryResult result;

    if (!browser_) {
        result.code = ErrorCode::DISCOVERY_UNAVAILABLE;
        result.error_message = "No service browser configured";
        LOG_ERROR("[Discovery] " << result.error_message);
        return result;
    }

    LOG_INFO("[Discovery] Browsing for " << config_.service_type << " (target " << config_.device_count
                                         << " light(s), timeout " << config_.timeout_ms << "ms)");

    registry_.clear();

    auto state = std::make_shared<BrowseState>();
    const size_t target = config_.device_count > 0 ? static_cast<size_t>(config_.device_count) : 1;

    auto on_announcement = [this, state, target](const ServiceAnnouncement &announcement) {
        // Prefer where the response came from; the advertised A record covers browsers that cannot tell
        const std::string &host =
            announcement.source_address.empty() ? announcement.address : announcement.source_address;
        if (host.empty() || announcement.port == 0) {
            return;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->settled) {
            return;
        }

        size_t count = registry_.append(device::DeviceEndpoint(host, announcement.port));
        if (count >= target) {
            state->target_reached = true;
            state->settled = true;
            state->cv.notify_all();
        }
    };

    std::string error;
    if (!browser_->start(config_.service_type, on_announcement, error)) {
        result.code = ErrorCode::DISCOVERY_UNAVAILABLE;
        result.error_message = "Cannot start multicast discovery: " + error;
        LOG_ERROR("[Discovery] " << result.error_message);
        browser_->stop();
        return result;
    }

    bool reached = false;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        reached = state->cv.wait_for(lock, std::chrono::milliseconds(config_.timeout_ms),
                                     [&state]() { return state->target_reached; });
        state->settled = true;
    }

    browser_->stop();

    result.endpoints = registry_.snapshot();
    const size_t found = result.endpoints.size();

    if (reached) {
        LOG_INFO("[Discovery] Found all " << found << " light(s)");
        result.success = true;
        return result;
    }

    if (found == 0) {
        result.code = ErrorCode::NO_DEVICES_FOUND;
        result.error_message = "Cannot discover any Key Lights in the network";
        LOG_ERROR("[Discovery] " << result.error_message);
        return result;
    }

    if (config_.partial_policy == PartialPolicy::FAIL) {
        result.code = ErrorCode::PARTIAL_DISCOVERY;
        result.error_message = "Discovered only " + std::to_string(found) + " of " + std::to_string(target) +
                               " Key Lights before timeout";
        LOG_ERROR("[Discovery] " << result.error_message);
        return result;
    }

    LOG_WARN("[Discovery] Timed out with " << found << " of " << target << " light(s); continuing with those found");
    result.success = true;
    return result;
}

}  // namespace discovery
}  // namespace keylight
