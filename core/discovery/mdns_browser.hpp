#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "discovery/i_service_browser.hpp"

namespace keylight {
namespace discovery {

struct MdnsBrowserConfig {
    std::string group = "224.0.0.251";     // Queries go here; joined only if it is a multicast address
    uint16_t port = 5353;                  // 0 binds an ephemeral port, see bound_port()
    int initial_query_interval_ms = 1000;  // Doubles after each query
    int max_query_interval_ms = 60000;
    int poll_timeout_ms = 100;             // Upper bound on stop() latency
};

/**
 * @brief DNS-SD browser over IPv4 multicast DNS
 *
 * Joins the mDNS group (224.0.0.251:5353 by default), sends PTR queries for "<service_type>.local" with
 * exponential backoff and reports each instance once per start()/stop()
 * session. An instance is reported only once its SRV record (port) has been
 * seen; the announcement carries both the UDP source address of the response
 * and the A record advertised for the instance's host, if any.
 */
class MdnsBrowser : public IServiceBrowser {
public:
    explicit MdnsBrowser(const MdnsBrowserConfig &config = MdnsBrowserConfig()) : config_(config) {}
    ~MdnsBrowser() override;

    MdnsBrowser(const MdnsBrowser &) = delete;
    MdnsBrowser &operator=(const MdnsBrowser &) = delete;

    bool start(const std::string &service_type, AnnouncementCallback callback, std::string &error) override;
    void stop() override;
    bool is_running() const override { return running_.load(); }

    // Local UDP port of the current session, 0 when not running
    uint16_t bound_port() const { return bound_port_.load(); }

private:
    void browse_loop();
    bool send_query(std::string &error);
    void handle_packet(const uint8_t *data, size_t len, const std::string &source_address);

    MdnsBrowserConfig config_;
    std::string service_name_;  // "<service_type>.local"
    AnnouncementCallback callback_;

    int socket_fd_ = -1;
    uint32_t group_addr_ = 0;  // Network byte order
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::thread browse_thread_;
    std::mutex lifecycle_mutex_;

    std::set<std::string> reported_;  // Instance names reported this session (browse thread only)
};

}  // namespace discovery
}  // namespace keylight
