#include "mdns_browser.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>
#include <vector>

#include "discovery/dns_message.hpp"
#include "logging/logger.hpp"

namespace keylight {
namespace discovery {

namespace {

// Large enough for a jumbo mDNS packet
constexpr size_t kReceiveBufferSize = 9000;

std::string lowercase_copy(const std::string &text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string errno_string(const char *what) { return std::string(what) + ": " + std::strerror(errno); }

}  // namespace

MdnsBrowser::~MdnsBrowser() { stop(); }

bool MdnsBrowser::start(const std::string &service_type, AnnouncementCallback callback, std::string &error) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.load()) {
        error = "browser already running";
        return false;
    }
    if (!callback) {
        error = "no announcement callback";
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        error = errno_string("socket failed");
        return false;
    }

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        error = errno_string("SO_REUSEADDR failed");
        ::close(fd);
        return false;
    }
#ifdef SO_REUSEPORT
    // Other responders (avahi, mDNSResponder) usually own 5353 as well
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) < 0) {
        LOG_DEBUG("[MdnsBrowser] SO_REUSEPORT unavailable: " << std::strerror(errno));
    }
#endif

    in_addr group_addr{};
    if (::inet_pton(AF_INET, config_.group.c_str(), &group_addr) != 1) {
        error = "invalid mDNS group address '" + config_.group + "'";
        ::close(fd);
        return false;
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_addr.sin_port = htons(config_.port);
    if (::bind(fd, reinterpret_cast<sockaddr *>(&bind_addr), sizeof(bind_addr)) < 0) {
        error = errno_string("bind to mDNS port failed");
        ::close(fd);
        return false;
    }

    sockaddr_in local{};
    socklen_t local_len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&local), &local_len) < 0) {
        error = errno_string("getsockname failed");
        ::close(fd);
        return false;
    }

    if (IN_MULTICAST(ntohl(group_addr.s_addr))) {
        ip_mreq membership{};
        membership.imr_multiaddr = group_addr;
        membership.imr_interface.s_addr = htonl(INADDR_ANY);
        if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
            error = errno_string("joining mDNS multicast group failed");
            ::close(fd);
            return false;
        }

        unsigned char ttl = 255;
        unsigned char loop = 1;
        ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
        ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
    }

    socket_fd_ = fd;
    group_addr_ = group_addr.s_addr;
    bound_port_.store(ntohs(local.sin_port));
    service_name_ = service_type + ".local";
    callback_ = std::move(callback);
    reported_.clear();

    if (!send_query(error)) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        bound_port_.store(0);
        callback_ = nullptr;
        return false;
    }

    running_.store(true);
    browse_thread_ = std::thread(&MdnsBrowser::browse_loop, this);

    LOG_INFO("[MdnsBrowser] Browsing for " << service_name_);
    return true;
}

void MdnsBrowser::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    running_.store(false);
    if (browse_thread_.joinable()) {
        browse_thread_.join();
    }

    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        bound_port_.store(0);
        callback_ = nullptr;
        LOG_DEBUG("[MdnsBrowser] Stopped browsing for " << service_name_ << " (" << reported_.size()
                                                       << " instances reported)");
    }
}

bool MdnsBrowser::send_query(std::string &error) {
    std::vector<uint8_t> query = build_ptr_query(service_name_);

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(bound_port_.load());
    group.sin_addr.s_addr = group_addr_;

    ssize_t sent = ::sendto(socket_fd_, query.data(), query.size(), 0, reinterpret_cast<sockaddr *>(&group),
                            sizeof(group));
    if (sent < 0) {
        error = errno_string("sending mDNS query failed");
        return false;
    }
    return true;
}

void MdnsBrowser::browse_loop() {
    std::vector<uint8_t> buffer(kReceiveBufferSize);
    int query_interval_ms = config_.initial_query_interval_ms;
    auto next_query = std::chrono::steady_clock::now() + std::chrono::milliseconds(query_interval_ms);

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_query) {
            std::string error;
            if (!send_query(error)) {
                LOG_WARN("[MdnsBrowser] " << error);
            }
            query_interval_ms = std::min(query_interval_ms * 2, config_.max_query_interval_ms);
            next_query = now + std::chrono::milliseconds(query_interval_ms);
        }

        pollfd pfd{};
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;

        int result = ::poll(&pfd, 1, config_.poll_timeout_ms);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[MdnsBrowser] " << errno_string("poll failed"));
            running_.store(false);
            break;
        }
        if (result == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        sockaddr_in source{};
        socklen_t source_len = sizeof(source);
        ssize_t received = ::recvfrom(socket_fd_, buffer.data(), buffer.size(), 0,
                                      reinterpret_cast<sockaddr *>(&source), &source_len);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LOG_ERROR("[MdnsBrowser] " << errno_string("recvfrom failed"));
            running_.store(false);
            break;
        }

        char address[INET_ADDRSTRLEN] = {0};
        if (::inet_ntop(AF_INET, &source.sin_addr, address, sizeof(address)) == nullptr) {
            continue;
        }
        handle_packet(buffer.data(), static_cast<size_t>(received), address);
    }
}

void MdnsBrowser::handle_packet(const uint8_t *data, size_t len, const std::string &source_address) {
    DnsMessage message;
    std::string error;
    if (!parse_dns_message(data, len, message, error)) {
        LOG_DEBUG("[MdnsBrowser] Ignoring malformed packet from " << source_address << ": " << error);
        return;
    }
    if (!message.is_response()) {
        return;
    }

    for (const auto &instance : extract_service_instances(message, service_name_)) {
        if (instance.port == 0 || (source_address.empty() && instance.address.empty())) {
            continue;
        }
        std::string key = lowercase_copy(instance.instance_name);
        if (!reported_.insert(key).second) {
            continue;
        }

        ServiceAnnouncement announcement;
        announcement.instance_name = instance.instance_name;
        announcement.source_address = source_address;
        announcement.port = instance.port;
        announcement.host = instance.host;
        announcement.address = instance.address;

        LOG_DEBUG("[MdnsBrowser] Found " << announcement.instance_name << " at " << source_address << ":"
                                         << announcement.port);
        if (running_.load()) {
            callback_(announcement);
        }
    }
}

}  // namespace discovery
}  // namespace keylight
