#include "network_probe.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "../Common/logging.hpp"

namespace scan {

namespace {

struct AddrInfoGuard {
    addrinfo* head = nullptr;
    ~AddrInfoGuard() { if (head) freeaddrinfo(head); }
};

struct SocketGuard {
    int fd = -1;
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
};

std::string addressString(const sockaddr* sa) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (sa->sa_family == AF_INET) {
        auto* in4 = reinterpret_cast<const sockaddr_in*>(sa);
        inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf));
    } else if (sa->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

bool connectOne(const addrinfo* ai, int timeout_ms) {
    SocketGuard sock;
    sock.fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock.fd < 0) {
        return false;
    }

    int flags = ::fcntl(sock.fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }

    int rc = ::connect(sock.fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = sock.fd;
    pfd.events = POLLOUT;
    do {
        rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    if (rc <= 0) {
        return false;   // timeout or poll error
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return false;
    }
    return err == 0;
}

} // namespace

std::vector<std::string> SocketProbe::resolve(const std::string& hostname) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfoGuard result;
    int rc = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &result.head);
    if (rc != 0) {
        hostguard::logger()->debug("resolve {} failed: {}", hostname, gai_strerror(rc));
        return {};
    }

    std::vector<std::string> addresses;
    for (const addrinfo* ai = result.head; ai; ai = ai->ai_next) {
        std::string addr = addressString(ai->ai_addr);
        if (!addr.empty() && std::find(addresses.begin(), addresses.end(), addr) == addresses.end()) {
            addresses.push_back(std::move(addr));
        }
    }
    return addresses;
}

bool SocketProbe::connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    AddrInfoGuard result;
    std::string service = std::to_string(port);
    if (::getaddrinfo(address.c_str(), service.c_str(), &hints, &result.head) != 0) {
        return false;
    }

    int timeout_ms = static_cast<int>(std::max<int64_t>(1, timeout.count()));
    for (const addrinfo* ai = result.head; ai; ai = ai->ai_next) {
        if (connectOne(ai, timeout_ms)) {
            return true;
        }
    }
    return false;
}

} // namespace scan
