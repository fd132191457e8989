#ifndef network_probe_hpp
#define network_probe_hpp

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace scan {

/**
 * Name resolution and TCP reachability.
 * Neither call should throw for an unreachable host; the orchestrator still
 * treats an exception as a failed attempt.
 */
class NetworkProbe {
public:
    virtual ~NetworkProbe() = default;

    /// Addresses for hostname in resolver order, empty when it does not resolve
    virtual std::vector<std::string> resolve(const std::string& hostname) = 0;

    /// True when a TCP connection to address:port completes within timeout
    virtual bool connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) = 0;
};

/**
 * getaddrinfo() plus a non-blocking connect() bounded by poll()
 */
class SocketProbe : public NetworkProbe {
public:
    std::vector<std::string> resolve(const std::string& hostname) override;
    bool connect(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) override;
};

} // namespace scan

#endif // network_probe_hpp
