#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <netinet/in.h>

namespace masterlist::net {

std::optional<sockaddr_in> ResolveIPv4(const std::string &ip, uint16_t port);
std::string FormatIPv4(const in_addr &address);

struct Datagram {
    std::vector<std::byte> payload;
    std::string ip;
    uint16_t port = 0;
};

enum class WaitResult {
    Ready,
    TimedOut,
    Error
};

// Non-blocking IPv4 datagram socket. The descriptor is released on close() or destruction.
class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket& operator=(UdpSocket &&other) noexcept;

    // Port 0 binds an ephemeral port.
    bool open(const std::string &bindHost = "0.0.0.0", uint16_t bindPort = 0);
    void close();
    bool isOpen() const { return socketFd >= 0; }

    std::optional<uint16_t> localPort() const;

    bool sendTo(const sockaddr_in &destination, const std::byte *data, std::size_t size);
    bool sendTo(const sockaddr_in &destination, const std::vector<std::byte> &payload) {
        return sendTo(destination, payload.data(), payload.size());
    }

    // Returns nullopt when nothing is queued.
    std::optional<Datagram> receive();

    WaitResult waitReadable(std::chrono::milliseconds timeout);

private:
    int socketFd = -1;
};

} // namespace masterlist::net
