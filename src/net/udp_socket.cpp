#include "net/udp_socket.hpp"

#include "spdlog/spdlog.h"

#include <array>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace masterlist::net {

namespace {

constexpr std::size_t kMaxDatagramSize = 2048;

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        flags = 0;
    }
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void closeSocketHandle(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace

std::optional<sockaddr_in> ResolveIPv4(const std::string &ip, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }
    return addr;
}

std::string FormatIPv4(const in_addr &address) {
    char ipBuffer[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &address, ipBuffer, sizeof(ipBuffer))) {
        return {};
    }
    return std::string(ipBuffer);
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket &&other) noexcept : socketFd(other.socketFd) {
    other.socketFd = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
        close();
        socketFd = other.socketFd;
        other.socketFd = -1;
    }
    return *this;
}

bool UdpSocket::open(const std::string &bindHost, uint16_t bindPort) {
    close();

    auto local = ResolveIPv4(bindHost, bindPort);
    if (!local) {
        spdlog::warn("UdpSocket: Invalid bind address {}", bindHost);
        return false;
    }

    socketFd = static_cast<int>(socket(AF_INET, SOCK_DGRAM, 0));
    if (socketFd < 0) {
        spdlog::warn("UdpSocket: Unable to create socket: {}", std::strerror(errno));
        return false;
    }

    if (bind(socketFd, reinterpret_cast<sockaddr*>(&*local), sizeof(*local)) < 0) {
        spdlog::warn("UdpSocket: Failed to bind {}:{}: {}", bindHost, bindPort, std::strerror(errno));
        close();
        return false;
    }

    setNonBlocking(socketFd);
    return true;
}

void UdpSocket::close() {
    closeSocketHandle(socketFd);
    socketFd = -1;
}

std::optional<uint16_t> UdpSocket::localPort() const {
    if (socketFd < 0) {
        return std::nullopt;
    }
    sockaddr_in local{};
    socklen_t length = sizeof(local);
    if (getsockname(socketFd, reinterpret_cast<sockaddr*>(&local), &length) < 0) {
        return std::nullopt;
    }
    return ntohs(local.sin_port);
}

bool UdpSocket::sendTo(const sockaddr_in &destination, const std::byte *data, std::size_t size) {
    if (socketFd < 0) {
        return false;
    }
    const auto sent = sendto(socketFd, reinterpret_cast<const char*>(data), size, 0,
                             reinterpret_cast<const sockaddr*>(&destination), sizeof(destination));
    if (sent < 0 || static_cast<std::size_t>(sent) != size) {
        spdlog::debug("UdpSocket: sendto failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<Datagram> UdpSocket::receive() {
    if (socketFd < 0) {
        return std::nullopt;
    }

    std::array<std::byte, kMaxDatagramSize> buffer{};
    sockaddr_in from{};
    socklen_t fromLen = sizeof(from);
    const auto received = recvfrom(socketFd, reinterpret_cast<char*>(buffer.data()), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&from), &fromLen);
    if (received < 0) {
        if (errno != EWOULDBLOCK && errno != EAGAIN && errno != EINTR) {
            // ICMP port-unreachable from a previous send lands here on Linux.
            spdlog::trace("UdpSocket: recvfrom failed: {}", std::strerror(errno));
        }
        return std::nullopt;
    }

    Datagram datagram;
    datagram.payload.assign(buffer.begin(), buffer.begin() + received);
    datagram.ip = FormatIPv4(from.sin_addr);
    datagram.port = ntohs(from.sin_port);
    return datagram;
}

WaitResult UdpSocket::waitReadable(std::chrono::milliseconds timeout) {
    if (socketFd < 0) {
        return WaitResult::Error;
    }
    if (timeout < std::chrono::milliseconds::zero()) {
        timeout = std::chrono::milliseconds::zero();
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(socketFd, &readSet);

    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

    const int ready = select(socketFd + 1, &readSet, nullptr, nullptr, &tv);
    if (ready < 0) {
        if (errno == EINTR) {
            return WaitResult::TimedOut;
        }
        spdlog::warn("UdpSocket: select() failed: {}", std::strerror(errno));
        return WaitResult::Error;
    }
    return ready == 0 ? WaitResult::TimedOut : WaitResult::Ready;
}

} // namespace masterlist::net
