#pragma once

#include "crypto/packet_cipher.hpp"
#include "net/endpoint.hpp"
#include "net/udp_socket.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

#include <netinet/in.h>

namespace masterlist::net {

enum class VerifyOutcome {
    Verified,
    TimedOut,
    Failed
};

const char *ToString(VerifyOutcome outcome);

// One challenge round trip against a game server's claimed endpoint. Each
// registration owns its own client; the socket is released on every exit path.
class VerificationClient {
public:
    enum class State {
        Idle,
        Connecting,
        AwaitingResponse,
        Verified,
        Closed
    };

    VerificationClient() = default;
    ~VerificationClient();

    VerificationClient(const VerificationClient&) = delete;
    VerificationClient& operator=(const VerificationClient&) = delete;

    // Sends exactly one sealed challenge. Returns false without sending when the
    // port is out of range, the address is not IPv4, or the socket cannot be set up.
    bool connect(const Endpoint &endpoint, const crypto::Key &key, uint64_t uid);

    // Drains queued datagrams. Returns true once the endpoint has answered.
    bool update();

    VerifyOutcome awaitChallenge(std::chrono::milliseconds timeout);

    void close();

    State state() const { return currentState; }
    bool verified() const { return currentState == State::Verified; }
    std::optional<int32_t> challengeValue() const { return challenge; }
    std::optional<uint16_t> localPort() const;

private:
    void handleDatagram(const Datagram &datagram);

    UdpSocket socket;
    State currentState = State::Idle;
    Endpoint target;
    crypto::Key sharedKey{};
    uint64_t expectedUid = 0;
    std::optional<int32_t> challenge;
    std::optional<uint16_t> boundPort;
};

} // namespace masterlist::net
