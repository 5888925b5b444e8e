#include "net/verification_client.hpp"

#include "net/challenge_protocol.hpp"

#include "spdlog/spdlog.h"

namespace masterlist::net {

const char *ToString(VerifyOutcome outcome) {
    switch (outcome) {
        case VerifyOutcome::Verified:
            return "verified";
        case VerifyOutcome::TimedOut:
            return "timed out";
        case VerifyOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

VerificationClient::~VerificationClient() {
    close();
}

bool VerificationClient::connect(const Endpoint &endpoint, const crypto::Key &key, uint64_t uid) {
    if (currentState != State::Idle) {
        spdlog::warn("VerificationClient: connect() called twice for {}", AddressKey(endpoint));
        return false;
    }

    if (!IsValidPort(endpoint.port)) {
        spdlog::warn("VerificationClient: Port {} is out of range", endpoint.port);
        currentState = State::Closed;
        return false;
    }

    const auto destination = ResolveIPv4(endpoint.ip, static_cast<uint16_t>(endpoint.port));
    if (!destination) {
        spdlog::warn("VerificationClient: '{}' is not an IPv4 address", endpoint.ip);
        currentState = State::Closed;
        return false;
    }

    target = endpoint;
    sharedKey = key;
    expectedUid = uid;
    currentState = State::Connecting;

    if (!socket.open()) {
        close();
        return false;
    }
    boundPort = socket.localPort();

    const auto sealed = crypto::Seal(challenge::EncodeRequest(uid), sharedKey);
    if (!sealed) {
        spdlog::error("VerificationClient: Failed to seal challenge for {}", AddressKey(target));
        close();
        return false;
    }

    if (!socket.sendTo(*destination, *sealed)) {
        spdlog::warn("VerificationClient: Failed to send challenge to {}", AddressKey(target));
        close();
        return false;
    }

    spdlog::debug("VerificationClient: Challenge sent to {} from local port {}",
                  AddressKey(target), boundPort.value_or(0));
    currentState = State::AwaitingResponse;
    return true;
}

bool VerificationClient::update() {
    while (currentState == State::AwaitingResponse) {
        auto datagram = socket.receive();
        if (!datagram) {
            break;
        }
        handleDatagram(*datagram);
    }
    return verified();
}

void VerificationClient::handleDatagram(const Datagram &datagram) {
    if (datagram.ip != target.ip || datagram.port != target.port) {
        spdlog::trace("VerificationClient: Ignoring datagram from {}:{}", datagram.ip, datagram.port);
        return;
    }

    const auto plaintext = crypto::Open(datagram.payload, sharedKey);
    if (!plaintext) {
        spdlog::trace("VerificationClient: Dropping undecryptable datagram from {}", AddressKey(target));
        return;
    }

    const auto value = challenge::MatchResponse(plaintext->data(), plaintext->size(), expectedUid);
    if (!value) {
        spdlog::trace("VerificationClient: Dropping malformed response from {}", AddressKey(target));
        return;
    }

    challenge = *value;
    socket.close();
    currentState = State::Verified;
    spdlog::debug("VerificationClient: {} answered challenge {}", AddressKey(target), *value);
}

VerifyOutcome VerificationClient::awaitChallenge(std::chrono::milliseconds timeout) {
    if (currentState == State::Verified) {
        return VerifyOutcome::Verified;
    }
    if (currentState != State::AwaitingResponse) {
        return VerifyOutcome::Failed;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (update()) {
            return VerifyOutcome::Verified;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            break;
        }

        if (socket.waitReadable(remaining) == WaitResult::Error) {
            close();
            return VerifyOutcome::Failed;
        }
    }

    spdlog::debug("VerificationClient: {} did not answer within {} ms", AddressKey(target), timeout.count());
    close();
    return VerifyOutcome::TimedOut;
}

void VerificationClient::close() {
    socket.close();
    if (currentState != State::Verified) {
        currentState = State::Closed;
    }
}

std::optional<uint16_t> VerificationClient::localPort() const {
    return boundPort;
}

} // namespace masterlist::net
