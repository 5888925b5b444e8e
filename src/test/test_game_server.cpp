#include "test/test_game_server.hpp"

#include "net/challenge_protocol.hpp"

#include <chrono>
#include <random>
#include <stdexcept>

namespace masterlist::test {

crypto::Key MakeKey(unsigned char seed) {
    crypto::Key key{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<unsigned char>(seed + i * 7);
    }
    return key;
}

FakeGameServer::FakeGameServer(const crypto::Key &key, Mode mode) : key(key), currentMode(mode) {
    if (!socket.open("127.0.0.1", 0)) {
        throw std::runtime_error("FakeGameServer: cannot bind loopback socket");
    }
    boundPort = socket.localPort().value_or(0);
    worker = std::thread(&FakeGameServer::run, this);
}

FakeGameServer::~FakeGameServer() {
    stopRequested = true;
    if (worker.joinable()) {
        worker.join();
    }
}

std::optional<uint64_t> FakeGameServer::lastUid() const {
    std::lock_guard<std::mutex> lock(mutex);
    return uid;
}

std::optional<int32_t> FakeGameServer::lastChallenge() const {
    std::lock_guard<std::mutex> lock(mutex);
    return challenge;
}

void FakeGameServer::run() {
    std::mt19937 challenges(std::random_device{}());
    while (!stopRequested) {
        if (socket.waitReadable(std::chrono::milliseconds(20)) != net::WaitResult::Ready) {
            continue;
        }
        while (auto datagram = socket.receive()) {
            const auto plaintext = crypto::Open(datagram->payload, key);
            if (!plaintext) {
                continue;
            }
            const auto request = net::challenge::DecodeRequest(plaintext->data(), plaintext->size());
            if (!request) {
                continue;
            }
            ++received;

            net::challenge::Response response;
            response.challenge = static_cast<int32_t>(challenges());
            response.uid = request->uid;
            {
                std::lock_guard<std::mutex> lock(mutex);
                uid = request->uid;
                challenge = response.challenge;
            }

            const Mode mode = currentMode.load();
            if (mode == Mode::Silent) {
                continue;
            }
            if (mode == Mode::WrongUid) {
                response.uid += 1;
            }

            crypto::Bytes reply = net::challenge::EncodeResponse(response);
            if (mode == Mode::Garbage) {
                reply.resize(5);
            }
            const crypto::Key replyKey = mode == Mode::WrongKey ? MakeKey(0xEE) : key;
            const auto sealed = crypto::Seal(reply, replyKey);
            const auto destination = net::ResolveIPv4(datagram->ip, datagram->port);
            if (sealed && destination) {
                socket.sendTo(*destination, *sealed);
            }
        }
    }
}

} // namespace masterlist::test
