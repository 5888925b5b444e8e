#pragma once

#include "registry/registry_backend.hpp"
#include "registry/resp.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace masterlist::registry {

struct RedisSettings {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string password;
    std::chrono::milliseconds ioTimeout{2000};
};

// RESP2 client over one TCP connection. Calls are serialized; a dropped
// connection is re-established on the next call.
class RedisBackend final : public RegistryBackend {
public:
    explicit RedisBackend(RedisSettings settings);
    ~RedisBackend() override;

    RedisBackend(const RedisBackend&) = delete;
    RedisBackend& operator=(const RedisBackend&) = delete;

    const char *name() const override { return "redis"; }

    // Round trip used at startup to report connectivity early.
    bool ping();

    void writeHash(const std::string &key, const Fields &fields, std::chrono::seconds ttl) override;
    std::optional<Fields> readHash(const std::string &key) override;
    std::vector<std::string> scanKeys(const std::string &prefix) override;

    std::set<std::string> readSet(const std::string &key) override;
    void replaceSet(const std::string &key, const std::set<std::string> &members) override;

    void writeField(const std::string &key, const std::string &field, const std::string &value) override;
    std::optional<std::string> readField(const std::string &key, const std::string &field) override;
    void deleteField(const std::string &key, const std::string &field) override;

private:
    using Command = std::vector<std::string>;

    resp::Reply command(Command args);
    // Sends every command in one write and reads one reply per command.
    std::vector<resp::Reply> pipeline(const std::vector<Command> &commands);
    // MULTI ... EXEC; returns the EXEC reply elements.
    std::vector<resp::Reply> transaction(const std::vector<Command> &commands);

    void ensureConnected();
    void disconnect();
    void sendAll(const std::string &payload);
    resp::Reply readReply();
    [[noreturn]] void fail(const std::string &what);

    RedisSettings settings;
    std::mutex mutex;
    int socketFd = -1;
    std::string readBuffer;
};

} // namespace masterlist::registry
