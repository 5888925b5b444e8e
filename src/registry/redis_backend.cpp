#include "registry/redis_backend.hpp"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace masterlist::registry {

namespace {

constexpr const char *kScanBatch = "100";

void closeSocketHandle(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

void applyTimeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// The reply was read in full, so the connection stays usable.
[[noreturn]] void rejected(const std::string &what) {
    throw RegistryUnavailable("RedisBackend: " + what);
}

std::string describe(const resp::Reply &reply) {
    if (reply.isError()) {
        return reply.text;
    }
    return "unexpected reply type";
}

} // namespace

RedisBackend::RedisBackend(RedisSettings settings) : settings(std::move(settings)) {}

RedisBackend::~RedisBackend() {
    disconnect();
}

bool RedisBackend::ping() {
    try {
        const resp::Reply reply = command({"PING"});
        return reply.isString() && reply.text == "PONG";
    } catch (const RegistryUnavailable &ex) {
        spdlog::warn("RedisBackend: PING failed: {}", ex.what());
        return false;
    }
}

void RedisBackend::writeHash(const std::string &key, const Fields &fields, std::chrono::seconds ttl) {
    std::vector<Command> commands;
    commands.push_back({"DEL", key});
    if (!fields.empty()) {
        Command hset{"HSET", key};
        for (const auto &[field, value] : fields) {
            hset.push_back(field);
            hset.push_back(value);
        }
        commands.push_back(std::move(hset));
        commands.push_back({"EXPIRE", key, std::to_string(ttl.count())});
    }
    transaction(commands);
}

std::optional<RegistryBackend::Fields> RedisBackend::readHash(const std::string &key) {
    const resp::Reply reply = command({"HGETALL", key});
    if (!reply.isArray()) {
        rejected("HGETALL " + key + ": " + describe(reply));
    }
    if (reply.elements.empty()) {
        return std::nullopt;
    }
    Fields fields;
    for (std::size_t i = 0; i + 1 < reply.elements.size(); i += 2) {
        fields[reply.elements[i].text] = reply.elements[i + 1].text;
    }
    return fields;
}

std::vector<std::string> RedisBackend::scanKeys(const std::string &prefix) {
    std::set<std::string> unique;
    std::string cursor = "0";
    do {
        const resp::Reply reply = command({"SCAN", cursor, "MATCH", prefix + "*", "COUNT", kScanBatch});
        if (!reply.isArray() || reply.elements.size() != 2 || !reply.elements[1].isArray()) {
            rejected("SCAN: " + describe(reply));
        }
        cursor = reply.elements[0].text;
        for (const auto &element : reply.elements[1].elements) {
            unique.insert(element.text);
        }
    } while (cursor != "0");
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::set<std::string> RedisBackend::readSet(const std::string &key) {
    const resp::Reply reply = command({"SMEMBERS", key});
    if (!reply.isArray()) {
        rejected("SMEMBERS " + key + ": " + describe(reply));
    }
    std::set<std::string> members;
    for (const auto &element : reply.elements) {
        members.insert(element.text);
    }
    return members;
}

void RedisBackend::replaceSet(const std::string &key, const std::set<std::string> &members) {
    std::vector<Command> commands;
    commands.push_back({"DEL", key});
    if (!members.empty()) {
        Command sadd{"SADD", key};
        sadd.insert(sadd.end(), members.begin(), members.end());
        commands.push_back(std::move(sadd));
    }
    transaction(commands);
}

void RedisBackend::writeField(const std::string &key, const std::string &field, const std::string &value) {
    const resp::Reply reply = command({"HSET", key, field, value});
    if (reply.isError()) {
        rejected("HSET " + key + ": " + reply.text);
    }
}

std::optional<std::string> RedisBackend::readField(const std::string &key, const std::string &field) {
    const resp::Reply reply = command({"HGET", key, field});
    if (reply.isNull()) {
        return std::nullopt;
    }
    if (!reply.isString()) {
        rejected("HGET " + key + ": " + describe(reply));
    }
    return reply.text;
}

void RedisBackend::deleteField(const std::string &key, const std::string &field) {
    const resp::Reply reply = command({"HDEL", key, field});
    if (reply.isError()) {
        rejected("HDEL " + key + ": " + reply.text);
    }
}

resp::Reply RedisBackend::command(Command args) {
    std::vector<Command> single;
    single.push_back(std::move(args));
    return std::move(pipeline(single).front());
}

std::vector<resp::Reply> RedisBackend::transaction(const std::vector<Command> &commands) {
    std::vector<Command> wrapped;
    wrapped.reserve(commands.size() + 2);
    wrapped.push_back({"MULTI"});
    wrapped.insert(wrapped.end(), commands.begin(), commands.end());
    wrapped.push_back({"EXEC"});

    std::vector<resp::Reply> replies = pipeline(wrapped);
    for (std::size_t i = 0; i + 1 < replies.size(); ++i) {
        if (replies[i].isError()) {
            rejected("transaction rejected: " + replies[i].text);
        }
    }
    resp::Reply &exec = replies.back();
    if (!exec.isArray()) {
        rejected("EXEC: " + (exec.isNull() ? std::string("aborted") : describe(exec)));
    }
    for (const auto &element : exec.elements) {
        if (element.isError()) {
            rejected("transaction command failed: " + element.text);
        }
    }
    return std::move(exec.elements);
}

std::vector<resp::Reply> RedisBackend::pipeline(const std::vector<Command> &commands) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureConnected();

    std::string payload;
    for (const auto &args : commands) {
        payload += resp::EncodeCommand(args);
    }
    sendAll(payload);

    std::vector<resp::Reply> replies;
    replies.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
        replies.push_back(readReply());
    }
    return replies;
}

void RedisBackend::ensureConnected() {
    if (socketFd >= 0) {
        return;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *results = nullptr;
    const std::string service = std::to_string(settings.port);
    const int rc = getaddrinfo(settings.host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        throw RegistryUnavailable("RedisBackend: cannot resolve " + settings.host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    for (addrinfo *entry = results; entry != nullptr; entry = entry->ai_next) {
        fd = static_cast<int>(socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol));
        if (fd < 0) {
            continue;
        }
        applyTimeout(fd, settings.ioTimeout);
        if (::connect(fd, entry->ai_addr, entry->ai_addrlen) == 0) {
            break;
        }
        closeSocketHandle(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) {
        throw RegistryUnavailable("RedisBackend: cannot connect to " + settings.host + ":" + service);
    }

    socketFd = fd;
    readBuffer.clear();
    spdlog::info("RedisBackend: Connected to {}:{}", settings.host, settings.port);

    if (!settings.password.empty()) {
        sendAll(resp::EncodeCommand({"AUTH", settings.password}));
        const resp::Reply reply = readReply();
        if (reply.isError()) {
            fail("AUTH rejected: " + reply.text);
        }
    }
}

void RedisBackend::disconnect() {
    closeSocketHandle(socketFd);
    socketFd = -1;
    readBuffer.clear();
}

void RedisBackend::sendAll(const std::string &payload) {
    std::size_t offset = 0;
    while (offset < payload.size()) {
        const auto sent = send(socketFd, payload.data() + offset, payload.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(std::string("send failed: ") + std::strerror(errno));
        }
        offset += static_cast<std::size_t>(sent);
    }
}

resp::Reply RedisBackend::readReply() {
    char chunk[4096];
    while (true) {
        resp::ParseResult parsed = resp::ParseReply(readBuffer);
        if (parsed.status == resp::ParseStatus::Complete) {
            readBuffer.erase(0, parsed.consumed);
            return std::move(parsed.reply);
        }
        if (parsed.status == resp::ParseStatus::Malformed) {
            fail("malformed reply");
        }

        const auto received = recv(socketFd, chunk, sizeof(chunk), 0);
        if (received == 0) {
            fail("connection closed by server");
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(std::string("recv failed: ") + std::strerror(errno));
        }
        readBuffer.append(chunk, static_cast<std::size_t>(received));
    }
}

void RedisBackend::fail(const std::string &what) {
    // Any protocol or I/O fault leaves the stream in an unknown position.
    disconnect();
    throw RegistryUnavailable("RedisBackend: " + what);
}

} // namespace masterlist::registry
