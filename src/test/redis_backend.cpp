#include <gtest/gtest.h>

#include "registry/redis_backend.hpp"
#include "test/test_redis_server.hpp"

#include <atomic>

using namespace masterlist::registry;
using namespace std::chrono_literals;
using masterlist::test::FakeRedisServer;
using Command = FakeRedisServer::Command;

namespace {

RedisSettings loopback(uint16_t port, const std::string &password = {}) {
    RedisSettings settings;
    settings.port = port;
    settings.password = password;
    settings.ioTimeout = 500ms;
    return settings;
}

// Queues everything between MULTI and EXEC, then answers EXEC with execReply.
FakeRedisServer::Handler transactionHandler(std::string execReply) {
    return [execReply](const Command &command) -> std::optional<std::string> {
        if (command.front() == "MULTI") {
            return std::string("+OK\r\n");
        }
        if (command.front() == "EXEC") {
            return execReply;
        }
        return std::string("+QUEUED\r\n");
    };
}

} // namespace

TEST(RedisBackend, WriteHashSendsOneTransaction) {
    FakeRedisServer server(transactionHandler("*3\r\n:1\r\n:2\r\n:1\r\n"));
    RedisBackend backend(loopback(server.port()));

    backend.writeHash("servers:1.2.3.4:27016", {{"port", "27016"}, {"name", "A"}}, 30s);

    const std::vector<Command> expected{
        {"MULTI"},
        {"DEL", "servers:1.2.3.4:27016"},
        {"HSET", "servers:1.2.3.4:27016", "name", "A", "port", "27016"},
        {"EXPIRE", "servers:1.2.3.4:27016", "30"},
        {"EXEC"},
    };
    EXPECT_EQ(server.commands(), expected);
    EXPECT_EQ(server.connections(), 1);
}

TEST(RedisBackend, AbortedExecIsReportedWithoutReconnecting) {
    std::atomic<bool> abortExec{true};
    FakeRedisServer server([&abortExec](const Command &command) -> std::optional<std::string> {
        if (command.front() == "MULTI") {
            return std::string("+OK\r\n");
        }
        if (command.front() == "EXEC") {
            return std::string(abortExec ? "*-1\r\n" : "*1\r\n:1\r\n");
        }
        if (command.front() == "PING") {
            return std::string("+PONG\r\n");
        }
        return std::string("+QUEUED\r\n");
    });
    RedisBackend backend(loopback(server.port()));

    EXPECT_THROW(backend.writeHash("servers:a", {{"name", "A"}}, 30s), RegistryUnavailable);

    // Every reply was consumed, so the same connection stays usable.
    EXPECT_TRUE(backend.ping());
    abortExec = false;
    EXPECT_NO_THROW(backend.replaceSet("known", {}));
    EXPECT_EQ(server.connections(), 1);
}

TEST(RedisBackend, QueuedCommandErrorFailsTransaction) {
    FakeRedisServer server([](const Command &command) -> std::optional<std::string> {
        if (command.front() == "MULTI") {
            return std::string("+OK\r\n");
        }
        if (command.front() == "EXEC") {
            return std::string("*2\r\n:1\r\n-WRONGTYPE Operation against a key\r\n");
        }
        return std::string("+QUEUED\r\n");
    });
    RedisBackend backend(loopback(server.port()));

    EXPECT_THROW(backend.replaceSet("known", {"servers:a"}), RegistryUnavailable);
}

TEST(RedisBackend, ScanFollowsCursorUntilZero) {
    FakeRedisServer server([](const Command &command) -> std::optional<std::string> {
        if (command.at(1) == "0") {
            return std::string("*2\r\n$2\r\n17\r\n*2\r\n$9\r\nservers:b\r\n$9\r\nservers:a\r\n");
        }
        return std::string("*2\r\n$1\r\n0\r\n*2\r\n$9\r\nservers:a\r\n$9\r\nservers:c\r\n");
    });
    RedisBackend backend(loopback(server.port()));

    const std::vector<std::string> keys = backend.scanKeys("servers:");

    EXPECT_EQ(keys, (std::vector<std::string>{"servers:a", "servers:b", "servers:c"}));
    const std::vector<Command> expected{
        {"SCAN", "0", "MATCH", "servers:*", "COUNT", "100"},
        {"SCAN", "17", "MATCH", "servers:*", "COUNT", "100"},
    };
    EXPECT_EQ(server.commands(), expected);
}

TEST(RedisBackend, ReplaceSetDeletesThenAdds) {
    FakeRedisServer server(transactionHandler("*2\r\n:1\r\n:2\r\n"));
    RedisBackend backend(loopback(server.port()));

    backend.replaceSet("known", {"servers:b", "servers:a"});
    const std::vector<Command> filled{
        {"MULTI"},
        {"DEL", "known"},
        {"SADD", "known", "servers:a", "servers:b"},
        {"EXEC"},
    };
    EXPECT_EQ(server.commands(), filled);

    server.clearCommands();
    backend.replaceSet("known", {});
    const std::vector<Command> emptied{
        {"MULTI"},
        {"DEL", "known"},
        {"EXEC"},
    };
    EXPECT_EQ(server.commands(), emptied);
}

TEST(RedisBackend, ReadsHashesFieldsAndSets) {
    FakeRedisServer server([](const Command &command) -> std::optional<std::string> {
        if (command.front() == "HGETALL") {
            if (command.at(1) == "servers:gone") {
                return std::string("*0\r\n");
            }
            return std::string("*4\r\n$4\r\nname\r\n$1\r\nA\r\n$4\r\nport\r\n$5\r\n27016\r\n");
        }
        if (command.front() == "HGET") {
            if (command.at(2) == "missing") {
                return std::string("$-1\r\n");
            }
            return std::string("$2\r\n{}\r\n");
        }
        if (command.front() == "SMEMBERS") {
            return std::string("*2\r\n$1\r\nx\r\n$1\r\ny\r\n");
        }
        return std::string(":1\r\n");
    });
    RedisBackend backend(loopback(server.port()));

    const auto fields = backend.readHash("servers:a");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(fields->at("name"), "A");
    EXPECT_EQ(fields->at("port"), "27016");
    EXPECT_FALSE(backend.readHash("servers:gone").has_value());

    EXPECT_FALSE(backend.readField("meta", "missing").has_value());
    EXPECT_EQ(backend.readField("meta", "servers:a").value_or(""), "{}");

    EXPECT_EQ(backend.readSet("known"), (std::set<std::string>{"x", "y"}));

    backend.writeField("meta", "servers:a", "{\"name\":\"A\"}");
    backend.deleteField("meta", "servers:a");
    const std::vector<Command> commands = server.commands();
    ASSERT_GE(commands.size(), 2u);
    EXPECT_EQ(commands[commands.size() - 2], (Command{"HSET", "meta", "servers:a", "{\"name\":\"A\"}"}));
    EXPECT_EQ(commands.back(), (Command{"HDEL", "meta", "servers:a"}));
}

TEST(RedisBackend, ErrorReplyToSingleCommandThrows) {
    FakeRedisServer server([](const Command &) -> std::optional<std::string> {
        return std::string("-WRONGTYPE Operation against a key\r\n");
    });
    RedisBackend backend(loopback(server.port()));

    EXPECT_THROW(backend.writeField("meta", "f", "v"), RegistryUnavailable);
    EXPECT_THROW(backend.readField("meta", "f"), RegistryUnavailable);
    EXPECT_EQ(server.connections(), 1);
}

TEST(RedisBackend, AuthenticatesBeforeFirstCommand) {
    FakeRedisServer server([](const Command &command) -> std::optional<std::string> {
        if (command.front() == "AUTH") {
            return std::string("+OK\r\n");
        }
        return std::string("+PONG\r\n");
    });
    RedisBackend backend(loopback(server.port(), "hunter2"));

    EXPECT_TRUE(backend.ping());
    const std::vector<Command> expected{
        {"AUTH", "hunter2"},
        {"PING"},
    };
    EXPECT_EQ(server.commands(), expected);
}

TEST(RedisBackend, RejectedAuthDisconnects) {
    FakeRedisServer server([](const Command &command) -> std::optional<std::string> {
        if (command.front() == "AUTH") {
            return std::string("-WRONGPASS invalid username-password pair\r\n");
        }
        return std::string("+PONG\r\n");
    });
    RedisBackend backend(loopback(server.port(), "wrong"));

    EXPECT_THROW(backend.readSet("known"), RegistryUnavailable);
    EXPECT_FALSE(backend.ping());

    // Each attempt opened a fresh connection and never got past AUTH.
    EXPECT_EQ(server.connections(), 2);
    for (const auto &command : server.commands()) {
        EXPECT_EQ(command.front(), "AUTH");
    }
}

TEST(RedisBackend, ReconnectsAfterDroppedConnection) {
    std::atomic<bool> dropNext{true};
    FakeRedisServer server([&dropNext](const Command &command) -> std::optional<std::string> {
        if (command.front() == "AUTH") {
            return std::string("+OK\r\n");
        }
        if (dropNext.exchange(false)) {
            return std::nullopt;
        }
        return std::string("$5\r\nvalue\r\n");
    });
    RedisBackend backend(loopback(server.port(), "secret"));

    EXPECT_THROW(backend.readField("meta", "servers:a"), RegistryUnavailable);
    EXPECT_EQ(backend.readField("meta", "servers:a").value_or(""), "value");

    EXPECT_EQ(server.connections(), 2);
    const std::vector<Command> expected{
        {"AUTH", "secret"},
        {"HGET", "meta", "servers:a"},
        {"AUTH", "secret"},
        {"HGET", "meta", "servers:a"},
    };
    EXPECT_EQ(server.commands(), expected);
}

TEST(RedisBackend, UnreachableServerIsUnavailable) {
    uint16_t port = 0;
    {
        FakeRedisServer closed([](const Command &) -> std::optional<std::string> { return std::nullopt; });
        port = closed.port();
    }
    RedisBackend backend(loopback(port));

    EXPECT_FALSE(backend.ping());
    EXPECT_THROW(backend.scanKeys("servers:"), RegistryUnavailable);
}
