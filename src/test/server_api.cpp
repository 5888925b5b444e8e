#include <gtest/gtest.h>

#include "masterlist/masterlist.h"
#include "test/test_game_server.hpp"
#include "test/test_registry.hpp"

using namespace masterlist;
using namespace masterlist::server;
using namespace std::chrono_literals;
using masterlist::test::FakeGameServer;
using masterlist::test::MakeKey;
using masterlist::test::MakeListing;

namespace {

registry::VersionCatalog makeCatalog() {
    return registry::VersionCatalog::FromJson(json::Parse(R"([
        {"name": "1.0.0", "supported": true, "realTypes": true},
        {"name": "0.9.0", "supported": false, "realTypes": false}
    ])"));
}

class ServerApiTest : public ::testing::Test {
protected:
    ServerApiTest()
        : backend(clock),
          store(backend),
          registration(store, registry::RegistrationSettings{200ms, 30s, registry::kDefaultChallengeUid}),
          catalog(makeCatalog()),
          api(store, registration, catalog, ApiSettings{"admin-secret", "https://example.invalid/update"}) {}

    void put(registry::Listing listing) {
        store.put(listing, 30s);
    }

    ManualClock clock;
    registry::MemoryBackend backend;
    registry::RegistryStore store;
    registry::RegistrationHandler registration;
    registry::VersionCatalog catalog;
    ServerApi api;
};

json::Value registrationBody(uint16_t port, const crypto::Key &key) {
    return json::Value{
        {"name", "Friday Night"},
        {"map", "mp_lobby"},
        {"version", "1.0.0"},
        {"maxPlayers", 16},
        {"numPlayers", 2},
        {"port", port},
        {"playlist", "private_match"},
        {"key", crypto::EncodeKey(key)}
    };
}

} // namespace

TEST(ResolveRequestContext, PrefersProxyHeaders) {
    ForwardingHeaders headers;
    headers.forwardedFor = " 198.51.100.4 , 10.0.0.1";
    EXPECT_EQ(ResolveRequestContext(headers, "127.0.0.1").clientIp, "198.51.100.4");

    headers.connectingIp = "198.51.100.5";
    EXPECT_EQ(ResolveRequestContext(headers, "127.0.0.1").clientIp, "198.51.100.5");

    headers.pseudoIPv4 = "198.51.100.6";
    headers.country = "NL";
    const RequestContext context = ResolveRequestContext(headers, "127.0.0.1");
    EXPECT_EQ(context.clientIp, "198.51.100.6");
    EXPECT_EQ(context.region, "NL");
}

TEST(ResolveRequestContext, FallsBackToPeer) {
    const RequestContext context = ResolveRequestContext(ForwardingHeaders{}, "::ffff:192.0.2.1");
    EXPECT_EQ(context.clientIp, "192.0.2.1");
    EXPECT_EQ(context.region, "XX");
}

TEST_F(ServerApiTest, ListFiltersHiddenAndOtherVersions) {
    put(MakeListing("1.1.1.1", 1, "Quiet", 1));
    put(MakeListing("2.2.2.2", 2, "Busy", 9));
    auto hidden = MakeListing("3.3.3.3", 3, "Hidden", 5);
    hidden.hidden = true;
    hidden.token = "t";
    put(hidden);
    auto other = MakeListing("4.4.4.4", 4, "Other", 3);
    other.version = "1.1.0";
    put(other);

    const ApiResponse response = api.listServers(json::Value{{"version", "1.0.0"}});
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.body["success"], true);
    const auto &servers = response.body["servers"];
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0]["name"], "Busy");
    EXPECT_EQ(servers[1]["name"], "Quiet");
    EXPECT_EQ(servers[0]["playerCount"], 9);
    EXPECT_FALSE(servers[0].contains("version"));
    EXPECT_EQ(servers[0]["password"], "");
}

TEST_F(ServerApiTest, ListWithoutVersionUsesStringTypes) {
    put(MakeListing("1.1.1.1", 1, "A", 1));
    auto other = MakeListing("4.4.4.4", 4, "B", 3);
    other.version = "1.1.0";
    put(other);

    const ApiResponse response = api.listServers(json::Object());
    const auto &servers = response.body["servers"];
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0]["playerCount"], "3");
}

TEST_F(ServerApiTest, AdminKeySeesEverything) {
    auto hidden = MakeListing("3.3.3.3", 3, "Hidden", 5);
    hidden.hidden = true;
    put(hidden);
    auto other = MakeListing("4.4.4.4", 4, "Other", 3);
    other.version = "1.1.0";
    put(other);

    const ApiResponse admin = api.listServers(json::Value{{"version", "1.0.0"}, {"password", "admin-secret"}});
    const auto &servers = admin.body["servers"];
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0]["name"], "Hidden");
    EXPECT_TRUE(servers[0].contains("version"));

    const ApiResponse guest = api.listServers(json::Value{{"version", "1.0.0"}, {"password", "wrong"}});
    EXPECT_TRUE(guest.body["servers"].empty());
}

TEST_F(ServerApiTest, UnsupportedVersionGetsUpdateNotice) {
    put(MakeListing("1.1.1.1", 1, "A", 1));

    const ApiResponse response = api.listServers(json::Value{{"version", "0.9.0"}});
    ASSERT_EQ(response.status, 200);
    const auto &servers = response.body["servers"];
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0]["name"], "--- UPDATE REQUIRED ---");
    EXPECT_NE(servers[1]["playlist"].get<std::string>().find("example.invalid"), std::string::npos);
}

TEST_F(ServerApiTest, VerifyPassword) {
    auto locked = MakeListing("1.1.1.1", 1, "Locked");
    locked.hasPassword = true;
    locked.password = "hunter2";
    put(locked);
    put(MakeListing("2.2.2.2", 2, "Open"));

    auto check = [&](const std::string &ip, int port, const std::string &password) {
        return api.verifyPassword(json::Value{{"ip", ip}, {"port", port}, {"password", password}}).status;
    };
    EXPECT_EQ(check("1.1.1.1", 1, "hunter2"), 200);
    EXPECT_EQ(check("1.1.1.1", 1, "nope"), 401);
    EXPECT_EQ(check("2.2.2.2", 2, "x"), 400);
    EXPECT_EQ(check("9.9.9.9", 9, "x"), 404);
    EXPECT_EQ(check("1.1.1.1", 70000, "x"), 404);
    EXPECT_EQ(check("", 1, "x"), 400);
    EXPECT_EQ(check("1.1.1.1", 0, "x"), 400);
    EXPECT_EQ(check("1.1.1.1", 1, ""), 400);

    const ApiResponse wrong = api.verifyPassword(json::Value{{"ip", "1.1.1.1"}, {"port", "1"}, {"password", "nope"}});
    EXPECT_EQ(wrong.body["error"], "Incorrect password.");
}

TEST_F(ServerApiTest, FindByToken) {
    auto hidden = MakeListing("3.3.3.3", 3, "Hidden", 5);
    hidden.hidden = true;
    hidden.token = "abc";
    put(hidden);

    EXPECT_EQ(api.findByToken(json::Object()).status, 400);
    EXPECT_EQ(api.findByToken(json::Value{{"token", "zzz"}}).status, 404);

    const ApiResponse found = api.findByToken(json::Value{{"token", "abc"}, {"version", "1.0.0"}});
    ASSERT_EQ(found.status, 200);
    EXPECT_EQ(found.body["server"]["name"], "Hidden");
    EXPECT_EQ(found.body["server"]["port"], 3);
    EXPECT_EQ(found.body["server"]["token"], "abc");
}

TEST_F(ServerApiTest, AddServer) {
    const crypto::Key key = MakeKey(20);
    FakeGameServer game(key);

    const ApiResponse response = api.addServer(registrationBody(game.port(), key),
                                               RequestContext{"127.0.0.1", "DE"});
    ASSERT_EQ(response.status, 200) << json::Dump(response.body);
    EXPECT_EQ(response.body["success"], true);
    EXPECT_TRUE(response.body["token"].is_null());
    EXPECT_EQ(response.body["ip"], "127.0.0.1");
    EXPECT_EQ(response.body["port"], game.port());

    const auto stored = store.getByEndpoint("127.0.0.1", game.port());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->region, "DE");
}

TEST_F(ServerApiTest, AddServerRejections) {
    const crypto::Key key = MakeKey(21);
    FakeGameServer game(key, FakeGameServer::Mode::Silent);

    json::Value invalid = registrationBody(game.port(), key);
    invalid["maxPlayers"] = 500;
    const ApiResponse rejected = api.addServer(invalid, RequestContext{"127.0.0.1", "DE"});
    EXPECT_EQ(rejected.status, 400);
    EXPECT_EQ(rejected.body["error"], "Max players must be between 1 and 128 players.");
    EXPECT_EQ(game.challengesReceived(), 0);

    const ApiResponse timedOut = api.addServer(registrationBody(game.port(), key), RequestContext{"127.0.0.1", "DE"});
    EXPECT_EQ(timedOut.status, 400);
    EXPECT_EQ(timedOut.body["error"], registry::kVerificationTimedOutMessage);
    EXPECT_TRUE(store.listings().empty());
}
